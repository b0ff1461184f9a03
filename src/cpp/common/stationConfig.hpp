#ifndef STATION_CONFIG_H
#define STATION_CONFIG_H

#include <string>

using std::string;

#include <boost/optional.hpp>


/** Connection details for one mountpoint on a caster
*/
struct StationConfig
{
	string	id;
	string	host;
	int		port		= 2101;
	string	mountpoint;
	string	username;
	string	password;

	boost::optional<double>	latitude;
	boost::optional<double>	longitude;
	boost::optional<double>	height;

	/** Connection relevant fields only - coordinates may change without a reconnect
	*/
	bool sameEndpoint(
		const StationConfig& other) const
	{
		return	( host			== other.host
				&&port			== other.port
				&&mountpoint	== other.mountpoint
				&&username		== other.username
				&&password		== other.password);
	}

	string sanitised() const
	{
		return host + ":" + std::to_string(port) + "/" + mountpoint;
	}
};

#endif
