#ifndef SOURCETABLE_H
#define SOURCETABLE_H

#include <string>
#include <vector>

using std::string;
using std::vector;

#include <boost/optional.hpp>

#include "stationConfig.hpp"


/** One STR record of a caster sourcetable
*/
struct MountpointRecord
{
	string			mountpoint;
	string			identifier;
	string			format;
	string			formatDetails;
	int				carrier		= 0;
	vector<string>	navSystems;
	string			network;
	string			country;

	boost::optional<double>	latitude;
	boost::optional<double>	longitude;
};

boost::optional<MountpointRecord> parseSourcetableLine(
	const string& line);

vector<MountpointRecord> parseSourcetable(
	const string& sourcetable);

StationConfig toStationConfig(
	const MountpointRecord&	record,
	const string&			casterHost,
	int						casterPort,
	const string&			username,
	const string&			password);

#endif
