#ifndef SESSION_SUPERVISOR_H
#define SESSION_SUPERVISOR_H

#include <memory>
#include <string>
#include <vector>
#include <mutex>
#include <map>

using std::string;
using std::vector;
using std::map;

#include <boost/optional.hpp>

#include "reconnectPolicy.hpp"
#include "ntripSession.hpp"


struct StationEntry
{
	StationConfig					config;
	std::shared_ptr<NtripSession>	session;
};

/** Owns the session of every configured station.
* Start, stop and reconnect commands for any station go through here
*/
struct SessionSupervisor
{
	StateListener	stateListener;		///< Handed to every session created after it is set

	SessionSupervisor(
		const SessionOptions&	sessionOptions,
		const ReconnectPolicy&	reconnectPolicy);

	~SessionSupervisor();

	SessionSupervisor(const SessionSupervisor&)				= delete;
	SessionSupervisor& operator=(const SessionSupervisor&)	= delete;

	bool addStation(
		const StationConfig&	config,
		bool					autoStart = true);

	bool updateStation(
		const StationConfig&	config);

	bool removeStation(
		const string&	stationId);

	bool start(
		const string&	stationId);

	bool stop(
		const string&	stationId);

	int reconnectAll();

	bool shutdown(
		time_duration bound = boost::posix_time::seconds(2));

	bool hasStation(
		const string&	stationId);

	vector<string> stationIds();

	boost::optional<StationConfig> stationConfig(
		const string&	stationId);

	boost::optional<SessionState> state(
		const string&	stationId);

	map<string, SessionState> snapshot();

	map<string, vector<SessionUpdate>> takeUpdates();

	std::shared_ptr<NtripSession> session(
		const string&	stationId);

private:
	SessionOptions		sessionOptions;
	ReconnectPolicy		reconnectPolicy;
	time_duration		joinBound		= boost::posix_time::seconds(2);

	std::mutex								supervisorMtx;
	map<string, StationEntry>				stations;
	vector<std::shared_ptr<NtripSession>>	retiredSessions;	///< Stopped sessions whose threads did not exit in time

	std::shared_ptr<NtripSession> makeSession(
		const StationConfig&	config);

	void retire(
		std::shared_ptr<NtripSession>	session);
};

#endif
