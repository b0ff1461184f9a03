
#include <boost/log/trivial.hpp>

#include "sessionSupervisor.hpp"


SessionSupervisor::SessionSupervisor(
	const SessionOptions&	sessionOptions,
	const ReconnectPolicy&	reconnectPolicy)
:	sessionOptions	(sessionOptions),
	reconnectPolicy	(reconnectPolicy)
{

}

SessionSupervisor::~SessionSupervisor()
{
	shutdown(joinBound);
}

std::shared_ptr<NtripSession> SessionSupervisor::makeSession(
	const StationConfig&	config)
{
	ReconnectPolicy policy = reconnectPolicy;

	auto session = std::make_shared<NtripSession>(config, sessionOptions, [policy](const SessionState& state)
	{
		return policy.decide(state.failureKind, state.reconnectAttempts, state.userStopped);
	});

	session->stateListener = stateListener;

	return session;
}

/** Stop a session and wait a bounded time for its thread.
* Sessions that do not exit in time are kept until shutdown so nothing blocks here
*/
void SessionSupervisor::retire(
	std::shared_ptr<NtripSession>	session)
{
	session->stop();

	if (session->join(joinBound))
	{
		return;
	}

	BOOST_LOG_TRIVIAL(warning)
	<< "Session for " << session->config().id << " did not stop within " << joinBound.total_milliseconds() << "ms";

	retiredSessions.push_back(session);
}

bool SessionSupervisor::addStation(
	const StationConfig&	config,
	bool					autoStart)
{
	std::lock_guard<std::mutex> guard(supervisorMtx);

	if (stations.find(config.id) != stations.end())
	{
		BOOST_LOG_TRIVIAL(warning)
		<< "Station " << config.id << " already exists";

		return false;
	}

	StationEntry& entry = stations[config.id];
	entry.config	= config;
	entry.session	= makeSession(config);

	BOOST_LOG_TRIVIAL(info)
	<< "Added station " << config.id << " (" << config.sanitised() << ")";

	if (autoStart)
	{
		entry.session->start();
	}

	return true;
}

bool SessionSupervisor::updateStation(
	const StationConfig&	config)
{
	std::lock_guard<std::mutex> guard(supervisorMtx);

	auto it = stations.find(config.id);
	if (it == stations.end())
	{
		BOOST_LOG_TRIVIAL(warning)
		<< "Cannot update unknown station " << config.id;

		return false;
	}

	auto& [id, entry] = *it;

	bool endpointChanged = entry.config.sameEndpoint(config) == false;

	entry.config = config;

	if (endpointChanged == false)
	{
		return true;
	}

	SessionState previous	= entry.session->state();
	bool wasWanted			= entry.session->running()
							&&previous.userStopped == false;

	retire(entry.session);

	entry.session = makeSession(config);

	BOOST_LOG_TRIVIAL(info)
	<< "Updated station " << id << " (" << config.sanitised() << ")";

	if (wasWanted)
	{
		entry.session->start();
	}

	return true;
}

bool SessionSupervisor::removeStation(
	const string&	stationId)
{
	std::lock_guard<std::mutex> guard(supervisorMtx);

	auto it = stations.find(stationId);
	if (it == stations.end())
	{
		BOOST_LOG_TRIVIAL(warning)
		<< "Cannot remove unknown station " << stationId;

		return false;
	}

	auto session = it->second.session;
	stations.erase(it);

	retire(session);

	BOOST_LOG_TRIVIAL(info)
	<< "Removed station " << stationId;

	return true;
}

bool SessionSupervisor::start(
	const string&	stationId)
{
	std::lock_guard<std::mutex> guard(supervisorMtx);

	auto it = stations.find(stationId);
	if (it == stations.end())
	{
		BOOST_LOG_TRIVIAL(warning)
		<< "Cannot start unknown station " << stationId;

		return false;
	}

	auto& session = it->second.session;

	if (session->running())
	{
		SessionState state = session->state();

		if	( state.userStopped	== false
			&&state.phase		!= E_SessionPhase::TERMINATED)
		{
			BOOST_LOG_TRIVIAL(warning)
			<< "Station " << stationId << " is already active, not starting";

			return false;
		}

		// stopping, or waiting on a retry timer
		session->stop();

		if (session->join(joinBound) == false)
		{
			BOOST_LOG_TRIVIAL(warning)
			<< "Session for " << stationId << " did not stop, not starting";

			return false;
		}
	}

	if (session->start() == false)
	{
		BOOST_LOG_TRIVIAL(warning)
		<< "Session for " << stationId << " could not be started";

		return false;
	}

	return true;
}

bool SessionSupervisor::stop(
	const string&	stationId)
{
	std::lock_guard<std::mutex> guard(supervisorMtx);

	auto it = stations.find(stationId);
	if (it == stations.end())
	{
		BOOST_LOG_TRIVIAL(warning)
		<< "Cannot stop unknown station " << stationId;

		return false;
	}

	it->second.session->stop();

	return true;
}

/** Restart every station that is not currently connected.
* Returns the number of sessions started
*/
int SessionSupervisor::reconnectAll()
{
	std::lock_guard<std::mutex> guard(supervisorMtx);

	int numStarted = 0;

	for (auto& [id, entry] : stations)
	{
		auto& session = entry.session;

		SessionState state = session->state();

		if	( state.isUp()
			||state.phase == E_SessionPhase::CONNECTING)
		{
			continue;
		}

		if (session->running())
		{
			// waiting on a retry timer
			session->stop();

			if (session->join(joinBound) == false)
			{
				BOOST_LOG_TRIVIAL(warning)
				<< "Session for " << id << " did not stop, not reconnecting";

				continue;
			}
		}

		if (session->start())
		{
			numStarted++;
		}
	}

	BOOST_LOG_TRIVIAL(info)
	<< "Reconnecting " << numStarted << " station(s)";

	return numStarted;
}

/** Stop every session and wait for their threads.
* Returns false if any thread was still running when the bound expired
*/
bool SessionSupervisor::shutdown(
	time_duration bound)
{
	vector<std::shared_ptr<NtripSession>> sessions;
	{
		std::lock_guard<std::mutex> guard(supervisorMtx);

		for (auto& [id, entry] : stations)
		{
			sessions.push_back(entry.session);
		}

		sessions.insert(sessions.end(), retiredSessions.begin(), retiredSessions.end());
		retiredSessions.clear();
	}

	for (auto& session : sessions)
	{
		session->stop();
	}

	ptime deadline = timeNow() + bound;

	bool allStopped = true;
	for (auto& session : sessions)
	{
		time_duration remaining = deadline - timeNow();
		if (remaining.is_negative())
		{
			remaining = boost::posix_time::seconds(0);
		}

		if (session->join(remaining) == false)
		{
			BOOST_LOG_TRIVIAL(error)
			<< "Session for " << session->config().id << " still running at shutdown";

			allStopped = false;

			std::lock_guard<std::mutex> guard(supervisorMtx);
			retiredSessions.push_back(session);
		}
	}

	return allStopped;
}

bool SessionSupervisor::hasStation(
	const string&	stationId)
{
	std::lock_guard<std::mutex> guard(supervisorMtx);

	return stations.find(stationId) != stations.end();
}

vector<string> SessionSupervisor::stationIds()
{
	std::lock_guard<std::mutex> guard(supervisorMtx);

	vector<string> ids;
	for (auto& [id, entry] : stations)
	{
		ids.push_back(id);
	}

	return ids;
}

boost::optional<StationConfig> SessionSupervisor::stationConfig(
	const string&	stationId)
{
	std::lock_guard<std::mutex> guard(supervisorMtx);

	auto it = stations.find(stationId);
	if (it == stations.end())
	{
		return boost::none;
	}

	return it->second.config;
}

boost::optional<SessionState> SessionSupervisor::state(
	const string&	stationId)
{
	auto session = this->session(stationId);
	if (session == nullptr)
	{
		return boost::none;
	}

	return session->state();
}

std::shared_ptr<NtripSession> SessionSupervisor::session(
	const string&	stationId)
{
	std::lock_guard<std::mutex> guard(supervisorMtx);

	auto it = stations.find(stationId);
	if (it == stations.end())
	{
		return nullptr;
	}

	return it->second.session;
}

map<string, SessionState> SessionSupervisor::snapshot()
{
	std::lock_guard<std::mutex> guard(supervisorMtx);

	map<string, SessionState> states;
	for (auto& [id, entry] : stations)
	{
		states[id] = entry.session->state();
	}

	return states;
}

map<string, vector<SessionUpdate>> SessionSupervisor::takeUpdates()
{
	std::lock_guard<std::mutex> guard(supervisorMtx);

	map<string, vector<SessionUpdate>> updates;
	for (auto& [id, entry] : stations)
	{
		auto stationUpdates = entry.session->takeUpdates();
		if (stationUpdates.empty())
		{
			continue;
		}

		updates[id] = std::move(stationUpdates);
	}

	return updates;
}
