#ifndef STREAM_STATISTICS_H
#define STREAM_STATISTICS_H

#include <utility>
#include <string>
#include <vector>
#include <deque>
#include <map>
#include <set>

using std::string;
using std::vector;
using std::deque;
using std::pair;
using std::map;
using std::set;

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/optional.hpp>

#include "ntripSession.hpp"
#include "sessionState.hpp"
#include "rtcmDecoder.hpp"
#include "ntripTrace.hpp"


struct StatisticsOptions
{
	time_duration	rateWindow				= boost::posix_time::seconds(10);
	time_duration	satelliteInterval		= boost::posix_time::seconds(10);
	bool			resetCountsOnReconnect	= true;
};

struct MessageTypeCount
{
	long int	count		= 0;
	ptime		lastSeen;
};

/** Byte count seen by one consumer since its previous poll
*/
struct ByteDelta
{
	long int		bytes	= 0;
	time_duration	elapsed	= boost::posix_time::seconds(0);

	double rate() const
	{
		if (elapsed.total_milliseconds() <= 0)
			return 0;

		return bytes * 1000.0 / elapsed.total_milliseconds();
	}
};

struct ConsumerBaseline
{
	long int	lastTotal	= 0;
	int			connectionId= 0;
	ptime		lastPoll;
};

/** Everything known about the stream of one station, rebuilt whenever a new connection starts
*/
struct StationStatistics
{
	string							stationId;
	int								connectionId		= 0;
	long int						totalBytes			= 0;		///< Bytes on the current connection
	deque<pair<ptime, long int>>	rateSamples;					///< (time, totalBytes) over the trailing window

	map<int, MessageTypeCount>		messageCounts;
	SatelliteSets					satellites;						///< Every satellite seen, per constellation
	SignalSets						signals;

	ptime							intervalStart;
	SatelliteSets					intervalSatellites;				///< Satellites seen in the interval being collected
	bool							intervalHasSatFrames	= false;
	SatelliteSets					lastIntervalSatellites;			///< Satellites seen in the last completed interval
	bool							lastIntervalValid		= false;

	time_duration					uptime				= boost::posix_time::seconds(0);
	SessionState					session;
	NetworkDataDownload				networkData;

	double byteRate() const;

	int satelliteCount() const;

	int intervalSatelliteCount() const;

	long int totalMessages() const;

	void resetConnection(
		int		newConnectionId,
		ptime	now,
		bool	resetCounts);
};

/** Turns session updates into per station statistics.
* Used from a single consumer thread, sessions hand data over through SessionSupervisor::takeUpdates()
*/
struct StatisticsAggregator
{
	StatisticsOptions	options;

	StatisticsAggregator(
		FrameDecoder&				decoder,
		const StatisticsOptions&	options = StatisticsOptions());

	void applyUpdate(
		const string&			stationId,
		const SessionUpdate&	update,
		ptime					now);

	void applySession(
		const SessionState&		state,
		ptime					now);

	void tick(
		ptime now);

	void removeStation(
		const string& stationId);

	void registerConsumer(
		const string& consumer);

	ByteDelta pollDelta(
		const string&	stationId,
		const string&	consumer,
		ptime			now);

	const StationStatistics* statistics(
		const string& stationId) const;

	const map<string, StationStatistics>& allStatistics() const
	{
		return stations;
	}

private:
	FrameDecoder&								decoder;
	map<string, StationStatistics>				stations;
	map<string, map<string, ConsumerBaseline>>	consumerBaselines;

	StationStatistics& stationStatistics(
		const string&	stationId,
		ptime			now);

	bool syncConnection(
		StationStatistics&	stats,
		int					connectionId,
		ptime				now);
};

#endif
