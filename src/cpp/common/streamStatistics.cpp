
#include <boost/log/trivial.hpp>

#include "streamStatistics.hpp"


int countSatellites(
	const SatelliteSets& sets)
{
	int count = 0;
	for (auto& [sys, prns] : sets)
	{
		count += prns.size();
	}
	return count;
}

/** Byte rate over the trailing sample window, in bytes per second
*/
double StationStatistics::byteRate() const
{
	if (rateSamples.size() < 2)
	{
		return 0;
	}

	auto& [firstTime,	firstTotal]	= rateSamples.front();
	auto& [lastTime,	lastTotal]	= rateSamples.back();

	long int milliseconds = (lastTime - firstTime).total_milliseconds();
	if (milliseconds <= 0)
	{
		return 0;
	}

	return (lastTotal - firstTotal) * 1000.0 / milliseconds;
}

int StationStatistics::satelliteCount() const
{
	return countSatellites(satellites);
}

int StationStatistics::intervalSatelliteCount() const
{
	return countSatellites(lastIntervalSatellites);
}

long int StationStatistics::totalMessages() const
{
	long int total = 0;
	for (auto& [type, messageCount] : messageCounts)
	{
		total += messageCount.count;
	}
	return total;
}

void StationStatistics::resetConnection(
	int		newConnectionId,
	ptime	now,
	bool	resetCounts)
{
	connectionId		= newConnectionId;
	totalBytes			= 0;
	uptime				= boost::posix_time::seconds(0);
	rateSamples			.clear();
	rateSamples			.push_back({now, 0});

	intervalStart		= now;
	intervalSatellites	.clear();
	intervalHasSatFrames	= false;
	lastIntervalSatellites	.clear();
	lastIntervalValid		= false;

	if (resetCounts)
	{
		messageCounts	.clear();
		satellites		.clear();
		signals			.clear();
	}
}

StatisticsAggregator::StatisticsAggregator(
	FrameDecoder&				decoder,
	const StatisticsOptions&	options)
:	options	(options),
	decoder	(decoder)
{

}

StationStatistics& StatisticsAggregator::stationStatistics(
	const string&	stationId,
	ptime			now)
{
	auto it = stations.find(stationId);
	if (it != stations.end())
	{
		return it->second;
	}

	StationStatistics& stats = stations[stationId];
	stats.stationId				= stationId;
	stats.intervalStart			= now;
	stats.networkData.streamName	= stationId;
	stats.networkData.startTime		= now;

	return stats;
}

/** Reset the per connection part of the statistics when a newer connection shows up.
* Returns false for data belonging to a connection that has already been replaced
*/
bool StatisticsAggregator::syncConnection(
	StationStatistics&	stats,
	int					connectionId,
	ptime				now)
{
	if (connectionId < stats.connectionId)
	{
		return false;
	}

	if (connectionId > stats.connectionId)
	{
		BOOST_LOG_TRIVIAL(debug)
		<< "New connection " << connectionId << " for " << stats.stationId << ", resetting statistics";

		stats.resetConnection(connectionId, now, options.resetCountsOnReconnect);
	}

	return true;
}

void StatisticsAggregator::applyUpdate(
	const string&			stationId,
	const SessionUpdate&	update,
	ptime					now)
{
	StationStatistics& stats = stationStatistics(stationId, now);

	if (syncConnection(stats, update.connectionId, now) == false)
	{
		return;
	}

	stats.totalBytes += update.byteDelta;
	stats.networkData.accumulateScanCounts(update.scanCounts);

	for (auto& frame : update.frames)
	{
		string error;
		auto decoded = decoder.decode(frame, error);
		if (decoded == boost::none)
		{
			BOOST_LOG_TRIVIAL(debug)
			<< "Decode failed for " << stationId << " message " << frame.messageType() << " : " << error;

			stats.networkData.numFramesDecodeFailed++;
			continue;
		}

		stats.networkData.numFramesDecoded++;

		auto& messageCount = stats.messageCounts[decoded->messageType];
		messageCount.count++;
		messageCount.lastSeen = now;

		if (RtcmDecoder::isMsm(decoded->messageType))
		{
			stats.intervalHasSatFrames = true;
		}

		for (auto& [sys, prns] : decoded->satellites)
		{
			stats.satellites		[sys].insert(prns.begin(), prns.end());
			stats.intervalSatellites[sys].insert(prns.begin(), prns.end());
		}

		for (auto& [sys, names] : decoded->signals)
		{
			stats.signals[sys].insert(names.begin(), names.end());
		}
	}
}

void StatisticsAggregator::applySession(
	const SessionState&		state,
	ptime					now)
{
	StationStatistics& stats = stationStatistics(state.stationId, now);

	if (syncConnection(stats, state.connectionId, now) == false)
	{
		return;
	}

	stats.session	= state;
	stats.uptime	= state.uptime(now);

	auto& networkData = stats.networkData;
	if (state.startedTime.is_not_a_date_time() == false)
	{
		networkData.startTime = state.startedTime;
	}
	networkData.endTime					= now;
	networkData.disconnectionCount		= state.disconnectionCount;
	networkData.numberChunks			= state.numberChunks;
	networkData.connectedDuration		= state.connectedDuration;
	networkData.disconnectedDuration	= state.disconnectedDuration;

	if (state.isUp())
	{
		networkData.connectedDuration		+= now - state.handshakeTime;
	}
	else if (state.disconnectedTime.is_not_a_date_time() == false
		&&	state.disconnectionCount > 0)
	{
		networkData.disconnectedDuration	+= now - state.disconnectedTime;
	}
}

/** Sample byte totals for the rate window and roll the satellite reporting interval
*/
void StatisticsAggregator::tick(
	ptime now)
{
	for (auto& [id, stats] : stations)
	{
		auto& samples = stats.rateSamples;

		samples.push_back({now, stats.totalBytes});

		// keep one sample at or before the window start as the baseline
		while	( samples.size() > 2
				&&samples[1].first <= now - options.rateWindow)
		{
			samples.pop_front();
		}

		if (stats.intervalStart.is_not_a_date_time())
		{
			stats.intervalStart = now;
		}

		if (now - stats.intervalStart >= options.satelliteInterval)
		{
			stats.lastIntervalSatellites	= stats.intervalSatellites;
			stats.lastIntervalValid			= stats.intervalHasSatFrames;
			stats.intervalSatellites		.clear();
			stats.intervalHasSatFrames		= false;
			stats.intervalStart				= now;
		}
	}
}

void StatisticsAggregator::removeStation(
	const string& stationId)
{
	stations.erase(stationId);

	for (auto& [consumer, baselines] : consumerBaselines)
	{
		baselines.erase(stationId);
	}
}

void StatisticsAggregator::registerConsumer(
	const string& consumer)
{
	consumerBaselines[consumer];
}

/** Bytes received by a station since this consumer last asked.
* Every consumer keeps its own baseline so polling by one never hides bytes from another
*/
ByteDelta StatisticsAggregator::pollDelta(
	const string&	stationId,
	const string&	consumer,
	ptime			now)
{
	ByteDelta delta;

	auto it = stations.find(stationId);
	if (it == stations.end())
	{
		return delta;
	}

	auto& stats		= it->second;
	auto& baseline	= consumerBaselines[consumer][stationId];

	if	( baseline.connectionId	!= stats.connectionId
		||baseline.lastTotal	> stats.totalBytes)
	{
		// counter restarted with a new connection
		delta.bytes = stats.totalBytes;
	}
	else
	{
		delta.bytes = stats.totalBytes - baseline.lastTotal;
	}

	if (baseline.lastPoll.is_not_a_date_time() == false)
	{
		delta.elapsed = now - baseline.lastPoll;
	}

	baseline.lastTotal		= stats.totalBytes;
	baseline.connectionId	= stats.connectionId;
	baseline.lastPoll		= now;

	return delta;
}

const StationStatistics* StatisticsAggregator::statistics(
	const string& stationId) const
{
	auto it = stations.find(stationId);
	if (it == stations.end())
	{
		return nullptr;
	}

	return &it->second;
}
