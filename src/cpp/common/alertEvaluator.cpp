
#include <sstream>

#include "alertEvaluator.hpp"


AlertSample AlertSample::fromStatistics(
	const StationStatistics& stats)
{
	AlertSample sample;
	sample.stationId		= stats.stationId;
	sample.up				= stats.session.isUp();
	sample.startedTime		= stats.session.startedTime;
	sample.byteRate			= stats.byteRate();
	sample.satellitesValid	= stats.lastIntervalValid;
	sample.satelliteCount	= stats.intervalSatelliteCount();
	return sample;
}

/** Raise an alert unless it is already raised or still cooling down from the last time
*/
bool raiseAlert(
	AlertKindState&		kindState,
	const AlertOptions&	options,
	ptime				now)
{
	if (kindState.raised)
	{
		return false;
	}

	if	( kindState.lastRaised.is_not_a_date_time() == false
		&&now - kindState.lastRaised < options.cooldown)
	{
		return false;
	}

	kindState.raised		= true;
	kindState.lastRaised	= now;
	return true;
}

AlertEvent makeEvent(
	const AlertSample&	sample,
	E_AlertKind			kind,
	ptime				now)
{
	AlertEvent event;
	event.stationId	= sample.stationId;
	event.kind		= kind;
	event.time		= now;

	std::stringstream message;
	message << sample.stationId << " : ";
	switch (kind)
	{
		case E_AlertKind::CONNECTION_LOST:		message << "connection lost";											break;
		case E_AlertKind::CONNECTION_RESTORED:	message << "connection restored";										break;
		case E_AlertKind::LOW_DATA_RATE:		message << "low data rate " << sample.byteRate << " B/s";				break;
		case E_AlertKind::LOW_SATELLITES:		message << "only " << sample.satelliteCount << " satellites tracked";	break;
	}
	event.message = message.str();

	return event;
}

/** Compare a new sample of a station with its alert state, returning the alerts that became active.
* The state is updated in place, so calling this again with the same sample raises nothing new
*/
vector<AlertEvent> evaluateAlerts(
	StationAlertState&		state,
	const AlertSample&		sample,
	const AlertOptions&		options,
	ptime					now)
{
	vector<AlertEvent> events;

	bool wasUp		= state.wasUp;
	state.wasUp		= sample.up;

	if (state.firstMeasurement)
	{
		state.firstMeasurement = false;
		return events;
	}

	bool inGrace	= sample.startedTime.is_not_a_date_time()
					||now - sample.startedTime < options.startupGrace;

	auto& lost		= state.kinds[E_AlertKind::CONNECTION_LOST];
	auto& restored	= state.kinds[E_AlertKind::CONNECTION_RESTORED];
	auto& lowRate	= state.kinds[E_AlertKind::LOW_DATA_RATE];
	auto& lowSats	= state.kinds[E_AlertKind::LOW_SATELLITES];

	if	( wasUp
		&&sample.up == false)
	{
		restored.raised = false;

		if	( inGrace == false
			&&raiseAlert(lost, options, now))
		{
			events.push_back(makeEvent(sample, E_AlertKind::CONNECTION_LOST, now));
		}
	}

	if	( wasUp == false
		&&sample.up)
	{
		bool wasLost = lost.raised;
		lost.raised = false;

		if	( inGrace == false
			&&wasLost
			&&raiseAlert(restored, options, now))
		{
			events.push_back(makeEvent(sample, E_AlertKind::CONNECTION_RESTORED, now));
		}
	}

	if	( sample.up == false
		||inGrace)
	{
		state.lowRateSince = ptime();
		return events;
	}

	if (sample.byteRate < options.lowRateThreshold)
	{
		if (state.lowRateSince.is_not_a_date_time())
		{
			state.lowRateSince = now;
		}

		if	( now - state.lowRateSince >= options.lowRateWindow
			&&raiseAlert(lowRate, options, now))
		{
			events.push_back(makeEvent(sample, E_AlertKind::LOW_DATA_RATE, now));
		}
	}
	else
	{
		state.lowRateSince	= ptime();
		lowRate.raised		= false;
	}

	if (sample.satellitesValid)
	{
		if (sample.satelliteCount < options.lowSatelliteThreshold)
		{
			if (raiseAlert(lowSats, options, now))
			{
				events.push_back(makeEvent(sample, E_AlertKind::LOW_SATELLITES, now));
			}
		}
		else
		{
			lowSats.raised = false;
		}
	}

	return events;
}

vector<AlertEvent> AlertEvaluator::evaluate(
	const AlertSample&	sample,
	ptime				now)
{
	return evaluateAlerts(stations[sample.stationId], sample, options, now);
}

void AlertEvaluator::removeStation(
	const string& stationId)
{
	stations.erase(stationId);
}

const StationAlertState* AlertEvaluator::alertState(
	const string& stationId) const
{
	auto it = stations.find(stationId);
	if (it == stations.end())
	{
		return nullptr;
	}

	return &it->second;
}
