#ifndef ALERT_EVALUATOR_H
#define ALERT_EVALUATOR_H

#include <string>
#include <vector>
#include <map>

using std::string;
using std::vector;
using std::map;

#include <boost/date_time/posix_time/posix_time.hpp>

#include "streamStatistics.hpp"
#include "enums.h"

using boost::posix_time::ptime;
using boost::posix_time::time_duration;


struct AlertOptions
{
	time_duration	startupGrace			= boost::posix_time::seconds(15);
	double			lowRateThreshold		= 100;		///< bytes per second
	time_duration	lowRateWindow			= boost::posix_time::seconds(30);
	int				lowSatelliteThreshold	= 4;
	time_duration	cooldown				= boost::posix_time::minutes(5);
};

/** The values of one station that alerts are evaluated against
*/
struct AlertSample
{
	string	stationId;
	bool	up					= false;
	ptime	startedTime;
	double	byteRate			= 0;
	bool	satellitesValid		= false;	///< A satellite reporting interval with satellite messages has completed
	int		satelliteCount		= 0;

	static AlertSample fromStatistics(
		const StationStatistics& stats);
};

struct AlertEvent
{
	string		stationId;
	E_AlertKind	kind;
	ptime		time;
	string		message;
};

struct AlertKindState
{
	ptime	lastRaised;
	bool	raised		= false;
};

struct StationAlertState
{
	bool							firstMeasurement	= true;
	bool							wasUp				= false;
	ptime							lowRateSince;
	map<E_AlertKind, AlertKindState>	kinds;
};

vector<AlertEvent> evaluateAlerts(
	StationAlertState&		state,
	const AlertSample&		sample,
	const AlertOptions&		options,
	ptime					now);

struct AlertEvaluator
{
	AlertOptions	options;

	AlertEvaluator(
		const AlertOptions& options = AlertOptions())
	:	options	(options)
	{

	}

	vector<AlertEvent> evaluate(
		const AlertSample&	sample,
		ptime				now);

	void removeStation(
		const string& stationId);

	const StationAlertState* alertState(
		const string& stationId) const;

private:
	map<string, StationAlertState>	stations;
};

#endif
