#ifndef MONITOR_CONFIG_H
#define MONITOR_CONFIG_H

#include <iostream>
#include <string>
#include <vector>

using std::string;
using std::vector;

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/log/trivial.hpp>
#include <boost/optional.hpp>

#include "streamStatistics.hpp"
#include "reconnectPolicy.hpp"
#include "alertEvaluator.hpp"
#include "stationConfig.hpp"
#include "ntripSession.hpp"


/** Stations added, changed or removed between two versions of the configuration
*/
struct StationChanges
{
	vector<StationConfig>	added;
	vector<StationConfig>	updated;
	vector<string>			removed;

	bool empty() const
	{
		return added.empty() && updated.empty() && removed.empty();
	}
};

StationChanges diffStations(
	const vector<StationConfig>&	previous,
	const vector<StationConfig>&	current);

struct MonitorConfig
{
	string					config_filename;

	vector<StationConfig>	stations;

	SessionOptions			sessionOpts;
	ReconnectPolicy			reconnectOpts;
	StatisticsOptions		statisticsOpts;
	AlertOptions			alertOpts;

	time_duration			update_interval			= boost::posix_time::seconds(1);

	bool					output_log				= false;
	string					log_filename			= "casterwatch.json";
	int						trace_level				= 0;
	bool					print_stream_statistics	= false;
	time_duration			statistics_interval		= boost::posix_time::seconds(60);

	bool					output_mongo_statistics	= false;
	string					mongo_uri				= "mongodb://localhost:27017";
	string					mongo_database			= "casterwatch";

	bool					run_once				= false;
	time_duration			run_seconds				= boost::posix_time::seconds(60);

	boost::optional<int>	cli_trace_level;
	boost::optional<string>	cli_log_filename;

	bool parse(
		const string& filename);

	bool parse(
		std::istream& input);

	bool parseTree(
		const boost::property_tree::ptree& tree);

	void applyOverrides();

	boost::log::trivial::severity_level severity() const;
};

extern MonitorConfig monConfig;

bool configure(
	int		argc,
	char**	argv);

#endif
