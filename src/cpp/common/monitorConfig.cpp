
#include <fstream>
#include <sstream>
#include <set>

#define BOOST_BIND_GLOBAL_PLACEHOLDERS

#include <boost/property_tree/json_parser.hpp>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

using boost::property_tree::ptree;

namespace po = boost::program_options;

#include "monitorConfig.hpp"
#include "sourcetable.hpp"


MonitorConfig monConfig;

#define MAX_READ_BUFFER_SIZE	1048576


/** Set an output from a tree node if the node exists.
* Returns false only when the node exists but cannot be converted
*/
template<typename TYPE>
bool trySetFromTree(
	TYPE&			output,
	const ptree&	tree,
	const string&	key)
{
	auto node = tree.get_child_optional(key);
	if (node == boost::none)
	{
		return true;
	}

	auto value = node->get_value_optional<TYPE>();
	if (value == boost::none)
	{
		BOOST_LOG_TRIVIAL(error)
		<< "Invalid value for " << key << " : '" << node->data() << "'";

		return false;
	}

	output = *value;
	return true;
}

bool trySetDuration(
	time_duration&	output,
	const ptree&	tree,
	const string&	key)
{
	double seconds = output.total_milliseconds() / 1000.0;

	if (trySetFromTree(seconds, tree, key) == false)
	{
		return false;
	}

	if (seconds < 0)
	{
		BOOST_LOG_TRIVIAL(error)
		<< "Negative duration for " << key;

		return false;
	}

	output = boost::posix_time::milliseconds((long int) (seconds * 1000));
	return true;
}

bool trySetPositiveDuration(
	time_duration&	output,
	const ptree&	tree,
	const string&	key)
{
	if (trySetDuration(output, tree, key) == false)
	{
		return false;
	}

	if (output.total_milliseconds() <= 0)
	{
		BOOST_LOG_TRIVIAL(error)
		<< "Duration for " << key << " must be positive";

		return false;
	}

	return true;
}

bool tryGetOptional(
	boost::optional<double>&	output,
	const ptree&				tree,
	const string&				key)
{
	double value = 0;
	if (tree.get_child_optional(key) == boost::none)
	{
		return true;
	}

	if (trySetFromTree(value, tree, key) == false)
	{
		return false;
	}

	output = value;
	return true;
}

bool parseStation(
	StationConfig&	station,
	const ptree&	node)
{
	bool pass = true;

	pass &= trySetFromTree(station.id,			node, "id");
	pass &= trySetFromTree(station.host,		node, "host");
	pass &= trySetFromTree(station.port,		node, "port");
	pass &= trySetFromTree(station.mountpoint,	node, "mountpoint");
	pass &= trySetFromTree(station.username,	node, "username");
	pass &= trySetFromTree(station.password,	node, "password");
	pass &= tryGetOptional(station.latitude,	node, "latitude");
	pass &= tryGetOptional(station.longitude,	node, "longitude");
	pass &= tryGetOptional(station.height,		node, "height");

	if (station.mountpoint.empty())
	{
		BOOST_LOG_TRIVIAL(error)
		<< "Station '" << station.id << "' has no mountpoint";

		pass = false;
	}

	if (station.id.empty())
	{
		station.id = station.mountpoint;
	}

	if (station.host.empty())
	{
		BOOST_LOG_TRIVIAL(error)
		<< "Station '" << station.id << "' has no host";

		pass = false;
	}

	if	( station.port <= 0
		||station.port > 65535)
	{
		BOOST_LOG_TRIVIAL(error)
		<< "Station '" << station.id << "' has invalid port " << station.port;

		pass = false;
	}

	return pass;
}

/** Add a station for every mountpoint of a saved sourcetable, unless a station with that id is already configured
*/
bool parseSourcetableFile(
	vector<StationConfig>&	stations,
	std::set<string>&		ids,
	const ptree&			node)
{
	string	file;
	string	host;
	int		port		= 2101;
	string	username;
	string	password;

	bool pass = true;
	pass &= trySetFromTree(file,		node, "file");
	pass &= trySetFromTree(host,		node, "host");
	pass &= trySetFromTree(port,		node, "port");
	pass &= trySetFromTree(username,	node, "username");
	pass &= trySetFromTree(password,	node, "password");

	if (pass == false)
	{
		return false;
	}

	if	( file.empty()
		||host.empty())
	{
		BOOST_LOG_TRIVIAL(error)
		<< "Sourcetable entries need a file and a host";

		return false;
	}

	std::ifstream input(file);
	if (!input)
	{
		BOOST_LOG_TRIVIAL(error)
		<< "Unable to open sourcetable file " << file;

		return false;
	}

	std::stringstream contents;
	contents << input.rdbuf();

	int numAdded = 0;
	for (auto& record : parseSourcetable(contents.str()))
	{
		if (ids.insert(record.mountpoint).second == false)
		{
			continue;
		}

		stations.push_back(toStationConfig(record, host, port, username, password));
		numAdded++;
	}

	BOOST_LOG_TRIVIAL(info)
	<< "Added " << numAdded << " stations from sourcetable " << file;

	return true;
}

bool MonitorConfig::parseTree(
	const ptree& tree)
{
	MonitorConfig parsed;
	parsed.config_filename	= config_filename;
	parsed.cli_trace_level	= cli_trace_level;
	parsed.cli_log_filename	= cli_log_filename;
	parsed.run_once			= run_once;
	parsed.run_seconds		= run_seconds;

	bool pass = true;

	std::set<string> ids;

	auto stationsNode = tree.get_child_optional("stations");
	if (stationsNode)
	{
		for (auto& [key, node] : *stationsNode)
		{
			StationConfig station;
			if (parseStation(station, node) == false)
			{
				pass = false;
				continue;
			}

			if (ids.insert(station.id).second == false)
			{
				BOOST_LOG_TRIVIAL(error)
				<< "Duplicate station id '" << station.id << "'";

				pass = false;
				continue;
			}

			parsed.stations.push_back(station);
		}
	}

	auto sourcetablesNode = tree.get_child_optional("sourcetables");
	if (sourcetablesNode)
	{
		for (auto& [key, node] : *sourcetablesNode)
		{
			pass &= parseSourcetableFile(parsed.stations, ids, node);
		}
	}

	ptree empty;

	auto& session = tree.get_child("session", empty);
	{
		auto& opts = parsed.sessionOpts;
		long int readBufferSize = opts.readBufferSize;

		pass &= trySetPositiveDuration(opts.handshakeTimeout,	session, "handshake_timeout");
		pass &= trySetPositiveDuration(opts.idleWarning,		session, "idle_warning");
		pass &= trySetPositiveDuration(opts.idleTimeout,		session, "idle_timeout");
		pass &= trySetPositiveDuration(opts.watchdogInterval,	session, "watchdog_interval");
		pass &= trySetFromTree(readBufferSize,					session, "read_buffer_size");
		pass &= trySetFromTree(opts.userAgent,					session, "user_agent");

		if	( readBufferSize <= 0
			||readBufferSize > MAX_READ_BUFFER_SIZE)
		{
			BOOST_LOG_TRIVIAL(error)
			<< "session.read_buffer_size must be between 1 and " << MAX_READ_BUFFER_SIZE;

			pass = false;
		}
		else
		{
			opts.readBufferSize = readBufferSize;
		}

		if (opts.idleWarning >= opts.idleTimeout)
		{
			BOOST_LOG_TRIVIAL(warning)
			<< "session.idle_warning is not shorter than session.idle_timeout, idle warnings will not be seen";
		}
	}

	auto& reconnect = tree.get_child("reconnect", empty);
	{
		pass &= trySetFromTree(parsed.reconnectOpts.maxAttempts,	reconnect, "max_attempts");
		pass &= trySetDuration(parsed.reconnectOpts.delay,			reconnect, "delay");

		if (parsed.reconnectOpts.maxAttempts < 0)
		{
			BOOST_LOG_TRIVIAL(error)
			<< "reconnect.max_attempts must not be negative";

			pass = false;
		}
	}

	auto& statistics = tree.get_child("statistics", empty);
	{
		auto& opts = parsed.statisticsOpts;
		pass &= trySetPositiveDuration(opts.rateWindow,			statistics, "rate_window");
		pass &= trySetPositiveDuration(opts.satelliteInterval,		statistics, "satellite_interval");
		pass &= trySetFromTree(opts.resetCountsOnReconnect,		statistics, "reset_counts_on_reconnect");
		pass &= trySetPositiveDuration(parsed.update_interval,		statistics, "update_interval");
	}

	auto& alerts = tree.get_child("alerts", empty);
	{
		auto& opts = parsed.alertOpts;
		pass &= trySetDuration(opts.startupGrace,			alerts, "startup_grace");
		pass &= trySetFromTree(opts.lowRateThreshold,		alerts, "low_rate_threshold");
		pass &= trySetDuration(opts.lowRateWindow,			alerts, "low_rate_window");
		pass &= trySetFromTree(opts.lowSatelliteThreshold,	alerts, "low_satellite_threshold");
		pass &= trySetDuration(opts.cooldown,				alerts, "cooldown");
	}

	auto& output = tree.get_child("output", empty);
	{
		pass &= trySetFromTree(parsed.output_log,				output, "output_log");
		pass &= trySetFromTree(parsed.log_filename,				output, "log_filename");
		pass &= trySetFromTree(parsed.trace_level,				output, "trace_level");
		pass &= trySetFromTree(parsed.print_stream_statistics,	output, "print_stream_statistics");
		pass &= trySetDuration(parsed.statistics_interval,		output, "statistics_interval");
		pass &= trySetFromTree(parsed.output_mongo_statistics,	output, "output_mongo_statistics");
		pass &= trySetFromTree(parsed.mongo_uri,				output, "mongo_uri");
		pass &= trySetFromTree(parsed.mongo_database,			output, "mongo_database");
	}

	if (pass == false)
	{
		return false;
	}

	parsed.applyOverrides();

	*this = parsed;
	return true;
}

bool MonitorConfig::parse(
	std::istream& input)
{
	ptree tree;
	try
	{
		boost::property_tree::read_json(input, tree);
	}
	catch (boost::property_tree::json_parser_error& e)
	{
		BOOST_LOG_TRIVIAL(error)
		<< "Error parsing configuration : " << e.what();

		return false;
	}

	return parseTree(tree);
}

bool MonitorConfig::parse(
	const string& filename)
{
	if (boost::filesystem::exists(filename) == false)
	{
		BOOST_LOG_TRIVIAL(error)
		<< "Configuration file " << filename << " does not exist";

		return false;
	}

	std::ifstream input(filename);
	if (!input)
	{
		BOOST_LOG_TRIVIAL(error)
		<< "Unable to open configuration file " << filename;

		return false;
	}

	config_filename = filename;

	return parse(input);
}

/** Command line values win over the configuration file
*/
void MonitorConfig::applyOverrides()
{
	if (cli_trace_level)	trace_level		= *cli_trace_level;
	if (cli_log_filename)
	{
		log_filename	= *cli_log_filename;
		output_log		= true;
	}

	sessionOpts.traceLevel = trace_level;

	if (output_log)		sessionOpts.logFilename = log_filename;
	else				sessionOpts.logFilename.clear();
}

boost::log::trivial::severity_level MonitorConfig::severity() const
{
	if (trace_level >= 5)	return boost::log::trivial::trace;
	if (trace_level >= 4)	return boost::log::trivial::debug;
	else					return boost::log::trivial::info;
}

StationChanges diffStations(
	const vector<StationConfig>&	previous,
	const vector<StationConfig>&	current)
{
	StationChanges changes;

	map<string, const StationConfig*> previousMap;
	for (auto& station : previous)
	{
		previousMap[station.id] = &station;
	}

	std::set<string> currentIds;
	for (auto& station : current)
	{
		currentIds.insert(station.id);

		auto it = previousMap.find(station.id);
		if (it == previousMap.end())
		{
			changes.added.push_back(station);
			continue;
		}

		const StationConfig& old = *it->second;
		if	( old.sameEndpoint(station)	== false
			||old.latitude				!= station.latitude
			||old.longitude				!= station.longitude
			||old.height				!= station.height)
		{
			changes.updated.push_back(station);
		}
	}

	for (auto& station : previous)
	{
		if (currentIds.count(station.id) == 0)
		{
			changes.removed.push_back(station.id);
		}
	}

	return changes;
}

/** Read the command line and the configuration file it names into monConfig
*/
bool configure(
	int		argc,
	char**	argv)
{
	po::options_description desc("casterwatch options");
	desc.add_options()
		("help,h",													"Help screen")
		("config,c",		po::value<string>(),					"Configuration file")
		("trace_level",		po::value<int>(),						"Trace level, 4 enables debug output and 5 trace output")
		("log_filename",	po::value<string>(),					"JSON log file, enables file logging")
		("once",													"Run for run_seconds then shut down")
		("run_seconds",		po::value<double>()->default_value(60),	"Duration of a --once run");

	po::variables_map vm;
	try
	{
		po::store(po::parse_command_line(argc, argv, desc), vm);
		po::notify(vm);
	}
	catch (po::error& e)
	{
		BOOST_LOG_TRIVIAL(error)
		<< e.what();

		return false;
	}

	if (vm.count("help"))
	{
		BOOST_LOG_TRIVIAL(info)
		<< desc;

		exit(EXIT_SUCCESS);
	}

	if (vm.count("config") == 0)
	{
		BOOST_LOG_TRIVIAL(error)
		<< "No configuration file given, use --config";

		return false;
	}

	if (vm.count("trace_level"))	monConfig.cli_trace_level	= vm["trace_level"]	.as<int>();
	if (vm.count("log_filename"))	monConfig.cli_log_filename	= vm["log_filename"].as<string>();

	monConfig.run_once		= vm.count("once") > 0;
	monConfig.run_seconds	= boost::posix_time::milliseconds((long int) (vm["run_seconds"].as<double>() * 1000));

	string filename = vm["config"].as<string>();

	BOOST_LOG_TRIVIAL(info)
	<< "Loading configuration from file " << filename;

	return monConfig.parse(filename);
}
