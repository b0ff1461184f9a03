
#include <iostream>
#include <sstream>
#include <fstream>
#include <atomic>
#include <thread>
#include <string>

using std::string;

#define BOOST_BIND_GLOBAL_PLACEHOLDERS

#include <boost/log/utility/setup/console.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/filesystem.hpp>
#include <boost/asio.hpp>

#include "sessionSupervisor.hpp"
#include "streamStatistics.hpp"
#include "alertEvaluator.hpp"
#include "monitorConfig.hpp"
#include "rtcmDecoder.hpp"
#include "ntripTrace.hpp"
#include "fileLog.hpp"
#include "mongo.hpp"


std::atomic<bool> keepRunning {true};

std::time_t configModifyTime = 0;


bool fileChanged(
	string filename)
{
	boost::system::error_code ec;
	auto modifyTime = boost::filesystem::last_write_time(filename, ec);
	if (ec)
	{
		return false;
	}

	if (modifyTime == configModifyTime)
	{
		return false;
	}

	configModifyTime = modifyTime;
	return true;
}

/** Apply a changed configuration file to the running stations
*/
void reloadConfiguration(
	SessionSupervisor&		supervisor,
	StatisticsAggregator&	aggregator,
	AlertEvaluator&			alertEvaluator)
{
	MonitorConfig newConfig = monConfig;
	bool pass = newConfig.parse(monConfig.config_filename);
	if (pass == false)
	{
		BOOST_LOG_TRIVIAL(error)
		<< "Configuration file changed but could not be read, keeping previous stations";

		return;
	}

	StationChanges changes = diffStations(monConfig.stations, newConfig.stations);

	monConfig.stations = newConfig.stations;

	if (changes.empty())
	{
		return;
	}

	BOOST_LOG_TRIVIAL(info)
	<< "Configuration changed, " << changes.added.size() << " added, " << changes.updated.size() << " updated, " << changes.removed.size() << " removed";

	for (auto& id : changes.removed)
	{
		supervisor		.removeStation(id);
		aggregator		.removeStation(id);
		alertEvaluator	.removeStation(id);
	}

	for (auto& station : changes.updated)	supervisor.updateStation(station);
	for (auto& station : changes.added)		supervisor.addStation(station);
}

/** Move everything the sessions produced since the last epoch through the statistics and the alerts
*/
void monitorEpoch(
	SessionSupervisor&		supervisor,
	StatisticsAggregator&	aggregator,
	AlertEvaluator&			alertEvaluator,
	ptime					now)
{
	for (auto& [id, state] : supervisor.snapshot())
	{
		aggregator.applySession(state, now);
	}

	for (auto& [id, updates] : supervisor.takeUpdates())
	for (auto& update : updates)
	{
		aggregator.applyUpdate(id, update, now);
	}

	aggregator.tick(now);

	for (auto& [id, stats] : aggregator.allStatistics())
	{
		auto events = alertEvaluator.evaluate(AlertSample::fromStatistics(stats), now);

		for (auto& event : events)
		{
			BOOST_LOG_TRIVIAL(warning)
			<< "ALERT " << alertName(event.kind) << " - " << event.message;
		}
	}
}

void outputStatistics(
	SessionSupervisor&		supervisor,
	StatisticsAggregator&	aggregator,
	ptime					now)
{
	for (auto& [id, stats] : aggregator.allStatistics())
	{
		auto session = supervisor.session(id);
		if	( session
			&&monConfig.trace_level >= 3)
		{
			session->ntripTrace.traceWriteEpoch(std::cout);
		}

		NetworkDataDownload networkData = stats.networkData;

		if (monConfig.output_log)
		{
			std::ofstream logStream(monConfig.log_filename, std::ofstream::app);
			if (logStream)
			{
				logStream << networkData.getJsonNetworkStatistics(now, "networkStatistics");
			}
		}

		if (monConfig.print_stream_statistics)
		{
			std::stringstream trace;
			bool unhealthy = networkData.printNetworkStatistics(trace, now);

			BOOST_LOG_TRIVIAL(info)
			<< "Station " << id << " " << phaseName(stats.session.phase)
			<< ", " << stats.byteRate() << " B/s, " << stats.totalMessages() << " messages, "
			<< stats.satelliteCount() << " satellites, up " << stats.uptime;

			if (unhealthy)
			{
				std::cout << trace.str() << std::endl;
			}

			for (auto& [messageType, typeCount] : stats.messageCounts)
			{
				BOOST_LOG_TRIVIAL(debug)
				<< "  " << messageType << " x" << typeCount.count
				<< " last " << timeString(typeCount.lastSeen)
				<< " : " << RtcmDecoder::messageDescription(messageType);
			}

			for (auto& [sys, sats] : stats.satellites)
			{
				BOOST_LOG_TRIVIAL(debug)
				<< "  " << sysName(sys) << " " << sats.size() << " satellites : "
				<< RtcmDecoder::constellationDescription(sys);
			}
		}

#		ifdef ENABLE_MONGODB
		if (monConfig.output_mongo_statistics)
		{
			mongoStationStatistics(stats, now);
		}
#		endif
	}
}

int main(
	int		argc,
	char**	argv)
{
	boost::log::core::get()->set_filter (boost::log::trivial::severity >= boost::log::trivial::info);
	boost::log::add_console_log(std::cout, boost::log::keywords::format = "%Message%");

	BOOST_LOG_TRIVIAL(info)
	<< "casterwatch starting...";

	bool pass = configure(argc, argv);
	if (pass == false)
	{
		BOOST_LOG_TRIVIAL(error) 	<< "Incorrect configuration";
		BOOST_LOG_TRIVIAL(info) 	<< "casterwatch finished";
		return EXIT_FAILURE;
	}

	boost::log::core::get()->set_filter (boost::log::trivial::severity >= monConfig.severity());

	if	( monConfig.output_log
		&&addFileLog(monConfig.log_filename) == nullptr)
	{
		BOOST_LOG_TRIVIAL(info) 	<< "casterwatch finished";
		return EXIT_FAILURE;
	}

	fileChanged(monConfig.config_filename);

	BOOST_LOG_TRIVIAL(info)
	<< "Logging with trace level:" << monConfig.trace_level;

#	ifdef ENABLE_MONGODB
	if (monConfig.output_mongo_statistics)
	{
		mongoInit(monConfig.mongo_uri, monConfig.mongo_database);
	}
#	endif

	boost::asio::io_context signalService;
	boost::asio::signal_set signals(signalService, SIGINT, SIGTERM);
	signals.async_wait([](const boost::system::error_code& err, int signalNumber)
	{
		if (err)
			return;

		BOOST_LOG_TRIVIAL(info)
		<< "Received signal " << signalNumber << ", shutting down";

		keepRunning = false;
	});
	std::thread signalThread([&signalService]
	{
		signalService.run();
	});

	RtcmDecoder				decoder;
	StatisticsAggregator	aggregator		(decoder, monConfig.statisticsOpts);
	AlertEvaluator			alertEvaluator	(monConfig.alertOpts);
	SessionSupervisor		supervisor		(monConfig.sessionOpts, monConfig.reconnectOpts);

	supervisor.stateListener = [](const SessionState& state)
	{
		BOOST_LOG_TRIVIAL(debug)
		<< "Station " << state.stationId << " now " << phaseName(state.phase);
	};

	for (auto& station : monConfig.stations)
	{
		supervisor.addStation(station);
	}

	ptime startTime			= timeNow();
	ptime lastStatistics	= startTime;

	while (keepRunning)
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(monConfig.update_interval.total_milliseconds()));

		ptime now = timeNow();

		if (fileChanged(monConfig.config_filename))
		{
			reloadConfiguration(supervisor, aggregator, alertEvaluator);
		}

		monitorEpoch(supervisor, aggregator, alertEvaluator, now);

		if (now - lastStatistics >= monConfig.statistics_interval)
		{
			outputStatistics(supervisor, aggregator, now);
			lastStatistics = now;
		}

		if	( monConfig.run_once
			&&now - startTime >= monConfig.run_seconds)
		{
			break;
		}
	}

	outputStatistics(supervisor, aggregator, timeNow());

	bool clean = supervisor.shutdown(boost::posix_time::seconds(2));

	signals.cancel();
	signalService.stop();
	signalThread.join();

	BOOST_LOG_TRIVIAL(info)
	<< "casterwatch finished";

	if (clean == false)
	{
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
