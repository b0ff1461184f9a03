#include <sstream>
#include <fstream>

#include <catch2/catch.hpp>
#include "catchOptional.hpp"

#include <boost/filesystem.hpp>
#include <boost/log/trivial.hpp>

#include "ntripTrace.hpp"
#include "fileLog.hpp"

using boost::posix_time::minutes;
using boost::posix_time::seconds;


TEST_CASE("json file log")
{
	auto path = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("casterwatch-log-%%%%-%%%%.json");

	auto sink = addFileLog(path.string());
	REQUIRE(sink != nullptr);

	BOOST_LOG_TRIVIAL(warning)
	<< "Disconnected caster.example.com:2101 MOUNT (IdleTimeout)";

	boost::log::core::get()->remove_sink(sink);
	sink.reset();

	std::ifstream input(path.string());
	std::stringstream contents;
	contents << input.rdbuf();
	string log = contents.str();

	boost::filesystem::remove(path);

	REQUIRE(log.find("\"label\":\"message\"")		!= string::npos);
	REQUIRE(log.find("\"level\":\"2\"")				!= string::npos);
	REQUIRE(log.find("\"severity\":\"warning\"")		!= string::npos);
	REQUIRE(log.find("(IdleTimeout)")				!= string::npos);

	SECTION("unwritable files are refused")
	{
		REQUIRE(addFileLog("/nonexistent/directory/log.json") == nullptr);
	}
}

TEST_CASE("network statistics")
{
	ptime t0 = boost::posix_time::time_from_string("2024-03-01 00:00:00.000");

	NetworkDataDownload networkData;
	networkData.streamName	= "ALIC00AUS0";
	networkData.startTime	= t0;

	SECTION("a stream that never dropped is fully connected")
	{
		networkData.numberChunks = 10;

		REQUIRE(networkData.connectedRatio(t0 + minutes(10)) == Approx(1));
		REQUIRE(networkData.meanDowntime() == 0);
	}

	SECTION("ratios follow the counters")
	{
		networkData.numberChunks			= 10;
		networkData.disconnectionCount		= 2;
		networkData.connectedDuration		= minutes(6);
		networkData.disconnectedDuration	= minutes(4);
		networkData.numPreambleFound		= 100;
		networkData.numFramesFailedCRC		= 5;

		REQUIRE(networkData.connectedRatio(t0 + minutes(10))	== Approx(0.6));
		REQUIRE(networkData.meanDowntime()						== Approx(2));
		REQUIRE(networkData.failedCrcRatio()					== Approx(0.05));

		std::stringstream trace;
		REQUIRE(networkData.printNetworkStatistics(trace, t0 + minutes(10)));
		REQUIRE(trace.str().find("Disconnects     : 2") != string::npos);

		string json = networkData.getJsonNetworkStatistics(t0 + minutes(10), "networkStatistics");
		REQUIRE(json.find("\"label\":\"networkStatistics\"")	!= string::npos);
		REQUIRE(json.find("\"Stream\":\"ALIC00AUS0\"")			!= string::npos);
		REQUIRE(json.find("\"RtcmFailCrc\":\"5\"")				!= string::npos);
	}

	SECTION("scan counts accumulate")
	{
		FrameScanCounts counts;
		counts.numPreambleFound		= 4;
		counts.numFramesPassCRC		= 3;
		counts.numFramesFailedCRC	= 1;
		counts.numNonMessBytes		= 7;

		networkData.accumulateScanCounts(counts);
		networkData.accumulateScanCounts(counts);

		REQUIRE(networkData.numPreambleFound	== 8);
		REQUIRE(networkData.numFramesPassCRC	== 6);
		REQUIRE(networkData.numFramesFailedCRC	== 2);
		REQUIRE(networkData.numNonMessBytes		== 14);
	}
}
