#include <catch2/catch.hpp>
#include "catchOptional.hpp"

#include "alertEvaluator.hpp"

using boost::posix_time::milliseconds;
using boost::posix_time::minutes;
using boost::posix_time::seconds;


ptime alertEpoch()
{
	return boost::posix_time::time_from_string("2024-03-01 06:00:00.000");
}

AlertSample upSample(
	ptime	started,
	double	byteRate = 1000)
{
	AlertSample sample;
	sample.stationId	= "ALIC00AUS0";
	sample.up			= true;
	sample.startedTime	= started;
	sample.byteRate		= byteRate;
	return sample;
}

AlertSample downSample(
	ptime started)
{
	AlertSample sample = upSample(started, 0);
	sample.up = false;
	return sample;
}

int countKind(
	const vector<AlertEvent>&	events,
	E_AlertKind					kind)
{
	int count = 0;
	for (auto& event : events)
	{
		if (event.kind == kind)
		{
			count++;
		}
	}
	return count;
}

TEST_CASE("connection alerts")
{
	ptime t0 = alertEpoch();

	AlertEvaluator evaluator;

	SECTION("first measurement never raises anything")
	{
		auto events = evaluator.evaluate(upSample(t0 - minutes(10)), t0);

		REQUIRE(events.empty());
	}

	SECTION("lost and restored fire on transitions only")
	{
		ptime started = t0 - minutes(1);

		evaluator.evaluate(upSample(started), t0);

		auto lost = evaluator.evaluate(downSample(started), t0 + seconds(1));
		REQUIRE(lost.size() == 1);
		REQUIRE(lost[0].kind == E_AlertKind::CONNECTION_LOST);
		REQUIRE(lost[0].stationId == "ALIC00AUS0");

		REQUIRE(evaluator.evaluate(downSample(started), t0 + seconds(2)).empty());
		REQUIRE(evaluator.evaluate(downSample(started), t0 + seconds(3)).empty());

		auto restored = evaluator.evaluate(upSample(started), t0 + seconds(4));
		REQUIRE(restored.size() == 1);
		REQUIRE(restored[0].kind == E_AlertKind::CONNECTION_RESTORED);

		REQUIRE(evaluator.evaluate(upSample(started), t0 + seconds(5)).empty());
	}

	SECTION("nothing fires during the startup grace period")
	{
		ptime started = t0;

		evaluator.evaluate(upSample(started),	t0 + seconds(1));

		REQUIRE(evaluator.evaluate(downSample(started),	t0 + seconds(5)).empty());
		REQUIRE(evaluator.evaluate(upSample(started),	t0 + seconds(8)).empty());

		// past the grace period
		REQUIRE(countKind(evaluator.evaluate(downSample(started), t0 + seconds(16)), E_AlertKind::CONNECTION_LOST) == 1);
	}

	SECTION("restored needs a raised connection lost")
	{
		ptime started = t0 - minutes(1);

		evaluator.evaluate(downSample(started), t0);

		REQUIRE(evaluator.evaluate(upSample(started), t0 + seconds(1)).empty());
	}

	SECTION("flapping connection is throttled by the cooldown")
	{
		ptime started = t0 - minutes(1);

		evaluator.evaluate(upSample(started), t0);

		int numLost		= 0;
		int numRestored	= 0;
		for (int i = 1; i <= 120; i++)
		{
			ptime now = t0 + seconds(5 * i);

			AlertSample sample = (i % 2) ? downSample(started) : upSample(started);

			auto events = evaluator.evaluate(sample, now);
			numLost		+= countKind(events, E_AlertKind::CONNECTION_LOST);
			numRestored	+= countKind(events, E_AlertKind::CONNECTION_RESTORED);
		}

		REQUIRE(numLost		== 2);
		REQUIRE(numRestored	== 2);
	}
}

TEST_CASE("data rate alerts")
{
	ptime t0 = alertEpoch();

	AlertEvaluator evaluator;

	ptime started = t0 - minutes(1);

	evaluator.evaluate(upSample(started), t0);

	SECTION("a single low sample does not fire")
	{
		REQUIRE(evaluator.evaluate(upSample(started, 10),	t0 + seconds(1)).empty());
		REQUIRE(evaluator.evaluate(upSample(started, 1000),	t0 + seconds(2)).empty());
	}

	SECTION("sustained low rate fires once")
	{
		int numLow = 0;
		for (int i = 1; i <= 60; i++)
		{
			numLow += countKind(evaluator.evaluate(upSample(started, 10), t0 + seconds(i)), E_AlertKind::LOW_DATA_RATE);

			// low since i == 1
			if (i == 30)	REQUIRE(numLow == 0);
			if (i == 31)	REQUIRE(numLow == 1);
		}

		REQUIRE(numLow == 1);
	}

	SECTION("rate oscillating every 5 seconds for 10 minutes fires at most twice")
	{
		int numLow = 0;
		for (int i = 1; i <= 600; i++)
		{
			double rate = ((i / 5) % 2) ? 10 : 1000;

			numLow += countKind(evaluator.evaluate(upSample(started, rate), t0 + seconds(i)), E_AlertKind::LOW_DATA_RATE);
		}

		REQUIRE(numLow <= 2);
	}

	SECTION("oscillation with a short window is bounded by the cooldown")
	{
		evaluator.options.lowRateWindow = seconds(0);

		int numLow = 0;
		for (int i = 1; i <= 600; i++)
		{
			double rate = ((i / 5) % 2) ? 10 : 1000;

			numLow += countKind(evaluator.evaluate(upSample(started, rate), t0 + seconds(i)), E_AlertKind::LOW_DATA_RATE);
		}

		REQUIRE(numLow == 2);
	}

	SECTION("a down station has no rate alert")
	{
		for (int i = 1; i <= 60; i++)
		{
			auto events = evaluator.evaluate(downSample(started), t0 + seconds(i));

			REQUIRE(countKind(events, E_AlertKind::LOW_DATA_RATE) == 0);
		}
	}
}

TEST_CASE("satellite alerts")
{
	ptime t0 = alertEpoch();

	AlertEvaluator evaluator;

	ptime started = t0 - minutes(1);

	AlertSample sample = upSample(started);
	evaluator.evaluate(sample, t0);

	SECTION("no alert until a satellite interval is available")
	{
		sample.satelliteCount = 0;

		REQUIRE(evaluator.evaluate(sample, t0 + seconds(1)).empty());
	}

	SECTION("few satellites fire once until recovered")
	{
		sample.satellitesValid	= true;
		sample.satelliteCount	= 3;

		REQUIRE(countKind(evaluator.evaluate(sample, t0 + seconds(1)), E_AlertKind::LOW_SATELLITES) == 1);
		REQUIRE(evaluator.evaluate(sample, t0 + seconds(2)).empty());

		sample.satelliteCount	= 12;
		REQUIRE(evaluator.evaluate(sample, t0 + seconds(3)).empty());

		REQUIRE(evaluator.alertState("ALIC00AUS0")->kinds.at(E_AlertKind::LOW_SATELLITES).raised == false);

		// cleared but still cooling down
		sample.satelliteCount	= 2;
		REQUIRE(evaluator.evaluate(sample, t0 + seconds(4)).empty());

		sample.satelliteCount	= 12;
		evaluator.evaluate(sample, t0 + seconds(5));

		sample.satelliteCount	= 2;
		REQUIRE(countKind(evaluator.evaluate(sample, t0 + minutes(6)), E_AlertKind::LOW_SATELLITES) == 1);
	}
}

TEST_CASE("alert samples from statistics")
{
	StationStatistics stats;
	stats.stationId					= "ALIC00AUS0";
	stats.session.phase				= E_SessionPhase::IDLE_WARNING;
	stats.lastIntervalValid			= true;
	stats.lastIntervalSatellites[E_Sys::GPS]	= {1, 2, 3};
	stats.lastIntervalSatellites[E_Sys::GAL]	= {4};

	AlertSample sample = AlertSample::fromStatistics(stats);

	REQUIRE(sample.stationId		== "ALIC00AUS0");
	REQUIRE(sample.up);
	REQUIRE(sample.satellitesValid);
	REQUIRE(sample.satelliteCount	== 4);
	REQUIRE(sample.byteRate			== 0);
}
