#include <catch2/catch.hpp>
#include "catchOptional.hpp"

#include "rtcmDecoder.hpp"
#include "testFrames.hpp"


RawFrame toRawFrame(
	const vector<uint8_t>& bytes)
{
	RawFrame frame;
	frame.bytes = bytes;
	return frame;
}

TEST_CASE("msm message numbers")
{
	REQUIRE(RtcmDecoder::isMsm(1071));
	REQUIRE(RtcmDecoder::isMsm(1077));
	REQUIRE(RtcmDecoder::isMsm(1127));
	REQUIRE_FALSE(RtcmDecoder::isMsm(1070));
	REQUIRE_FALSE(RtcmDecoder::isMsm(1078));
	REQUIRE_FALSE(RtcmDecoder::isMsm(1005));
	REQUIRE_FALSE(RtcmDecoder::isMsm(1230));

	REQUIRE(RtcmDecoder::msmSystem(1074) == E_Sys::GPS);
	REQUIRE(RtcmDecoder::msmSystem(1087) == E_Sys::GLO);
	REQUIRE(RtcmDecoder::msmSystem(1097) == E_Sys::GAL);
	REQUIRE(RtcmDecoder::msmSystem(1107) == E_Sys::SBS);
	REQUIRE(RtcmDecoder::msmSystem(1117) == E_Sys::QZS);
	REQUIRE(RtcmDecoder::msmSystem(1127) == E_Sys::BDS);
	REQUIRE(RtcmDecoder::msmSystem(1005) == E_Sys::NONE);
}

TEST_CASE("signal names")
{
	REQUIRE(RtcmDecoder::signalName(E_Sys::GPS, 2)	== "L1 P(Y)");
	REQUIRE(RtcmDecoder::signalName(E_Sys::GAL, 4)	== "E5a I");
	REQUIRE(RtcmDecoder::signalName(E_Sys::GPS, 30)	== "Signal 30");
}

TEST_CASE("message and constellation descriptions")
{
	REQUIRE(RtcmDecoder::messageDescription(1005)	== "Station coordinates (stationary RTK reference station)");
	REQUIRE(RtcmDecoder::messageDescription(1077)	== "GPS MSM7 - Full pseudoranges, phase ranges, phase range rate, and CNR (high resolution)");
	REQUIRE(RtcmDecoder::messageDescription(1124)	== "BeiDou MSM4 - Full pseudoranges and phase ranges");
	REQUIRE(RtcmDecoder::messageDescription(1081)	== "GLONASS MSM1 - Compact pseudoranges");
	REQUIRE(RtcmDecoder::messageDescription(4094)	== "RTCM correction data");

	REQUIRE(RtcmDecoder::constellationDescription(E_Sys::QZS).find("Japan")	!= string::npos);
	REQUIRE(RtcmDecoder::constellationDescription(E_Sys::NONE)				== "GNSS satellite constellation");
}

TEST_CASE("frame decoding")
{
	RtcmDecoder decoder;
	string error;

	SECTION("non msm message has a type and no satellites")
	{
		auto decoded = decoder.decode(toRawFrame(makeMessage(1005)), error);

		REQUIRE(decoded);
		REQUIRE(decoded->messageType == 1005);
		REQUIRE(decoded->hasSatellites() == false);
		REQUIRE(error.empty());
	}

	SECTION("msm message yields its satellites and signals")
	{
		auto decoded = decoder.decode(toRawFrame(makeMsm(1077, 2401, {1, 7, 32, 64}, {2, 16})), error);

		REQUIRE(decoded);
		REQUIRE(decoded->messageType	== 1077);
		REQUIRE(decoded->sys			== E_Sys::GPS);
		REQUIRE(decoded->stationId		== 2401);

		REQUIRE(decoded->satellites.at(E_Sys::GPS) == set<int>{1, 7, 32, 64});
		REQUIRE(decoded->signals.at(E_Sys::GPS) == set<string>{"L1 P(Y)", "Signal 16"});
	}

	SECTION("galileo msm is filed under galileo")
	{
		auto decoded = decoder.decode(toRawFrame(makeMsm(1094, 1, {11, 12}, {1})), error);

		REQUIRE(decoded);
		REQUIRE(decoded->satellites.size() == 1);
		REQUIRE(decoded->satellites.at(E_Sys::GAL) == set<int>{11, 12});
	}

	SECTION("msm too short for its masks fails")
	{
		vector<uint8_t> payload(10, 0);
		setbitu(payload.data(), 0, 12, 1077);

		auto decoded = decoder.decode(toRawFrame(makeFrame(payload)), error);

		REQUIRE_FALSE(decoded);
		REQUIRE(error.empty() == false);
	}

	SECTION("message number zero fails")
	{
		vector<uint8_t> payload(5, 0);

		auto decoded = decoder.decode(toRawFrame(makeFrame(payload)), error);

		REQUIRE_FALSE(decoded);
	}
}
