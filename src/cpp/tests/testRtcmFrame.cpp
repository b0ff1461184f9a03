#include <catch2/catch.hpp>
#include "catchOptional.hpp"

#include "rtcmFrame.hpp"
#include "testFrames.hpp"


TEST_CASE("crc24q")
{
	SECTION("empty buffer has zero crc")
	{
		REQUIRE(crc24q(nullptr, 0) == 0);
	}

	SECTION("crc of a frame including its crc is zero")
	{
		auto frame = makeMessage(1005);

		REQUIRE(crc24q(frame.data(), frame.size()) == 0);
	}
}

TEST_CASE("bit extraction")
{
	uint8_t buff[4] = {0xD3, 0x00, 0x13, 0x3E};

	REQUIRE(getbitu(buff, 0,	8)	== 0xD3);
	REQUIRE(getbitu(buff, 14,	10)	== 0x13);

	int pos = 24;
	REQUIRE(getbituInc(buff, pos, 4) == 0x3);
	REQUIRE(pos == 28);
}

TEST_CASE("frame extraction")
{
	SECTION("single frame")
	{
		auto frame = makeMessage(1005);

		auto result = extractFrames(frame);

		REQUIRE(result.frames.size()		== 1);
		REQUIRE(result.bytesConsumed		== frame.size());
		REQUIRE(result.frames[0].bytes		== frame);
		REQUIRE(result.frames[0].messageType()	== 1005);
		REQUIRE(result.counts.numFramesPassCRC	== 1);
	}

	SECTION("empty buffer")
	{
		vector<uint8_t> empty;
		auto result = extractFrames(empty);

		REQUIRE(result.frames.empty());
		REQUIRE(result.bytesConsumed == 0);
	}

	SECTION("frames interleaved with garbage come out whole and in order")
	{
		vector<vector<uint8_t>> frames =
		{
			makeMessage(1005),
			makeMsm(1077, 12, {1, 5, 32}, {2, 16}),
			makeMessage(1033, 40),
			makeMessage(1230, 8),
			makeMsm(1127, 12, {3, 40}, {1})
		};

		vector<vector<uint8_t>> garbage =
		{
			{0x01, 0x02, 0x03},
			{},
			{0xD3, 0xFF, 0x10},				//false preamble with reserved bits set
			{0x00, 0x7E, 0x7E, 0x11, 0x22},
			{0x55}
		};

		vector<uint8_t> stream;
		for (size_t i = 0; i < frames.size(); i++)
		{
			append(stream, garbage[i]);
			append(stream, frames[i]);
		}
		append(stream, {0x42, 0x43});

		auto result = extractFrames(stream);

		REQUIRE(result.frames.size() == frames.size());
		for (size_t i = 0; i < frames.size(); i++)
		{
			REQUIRE(result.frames[i].bytes == frames[i]);
		}

		REQUIRE(result.bytesConsumed				== stream.size());
		REQUIRE(result.counts.numFramesPassCRC		== 5);
		REQUIRE(result.counts.numNonMessBytes		== 14);
	}

	SECTION("corrupted frame is dropped and the scanner resynchronises")
	{
		auto good1		= makeMessage(1005);
		auto corrupt	= makeMessage(1019, 30);
		auto good2		= makeMessage(1020, 20);

		corrupt[10] ^= 0xFF;

		vector<uint8_t> stream;
		append(stream, good1);
		append(stream, corrupt);
		append(stream, good2);

		auto result = extractFrames(stream);

		REQUIRE(result.frames.size()			== 2);
		REQUIRE(result.frames[0].bytes			== good1);
		REQUIRE(result.frames[1].bytes			== good2);
		REQUIRE(result.counts.numFramesFailedCRC	>= 1);
		REQUIRE(result.bytesConsumed			== stream.size());
	}

	SECTION("partial frame is left for the next call")
	{
		auto first	= makeMessage(1005);
		auto second	= makeMessage(1006, 21);

		vector<uint8_t> buffer;
		append(buffer, first);
		buffer.insert(buffer.end(), second.begin(), second.begin() + 2);

		auto result = extractFrames(buffer);

		REQUIRE(result.frames.size()	== 1);
		REQUIRE(result.frames[0].bytes	== first);
		REQUIRE(result.bytesConsumed	== first.size());

		buffer.erase(buffer.begin(), buffer.begin() + result.bytesConsumed);
		buffer.insert(buffer.end(), second.begin() + 2, second.end());

		auto rest = extractFrames(buffer);

		REQUIRE(rest.frames.size()		== 1);
		REQUIRE(rest.frames[0].bytes	== second);
		REQUIRE(rest.bytesConsumed		== second.size());
	}

	SECTION("buffer with only a partial frame consumes nothing")
	{
		auto frame = makeMessage(1005);
		vector<uint8_t> partial(frame.begin(), frame.end() - 1);

		auto result = extractFrames(partial);

		REQUIRE(result.frames.empty());
		REQUIRE(result.bytesConsumed == 0);
	}

	SECTION("frames split at every possible read boundary")
	{
		vector<uint8_t> stream;
		append(stream, makeMessage(1005));
		append(stream, makeMsm(1087, 7, {2, 3, 4}, {1, 3}));
		append(stream, makeMessage(1230, 8));

		for (size_t split = 1; split < stream.size(); split++)
		{
			vector<uint8_t> buffer(stream.begin(), stream.begin() + split);

			auto firstPart = extractFrames(buffer);
			buffer.erase(buffer.begin(), buffer.begin() + firstPart.bytesConsumed);
			buffer.insert(buffer.end(), stream.begin() + split, stream.end());

			auto secondPart = extractFrames(buffer);

			REQUIRE(firstPart.frames.size() + secondPart.frames.size() == 3);
			REQUIRE(firstPart.bytesConsumed + secondPart.bytesConsumed == stream.size());
		}
	}
}
