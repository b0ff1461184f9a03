#ifndef RTCM_FRAME_H
#define RTCM_FRAME_H

#include <cstddef>
#include <cstdint>
#include <vector>

using std::vector;


#define RTCM_PREAMBLE		0xD3
#define RTCM_HEADER_LEN		3
#define RTCM_CRC_LEN		3
#define RTCM_MAX_PAYLOAD	1023

/** One complete, crc checked RTCM3 frame copied out of a stream buffer.
* The bytes include the preamble, length header, payload and crc.
*/
struct RawFrame
{
	vector<uint8_t>	bytes;

	unsigned int	payloadLength()	const	{	return (unsigned int) bytes.size() - RTCM_HEADER_LEN - RTCM_CRC_LEN;	}
	const uint8_t*	payload()		const	{	return bytes.data() + RTCM_HEADER_LEN;									}
	int				messageType()	const;
};

/** Counters describing what the frame scanner had to discard to find frames.
*/
struct FrameScanCounts
{
	long int	numPreambleFound	= 0;
	long int	numFramesFailedCRC	= 0;
	long int	numFramesPassCRC	= 0;
	long int	numNonMessBytes		= 0;

	void accumulateFrom(
		const FrameScanCounts& other);
};

struct FrameExtraction
{
	vector<RawFrame>	frames;
	size_t				bytesConsumed	= 0;
	FrameScanCounts		counts;
};

unsigned int crc24q(
	const uint8_t*	buff,
	size_t			len);

unsigned int getbitu(
	const uint8_t*	buff,
	int				pos,
	int				len);

unsigned int getbituInc(
	const uint8_t*	buff,
	int&			pos,
	int				len);

FrameExtraction extractFrames(
	const uint8_t*	data,
	size_t			size);

inline FrameExtraction extractFrames(
	const vector<uint8_t>& buffer)
{
	return extractFrames(buffer.data(), buffer.size());
}

#endif
