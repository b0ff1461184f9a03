
#include "rtcmFrame.hpp"


#define CRC24Q_POLY		0x1864CFB


enum E_Candidate
{
	FRAME_VALID,
	FRAME_BAD_HEADER,
	FRAME_BAD_CRC,
	FRAME_INCOMPLETE
};


unsigned int crc24q(
	const uint8_t*	buff,
	size_t			len)
{
	unsigned int crc = 0;
	for (size_t i = 0; i < len; i++)
	{
		crc ^= (unsigned int) buff[i] << 16;
		for (int bit = 0; bit < 8; bit++)
		{
			crc <<= 1;
			if (crc & 0x1000000)
				crc ^= CRC24Q_POLY;
		}
	}
	return crc & 0xFFFFFF;
}

unsigned int getbitu(
	const uint8_t*	buff,
	int				pos,
	int				len)
{
	unsigned int bits = 0;
	for (int i = pos; i < pos + len; i++)
	{
		bits = (bits << 1) + ((buff[i / 8] >> (7 - i % 8)) & 1u);
	}
	return bits;
}

unsigned int getbituInc(
	const uint8_t*	buff,
	int&			pos,
	int				len)
{
	unsigned int bits = getbitu(buff, pos, len);
	pos += len;
	return bits;
}

int RawFrame::messageType() const
{
	if (bytes.size() < RTCM_HEADER_LEN + RTCM_CRC_LEN + 2)
		return 0;

	return getbitu(payload(), 0, 12);
}

void FrameScanCounts::accumulateFrom(
	const FrameScanCounts& other)
{
	numPreambleFound	+= other.numPreambleFound;
	numFramesFailedCRC	+= other.numFramesFailedCRC;
	numFramesPassCRC	+= other.numFramesPassCRC;
	numNonMessBytes		+= other.numNonMessBytes;
}

/** Check whether a complete frame starts at pos.
*/
E_Candidate checkCandidate(
	const uint8_t*	data,
	size_t			size,
	size_t			pos,
	unsigned int&	frameLen)
{
	if (size - pos < RTCM_HEADER_LEN)
	{
		return FRAME_INCOMPLETE;
	}

	// the 6 bits after the preamble are reserved and always zero in RTCM3
	if (data[pos + 1] & 0xFC)
	{
		return FRAME_BAD_HEADER;
	}

	unsigned int messageLength = getbitu(data + pos, 14, 10);
	frameLen = RTCM_HEADER_LEN + messageLength + RTCM_CRC_LEN;

	if (size - pos < frameLen)
	{
		return FRAME_INCOMPLETE;
	}

	unsigned int crcCalc = crc24q	(data + pos, RTCM_HEADER_LEN + messageLength);
	unsigned int crcRead = getbitu	(data + pos + RTCM_HEADER_LEN + messageLength, 0, 24);

	if (crcCalc != crcRead)
	{
		return FRAME_BAD_CRC;
	}

	return FRAME_VALID;
}

/** Search for any complete, valid frame starting at or after pos.
*/
bool laterFrameExists(
	const uint8_t*	data,
	size_t			size,
	size_t			pos)
{
	for (size_t i = pos; i < size; i++)
	{
		if (data[i] != RTCM_PREAMBLE)
			continue;

		unsigned int frameLen = 0;
		if (checkCandidate(data, size, i, frameLen) == FRAME_VALID)
			return true;
	}
	return false;
}

/** Scan a stream buffer for complete RTCM3 frames.
* Frames are returned in buffer order. Bytes that cannot be part of a frame are consumed,
* a trailing partial frame is left in place for the next call.
*/
FrameExtraction extractFrames(
	const uint8_t*	data,
	size_t			size)
{
	FrameExtraction result;

	size_t pos = 0;
	while (pos < size)
	{
		// Skip to the start of the frame - marked by preamble character 0xD3
		size_t start = pos;
		while	( pos < size
				&&data[pos] != RTCM_PREAMBLE)
		{
			pos++;
		}
		result.counts.numNonMessBytes += pos - start;

		if (pos == size)
		{
			break;
		}

		unsigned int frameLen = 0;
		E_Candidate candidate = checkCandidate(data, size, pos, frameLen);

		if (candidate == FRAME_VALID)
		{
			result.counts.numPreambleFound++;
			result.counts.numFramesPassCRC++;

			RawFrame frame;
			frame.bytes.assign(data + pos, data + pos + frameLen);
			result.frames.push_back(std::move(frame));

			pos += frameLen;
			continue;
		}

		if (candidate == FRAME_INCOMPLETE)
		{
			// a valid frame further on means this preamble was not the start of a frame
			if (laterFrameExists(data, size, pos + 1) == false)
			{
				break;
			}
		}
		else
		{
			result.counts.numPreambleFound++;
		}

		if (candidate == FRAME_BAD_CRC)
		{
			result.counts.numFramesFailedCRC++;
		}

		// resynchronise on the byte after this false preamble
		result.counts.numNonMessBytes++;
		pos++;
	}

	result.bytesConsumed = pos;
	return result;
}
