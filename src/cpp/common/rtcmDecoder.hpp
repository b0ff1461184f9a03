#ifndef RTCM_DECODER_H
#define RTCM_DECODER_H

#include <string>
#include <map>
#include <set>

using std::string;
using std::map;
using std::set;

#include <boost/optional.hpp>

#include "rtcmFrame.hpp"
#include "enums.h"


typedef map<E_Sys, set<int>>		SatelliteSets;
typedef map<E_Sys, set<string>>		SignalSets;

/** A frame after decoding - the message number plus any per satellite content it carries
*/
struct DecodedMessage
{
	int				messageType	= 0;
	E_Sys			sys			= E_Sys::NONE;
	int				stationId	= -1;
	SatelliteSets	satellites;
	SignalSets		signals;

	bool hasSatellites() const
	{
		return satellites.empty() == false;
	}
};

/** Interface for turning a complete frame into a typed message
*/
struct FrameDecoder
{
	virtual ~FrameDecoder() = default;

	virtual boost::optional<DecodedMessage> decode(
		const RawFrame&	frame,
		string&			error) = 0;
};

struct RtcmDecoder : FrameDecoder
{
	boost::optional<DecodedMessage> decode(
		const RawFrame&	frame,
		string&			error)
	override;

	static bool isMsm(
		int messageType);

	static E_Sys msmSystem(
		int messageType);

	static string signalName(
		E_Sys	sys,
		int		signalId);

	static string messageDescription(
		int messageType);

	static string constellationDescription(
		E_Sys sys);

	void decodeMSM(
		const uint8_t*	data,
		unsigned int	messageLength,
		DecodedMessage&	message,
		string&			error);
};

#endif
