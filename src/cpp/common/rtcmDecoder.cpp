
#include <sstream>

#include "rtcmDecoder.hpp"


// bit lengths of the msm header fields preceding the satellite mask
#define MSM_HEADER_BITS		73
#define MSM_SAT_MASK_BITS	64
#define MSM_SIG_MASK_BITS	32


map<E_Sys, map<int, string>> signalNameMap =
{
	{E_Sys::GPS,	{{1, "L1 C/A"},	{2, "L1 P(Y)"},	{3, "L1 M"},	{4, "L2 P(Y)"},	{5, "L2 C"},	{6, "L2 M"},	{7, "L5 I"},	{8, "L5 Q"}}},
	{E_Sys::GLO,	{{1, "G1 C/A"},	{2, "G1 P"},	{3, "G2 C/A"},	{4, "G2 P"},	{5, "G3 I"},	{6, "G3 Q"}}},
	{E_Sys::GAL,	{{1, "E1 C"},	{2, "E1 A"},	{3, "E1 B"},	{4, "E5a I"},	{5, "E5a Q"},	{6, "E5b I"},	{7, "E5b Q"},	{8, "E6 C"}}},
	{E_Sys::BDS,	{{1, "B1 I"},	{2, "B1 Q"},	{3, "B2 I"},	{4, "B2 Q"},	{5, "B3 I"},	{6, "B3 Q"}}},
	{E_Sys::QZS,	{{1, "L1 C/A"},	{2, "L1 S"},	{4, "L2 C"},	{5, "L2 L"},	{7, "L5 I"},	{8, "L5 Q"},	{9, "L6 I"},	{10, "L6 Q"}}},
	{E_Sys::SBS,	{{1, "L1 C/A"},	{7, "L5 I"},	{8, "L5 Q"}}}
};


map<int, string> messageDescriptionMap =
{
	{1005, "Station coordinates (stationary RTK reference station)"},
	{1006, "Station coordinates with antenna height"},
	{1007, "Antenna descriptor"},
	{1008, "Antenna descriptor & serial number"},
	{1019, "GPS ephemeris"},
	{1020, "GLONASS ephemeris"},
	{1033, "Receiver and antenna descriptors"},
	{1042, "BeiDou ephemeris"},
	{1044, "QZSS ephemeris"},
	{1045, "Galileo F/NAV ephemeris"},
	{1046, "Galileo I/NAV ephemeris"},
	{1230, "GLONASS code-phase biases"}
};

// indexed by msm level 1..7
const char* msmContentDescription[] =
{
	"",
	"Compact pseudoranges",
	"Compact phase ranges",
	"Compact pseudoranges and phase ranges",
	"Full pseudoranges and phase ranges",
	"Full pseudoranges, phase ranges, phase range rate, and CNR",
	"Full pseudoranges and CNR (high resolution)",
	"Full pseudoranges, phase ranges, phase range rate, and CNR (high resolution)"
};

map<E_Sys, string> constellationDescriptionMap =
{
	{E_Sys::GPS,	"Global Positioning System (USA) - global coverage with L1, L2, and L5 signals."},
	{E_Sys::GAL,	"European GNSS constellation - high-precision positioning with E1, E5a, E5b, and E6 signals."},
	{E_Sys::GLO,	"Russian GNSS constellation - global coverage with L1 and L2 signals on FDMA frequencies."},
	{E_Sys::BDS,	"Chinese Navigation Satellite System - global coverage with B1, B2, and B3 signals from MEO, IGSO, and GEO satellites."},
	{E_Sys::QZS,	"Quasi-Zenith Satellite System (Japan) - regional system enhancing GPS in Asia-Oceania with L1, L2, and L5 signals."},
	{E_Sys::SBS,	"Satellite-Based Augmentation System - geostationary satellites providing correction data for improved GPS accuracy."}
};


bool RtcmDecoder::isMsm(
	int messageType)
{
	if	( messageType < 1071
		||messageType > 1127)
	{
		return false;
	}

	int msmType = messageType % 10;
	return	( msmType >= 1
			&&msmType <= 7);
}

E_Sys RtcmDecoder::msmSystem(
	int messageType)
{
	if (isMsm(messageType) == false)
		return E_Sys::NONE;

	switch ((messageType - 1071) / 10)
	{
		case 0:		return E_Sys::GPS;
		case 1:		return E_Sys::GLO;
		case 2:		return E_Sys::GAL;
		case 3:		return E_Sys::SBS;
		case 4:		return E_Sys::QZS;
		case 5:		return E_Sys::BDS;
		default:	return E_Sys::NONE;
	}
}

string RtcmDecoder::signalName(
	E_Sys	sys,
	int		signalId)
{
	auto sysIt = signalNameMap.find(sys);
	if (sysIt != signalNameMap.end())
	{
		auto& [dummySys, names] = *sysIt;

		auto nameIt = names.find(signalId);
		if (nameIt != names.end())
		{
			return nameIt->second;
		}
	}

	return "Signal " + std::to_string(signalId);
}

string RtcmDecoder::messageDescription(
	int messageType)
{
	if (isMsm(messageType))
	{
		int msmType = messageType % 10;

		std::stringstream ss;
		ss << sysName(msmSystem(messageType)) << " MSM" << msmType << " - " << msmContentDescription[msmType];
		return ss.str();
	}

	auto it = messageDescriptionMap.find(messageType);
	if (it == messageDescriptionMap.end())
	{
		return "RTCM correction data";
	}

	return it->second;
}

string RtcmDecoder::constellationDescription(
	E_Sys sys)
{
	auto it = constellationDescriptionMap.find(sys);
	if (it == constellationDescriptionMap.end())
	{
		return "GNSS satellite constellation";
	}

	return it->second;
}

void RtcmDecoder::decodeMSM(
	const uint8_t*	data,
	unsigned int	messageLength,
	DecodedMessage&	message,
	string&			error)
{
	unsigned int requiredBits = MSM_HEADER_BITS + MSM_SAT_MASK_BITS + MSM_SIG_MASK_BITS;
	if (messageLength * 8 < requiredBits)
	{
		std::stringstream ss;
		ss << "MSM message " << message.messageType << " too short for masks, length : " << messageLength;
		error = ss.str();
		return;
	}

	int i = 12;
	message.stationId	= getbituInc(data, i,	12);

	i = MSM_HEADER_BITS;

	//create satellite identifiers according to the mask
	auto& sats = message.satellites[message.sys];
	for (int sat = 0; sat < MSM_SAT_MASK_BITS; sat++)
	{
		bool mask = getbituInc(data, i,	1);
		if (mask)
		{
			sats.insert(sat + 1);
		}
	}

	auto& sigs = message.signals[message.sys];
	for (int sig = 0; sig < MSM_SIG_MASK_BITS; sig++)
	{
		bool mask = getbituInc(data, i,	1);
		if (mask)
		{
			sigs.insert(signalName(message.sys, sig + 1));
		}
	}

	if (sats.empty())	message.satellites	.erase(message.sys);
	if (sigs.empty())	message.signals		.erase(message.sys);
}

boost::optional<DecodedMessage> RtcmDecoder::decode(
	const RawFrame&	frame,
	string&			error)
{
	error.clear();

	if	( frame.bytes.size() < RTCM_HEADER_LEN + RTCM_CRC_LEN + 2)
	{
		error = "Frame too short to hold a message number";
		return boost::none;
	}

	DecodedMessage message;
	message.messageType = frame.messageType();

	if (message.messageType == 0)
	{
		error = "Frame has message number zero";
		return boost::none;
	}

	if (isMsm(message.messageType))
	{
		message.sys = msmSystem(message.messageType);

		decodeMSM(frame.payload(), frame.payloadLength(), message, error);

		if (error.empty() == false)
		{
			return boost::none;
		}
	}

	return message;
}
