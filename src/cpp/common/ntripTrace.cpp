
#include <sstream>
#include <algorithm>
#include <string>

#define BOOST_BIND_GLOBAL_PLACEHOLDERS

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/log/trivial.hpp>

using boost::property_tree::ptree;
using boost::property_tree::write_json;

using std::string;

#include "ntripTrace.hpp"


ptime timeNow()
{
	return boost::posix_time::microsec_clock::universal_time();
}

string timeString(
	ptime time)
{
	if (time.is_not_a_date_time())
		return "-";

	// "%F %X" without fractional seconds
	string str = boost::posix_time::to_iso_extended_string(time);
	std::replace(str.begin(), str.end(), 'T', ' ');
	return str.substr(0, 19);
}

void NtripTrace::networkLog(
	string message)
{
	if (level_trace < 3)
		return;

	std::lock_guard<std::mutex> guard(traceMtx);

	std::ostream outStream(&netConnBuf);
	outStream << boost::posix_time::second_clock::universal_time();
	outStream << " " << message << std::endl;
}

void NtripTrace::messageRtcmLog(
	string message)
{
	if (level_trace < 3)
		return;

	std::lock_guard<std::mutex> guard(traceMtx);

	std::ostream outStream(&messErrRtcmBuf);
	outStream << boost::posix_time::second_clock::universal_time();
	outStream << " " << message << std::endl;
}

void NtripTrace::traceWriteEpoch(
	std::ostream& trace)
{
	std::lock_guard<std::mutex> guard(traceMtx);

	if (netConnBuf.size() > 0)
	{
		trace << std::endl << "------=============== Network Connection : " << mountPoint << " =============-----------" << std::endl;
		trace << &netConnBuf;
	}

	if (messErrRtcmBuf.size() > 0)
	{
		trace << std::endl << "------=============== RTCM Framing : " << mountPoint << " =============-----------" << std::endl;
		trace << &messErrRtcmBuf;
	}
}

void NetworkDataDownload::accumulateScanCounts(
	const FrameScanCounts& counts)
{
	numPreambleFound		+= counts.numPreambleFound;
	numFramesFailedCRC		+= counts.numFramesFailedCRC;
	numFramesPassCRC		+= counts.numFramesPassCRC;
	numNonMessBytes			+= counts.numNonMessBytes;
}

/** Fraction of the time since the stream started that it was connected
*/
double NetworkDataDownload::connectedRatio(
	ptime now) const
{
	if	( disconnectionCount	== 0
		&&numberChunks			> 0)
	{
		return 1;
	}

	if (startTime.is_not_a_date_time())
		return 0;

	long int totalMilliseconds = (now - startTime).total_milliseconds();
	if (totalMilliseconds <= 0)
		return 0;

	return (double) connectedDuration.total_milliseconds() / totalMilliseconds;
}

/** Mean time spent disconnected per disconnection, in minutes
*/
double NetworkDataDownload::meanDowntime() const
{
	if (disconnectionCount == 0)
		return 0;

	return disconnectedDuration.total_milliseconds() / (60.0 * 1000.0 * disconnectionCount);
}

double NetworkDataDownload::failedCrcRatio() const
{
	if (numPreambleFound == 0)
		return 0;

	return (double) numFramesFailedCRC / numPreambleFound;
}

string NetworkDataDownload::getJsonNetworkStatistics(
	ptime	now,
	string	label)
{
	ptree root;

	root.put("label", 			label);
	root.put("Stream", 			streamName);
	root.put("Epoch", 			timeString(now));
	root.put("Start", 			timeString(startTime));
	root.put("Finish", 			timeString(endTime));
	root.put("Downloading", 	true);

	root.put("Disconnects", 	disconnectionCount);
	root.put("MeanDowntime", 	meanDowntime());
	root.put("ConnectedRatio", 	connectedRatio(now));
	root.put("Chunks", 			numberChunks);

	root.put("RtcmExtraBytes", 	numNonMessBytes);
	root.put("RtcmFailCrc", 	numFramesFailedCRC);
	root.put("RtcmPassedCrc", 	numFramesPassCRC);
	root.put("RtcmDecoded", 	numFramesDecoded);
	root.put("RtcmDecodeFail",	numFramesDecodeFailed);
	root.put("RtcmPreamble", 	numPreambleFound);

	root.put("RtcmFailedCrcToPreambleRatio", failedCrcRatio());

	std::stringstream ss;
	write_json(ss, root, false);
	return ss.str();
}

/** Write a readable summary of the counters.
* Returns true when the stream looks unhealthy enough to be worth printing to the terminal
*/
bool NetworkDataDownload::printNetworkStatistics(
	std::ostream&	trace,
	ptime			now)
{
	std::stringstream traceStr;
	traceStr << "Stream :  " << streamName			<< std::endl;
	traceStr << "Start  :  " << timeString(startTime)	<< std::endl;
	traceStr << "Epoch  :  " << timeString(now) 		<< std::endl;

	double connRatio	= connectedRatio(now);
	double crcRatio		= failedCrcRatio();

	traceStr << "Disconnects     : " << disconnectionCount 		<< std::endl;
	traceStr << "MeanDowntime    : " << meanDowntime()			<< std::endl;
	traceStr << "ConnectedRatio  : " << connRatio 				<< std::endl;
	traceStr << "Chunks          : " << numberChunks			<< std::endl;
	traceStr << "RtcmExtraBytes  : " << numNonMessBytes			<< std::endl;
	traceStr << "RtcmFailCrc     : " << numFramesFailedCRC 		<< std::endl;
	traceStr << "RtcmPassedCrc   : " << numFramesPassCRC		<< std::endl;
	traceStr << "RtcmDecoded     : " << numFramesDecoded		<< std::endl;
	traceStr << "RtcmDecodeFail  : " << numFramesDecodeFailed	<< std::endl;
	traceStr << "RtcmPreamble    : " << numPreambleFound		<< std::endl;

	traceStr << "RtcmFailedCrcToPreambleRatio : " << crcRatio	<< std::endl;

	trace << traceStr.str();

	return	( crcRatio	> 0.01
			||connRatio	< 0.99);
}
