#ifndef NTRIP_TRACE_H
#define NTRIP_TRACE_H

#include <iostream>
#include <string>
#include <mutex>

using std::string;

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/asio/streambuf.hpp>

#include "rtcmFrame.hpp"

using boost::posix_time::ptime;


ptime timeNow();

string timeString(
	ptime time);


/** Diagnostic counters for one downloading stream.
* Frame level problems are only ever reported here, never as session failures
*/
struct NetworkDataDownload
{
	string 		streamName;

	ptime 		startTime;
	ptime 		endTime;
	long int	numPreambleFound		= 0;
	long int	numFramesFailedCRC		= 0;
	long int	numFramesPassCRC		= 0;
	long int	numFramesDecoded		= 0;
	long int	numFramesDecodeFailed	= 0;
	long int	numNonMessBytes			= 0;

	int 		disconnectionCount		= 0;
	long int	numberChunks			= 0;

	boost::posix_time::time_duration connectedDuration		= boost::posix_time::hours(0);
	boost::posix_time::time_duration disconnectedDuration	= boost::posix_time::hours(0);

	void accumulateScanCounts(
		const FrameScanCounts& counts);

	double connectedRatio(
		ptime now) const;

	double meanDowntime() const;

	double failedCrcRatio() const;

	string getJsonNetworkStatistics(
		ptime	now,
		string	label);

	bool printNetworkStatistics(
		std::ostream&	trace,
		ptime			now);
};

/** Per stream trace buffers, filled by the session thread and flushed by the monitor
*/
struct NtripTrace
{
	int 	level_trace = 0;
	string	mountPoint;

	std::mutex				traceMtx;
	boost::asio::streambuf	netConnBuf;
	boost::asio::streambuf	messErrRtcmBuf;

	void networkLog(
		string message);

	void messageRtcmLog(
		string message);

	void traceWriteEpoch(
		std::ostream& trace);
};

#endif
