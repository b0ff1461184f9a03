#ifndef NTRIP_SESSION_H
#define NTRIP_SESSION_H

#include <condition_variable>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <atomic>
#include <vector>
#include <deque>
#include <mutex>

using std::string;
using std::vector;
using std::deque;

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/asio.hpp>

using boost::asio::ip::tcp;

#include "reconnectPolicy.hpp"
#include "stationConfig.hpp"
#include "sessionState.hpp"
#include "ntripTrace.hpp"
#include "rtcmFrame.hpp"


struct SessionOptions
{
	time_duration	handshakeTimeout	= boost::posix_time::seconds(10);
	time_duration	idleWarning			= boost::posix_time::seconds(5);
	time_duration	idleTimeout			= boost::posix_time::seconds(10);
	time_duration	watchdogInterval	= boost::posix_time::milliseconds(250);
	size_t			readBufferSize		= 4096;
	string			userAgent			= "NTRIP casterwatch/1.0";
	string			logFilename;		///< JSON connection log, disabled when empty
	int				traceLevel			= 0;
};

/** Frames and byte counts produced by one connection since the consumer last collected them
*/
struct SessionUpdate
{
	int					connectionId	= 0;
	long int			byteDelta		= 0;
	vector<RawFrame>	frames;
	FrameScanCounts		scanCounts;
};

typedef std::function<RetryDecision(const SessionState&)>	RetryDecider;
typedef std::function<void(const SessionState&)>			StateListener;

string base64Encode(
	const string& input);

/** Streams one mountpoint from a caster.
* All network work and all writes to the session state happen on the session's own thread,
* other threads only see copies of the state and collect extracted frames through takeUpdates()
*/
struct NtripSession
{
	NtripTrace		ntripTrace;
	StateListener	stateListener;		///< Called on the session thread after every phase change

	NtripSession(
		const StationConfig&	config,
		const SessionOptions&	options,
		RetryDecider			retryDecider);

	~NtripSession();

	NtripSession(const NtripSession&)				= delete;
	NtripSession& operator=(const NtripSession&)	= delete;

	bool start();

	void stop();

	bool join(
		time_duration timeout);

	bool running();

	const StationConfig& config() const
	{
		return stationConfig;
	}

	SessionState state() const;

	vector<SessionUpdate> takeUpdates();

	static E_FailureKind classify(
		const boost::system::error_code&	err,
		bool								dataFlowed);

	static string buildRequest(
		const StationConfig&	config,
		const string&			userAgent);

private:
	StationConfig	stationConfig;
	SessionOptions	options;
	RetryDecider	retryDecider;
	string			request_string;

	std::unique_ptr<boost::asio::io_context>		io;
	std::unique_ptr<tcp::resolver>					resolver;
	std::unique_ptr<tcp::socket>					socket;
	std::unique_ptr<boost::asio::deadline_timer>	handshakeTimer;
	std::unique_ptr<boost::asio::deadline_timer>	watchdogTimer;
	std::unique_ptr<boost::asio::deadline_timer>	retryTimer;

	boost::asio::streambuf	responseBuf;
	vector<uint8_t>			readBuf;
	vector<uint8_t>			frameBuffer;
	string					http_version;
	bool					skipBlankLine	= false;	///< ICY replies may end with an empty line

	mutable std::mutex		stateMtx;
	SessionState			sessionState;

	std::mutex				updateMtx;
	deque<SessionUpdate>	pendingUpdates;

	std::mutex				workerMtx;
	std::condition_variable	finishedCv;
	std::thread				worker;
	bool					finished		= true;
	std::atomic<bool>		stopRequested	{false};

	void run();

	void connect();

	void handshakeTimeout(
		int									connId,
		const boost::system::error_code&	err);

	void resolveResponse(
		int									connId,
		const boost::system::error_code&	err,
		tcp::resolver::results_type			results);

	void connectResponse(
		int									connId,
		const boost::system::error_code&	err);

	void writeResponse(
		int									connId,
		const boost::system::error_code&	err);

	void readStatusLine(
		int									connId,
		const boost::system::error_code&	err);

	void readHeaderLine(
		int									connId,
		const boost::system::error_code&	err);

	void accepted();

	void startRead();

	void readResponse(
		int									connId,
		const boost::system::error_code&	err,
		size_t								numBytes);

	void bytesReceived(
		const uint8_t*	data,
		size_t			numBytes);

	void startWatchdog();

	void watchdogCheck(
		int									connId,
		const boost::system::error_code&	err);

	void finish(
		E_FailureKind kind);

	void retryResponse(
		const boost::system::error_code& err);

	bool stale(
		int connId) const;

	void publish(
		const SessionState& snapshot);

	void connectionError(
		const boost::system::error_code&	err,
		string								operation);

	void serverResponse(
		unsigned int	status_code,
		string			http_version);
};

#endif
