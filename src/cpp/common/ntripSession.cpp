
#include <fstream>
#include <sstream>

#define BOOST_BIND_GLOBAL_PLACEHOLDERS

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/log/trivial.hpp>

using boost::property_tree::ptree;
using boost::property_tree::write_json;

#include "ntripSession.hpp"


std::mutex jsonLogMtx;


string base64Encode(
	const string& input)
{
	using namespace boost::archive::iterators;

	typedef base64_from_binary<transform_width<string::const_iterator, 6, 8>> Base64Iterator;

	string encoded(Base64Iterator(input.begin()), Base64Iterator(input.end()));
	encoded.append((3 - input.size() % 3) % 3, '=');
	return encoded;
}

string NtripSession::buildRequest(
	const StationConfig&	config,
	const string&			userAgent)
{
	std::stringstream request_stream;
								request_stream	<< "GET /"		<< config.mountpoint << " HTTP/1.0\r\n";
								request_stream	<< "Host: "		<< config.host << "\r\n";
								request_stream	<< "User-Agent: " << userAgent << "\r\n";
	if (!config.username.empty())
	{
								request_stream	<< "Authorization: Basic "
												<< base64Encode(config.username + ":" + config.password)
												<< "\r\n";
	}
								request_stream	<< "Accept: */*\r\n";
								request_stream	<< "Connection: close\r\n";
								request_stream	<< "\r\n";
	return request_stream.str();
}

/** Map a transport error onto the session failure taxonomy
*/
E_FailureKind NtripSession::classify(
	const boost::system::error_code&	err,
	bool								dataFlowed)
{
	if (err == boost::asio::error::eof)
	{
		if (dataFlowed)		return E_FailureKind::MOUNTPOINT_CLOSED;
		else				return E_FailureKind::NETWORK_ERROR;
	}

	return E_FailureKind::NETWORK_ERROR;
}

NtripSession::NtripSession(
	const StationConfig&	config,
	const SessionOptions&	options,
	RetryDecider			retryDecider)
:	stationConfig	(config),
	options			(options),
	retryDecider	(retryDecider)
{
	ntripTrace.mountPoint	= config.mountpoint;
	ntripTrace.level_trace	= options.traceLevel;

	sessionState.stationId	= config.id;
}

NtripSession::~NtripSession()
{
	stop();

	if (worker.joinable())
	{
		worker.join();
	}
}

bool NtripSession::start()
{
	std::lock_guard<std::mutex> guard(workerMtx);

	if (worker.joinable())
	{
		if (finished == false)
		{
			return false;
		}

		worker.join();
	}

	retryTimer		.reset();
	watchdogTimer	.reset();
	handshakeTimer	.reset();
	socket			.reset();
	resolver		.reset();

	io				= std::make_unique<boost::asio::io_context>();
	resolver		= std::make_unique<tcp::resolver>				(*io);
	socket			= std::make_unique<tcp::socket>					(*io);
	handshakeTimer	= std::make_unique<boost::asio::deadline_timer>	(*io);
	watchdogTimer	= std::make_unique<boost::asio::deadline_timer>	(*io);
	retryTimer		= std::make_unique<boost::asio::deadline_timer>	(*io);

	responseBuf.consume(responseBuf.size());
	frameBuffer.clear();
	readBuf.assign(options.readBufferSize, 0);

	request_string = buildRequest(stationConfig, options.userAgent);

	{
		std::lock_guard<std::mutex> stateGuard(stateMtx);
		sessionState.stationId = stationConfig.id;
		sessionState.started(timeNow());
	}

	stopRequested	= false;
	finished		= false;

	worker = std::thread(&NtripSession::run, this);

	return true;
}

void NtripSession::stop()
{
	std::lock_guard<std::mutex> guard(workerMtx);

	stopRequested = true;

	{
		std::lock_guard<std::mutex> stateGuard(stateMtx);
		sessionState.userStopped = true;
	}

	if	( io == nullptr
		||finished)
	{
		return;
	}

	// closing the socket from the session thread unblocks any pending read immediately
	boost::asio::post(*io, [this]
	{
		retryTimer->cancel();

		finish(E_FailureKind::USER_STOP);
	});
}

bool NtripSession::join(
	time_duration timeout)
{
	std::unique_lock<std::mutex> lock(workerMtx);

	bool done = finishedCv.wait_for(lock, std::chrono::milliseconds(timeout.total_milliseconds()), [this]
	{
		return finished;
	});

	if (done == false)
	{
		return false;
	}

	if (worker.joinable())
	{
		worker.join();
	}

	return true;
}

bool NtripSession::running()
{
	std::lock_guard<std::mutex> guard(workerMtx);

	return	( worker.joinable()
			&&finished == false);
}

SessionState NtripSession::state() const
{
	std::lock_guard<std::mutex> guard(stateMtx);

	return sessionState;
}

vector<SessionUpdate> NtripSession::takeUpdates()
{
	std::lock_guard<std::mutex> guard(updateMtx);

	vector<SessionUpdate> updates(pendingUpdates.begin(), pendingUpdates.end());
	pendingUpdates.clear();

	return updates;
}

void NtripSession::run()
{
	boost::asio::post(*io, [this]
	{
		connect();
	});

	try
	{
		io->run();
	}
	catch (std::exception& e)
	{
		BOOST_LOG_TRIVIAL(error)
		<< "Error, session thread for " << stationConfig.id << " stopped unexpectedly : " << e.what();

		std::lock_guard<std::mutex> stateGuard(stateMtx);
		if (sessionState.phase != E_SessionPhase::TERMINATED)
		{
			sessionState.terminate(E_FailureKind::NETWORK_ERROR, timeNow());
		}
	}

	{
		std::lock_guard<std::mutex> guard(workerMtx);
		finished = true;
	}
	finishedCv.notify_all();
}

bool NtripSession::stale(
	int connId) const
{
	return	( connId				!= sessionState.connectionId
			||sessionState.phase	== E_SessionPhase::TERMINATED);
}

void NtripSession::publish(
	const SessionState& snapshot)
{
	if (stateListener)
	{
		stateListener(snapshot);
	}
}

void NtripSession::connect()
{
	if (stopRequested)
	{
		return;
	}

	SessionState snapshot;
	{
		std::lock_guard<std::mutex> guard(stateMtx);
		sessionState.beginConnect(timeNow());
		snapshot = sessionState;
	}

	int connId = snapshot.connectionId;

	responseBuf.consume(responseBuf.size());
	frameBuffer.clear();
	skipBlankLine	= false;
	http_version	.clear();

	BOOST_LOG_TRIVIAL(info)
	<< "Connecting to " << stationConfig.sanitised() << " for " << stationConfig.id;

	ntripTrace.networkLog("Connecting to " + stationConfig.sanitised());

	publish(snapshot);

	handshakeTimer->expires_from_now(options.handshakeTimeout);
	handshakeTimer->async_wait([this, connId](const boost::system::error_code& err)
	{
		handshakeTimeout(connId, err);
	});

	resolver->async_resolve(stationConfig.host, std::to_string(stationConfig.port),
		[this, connId](const boost::system::error_code& err, tcp::resolver::results_type results)
		{
			resolveResponse(connId, err, results);
		});
}

void NtripSession::handshakeTimeout(
	int									connId,
	const boost::system::error_code&	err)
{
	if	( err
		||stale(connId)
		||sessionState.phase != E_SessionPhase::CONNECTING)
	{
		return;
	}

	connectionError(boost::asio::error::timed_out, "handshake");
	finish(E_FailureKind::NETWORK_ERROR);
}

void NtripSession::resolveResponse(
	int									connId,
	const boost::system::error_code&	err,
	tcp::resolver::results_type			results)
{
	if (stale(connId))
	{
		return;
	}

	if (err)
	{
		connectionError(err, "resolve");
		finish(E_FailureKind::NETWORK_ERROR);
		return;
	}

	boost::asio::async_connect(*socket, results,
		[this, connId](const boost::system::error_code& err, const tcp::endpoint& endpoint)
		{
			connectResponse(connId, err);
		});
}

void NtripSession::connectResponse(
	int									connId,
	const boost::system::error_code&	err)
{
	if (stale(connId))
	{
		return;
	}

	if (err)
	{
		connectionError(err, "connect");
		finish(E_FailureKind::NETWORK_ERROR);
		return;
	}

	boost::asio::async_write(*socket, boost::asio::buffer(request_string),
		[this, connId](const boost::system::error_code& err, size_t numBytes)
		{
			writeResponse(connId, err);
		});
}

void NtripSession::writeResponse(
	int									connId,
	const boost::system::error_code&	err)
{
	if (stale(connId))
	{
		return;
	}

	if (err)
	{
		connectionError(err, "write");
		finish(E_FailureKind::NETWORK_ERROR);
		return;
	}

	boost::asio::async_read_until(*socket, responseBuf, "\r\n",
		[this, connId](const boost::system::error_code& err, size_t numBytes)
		{
			readStatusLine(connId, err);
		});
}

void NtripSession::readStatusLine(
	int									connId,
	const boost::system::error_code&	err)
{
	if (stale(connId))
	{
		return;
	}

	if (err)
	{
		connectionError(err, "read status");
		finish(E_FailureKind::NETWORK_ERROR);
		return;
	}

	std::istream response_stream(&responseBuf);
	string statusLine;
	std::getline(response_stream, statusLine);
	boost::algorithm::trim(statusLine);

	ntripTrace.networkLog("Server response : " + statusLine);

	if (boost::algorithm::starts_with(statusLine, "ICY 200"))
	{
		http_version	= "ICY";
		skipBlankLine	= true;

		serverResponse(200, http_version);
		accepted();
		return;
	}

	if (boost::algorithm::starts_with(statusLine, "SOURCETABLE"))
	{
		serverResponse(200, "SOURCETABLE");

		BOOST_LOG_TRIVIAL(warning)
		<< "Caster returned its sourcetable for " << stationConfig.sanitised() << ", mountpoint not available";

		finish(E_FailureKind::AUTH_FAILURE);
		return;
	}

	unsigned int status_code = 0;
	if (boost::algorithm::starts_with(statusLine, "HTTP/"))
	{
		std::stringstream ss(statusLine);
		ss >> http_version >> status_code;
	}

	serverResponse(status_code, http_version);

	if (status_code != 200)
	{
		if (status_code == 401)
		{
			BOOST_LOG_TRIVIAL(warning)
			<< "Authentication failed for " << stationConfig.sanitised();
		}
		else
		{
			BOOST_LOG_TRIVIAL(warning)
			<< "Caster rejected connection to " << stationConfig.sanitised() << " : " << statusLine;
		}

		finish(E_FailureKind::AUTH_FAILURE);
		return;
	}

	boost::asio::async_read_until(*socket, responseBuf, "\r\n",
		[this, connId](const boost::system::error_code& err, size_t numBytes)
		{
			readHeaderLine(connId, err);
		});
}

void NtripSession::readHeaderLine(
	int									connId,
	const boost::system::error_code&	err)
{
	if (stale(connId))
	{
		return;
	}

	if (err)
	{
		connectionError(err, "read header");
		finish(E_FailureKind::NETWORK_ERROR);
		return;
	}

	std::istream response_stream(&responseBuf);
	string header;
	std::getline(response_stream, header);
	boost::algorithm::trim(header);

	if (header.empty())
	{
		accepted();
		return;
	}

	if (boost::algorithm::icontains(header, "gnss/sourcetable"))
	{
		BOOST_LOG_TRIVIAL(warning)
		<< "Caster returned its sourcetable for " << stationConfig.sanitised() << ", mountpoint not available";

		finish(E_FailureKind::AUTH_FAILURE);
		return;
	}

	boost::asio::async_read_until(*socket, responseBuf, "\r\n",
		[this, connId](const boost::system::error_code& err, size_t numBytes)
		{
			readHeaderLine(connId, err);
		});
}

void NtripSession::accepted()
{
	handshakeTimer->cancel();

	SessionState snapshot;
	{
		std::lock_guard<std::mutex> guard(stateMtx);
		sessionState.handshakeAccepted(timeNow());
		snapshot = sessionState;
	}

	BOOST_LOG_TRIVIAL(info)
	<< "Connection OK " << stationConfig.sanitised();

	publish(snapshot);

	// bytes read together with the response header already belong to the stream
	if (responseBuf.size() > 0)
	{
		auto bufs = responseBuf.data();
		vector<uint8_t> leftover(boost::asio::buffers_begin(bufs), boost::asio::buffers_end(bufs));
		responseBuf.consume(responseBuf.size());

		bytesReceived(leftover.data(), leftover.size());
	}

	startWatchdog();
	startRead();
}

void NtripSession::startRead()
{
	int connId = sessionState.connectionId;

	socket->async_read_some(boost::asio::buffer(readBuf),
		[this, connId](const boost::system::error_code& err, size_t numBytes)
		{
			readResponse(connId, err, numBytes);
		});
}

void NtripSession::readResponse(
	int									connId,
	const boost::system::error_code&	err,
	size_t								numBytes)
{
	if (stale(connId))
	{
		return;
	}

	if (numBytes > 0)
	{
		bytesReceived(readBuf.data(), numBytes);
	}

	if (err)
	{
		if (err == boost::asio::error::operation_aborted)
		{
			return;
		}

		connectionError(err, "read");
		finish(classify(err, sessionState.dataFlowed));
		return;
	}

	startRead();
}

void NtripSession::bytesReceived(
	const uint8_t*	data,
	size_t			numBytes)
{
	if (skipBlankLine)
	{
		while	( numBytes > 0
				&&(data[0] == '\r' || data[0] == '\n'))
		{
			data++;
			numBytes--;
		}

		if (numBytes == 0)
		{
			return;
		}

		skipBlankLine = false;
	}

	bool			first;
	bool			resumed;
	SessionState	snapshot;
	{
		std::lock_guard<std::mutex> guard(stateMtx);
		resumed	= sessionState.phase == E_SessionPhase::IDLE_WARNING;
		first	= sessionState.dataReceived(numBytes, timeNow());
		if (resumed)
		{
			snapshot = sessionState;
		}
	}

	if (first)
	{
		BOOST_LOG_TRIVIAL(debug)
		<< "Data flowing from " << stationConfig.sanitised();
	}

	if (resumed)
	{
		BOOST_LOG_TRIVIAL(info)
		<< "Data resumed from " << stationConfig.sanitised();

		publish(snapshot);
	}

	frameBuffer.insert(frameBuffer.end(), data, data + numBytes);

	FrameExtraction extraction = extractFrames(frameBuffer);

	frameBuffer.erase(frameBuffer.begin(), frameBuffer.begin() + extraction.bytesConsumed);

	if (extraction.counts.numNonMessBytes > 0)
	{
		std::stringstream message;
		message << "RTCM Extra Bytes, size : " << extraction.counts.numNonMessBytes;
		ntripTrace.messageRtcmLog(message.str());
	}

	if (extraction.counts.numFramesFailedCRC > 0)
	{
		std::stringstream message;
		message << "RTCM CRC Failure, Number Fail CRC : "	<< extraction.counts.numFramesFailedCRC;
		message << ", Number Passed CRC : "					<< extraction.counts.numFramesPassCRC;
		message << ", Number Preamble : "					<< extraction.counts.numPreambleFound;
		ntripTrace.messageRtcmLog(message.str());
	}

	std::lock_guard<std::mutex> guard(updateMtx);

	if	( pendingUpdates.empty()
		||pendingUpdates.back().connectionId != sessionState.connectionId)
	{
		SessionUpdate update;
		update.connectionId = sessionState.connectionId;
		pendingUpdates.push_back(update);
	}

	SessionUpdate& update = pendingUpdates.back();
	update.byteDelta += numBytes;
	update.scanCounts.accumulateFrom(extraction.counts);
	for (auto& frame : extraction.frames)
	{
		update.frames.push_back(std::move(frame));
	}
}

void NtripSession::startWatchdog()
{
	int connId = sessionState.connectionId;

	watchdogTimer->expires_from_now(options.watchdogInterval);
	watchdogTimer->async_wait([this, connId](const boost::system::error_code& err)
	{
		watchdogCheck(connId, err);
	});
}

void NtripSession::watchdogCheck(
	int									connId,
	const boost::system::error_code&	err)
{
	if	( err
		||stale(connId))
	{
		return;
	}

	E_FailureKind	idleResult;
	bool			warned;
	SessionState	snapshot;
	{
		std::lock_guard<std::mutex> guard(stateMtx);
		E_SessionPhase before = sessionState.phase;
		idleResult	= sessionState.checkIdle(timeNow(), options.idleWarning, options.idleTimeout);
		warned		= before != sessionState.phase;
		snapshot	= sessionState;
	}

	if (warned)
	{
		BOOST_LOG_TRIVIAL(warning)
		<< "No data from " << stationConfig.sanitised() << " for " << options.idleWarning.total_seconds() << "s";

		publish(snapshot);
	}

	if (idleResult == E_FailureKind::IDLE_TIMEOUT)
	{
		ntripTrace.networkLog("Idle timeout");
		finish(E_FailureKind::IDLE_TIMEOUT);
		return;
	}

	startWatchdog();
}

void NtripSession::finish(
	E_FailureKind kind)
{
	if (sessionState.phase == E_SessionPhase::TERMINATED)
	{
		return;
	}

	boost::system::error_code ignored;
	handshakeTimer	->cancel();
	watchdogTimer	->cancel();
	resolver		->cancel();
	socket			->shutdown(tcp::socket::shutdown_both, ignored);
	socket			->close(ignored);

	if (stopRequested)
	{
		kind = E_FailureKind::USER_STOP;
	}

	SessionState snapshot;
	{
		std::lock_guard<std::mutex> guard(stateMtx);
		sessionState.terminate(kind, timeNow());
		snapshot = sessionState;
	}

	ntripTrace.networkLog(string("Terminated : ") + failureName(kind));

	if (kind == E_FailureKind::USER_STOP)
	{
		BOOST_LOG_TRIVIAL(info)
		<< "Disconnected " << stationConfig.sanitised() << " (user stopped)";
	}
	else
	{
		BOOST_LOG_TRIVIAL(warning)
		<< "Disconnected " << stationConfig.sanitised() << " (" << failureName(kind) << ")";
	}

	// state is published before anything decides what happens next
	publish(snapshot);

	if (stopRequested)
	{
		return;
	}

	RetryDecision decision;
	if (retryDecider)
	{
		decision = retryDecider(snapshot);
	}

	if (decision.retry() == false)
	{
		return;
	}

	BOOST_LOG_TRIVIAL(info)
	<< "Reconnecting " << stationConfig.sanitised()
	<< " (" << snapshot.reconnectAttempts + 1 << ") in " << decision.delay.total_milliseconds() / 1000.0 << "s";

	retryTimer->expires_from_now(decision.delay);
	retryTimer->async_wait([this](const boost::system::error_code& err)
	{
		retryResponse(err);
	});
}

void NtripSession::retryResponse(
	const boost::system::error_code& err)
{
	if	( err
		||stopRequested)
	{
		return;
	}

	{
		std::lock_guard<std::mutex> guard(stateMtx);
		sessionState.reconnectAttempts++;
	}

	connect();
}

void NtripSession::connectionError(
	const boost::system::error_code&	err,
	string								operation)
{
	ntripTrace.networkLog("Connection error (" + operation + ") : " + err.message());

	BOOST_LOG_TRIVIAL(debug)
	<< "Connection error " << stationConfig.sanitised() << " " << operation << " : " << err.message();

	if (options.logFilename.empty())
		return;

	std::lock_guard<std::mutex> guard(jsonLogMtx);

	std::ofstream logStream(options.logFilename, std::ofstream::app);

	if (!logStream)
	{
		BOOST_LOG_TRIVIAL(warning) << "Error opening log file.\n";
		return;
	}

	ptree root;
	root.put("label", 			"connectionError");
	root.put("Stream", 			stationConfig.mountpoint);
	root.put("Station",			stationConfig.id);
	root.put("Time", 			timeString(timeNow()));
	root.put("BoostSysErrCode", err.value());
	root.put("BoostSysErrMess", err.message());
	root.put("SocketOperation", operation);

	write_json(logStream, root, false);
}

void NtripSession::serverResponse(
	unsigned int	status_code,
	string 			http_version)
{
	if (options.logFilename.empty())
		return;

	std::lock_guard<std::mutex> guard(jsonLogMtx);

	std::ofstream logStream(options.logFilename, std::ofstream::app);

	if (!logStream)
	{
		BOOST_LOG_TRIVIAL(warning) << "Error opening log file.\n";
		return;
	}

	ptree root;
	root.put("label", 			"serverResponse");
	root.put("Stream", 			stationConfig.mountpoint);
	root.put("Station",			stationConfig.id);
	root.put("Time", 			timeString(timeNow()));
	root.put("ServerStatus", 	status_code);
	root.put("VersionHTTP",		http_version);

	write_json(logStream, root, false);
}
