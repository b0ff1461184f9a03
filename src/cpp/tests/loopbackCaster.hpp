#ifndef LOOPBACK_CASTER_H
#define LOOPBACK_CASTER_H

#include <functional>
#include <cstdint>
#include <memory>
#include <thread>
#include <string>
#include <vector>
#include <deque>
#include <mutex>

using std::string;
using std::vector;
using std::deque;

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/asio.hpp>

using boost::asio::ip::tcp;


/** What the caster does with one incoming connection
*/
struct CasterReply
{
	bool			dropImmediately	= false;			///< Close without reading the request
	string			header			= "ICY 200 OK\r\n\r\n";
	vector<uint8_t>	data;
	bool			closeAfterData	= false;
};

/** A scripted caster on the loopback interface.
* Each accepted connection takes the next reply from the script, the last one repeats
*/
struct LoopbackCaster
{
	boost::asio::io_context	io;
	tcp::acceptor			acceptor;
	std::thread				thread;

	std::mutex								casterMtx;
	deque<CasterReply>						script;
	vector<string>							requests;
	int										connections	= 0;
	vector<std::shared_ptr<tcp::socket>>	openSockets;

	LoopbackCaster()
	:	acceptor(io, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0))
	{
		accept();

		thread = std::thread([this]
		{
			io.run();
		});
	}

	~LoopbackCaster()
	{
		io.stop();
		thread.join();
	}

	int port()
	{
		return acceptor.local_endpoint().port();
	}

	void addReply(
		const CasterReply& reply)
	{
		std::lock_guard<std::mutex> guard(casterMtx);
		script.push_back(reply);
	}

	int connectionCount()
	{
		std::lock_guard<std::mutex> guard(casterMtx);
		return connections;
	}

	vector<string> receivedRequests()
	{
		std::lock_guard<std::mutex> guard(casterMtx);
		return requests;
	}

	/** Close every connection that was left open
	*/
	void closeAll()
	{
		boost::asio::post(io, [this]
		{
			std::lock_guard<std::mutex> guard(casterMtx);
			for (auto& socket : openSockets)
			{
				boost::system::error_code ignored;
				socket->shutdown(tcp::socket::shutdown_both, ignored);
				socket->close(ignored);
			}
			openSockets.clear();
		});
	}

private:
	CasterReply nextReply()
	{
		std::lock_guard<std::mutex> guard(casterMtx);

		connections++;

		CasterReply reply;
		if (script.empty() == false)
		{
			reply = script.front();
			if (script.size() > 1)
			{
				script.pop_front();
			}
		}
		return reply;
	}

	void accept()
	{
		auto socket = std::make_shared<tcp::socket>(io);

		acceptor.async_accept(*socket, [this, socket](const boost::system::error_code& err)
		{
			if (err)
			{
				return;
			}

			serve(socket, nextReply());

			accept();
		});
	}

	void serve(
		std::shared_ptr<tcp::socket>	socket,
		CasterReply						reply)
	{
		if (reply.dropImmediately)
		{
			boost::system::error_code ignored;
			socket->close(ignored);
			return;
		}

		auto requestBuf = std::make_shared<boost::asio::streambuf>();

		boost::asio::async_read_until(*socket, *requestBuf, "\r\n\r\n",
			[this, socket, requestBuf, reply](const boost::system::error_code& err, size_t numBytes)
			{
				if (err)
				{
					return;
				}

				auto bufs = requestBuf->data();
				string request(boost::asio::buffers_begin(bufs), boost::asio::buffers_begin(bufs) + numBytes);
				{
					std::lock_guard<std::mutex> guard(casterMtx);
					requests.push_back(request);
				}

				auto payload = std::make_shared<string>(reply.header);
				payload->append(reply.data.begin(), reply.data.end());

				boost::asio::async_write(*socket, boost::asio::buffer(*payload),
					[this, socket, payload, reply](const boost::system::error_code& err, size_t numBytes)
					{
						if (reply.closeAfterData)
						{
							boost::system::error_code ignored;
							socket->shutdown(tcp::socket::shutdown_both, ignored);
							socket->close(ignored);
							return;
						}

						std::lock_guard<std::mutex> guard(casterMtx);
						openSockets.push_back(socket);
					});
			});
	}
};

/** Poll a condition until it holds or the timeout passes
*/
inline bool waitFor(
	std::function<bool()>				condition,
	boost::posix_time::time_duration	timeout = boost::posix_time::seconds(5))
{
	auto deadline = boost::posix_time::microsec_clock::universal_time() + timeout;

	while (boost::posix_time::microsec_clock::universal_time() < deadline)
	{
		if (condition())
		{
			return true;
		}

		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}

	return condition();
}

#endif
