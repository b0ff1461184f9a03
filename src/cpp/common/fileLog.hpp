#ifndef FILE_LOG_H
#define FILE_LOG_H

#include <fstream>
#include <string>

using std::string;

#include <boost/log/sinks/basic_sink_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/core.hpp>
#include <boost/shared_ptr.hpp>


/** Log sink backend that appends every log line to a file as a JSON record,
* alongside the connectionError, serverResponse and networkStatistics records of the sessions
*/
struct FileLog : public boost::log::sinks::basic_formatted_sink_backend<char, boost::log::sinks::synchronized_feeding>
{
	FileLog(
		const string& filename);

	bool isOpen() const
	{
		return logStream.is_open();
	}

	void consume(
		boost::log::record_view const&	rec,
		string_type const&				log_string);

private:
	std::ofstream	logStream;
};

typedef boost::log::sinks::synchronous_sink<FileLog>	FileLogSink;

boost::shared_ptr<FileLogSink> addFileLog(
	const string& filename);

#endif
