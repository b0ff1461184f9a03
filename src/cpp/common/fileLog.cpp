
#define BOOST_BIND_GLOBAL_PLACEHOLDERS

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/log/trivial.hpp>
#include <boost/make_shared.hpp>

using boost::property_tree::ptree;
using boost::property_tree::write_json;

#include "ntripTrace.hpp"
#include "fileLog.hpp"


FileLog::FileLog(
	const string& filename)
:	logStream	(filename, std::ofstream::app)
{

}

/** Trace level of a log record, matching the trace_level option
*/
int traceLevel(
	boost::log::trivial::severity_level severity)
{
	switch (severity)
	{
		case boost::log::trivial::trace:		return 5;
		case boost::log::trivial::debug:		return 4;
		case boost::log::trivial::info:			return 3;
		case boost::log::trivial::warning:		return 2;
		case boost::log::trivial::error:		return 1;
		case boost::log::trivial::fatal:		return 0;
	}
	return 2;
}

void FileLog::consume(
	boost::log::record_view	const&	rec,
	string_type				const&	log_string)
{
	string mess = log_string;
	boost::erase_all(mess, "\n");
	if (mess.empty())
		return;

	auto severity = rec.attribute_values()[boost::log::trivial::severity];

	ptree root;
	root.put("label", 		"message");
	root.put("timestamp", 	timeString(timeNow()));
	if (severity)
	{
		root.put("level", 	traceLevel(*severity));
		root.put("severity",boost::log::trivial::to_string(*severity));
	}
	root.put("str", 		mess);

	write_json(logStream, root, false);
	logStream.flush();
}

/** Register a JSON file sink with the logging core.
* Returns nullptr, leaving the core unchanged, if the file cannot be opened
*/
boost::shared_ptr<FileLogSink> addFileLog(
	const string& filename)
{
	auto backend = boost::make_shared<FileLog>(filename);
	if (backend->isOpen() == false)
	{
		BOOST_LOG_TRIVIAL(error)
		<< "Unable to open log file " << filename;

		return nullptr;
	}

	auto logSink = boost::make_shared<FileLogSink>(backend);

	boost::log::core::get()->add_sink(logSink);

	return logSink;
}
