
#ifdef ENABLE_MONGODB

#include <chrono>

#include <boost/log/trivial.hpp>

#include "mongo.hpp"


Mongo*	mongo_ptr = nullptr;
string	mongo_database;

void mongoInit(
	string uri,
	string database)
{
	if (mongo_ptr)
		return;

	try
	{
		mongo_ptr = new Mongo(uri);
	}
	catch (std::exception& e)
	{
		BOOST_LOG_TRIVIAL(error)
		<< "Unable to connect to mongo at " << uri << " : " << e.what();

		return;
	}

	mongo_database = database;

	Mongo& mongo = *mongo_ptr;

	auto c = mongo.pool.acquire();
	mongocxx::client&		client	= *c;
	mongocxx::database		db		= client[mongo_database];

	db["Streams"]		.create_index(
							document{}
								<< "Epoch"		<< 1
								<< "Station"	<< 1
								<< finalize,
							{});
}

std::chrono::system_clock::time_point toTimePoint(
	ptime time)
{
	auto sinceEpoch = time - boost::posix_time::ptime(boost::gregorian::date(1970, 1, 1));
	return std::chrono::system_clock::time_point(std::chrono::milliseconds(sinceEpoch.total_milliseconds()));
}

void mongoStationStatistics(
	const StationStatistics&	stats,
	ptime						now)
{
	if (mongo_ptr == nullptr)
	{
		return;
	}

	Mongo& mongo = *mongo_ptr;

	auto 						c		= mongo.pool.acquire();
	mongocxx::client&			client	= *c;
	mongocxx::database			db		= client[mongo_database];
	mongocxx::collection		coll	= db	["Streams"];

	bsoncxx::builder::stream::document messages;
	for (auto& [type, messageCount] : stats.messageCounts)
	{
		messages << std::to_string(type) << messageCount.count;
	}

	bsoncxx::builder::stream::document satellites;
	for (auto& [sys, prns] : stats.satellites)
	{
		satellites << sysName(sys) << (int) prns.size();
	}

	try
	{
		coll.insert_one(
			document{}
				<< "Epoch"			<< bsoncxx::types::b_date {toTimePoint(now)}
				<< "Station"		<< stats.stationId
				<< "Phase"			<< phaseName(stats.session.phase)
				<< "Failure"		<< failureName(stats.session.failureKind)
				<< "Bytes"			<< (int64_t) stats.totalBytes
				<< "ByteRate"		<< stats.byteRate()
				<< "Uptime"			<< (int64_t) stats.uptime.total_seconds()
				<< "Disconnects"	<< stats.networkData.disconnectionCount
				<< "Messages"		<< bsoncxx::types::b_document{messages.view()}
				<< "Satellites"		<< bsoncxx::types::b_document{satellites.view()}
				<< finalize
			);
	}
	catch (std::exception& e)
	{
		BOOST_LOG_TRIVIAL(warning)
		<< "Unable to write statistics of " << stats.stationId << " to mongo : " << e.what();
	}
}

#endif
