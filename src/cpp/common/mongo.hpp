#ifndef MONGO_H
#define MONGO_H

#ifdef ENABLE_MONGODB

#include <string>

using std::string;

#include <bsoncxx/builder/stream/document.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/uri.hpp>

using bsoncxx::builder::stream::document;
using bsoncxx::builder::stream::finalize;
using bsoncxx::builder::stream::open_document;
using bsoncxx::builder::stream::close_document;

#include "streamStatistics.hpp"


struct Mongo
{
	mongocxx::instance	instance;
	mongocxx::pool		pool;

	Mongo(
		string uri)
	:	pool	{mongocxx::uri{uri}}
	{

	}
};

extern Mongo* mongo_ptr;

void mongoInit(
	string uri,
	string database);

void mongoStationStatistics(
	const StationStatistics&	stats,
	ptime						now);

#endif

#endif
