
#include <sstream>

#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/log/trivial.hpp>

#include "sourcetable.hpp"


#define STR_LAT_FIELD	9
#define STR_LON_FIELD	10

/** Sourcetables use 0 for unknown coordinates
*/
boost::optional<double> parseCoordinate(
	const string& field)
{
	double value;
	if	( field.empty()
		||boost::conversion::try_lexical_convert(field, value) == false
		||value == 0)
	{
		return boost::none;
	}

	return value;
}

boost::optional<MountpointRecord> parseSourcetableLine(
	const string& line)
{
	string trimmed = boost::algorithm::trim_copy(line);

	if (boost::algorithm::starts_with(trimmed, "STR;") == false)
	{
		return boost::none;
	}

	vector<string> fields;
	boost::algorithm::split(fields, trimmed, boost::is_any_of(";"));

	if (fields.size() <= STR_LON_FIELD)
	{
		BOOST_LOG_TRIVIAL(debug)
		<< "Skipping short sourcetable record : " << trimmed;

		return boost::none;
	}

	MountpointRecord record;
	record.mountpoint		= fields[1];
	record.identifier		= fields[2];
	record.format			= fields[3];
	record.formatDetails	= fields[4];
	record.network			= fields[7];
	record.country			= fields[8];

	if (boost::conversion::try_lexical_convert(fields[5], record.carrier) == false)
	{
		record.carrier = 0;
	}

	if (fields[6].empty() == false)
	{
		boost::algorithm::split(record.navSystems, fields[6], boost::is_any_of("+"));
	}

	record.latitude		= parseCoordinate(fields[STR_LAT_FIELD]);
	record.longitude	= parseCoordinate(fields[STR_LON_FIELD]);

	if (record.mountpoint.empty())
	{
		BOOST_LOG_TRIVIAL(debug)
		<< "Skipping sourcetable record without mountpoint : " << trimmed;

		return boost::none;
	}

	return record;
}

/** Parse the STR records of a full sourcetable response, ignoring the CAS and NET records and any http header
*/
vector<MountpointRecord> parseSourcetable(
	const string& sourcetable)
{
	vector<MountpointRecord> records;

	std::istringstream stream(sourcetable);
	string line;
	while (std::getline(stream, line))
	{
		if (boost::algorithm::starts_with(line, "ENDSOURCETABLE"))
		{
			break;
		}

		auto record = parseSourcetableLine(line);
		if (record)
		{
			records.push_back(*record);
		}
	}

	return records;
}

StationConfig toStationConfig(
	const MountpointRecord&	record,
	const string&			casterHost,
	int						casterPort,
	const string&			username,
	const string&			password)
{
	StationConfig config;
	config.id			= record.mountpoint;
	config.host			= casterHost;
	config.port			= casterPort;
	config.mountpoint	= record.mountpoint;
	config.username		= username;
	config.password		= password;
	config.latitude		= record.latitude;
	config.longitude	= record.longitude;
	return config;
}
