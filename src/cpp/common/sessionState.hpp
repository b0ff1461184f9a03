#ifndef SESSION_STATE_H
#define SESSION_STATE_H

#include <string>

using std::string;

#include <boost/date_time/posix_time/posix_time.hpp>

#include "enums.h"

using boost::posix_time::ptime;
using boost::posix_time::time_duration;


/** Connection state of one station, written only by its session thread.
* Other threads work on copies taken through NtripSession::state()
*/
struct SessionState
{
	string			stationId;
	E_SessionPhase	phase				= E_SessionPhase::DISCONNECTED;
	E_FailureKind	failureKind			= E_FailureKind::FAILURE_NONE;

	long int		totalBytesReceived	= 0;
	int				reconnectAttempts	= 0;
	int				connectionId		= 0;		///< Incremented for every fresh connection attempt
	bool			dataFlowed			= false;	///< Bytes have arrived on the current connection
	bool			userStopped			= false;

	ptime			startedTime;
	ptime			lastDataTimestamp;
	ptime			connectedSince;
	ptime			handshakeTime;
	ptime			disconnectedTime;
	time_duration	accumulatedUptime	= boost::posix_time::seconds(0);

	int				disconnectionCount	= 0;
	long int		numberChunks		= 0;
	time_duration	connectedDuration		= boost::posix_time::seconds(0);
	time_duration	disconnectedDuration	= boost::posix_time::seconds(0);

	bool isUp() const
	{
		return	( phase == E_SessionPhase::CONNECTED
				||phase == E_SessionPhase::IDLE_WARNING);
	}

	bool isActive() const
	{
		return	( phase != E_SessionPhase::DISCONNECTED
				&&phase != E_SessionPhase::TERMINATED);
	}

	time_duration uptime(
		ptime now) const;

	void started(
		ptime now);

	void beginConnect(
		ptime now);

	void handshakeAccepted(
		ptime now);

	bool dataReceived(
		size_t	numBytes,
		ptime	now);

	E_FailureKind checkIdle(
		ptime			now,
		time_duration	idleWarning,
		time_duration	idleTimeout);

	void terminate(
		E_FailureKind	kind,
		ptime			now);
};

#endif
