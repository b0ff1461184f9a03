
#include "sessionState.hpp"


time_duration SessionState::uptime(
	ptime now) const
{
	time_duration total = accumulatedUptime;

	if	( phase == E_SessionPhase::CONNECTED
		&&connectedSince.is_not_a_date_time() == false
		&&now > connectedSince)
	{
		total += now - connectedSince;
	}

	return total;
}

void SessionState::started(
	ptime now)
{
	phase				= E_SessionPhase::DISCONNECTED;
	failureKind			= E_FailureKind::FAILURE_NONE;
	reconnectAttempts	= 0;
	userStopped			= false;
	startedTime			= now;
	disconnectedTime	= now;
}

void SessionState::beginConnect(
	ptime now)
{
	phase				= E_SessionPhase::CONNECTING;
	totalBytesReceived	= 0;
	dataFlowed			= false;
	accumulatedUptime	= boost::posix_time::seconds(0);
	connectedSince		= ptime();
	handshakeTime		= ptime();
	lastDataTimestamp	= ptime();

	connectionId++;
}

void SessionState::handshakeAccepted(
	ptime now)
{
	phase			= E_SessionPhase::CONNECTED;
	connectedSince	= now;
	handshakeTime	= now;

	if (disconnectedTime.is_not_a_date_time() == false)
	{
		disconnectedDuration += now - disconnectedTime;
	}
}

/** Record a chunk of stream bytes.
* Returns true for the first chunk on this connection - the point where reconnection attempts are reset
*/
bool SessionState::dataReceived(
	size_t	numBytes,
	ptime	now)
{
	totalBytesReceived	+= numBytes;
	numberChunks		++;
	lastDataTimestamp	= now;

	if (phase == E_SessionPhase::IDLE_WARNING)
	{
		phase			= E_SessionPhase::CONNECTED;
		connectedSince	= now;
	}

	if (dataFlowed)
	{
		return false;
	}

	dataFlowed			= true;
	reconnectAttempts	= 0;

	return true;
}

/** Move between Connected and IdleWarning according to the time since the last data.
* Returns IDLE_TIMEOUT when the connection should be terminated
*/
E_FailureKind SessionState::checkIdle(
	ptime			now,
	time_duration	idleWarning,
	time_duration	idleTimeout)
{
	if (isUp() == false)
	{
		return E_FailureKind::FAILURE_NONE;
	}

	ptime reference = handshakeTime;
	if	( lastDataTimestamp.is_not_a_date_time() == false
		&&lastDataTimestamp > reference)
	{
		reference = lastDataTimestamp;
	}

	time_duration idle = now - reference;

	if (idle >= idleTimeout)
	{
		return E_FailureKind::IDLE_TIMEOUT;
	}

	if	( idle	>= idleWarning
		&&phase	== E_SessionPhase::CONNECTED)
	{
		accumulatedUptime	+= now - connectedSince;
		connectedSince		= ptime();
		phase				= E_SessionPhase::IDLE_WARNING;
	}

	return E_FailureKind::FAILURE_NONE;
}

void SessionState::terminate(
	E_FailureKind	kind,
	ptime			now)
{
	if (isUp())
	{
		if (phase == E_SessionPhase::CONNECTED)
		{
			accumulatedUptime += now - connectedSince;
		}

		connectedDuration += now - handshakeTime;
		disconnectionCount++;
		disconnectedTime = now;
	}

	connectedSince	= ptime();
	phase			= E_SessionPhase::TERMINATED;
	failureKind		= kind;

	if (kind == E_FailureKind::USER_STOP)
	{
		userStopped = true;
	}
}
