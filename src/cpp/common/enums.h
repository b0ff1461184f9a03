#ifndef ENUMS_H
#define ENUMS_H


/** Satellite systems that can be identified from RTCM MSM message numbers
*/
enum class E_Sys
{
	NONE,
	GPS,
	GLO,
	GAL,
	SBS,
	QZS,
	BDS
};

/** Lifecycle of a single caster connection
*/
enum class E_SessionPhase
{
	DISCONNECTED,
	CONNECTING,
	CONNECTED,
	IDLE_WARNING,
	TERMINATED
};

/** Classification of the most recent termination of a session
*/
enum class E_FailureKind
{
	FAILURE_NONE,
	NETWORK_ERROR,
	IDLE_TIMEOUT,
	MOUNTPOINT_CLOSED,
	AUTH_FAILURE,
	USER_STOP
};

enum class E_RetryAction
{
	RETRY_AFTER,
	GIVE_UP
};

enum class E_AlertKind
{
	CONNECTION_LOST,
	CONNECTION_RESTORED,
	LOW_DATA_RATE,
	LOW_SATELLITES
};



inline const char* sysName(
	E_Sys sys)
{
	switch (sys)
	{
		case E_Sys::GPS:	return "GPS";
		case E_Sys::GLO:	return "GLONASS";
		case E_Sys::GAL:	return "Galileo";
		case E_Sys::SBS:	return "SBAS";
		case E_Sys::QZS:	return "QZSS";
		case E_Sys::BDS:	return "BeiDou";
		default:			return "NONE";
	}
}

inline const char* phaseName(
	E_SessionPhase phase)
{
	switch (phase)
	{
		case E_SessionPhase::DISCONNECTED:	return "Disconnected";
		case E_SessionPhase::CONNECTING:	return "Connecting";
		case E_SessionPhase::CONNECTED:		return "Connected";
		case E_SessionPhase::IDLE_WARNING:	return "IdleWarning";
		case E_SessionPhase::TERMINATED:	return "Terminated";
	}
	return "Unknown";
}

inline const char* failureName(
	E_FailureKind kind)
{
	switch (kind)
	{
		case E_FailureKind::FAILURE_NONE:		return "None";
		case E_FailureKind::NETWORK_ERROR:		return "NetworkError";
		case E_FailureKind::IDLE_TIMEOUT:		return "IdleTimeout";
		case E_FailureKind::MOUNTPOINT_CLOSED:	return "MountpointClosed";
		case E_FailureKind::AUTH_FAILURE:		return "AuthFailure";
		case E_FailureKind::USER_STOP:			return "UserStop";
	}
	return "Unknown";
}

inline const char* alertName(
	E_AlertKind kind)
{
	switch (kind)
	{
		case E_AlertKind::CONNECTION_LOST:		return "ConnectionLost";
		case E_AlertKind::CONNECTION_RESTORED:	return "ConnectionRestored";
		case E_AlertKind::LOW_DATA_RATE:		return "LowDataRate";
		case E_AlertKind::LOW_SATELLITES:		return "LowSatellites";
	}
	return "Unknown";
}

#endif
