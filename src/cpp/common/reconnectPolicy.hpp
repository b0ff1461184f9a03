#ifndef RECONNECT_POLICY_H
#define RECONNECT_POLICY_H

#include <boost/date_time/posix_time/posix_time.hpp>

#include "enums.h"

using boost::posix_time::time_duration;


struct RetryDecision
{
	E_RetryAction	action	= E_RetryAction::GIVE_UP;
	time_duration	delay	= boost::posix_time::seconds(0);

	bool retry() const
	{
		return action == E_RetryAction::RETRY_AFTER;
	}
};

/** Decides whether a terminated session may be retried.
* Only transport failures are worth retrying, and only a bounded number of times
*/
struct ReconnectPolicy
{
	int				maxAttempts	= 3;
	time_duration	delay		= boost::posix_time::seconds(10);

	RetryDecision decide(
		E_FailureKind	failureKind,
		int				reconnectAttempts,
		bool			userStopped = false) const;
};

#endif
