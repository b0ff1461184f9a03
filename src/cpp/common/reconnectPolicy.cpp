
#include "reconnectPolicy.hpp"


RetryDecision ReconnectPolicy::decide(
	E_FailureKind	failureKind,
	int				reconnectAttempts,
	bool			userStopped) const
{
	RetryDecision decision;

	if (userStopped)
	{
		return decision;
	}

	switch (failureKind)
	{
		case E_FailureKind::NETWORK_ERROR:
		{
			if (reconnectAttempts < maxAttempts)
			{
				decision.action	= E_RetryAction::RETRY_AFTER;
				decision.delay	= delay;
			}
			break;
		}
		case E_FailureKind::IDLE_TIMEOUT:
		case E_FailureKind::MOUNTPOINT_CLOSED:
		case E_FailureKind::AUTH_FAILURE:
		case E_FailureKind::USER_STOP:
		case E_FailureKind::FAILURE_NONE:
			break;
	}

	return decision;
}
