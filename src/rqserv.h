#ifndef RQSERV_H
#define RQSERV_H

/*
 * status codes shared by the queue, executor, store and session table
 */
enum rq_status_t {
  RQ_OK,
  RQ_INVALID_COMMAND,		// empty or whitespace-only command text
  RQ_EVALUATION_FAILURE,	// command raised an error on the device
  RQ_DEVICE_UNAVAILABLE,	// device acquisition failed
  RQ_TIMEOUT,			// command exceeded its execution budget
  RQ_CANCELLED,			// batch abandoned before command ran
  RQ_ERROR			// store or I/O failure
};

inline const char *rq_status_string(rq_status_t status)
{
  switch (status) {
  case RQ_OK:                 return "ok";
  case RQ_INVALID_COMMAND:    return "invalid command";
  case RQ_EVALUATION_FAILURE: return "evaluation failure";
  case RQ_DEVICE_UNAVAILABLE: return "unavailable device";
  case RQ_TIMEOUT:            return "timeout";
  case RQ_CANCELLED:          return "cancelled";
  default:                    return "error";
  }
}

#endif
