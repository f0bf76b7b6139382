#ifndef DEVICECHANNEL_H
#define DEVICECHANNEL_H

#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <string>
#include <set>
#include <cstdint>

#include "sharedqueue.h"
#include "Device.h"

/*
 * device_request
 *   requests to the device process thread can be:
 *     DEV_ACQUIRE:  acquire the device, replies
 *     DEV_EVAL:     evaluate text, replies with rendering or error
 *     DEV_RELEASE:  release the device, no reply
 *     DEV_SHUTDOWN: end the process thread
 */

enum device_request_type_t { DEV_ACQUIRE, DEV_EVAL, DEV_RELEASE, DEV_SHUTDOWN };

typedef struct device_request_s {
  device_request_type_t type;
  uint64_t id;
  std::string text;
} device_request_t;

typedef struct device_reply_s {
  uint64_t id;
  int rc;
  std::string result;
} device_reply_t;

/*
 * DeviceChannel
 *
 * Owns the only thread that touches the Device. Callers hold a lease
 * (one at a time, across all sessions) between acquire() and release()
 * and wait on replies with a timeout. A reply that arrives after its
 * caller gave up is recognised by id and dropped, so the device never
 * sees two commands at once.
 *
 * An evaluation's budget starts when the process thread picks it up.
 * If a timed out command is still running the next one first waits up
 * to one more timeout for the device; if it never gets there it is
 * skipped, not run late.
 */
class DeviceChannel
{
  Device *device;

  std::thread process_thread;
  SharedQueue<device_request_t> queue;
  SharedQueue<device_reply_t> replies;
  std::atomic<uint64_t> next_id{1};

  std::mutex lease_mutex;
  std::condition_variable lease_cond;
  bool leased = false;

  /* which requests the process thread has picked up or must skip */
  std::mutex state_mutex;
  std::condition_variable state_cond;
  uint64_t last_started = 0;
  std::set<uint64_t> abandoned;

  std::atomic<int> eval_timeout_ms;
  std::atomic<int> acquire_timeout_ms;
  std::atomic<bool> m_bDone;

  static void process_requests(DeviceChannel *channel);
  bool start_request(uint64_t id);
  int wait_reply(uint64_t id, int timeout_ms, std::string &result);
  void free_lease(void);

 public:
  static constexpr int DEFAULT_TIMEOUT_MS = 5000;

  DeviceChannel(Device *device,
		int timeout_ms = DEFAULT_TIMEOUT_MS,
		int acquire_timeout_ms = DEFAULT_TIMEOUT_MS);
  ~DeviceChannel();

  int acquire(std::string &error);
  int evaluate(const std::string &text, std::string &result);
  void release(void);

  void set_timeout(int ms) { eval_timeout_ms = ms; }
  int timeout(void) const { return eval_timeout_ms; }
  void set_acquire_timeout(int ms) { acquire_timeout_ms = ms; }
  int acquire_timeout(void) const { return acquire_timeout_ms; }

  void shutdown(void);
  bool isDone(void) { return m_bDone; }
};

/*
 * DeviceLease
 *   scoped hold on a channel, released on every exit path
 */
class DeviceLease
{
  DeviceChannel &channel;
  int rc;
  std::string error_;

 public:
  explicit DeviceLease(DeviceChannel &channel): channel(channel)
  {
    rc = channel.acquire(error_);
  }
  ~DeviceLease()
  {
    if (rc == DEVICE_OK) channel.release();
  }
  DeviceLease(const DeviceLease &) = delete;
  DeviceLease &operator=(const DeviceLease &) = delete;

  bool held() const { return rc == DEVICE_OK; }
  const std::string &error() const { return error_; }
};

#endif
