#include "DeviceChannel.h"

#include <chrono>
#include <exception>
#include <iostream>

DeviceChannel::DeviceChannel(Device *device, int timeout_ms,
			     int acquire_timeout_ms):
  device(device), eval_timeout_ms(timeout_ms),
  acquire_timeout_ms(acquire_timeout_ms)
{
  m_bDone = false;
  process_thread = std::thread(&DeviceChannel::process_requests, this);
}

DeviceChannel::~DeviceChannel()
{
  shutdown();
  if (process_thread.joinable()) process_thread.join();
}

void DeviceChannel::shutdown(void)
{
  if (m_bDone.exchange(true)) return;

  device_request_t req;
  req.type = DEV_SHUTDOWN;
  req.id = 0;
  queue.push_back(std::move(req));
}

/*
 * a device that throws fails the call instead of ending the thread
 * every request depends on
 */
template <typename F>
static int guarded(const char *what, std::string &error, F call)
{
  try {
    return call();
  } catch (const std::exception &e) {
    error = e.what();
  } catch (...) {
    error = std::string("unknown exception in device ") + what;
  }
  std::cerr << "DeviceChannel: device " << what << " threw: "
	    << error << std::endl;
  return DEVICE_ERROR;
}

static void release_device(Device *device)
{
  std::string error;
  guarded("release", error, [device] { device->release(); return DEVICE_OK; });
}

void DeviceChannel::process_requests(DeviceChannel *channel)
{
  Device *device = channel->device;
  bool acquired = false;

  /* process until receive a message saying we are done */
  while (true) {
    device_request_t req = channel->queue.pop_front();
    if (req.type == DEV_SHUTDOWN) break;

    device_reply_t reply;
    reply.id = req.id;
    reply.rc = DEVICE_OK;

    switch (req.type) {
    case DEV_ACQUIRE:
      if (!acquired) {
	reply.rc = guarded("acquire", reply.result,
			   [&] { return device->acquire(reply.result); });
	acquired = (reply.rc == DEVICE_OK);
      }
      channel->replies.push_back(std::move(reply));
      break;
    case DEV_EVAL:
      if (!channel->start_request(req.id)) break;
      if (!acquired) {
	reply.rc = DEVICE_ERROR;
	reply.result = "device not acquired";
      }
      else {
	reply.rc = guarded("evaluate", reply.result,
			   [&] { return device->evaluate(req.text, reply.result); });
      }
      channel->replies.push_back(std::move(reply));
      break;
    case DEV_RELEASE:
      if (acquired) {
	release_device(device);
	acquired = false;
      }
      break;
    default:
      break;
    }
  }

  if (acquired) release_device(device);
}

/*
 * mark request id as running, false if its caller already gave up
 */
bool DeviceChannel::start_request(uint64_t id)
{
  std::lock_guard<std::mutex> lock(state_mutex);
  last_started = id;
  bool skip = abandoned.erase(id) > 0;
  state_cond.notify_all();
  return !skip;
}

/*
 * wait for the reply to request id, dropping replies to requests
 * whose callers already timed out
 */
int DeviceChannel::wait_reply(uint64_t id, int timeout_ms,
			      std::string &result)
{
  using namespace std::chrono;
  auto deadline = steady_clock::now() + milliseconds(timeout_ms);
  device_reply_t reply;

  while (true) {
    auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
    if (remaining.count() < 0) remaining = milliseconds(0);

    if (!replies.pop_front_for(reply, remaining)) return DEVICE_TIMEOUT;
    if (reply.id == id) {
      result = std::move(reply.result);
      return reply.rc;
    }
  }
}

void DeviceChannel::free_lease(void)
{
  {
    std::lock_guard<std::mutex> lock(lease_mutex);
    leased = false;
  }
  lease_cond.notify_one();
}

int DeviceChannel::acquire(std::string &error)
{
  if (m_bDone) {
    error = "device channel shut down";
    return DEVICE_ERROR;
  }

  {
    std::unique_lock<std::mutex> lock(lease_mutex);
    if (!lease_cond.wait_for(lock,
			     std::chrono::milliseconds(acquire_timeout_ms),
			     [this] { return !leased; })) {
      error = "device busy";
      return DEVICE_ERROR;
    }
    leased = true;
  }

  device_request_t req;
  req.type = DEV_ACQUIRE;
  req.id = next_id++;
  queue.push_back(req);

  int rc = wait_reply(req.id, acquire_timeout_ms, error);
  if (rc == DEVICE_OK) return DEVICE_OK;

  if (rc == DEVICE_TIMEOUT) error = "device did not respond";

  /* balance an acquisition that completes after we gave up */
  device_request_t rel;
  rel.type = DEV_RELEASE;
  rel.id = 0;
  queue.push_back(std::move(rel));

  free_lease();
  return DEVICE_ERROR;
}

int DeviceChannel::evaluate(const std::string &text, std::string &result)
{
  device_request_t req;
  req.type = DEV_EVAL;
  req.id = next_id++;
  req.text = text;
  queue.push_back(req);

  /* the device may still be busy with a command that timed out */
  {
    std::unique_lock<std::mutex> lock(state_mutex);
    if (!state_cond.wait_for(lock, std::chrono::milliseconds(eval_timeout_ms),
			     [this, &req] { return last_started >= req.id; })) {
      abandoned.insert(req.id);
      result = "timeout";
      return DEVICE_TIMEOUT;
    }
  }

  int rc = wait_reply(req.id, eval_timeout_ms, result);
  if (rc == DEVICE_TIMEOUT) result = "timeout";
  return rc;
}

void DeviceChannel::release(void)
{
  device_request_t req;
  req.type = DEV_RELEASE;
  req.id = 0;
  queue.push_back(std::move(req));

  free_lease();
}
