#ifndef DEVICE_H
#define DEVICE_H

#include <string>

enum device_rc { DEVICE_OK, DEVICE_ERROR, DEVICE_TIMEOUT };

/*
 * Device
 *
 * Opaque, stateful connection that commands run against. A device is
 * only ever called from the DeviceChannel process thread, so
 * implementations need no locking of their own.
 *
 * acquire() and evaluate() return DEVICE_OK or DEVICE_ERROR; on error
 * the string argument holds a human readable description. On success
 * evaluate() leaves the rendered value (possibly empty) in result.
 */
class Device
{
 public:
  virtual ~Device() {}

  virtual int acquire(std::string &error) = 0;
  virtual int evaluate(const std::string &text, std::string &result) = 0;
  virtual void release() = 0;
};

#endif
