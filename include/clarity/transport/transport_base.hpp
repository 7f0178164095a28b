#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal HID transport seam consumed by clarity::Session.
 *
 * Header-only. The session needs exactly two things from the outside:
 * enumerate devices by vendor/product id, and open a path into a byte handle that
 * can write one report and read one report with a timeout. Everything else about
 * HID (report descriptors, feature reports, hotplug) stays out.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace clarity::transport {

// Return codes kept simple; the session maps them onto its exceptions.
enum class TxResult : uint8_t { Ok=0, Error=1 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };   // None = timed out with no data

/// One enumerated device.
struct DeviceInfo {
  std::string path;           // provider-specific open path (/dev/hidraw3, "1-2:1.0", ...)
  uint16_t    vendor_id{0};
  uint16_t    product_id{0};
  std::string serial;         // USB serial string, may be empty
  std::string product;        // product string, may be empty
};

/**
 * @brief An open HID handle.
 *
 * Contract:
 *  - write(data,len,written) sends one report; Ok only if the whole report went out
 *    (written == len). Byte 0 of data is the report id (0 for unnumbered reports).
 *  - read(out,cap,out_len,timeout_ms) waits up to timeout_ms for one report and copies
 *    at most cap bytes. None if nothing arrived, Error on hard failure.
 *  - close() releases the OS handle; idempotent. Destruction closes too.
 *  - name() is a short identifier for logs.
 *
 * Not thread-safe on its own. Session serializes access.
 */
class IHidDevice {
public:
  virtual ~IHidDevice() = default;
  virtual TxResult    write(const uint8_t* data, std::size_t len, std::size_t& written) = 0;
  virtual RxResult    read(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) = 0;
  virtual void        close() = 0;
  virtual const char* name() const = 0;
};

/// Factory side: find devices and open them.
class IHidProvider {
public:
  virtual ~IHidProvider() = default;
  virtual std::vector<DeviceInfo>     enumerate(uint16_t vendor_id, uint16_t product_id) = 0;
  virtual std::unique_ptr<IHidDevice> open(const std::string& path) = 0;   // null on failure
  virtual const char*                 name() const = 0;
};

} // namespace clarity::transport
