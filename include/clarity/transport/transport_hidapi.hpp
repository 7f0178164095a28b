#pragma once
/**
 * @file transport_hidapi.hpp
 * @brief hidapi-backed provider (header-only; hidraw or libusb flavour, picked at link time).
 *
 * Depends on: hidapi.h. The library is initialised once per process and torn down
 * when the last provider and every device any provider opened are gone.
 */

#include "clarity/transport/transport_base.hpp"

#include <hidapi.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace clarity::transport {

namespace detail {

// hid_init()/hid_exit() pair. hidapi state is process-wide, so there is one
// instance at a time, held by every provider and every device they opened.
struct HidApiLibrary {
  bool ok{false};
  HidApiLibrary() : ok(::hid_init() == 0) {}
  ~HidApiLibrary() { if (ok) ::hid_exit(); }
  HidApiLibrary(const HidApiLibrary&) = delete;
  HidApiLibrary& operator=(const HidApiLibrary&) = delete;
};

// The live instance, or a fresh one once the last holder has released it.
inline std::shared_ptr<HidApiLibrary> acquire_library() {
  static std::mutex m;
  static std::weak_ptr<HidApiLibrary> current;
  std::lock_guard<std::mutex> lk(m);
  std::shared_ptr<HidApiLibrary> lib = current.lock();
  if (!lib) {
    lib = std::make_shared<HidApiLibrary>();
    current = lib;
  }
  return lib;
}

// USB string descriptors from this unit are ASCII; anything wider is replaced.
inline std::string narrow(const wchar_t* w) {
  std::string s;
  if (!w) return s;
  for (; *w; ++w) s.push_back((*w > 0 && *w < 0x80) ? static_cast<char>(*w) : '?');
  return s;
}

} // namespace detail

class HidApiDevice : public IHidDevice {
public:
  HidApiDevice(::hid_device* dev, std::shared_ptr<detail::HidApiLibrary> lib)
  : dev_(dev), lib_(std::move(lib)) {}

  ~HidApiDevice() override { close(); }

  HidApiDevice(const HidApiDevice&) = delete;
  HidApiDevice& operator=(const HidApiDevice&) = delete;

  TxResult write(const uint8_t* data, std::size_t len, std::size_t& written) override {
    written = 0;
    if (!dev_ || !data || !len) return TxResult::Error;
    int w = ::hid_write(dev_, data, len);
    if (w < 0) return TxResult::Error;
    written = static_cast<std::size_t>(w);
    return (written == len) ? TxResult::Ok : TxResult::Error;
  }

  RxResult read(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) override {
    out_len = 0;
    if (!dev_ || !out || cap == 0) return RxResult::Error;
    // hidapi blocks forever on a negative timeout
    int r = ::hid_read_timeout(dev_, out, cap, timeout_ms < 0 ? 0 : timeout_ms);
    if (r < 0)  return RxResult::Error;
    if (r == 0) return RxResult::None;      // hidapi reports a timeout as zero bytes
    out_len = static_cast<std::size_t>(r);
    return RxResult::Ok;
  }

  void close() override {
    if (dev_) { ::hid_close(dev_); dev_ = nullptr; }
  }

  const char* name() const override { return "hidapi"; }

private:
  ::hid_device* dev_{nullptr};
  std::shared_ptr<detail::HidApiLibrary> lib_;
};

class HidApiProvider : public IHidProvider {
public:
  HidApiProvider() : lib_(detail::acquire_library()) {}

  std::vector<DeviceInfo> enumerate(uint16_t vendor_id, uint16_t product_id) override {
    std::vector<DeviceInfo> out;
    if (!lib_->ok) return out;
    ::hid_device_info* head = ::hid_enumerate(vendor_id, product_id);
    for (::hid_device_info* it = head; it; it = it->next) {
      DeviceInfo d;
      d.path       = it->path ? it->path : "";
      d.vendor_id  = it->vendor_id;
      d.product_id = it->product_id;
      d.serial     = detail::narrow(it->serial_number);
      d.product    = detail::narrow(it->product_string);
      out.push_back(d);
    }
    ::hid_free_enumeration(head);   // safe on nullptr
    return out;
  }

  std::unique_ptr<IHidDevice> open(const std::string& path) override {
    if (!lib_->ok || path.empty()) return nullptr;
    ::hid_device* dev = ::hid_open_path(path.c_str());
    if (!dev) return nullptr;
    if (::hid_set_nonblocking(dev, 0) != 0) {   // reads block up to their timeout
      ::hid_close(dev);
      return nullptr;
    }
    return std::make_unique<HidApiDevice>(dev, lib_);
  }

  const char* name() const override { return "hidapi"; }

private:
  std::shared_ptr<detail::HidApiLibrary> lib_;
};

} // namespace clarity::transport
