#pragma once
/**
 * @file transport_hidraw.hpp
 * @brief Linux hidraw provider (header-only; no userspace HID library).
 *
 * Depends on: hidraw_io.hpp for the syscalls, device_registry.hpp for the sysfs scan.
 */

#if !defined(__linux__)
#  error "transport_hidraw.hpp is Linux-only."
#endif

#include "clarity/transport/transport_base.hpp"
#include "device_registry.hpp"
#include "hidraw_io.hpp"

#include <memory>
#include <string>
#include <vector>

namespace clarity::transport {

class HidrawDevice : public IHidDevice {
public:
  HidrawDevice(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}
  ~HidrawDevice() override { close(); }

  HidrawDevice(const HidrawDevice&) = delete;
  HidrawDevice& operator=(const HidrawDevice&) = delete;

  TxResult write(const uint8_t* data, std::size_t len, std::size_t& written) override {
    written = 0;
    if (!clarity::write_report(fd_, data, len)) return TxResult::Error;
    written = len;
    return TxResult::Ok;
  }

  RxResult read(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) override {
    out_len = 0;
    int r = clarity::read_report(fd_, out, cap, timeout_ms);
    if (r < 0)  return RxResult::Error;
    if (r == 0) return RxResult::None;
    out_len = static_cast<std::size_t>(r);
    return RxResult::Ok;
  }

  void close() override {
    if (fd_ >= 0) { clarity::close_hidraw(fd_); fd_ = -1; }
  }

  const char* name() const override { return "hidraw"; }

  const std::string& path() const { return path_; }

private:
  int fd_{-1};
  std::string path_;
};

class HidrawProvider : public IHidProvider {
public:
  explicit HidrawProvider(std::string sysfs_root = "/sys/class/hidraw",
                          std::string dev_root = "/dev")
  : sysfs_root_(std::move(sysfs_root)), dev_root_(std::move(dev_root)) {}

  std::vector<DeviceInfo> enumerate(uint16_t vendor_id, uint16_t product_id) override {
    return clarity::scan_hidraw(vendor_id, product_id, sysfs_root_, dev_root_);
  }

  std::unique_ptr<IHidDevice> open(const std::string& path) override {
    int fd = clarity::open_hidraw(path);
    if (fd < 0) return nullptr;
    return std::make_unique<HidrawDevice>(fd, path);
  }

  const char* name() const override { return "hidraw"; }

private:
  std::string sysfs_root_;
  std::string dev_root_;
};

} // namespace clarity::transport
