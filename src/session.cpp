// -----------------------------------------------------------------------------
// session.cpp: Implementation of clarity::Session
//
// API & state machine:
//   see include/clarity/session.hpp
//
// Usage tests:
//   see tests/test_session.cpp (fake transport, concurrency, timeouts)
//
// NOTE: every path through transact() holds mtx_ for the whole write+read pair
// and releases it through the scoped lock, including when an exception leaves.
// -----------------------------------------------------------------------------
#include "clarity/session.hpp"

#include <ostream>
#include <stdexcept>
#include <string>

namespace clarity {

// ---------- construction / lifecycle ----------

Session::Session(std::unique_ptr<transport::IHidDevice> device, SessionOptions opts)
: device_(std::move(device)), opts_(opts) {}

Session::Session(transport::IHidProvider& provider, size_t index, SessionOptions opts)
: opts_(opts) {
  auto devices = provider.enumerate(VENDOR_ID, PRODUCT_ID);
  if (index >= devices.size()) {
    throw DeviceNotFound("no Clarity unit at index " + std::to_string(index) +
                         " (" + std::to_string(devices.size()) + " found via " +
                         provider.name() + ")");
  }
  const std::string& path = devices[index].path;
  device_ = provider.open(path);
  if (!device_) {
    throw TransportOpenError("cannot open " + path + " via " + provider.name());
  }
}

Session::~Session() {
  close();
}

void Session::close() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!device_) return;            // already Closed: no-op
  device_->close();
  device_.reset();
}

bool Session::is_open() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return device_ != nullptr;
}

const char* Session::device_name() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return device_ ? device_->name() : "closed";
}


// ---------- transaction ----------

Frame Session::transact(uint8_t command, uint8_t parameter) {
  return transact(command, parameter, opts_.record_length, opts_.timeout_ms);
}

// Phases:
//   1) lock,
//   2) refuse if Closed or the timeout is negative (no I/O),
//   3) encode,
//   4) write the whole record,
//   5) read one record within the timeout,
//   6) unlock on scope exit.
Frame Session::transact(uint8_t command, uint8_t parameter, size_t max_length, int timeout_ms) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!device_) throw SessionClosed("session is closed");
  if (timeout_ms < 0) {
    throw std::invalid_argument("timeout " + std::to_string(timeout_ms) + " ms is negative");
  }

  const Frame tx = encode_frame(command, parameter, max_length);

  size_t written = 0;
  if (device_->write(tx.data(), tx.size(), written) != transport::TxResult::Ok) {
    trace_line(tx, nullptr, "write_failed");
    throw TransportWriteError("write of " + std::to_string(tx.size()) + " bytes failed (" +
                              std::to_string(written) + " written)");
  }

  Frame rx;
  rx.resize(max_length, 0);
  size_t got = 0;
  switch (device_->read(rx.data(), rx.size(), got, timeout_ms)) {
    case transport::RxResult::Ok:
      break;
    case transport::RxResult::None:
      trace_line(tx, nullptr, "timeout");
      throw TransportTimeout("no response within " + std::to_string(timeout_ms) + " ms");
    case transport::RxResult::Error:
    default:
      trace_line(tx, nullptr, "read_failed");
      throw TransportReadError("read failed");
  }
  rx.resize(got < max_length ? got : max_length);

  trace_line(tx, &rx, nullptr);
  return rx;
}

// Called with mtx_ held, so trace lines never interleave.
void Session::trace_line(const Frame& tx, const Frame* rx, const char* error) const {
  if (!opts_.trace) return;
  std::ostream& os = *opts_.trace;
  os << "tx=" << hex_dump(tx);
  if (rx)    os << " rx=" << hex_dump(*rx);
  if (error) os << " error=" << error;
  os << "\n";
}


// ---------- typed accessors ----------

Frame Session::switch_on()  { return transact(SETONOFF, to_wire(Power::Run)); }
Frame Session::switch_off() { return transact(SETONOFF, to_wire(Power::Sleep)); }

Power Session::get_on_off() {
  return static_cast<Power>(decode_status_byte(transact(GETONOFF)));
}

Frame Session::set_disk_position(DiskPosition pos) {
  return transact(SETDISK, to_wire(pos));
}

DiskPosition Session::get_disk_position() {
  return static_cast<DiskPosition>(decode_status_byte(transact(GETDISK)));
}

Frame Session::set_filter_position(FilterPosition pos) {
  return transact(SETFILT, to_wire(pos));
}

FilterPosition Session::get_filter_position() {
  return static_cast<FilterPosition>(decode_status_byte(transact(GETFILT)));
}

Frame Session::set_calibration_led(CalLed state) {
  return transact(SETCAL, to_wire(state));
}

CalLed Session::get_calibration_led() {
  return static_cast<CalLed>(decode_status_byte(transact(GETCAL)));
}

Door Session::get_door() {
  return static_cast<Door>(decode_status_byte(transact(GETDOOR)));
}

uint32_t Session::get_serial_number() {
  return decode_serial(transact(GETSERIAL));
}

FullStatus Session::get_full_stat() {
  return decode_full_status(transact(FULLSTAT));
}

Version Session::get_version() {
  return decode_version(transact(GETVERSION));
}

} // namespace clarity
