#pragma once
/**
 * @page clarity-device-registry Clarity Device Registry
 * @file device_registry.hpp
 * @brief Finding Clarity units on a Linux host and listing them for tools.
 *
 * @details
 * PURPOSE
 * -------
 * Sessions are opened "by index": the N-th device the provider enumerates for
 * VENDOR_ID/PRODUCT_ID. This header gives tools the same roster the session sees,
 * so an operator can tell which index is which unit before opening it.
 *
 * WHAT THIS DOES
 * --------------
 * - discover_devices(): ask any IHidProvider for matching devices (what Session::open uses).
 * - scan_hidraw(): walk /sys/class/hidraw, read each node's device/uevent, and keep the
 *   nodes whose HID_ID matches. This is the enumeration behind the hidraw provider.
 *   Results are ordered by node number (hidraw2 before hidraw10) so indices are stable
 *   for a given plug-in order.
 * - parse_hid_uevent(): the uevent parser, exposed for tests.
 * - registry_to_json(): the roster as a JSON array for `clarity-cli --scan --format json`.
 *
 * RELIABILITY AND TRADE-OFFS
 * --------------------------
 * - No libudev dependency: sysfs is read as plain files.
 * - Nothing is probed: a listed device has not been opened. Permission problems show up
 *   at Session::open time as TransportOpenError.
 * - The roster is not persisted; USB paths change across replugs.
 *
 * EXAMPLE
 * -------
 * @code
 *   clarity::transport::HidrawProvider hid;
 *   auto devices = clarity::discover_devices(hid);
 *   for (size_t i = 0; i < devices.size(); ++i)
 *       std::cout << "index=" << i << " path=" << devices[i].path << "\n";
 * @endcode
 */

#include <cstdint>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "clarity/transport/transport_base.hpp"

namespace clarity {

using transport::DeviceInfo;

/**
 * @brief Parse the text of a hidraw node's device/uevent file.
 *
 * Recognised keys:
 *   HID_ID=0003:00001F0A:00000088   (bus:vendor:product, hex)
 *   HID_NAME=Aurox Clarity
 *   HID_UNIQ=12345678               (USB serial string, may be empty)
 *
 * Only vendor_id, product_id, product and serial are filled; path is left alone.
 *
 * @return true if a well-formed HID_ID line was found.
 */
bool parse_hid_uevent(const std::string& text, DeviceInfo& out);

/**
 * @brief List hidraw nodes whose HID_ID matches @p vendor_id / @p product_id.
 *
 * @param sysfs_root  Directory holding hidrawN entries (default "/sys/class/hidraw").
 * @param dev_root    Directory the device nodes live in (default "/dev").
 * @return            Matching devices, path = dev_root/hidrawN, ordered by N.
 *                    Empty if sysfs_root does not exist.
 */
std::vector<DeviceInfo> scan_hidraw(uint16_t vendor_id, uint16_t product_id,
                                    const std::string& sysfs_root = "/sys/class/hidraw",
                                    const std::string& dev_root = "/dev");

/**
 * @brief Enumerate Clarity units (VENDOR_ID/PRODUCT_ID) through @p provider.
 *
 * Same order Session::open() indexes into.
 */
std::vector<DeviceInfo> discover_devices(transport::IHidProvider& provider);

/**
 * @brief Roster as JSON: [{"index":0,"path":"...","vendor_id":"1f0a",...}, ...]
 */
nlohmann::json registry_to_json(const std::vector<DeviceInfo>& devices);

} // namespace clarity
