// ============================================================================
// device_registry.cpp: implementation for device_registry.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file device_registry.cpp
 */

#include "device_registry.hpp"  // public types and function declarations for the registry layer
#include "clarity/protocol.hpp" // VENDOR_ID / PRODUCT_ID

#include <algorithm>            // std::sort for stable hidrawN ordering
#include <cstdlib>              // strtoul for hex id fields
#include <filesystem>           // std::filesystem for walking /sys/class/hidraw
#include <fstream>              // std::ifstream for uevent files
#include <iomanip>              // std::setw/std::setfill for hex ids in JSON
#include <sstream>              // std::istringstream line splitting
#include <system_error>         // std::error_code for non-throwing filesystem ops

namespace fs = std::filesystem;
namespace clarity {

// -------- helpers --------

/*
 * parse_hex16()
 * -------------
 * Parse one hex field of HID_ID. The kernel pads vendor/product to 8 digits
 * ("00001F0A"); anything that does not fit in 16 bits is rejected.
 */
static bool parse_hex16(const std::string& s, uint16_t& out) {
    if (s.empty()) return false;
    char* e = nullptr;
    unsigned long v = std::strtoul(s.c_str(), &e, 16);
    if (!e || *e) return false;
    if (v > 0xFFFFul) return false;
    out = static_cast<uint16_t>(v);
    return true;
}

/*
 * node_number()
 * -------------
 * "hidraw12" -> 12. Entries without a trailing number sort last.
 */
static unsigned long node_number(const std::string& name) {
    size_t i = name.size();
    while (i > 0 && name[i - 1] >= '0' && name[i - 1] <= '9') --i;
    if (i == name.size()) return static_cast<unsigned long>(-1);
    return std::strtoul(name.c_str() + i, nullptr, 10);
}

static std::string hex4(uint16_t v) {
    std::ostringstream os;
    os << std::hex << std::setw(4) << std::setfill('0') << v;
    return os.str();
}


// -------- public API --------

/*
 * parse_hid_uevent()
 * ------------------
 * Walk KEY=VALUE lines. HID_ID is mandatory, the rest are best effort.
 */
bool parse_hid_uevent(const std::string& text, DeviceInfo& out) {
    std::istringstream in(text);
    std::string line;
    bool have_id = false;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        const std::string key = line.substr(0, eq);
        const std::string val = line.substr(eq + 1);

        if (key == "HID_ID") {
            // bus:vendor:product
            auto a = val.find(':');
            auto b = (a == std::string::npos) ? std::string::npos : val.find(':', a + 1);
            if (b == std::string::npos) return false;
            uint16_t vid = 0, pid = 0;
            if (!parse_hex16(val.substr(a + 1, b - a - 1), vid)) return false;
            if (!parse_hex16(val.substr(b + 1), pid)) return false;
            out.vendor_id  = vid;
            out.product_id = pid;
            have_id = true;
        } else if (key == "HID_NAME") {
            out.product = val;
        } else if (key == "HID_UNIQ") {
            out.serial = val;
        }
    }
    return have_id;
}


/*
 * scan_hidraw()
 * -------------
 * sysfs layout per node:
 *   /sys/class/hidraw/hidrawN/device/uevent
 *
 * Failure handling:
 * - We never throw; unreadable entries are skipped.
 */
std::vector<DeviceInfo> scan_hidraw(uint16_t vendor_id, uint16_t product_id,
                                    const std::string& sysfs_root,
                                    const std::string& dev_root) {
    std::vector<std::pair<unsigned long, DeviceInfo>> found;

    std::error_code ec;
    fs::directory_iterator it(sysfs_root, ec), end;
    if (ec) return {};

    for (; it != end; it.increment(ec)) {
        if (ec) break;
        const std::string node = it->path().filename().string();

        std::ifstream in(it->path() / "device" / "uevent");
        if (!in) continue;
        std::stringstream buf;
        buf << in.rdbuf();

        DeviceInfo d;
        if (!parse_hid_uevent(buf.str(), d)) continue;
        if (d.vendor_id != vendor_id || d.product_id != product_id) continue;

        d.path = (fs::path(dev_root) / node).string();
        found.emplace_back(node_number(node), d);
    }

    std::sort(found.begin(), found.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<DeviceInfo> out;
    out.reserve(found.size());
    for (auto& f : found) out.push_back(f.second);
    return out;
}


std::vector<DeviceInfo> discover_devices(transport::IHidProvider& provider) {
    return provider.enumerate(VENDOR_ID, PRODUCT_ID);
}


nlohmann::json registry_to_json(const std::vector<DeviceInfo>& devices) {
    nlohmann::json arr = nlohmann::json::array();
    for (size_t i = 0; i < devices.size(); ++i) {
        const auto& d = devices[i];
        nlohmann::json j;
        j["index"]      = i;
        j["path"]       = d.path;
        j["vendor_id"]  = hex4(d.vendor_id);
        j["product_id"] = hex4(d.product_id);
        j["serial"]     = d.serial;
        j["product"]    = d.product;
        arr.push_back(j);
    }
    return arr;
}

} // namespace clarity
