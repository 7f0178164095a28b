// -----------------------------------------------------------------------------
// Implementation for command_dispatch.hpp
//
// This file provides the working guts of the clarity-cli command dispatcher.
// - See command_dispatch.hpp for API contracts, design overview, and examples.
// - See tests/test_command_dispatch.cpp for the name/value tables exercised.
//
// Notes for maintainers:
// - Name and value parsing never throws; failure is always signaled by "false".
// - execute() is the only function that touches the device, and it lets the
//   session's exceptions through untouched.
// -----------------------------------------------------------------------------

#include "command_dispatch.hpp"  // matching header: declares dispatcher API and enums

#include <cctype>                // character classification and case conversion
#include <cstdlib>               // strtol for numeric position values
#include <sstream>               // std::ostringstream for numeric fields

namespace clarity {

// ---------- local parsing helpers (no exceptions) ----------
// - strtol with base 0 accepts "2", "0x02" and "002" alike.
// - Each parser enforces explicit bounds so bad values never reach the wire.

static bool parse_u8(const std::string& s, uint8_t& out,
                     uint32_t lo=0, uint32_t hi=255) {
    if (s.empty()) return false;
    char* e = nullptr;
    long v = std::strtol(s.c_str(), &e, 0);

    // Reject if parsing failed or leftover junk chars exist
    if (!e || *e) return false;

    if (v < (long)lo || v > (long)hi) return false;
    out = (uint8_t)v;
    return true;
}

// ---------- lowercase normalizer ----------
// Cast to unsigned char first so std::tolower is well-defined.
static std::string lower(std::string s) {
    for (auto& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

// "pos2" -> "2"; anything else unchanged.
static std::string strip_pos(const std::string& s) {
    if (s.size() > 3 && s.compare(0, 3, "pos") == 0) return s.substr(3);
    return s;
}


// ---------- value parsers ----------

bool parse_power(const std::string& raw, Power& out) {
    const std::string s = lower(raw);
    if (s == "on"  || s == "run"   || s == "1") { out = Power::Run;   return true; }
    if (s == "off" || s == "sleep" || s == "0") { out = Power::Sleep; return true; }
    return false;
}

bool parse_disk_position(const std::string& raw, DiskPosition& out) {
    uint8_t v;
    if (!parse_u8(strip_pos(lower(raw)), v, 0, 3)) return false;
    out = static_cast<DiskPosition>(v);
    return true;
}

bool parse_filter_position(const std::string& raw, FilterPosition& out) {
    uint8_t v;
    if (!parse_u8(strip_pos(lower(raw)), v, 1, 4)) return false;
    out = static_cast<FilterPosition>(v);
    return true;
}

bool parse_cal_led(const std::string& raw, CalLed& out) {
    const std::string s = lower(raw);
    if (s == "on"  || s == "1")             { out = CalLed::On;  return true; }
    if (s == "off" || s == "0" || s == "2") { out = CalLed::Off; return true; }
    return false;
}


// ---------- mapping: (name, is_set) -> CommandKind ----------
// Explicit branches over a table: the vocabulary is small and easy to audit.
bool name_to_kind(const std::string& raw_name, bool is_set, CommandKind& out_kind) {
    const std::string name = lower(raw_name);

    // Settable fields
    if (name == "power" || name == "onoff") {
        out_kind = is_set ? CommandKind::SET_POWER : CommandKind::GET_POWER; return true;
    }
    if (name == "disk") {
        out_kind = is_set ? CommandKind::SET_DISK : CommandKind::GET_DISK; return true;
    }
    if (name == "filter" || name == "filt") {
        out_kind = is_set ? CommandKind::SET_FILTER : CommandKind::GET_FILTER; return true;
    }
    if (name == "cal" || name == "led") {
        out_kind = is_set ? CommandKind::SET_CAL : CommandKind::GET_CAL; return true;
    }

    // Read-only: a SET falls through to false.
    if (!is_set) {
        if (name == "door")                    { out_kind = CommandKind::GET_DOOR;    return true; }
        if (name == "serial")                  { out_kind = CommandKind::GET_SERIAL;  return true; }
        if (name == "version" || name == "fw") { out_kind = CommandKind::GET_VERSION; return true; }
        if (name == "status" || name == "all") { out_kind = CommandKind::GET_STATUS;  return true; }
    }
    return false;
}


bool build_request(const std::string& name, bool is_set, const std::string& value,
                   Request& out, std::string& err) {
    Request r;
    if (!name_to_kind(name, is_set, r.kind)) {
        err = std::string(is_set ? "unknown_set:" : "unknown_get:") + name;
        return false;
    }
    if (is_set && value.empty()) { err = "missing_value:" + name; return false; }

    switch (r.kind) {
        case CommandKind::SET_POWER:
            if (!parse_power(value, r.power)) { err = "bad_value:power(on|off)"; return false; }
            break;
        case CommandKind::SET_DISK:
            if (!parse_disk_position(value, r.disk)) { err = "bad_value:disk(0..3)"; return false; }
            break;
        case CommandKind::SET_FILTER:
            if (!parse_filter_position(value, r.filter)) { err = "bad_value:filter(1..4)"; return false; }
            break;
        case CommandKind::SET_CAL:
            if (!parse_cal_led(value, r.cal)) { err = "bad_value:cal(on|off)"; return false; }
            break;
        default:
            break;   // GETs carry no value
    }
    out = r;
    return true;
}


// ---------- execution ----------

// Common tail for every SET: what we asked for, how the unit answered, raw reply.
static void add_echo(Fields& f, uint8_t command, const Frame& reply) {
    f.emplace_back("echo", to_string(check_echo(command, reply)));
    f.emplace_back("reply", hex_dump(reply));
}

Fields execute(Session& session, const Request& req) {
    Fields f;
    switch (req.kind) {

        // ===== Power =====
        case CommandKind::GET_POWER:
            f.emplace_back("power", to_string(session.get_on_off()));
            break;
        case CommandKind::SET_POWER: {
            Frame reply = (req.power == Power::Run) ? session.switch_on() : session.switch_off();
            f.emplace_back("power", to_string(req.power));
            add_echo(f, SETONOFF, reply);
            break;
        }

        // ===== Disk =====
        case CommandKind::GET_DISK:
            f.emplace_back("disk", to_string(session.get_disk_position()));
            break;
        case CommandKind::SET_DISK: {
            Frame reply = session.set_disk_position(req.disk);
            f.emplace_back("disk", to_string(req.disk));
            add_echo(f, SETDISK, reply);
            break;
        }

        // ===== Filter =====
        case CommandKind::GET_FILTER:
            f.emplace_back("filter", to_string(session.get_filter_position()));
            break;
        case CommandKind::SET_FILTER: {
            Frame reply = session.set_filter_position(req.filter);
            f.emplace_back("filter", to_string(req.filter));
            add_echo(f, SETFILT, reply);
            break;
        }

        // ===== Calibration LED =====
        case CommandKind::GET_CAL:
            f.emplace_back("cal", to_string(session.get_calibration_led()));
            break;
        case CommandKind::SET_CAL: {
            Frame reply = session.set_calibration_led(req.cal);
            f.emplace_back("cal", to_string(req.cal));
            add_echo(f, SETCAL, reply);
            break;
        }

        // ===== Read-only =====
        case CommandKind::GET_DOOR:
            f.emplace_back("door", to_string(session.get_door()));
            break;
        case CommandKind::GET_SERIAL:
            f.emplace_back("serial", std::to_string(session.get_serial_number()));
            break;
        case CommandKind::GET_VERSION:
            f.emplace_back("version", session.get_version().to_string());
            break;
        case CommandKind::GET_STATUS: {
            FullStatus st = session.get_full_stat();
            f.emplace_back("version", st.version.to_string());
            f.emplace_back("power",   to_string(st.power));
            f.emplace_back("door",    to_string(st.door));
            f.emplace_back("disk",    to_string(st.disk));
            f.emplace_back("filter",  to_string(st.filter));
            f.emplace_back("cal",     to_string(st.cal));
            break;
        }
    }
    return f;
}


// ---------- rendering ----------

std::string format_fields(const Fields& fields) {
    std::ostringstream os;
    os << "status=ok";
    for (const auto& kv : fields) {
        os << ' ' << kv.first << '=';
        // Values with spaces (raw reply dumps) are quoted so `cut -d' '` stays usable.
        if (kv.second.find(' ') != std::string::npos) os << '"' << kv.second << '"';
        else                                          os << kv.second;
    }
    return os.str();
}

nlohmann::json fields_to_json(const Fields& fields) {
    nlohmann::json j;
    j["status"] = "ok";
    for (const auto& kv : fields) j[kv.first] = kv.second;
    return j;
}

} // namespace clarity
