#pragma once
/**
 * @page clarity-command-dispatch Clarity Command Dispatcher
 * @file command_dispatch.hpp
 * @brief Centralized resolution of CLI names and values → typed Session calls.
 *
 * @details
 * PURPOSE
 * -------
 * The dispatcher is the glue between `clarity-cli --get disk` / `--set disk 2` and the
 * typed accessors on clarity::Session. It exists so that:
 *   - `cli/main.cpp` never has to know about individual accessors or value spellings.
 *   - New operations are added by editing only this file and its .cpp.
 *   - Parsing, validation and result formatting live in one place.
 *
 * WHAT THIS DOES
 * --------------
 * - `CommandKind` lists every operation the tool can run.
 * - `name_to_kind()` maps a user-facing name (plus GET vs SET) to a kind, folding
 *   synonyms ("power"/"onoff", "status"/"all", "cal"/"led").
 * - `parse_*()` turn user values into status enums ("2", "pos2", "on", "sleep", ...).
 * - `build_request()` combines both: name + value → validated Request.
 * - `execute()` runs one Request against a Session and returns ordered key=value Fields.
 * - `format_fields()` / `fields_to_json()` render Fields for the terminal or scripts.
 *
 * PROCESS FLOW
 * ------------
 * 1. CLI parses `--set filter 3`.
 * 2. `build_request("filter", true, "3", req, err)` → {SET_FILTER, FilterPosition::Pos3}.
 * 3. `execute(session, req)` → session.set_filter_position(Pos3) → reply.
 * 4. Fields {filter=pos3, echo=ack, reply=00 24 ...} → "status=ok filter=pos3 echo=ack ..."
 *
 * ERRORS
 * ------
 * Name and value problems come back as `false` with stable tokens in `err`
 * ("unknown_get:foo", "bad_value:disk(0..3)") so scripts can act on them. Transport
 * failures are not caught here: execute() lets clarity::Error propagate to the caller.
 */

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"

#include "clarity/protocol.hpp"
#include "clarity/session.hpp"

namespace clarity {

/**
 * @enum CommandKind
 * @brief Every operation clarity-cli can issue.
 *
 * GET_* are read-only. SET_* carry a value. There is no SET for door, serial,
 * version or status: those are read-only on the unit.
 */
enum class CommandKind : uint8_t {
    GET_POWER,
    SET_POWER,
    GET_DOOR,
    GET_DISK,
    SET_DISK,
    GET_FILTER,
    SET_FILTER,
    GET_CAL,
    SET_CAL,
    GET_SERIAL,
    GET_VERSION,
    GET_STATUS
};

/// A validated operation. Only the field matching `kind` is meaningful.
struct Request {
    CommandKind    kind   = CommandKind::GET_STATUS;
    Power          power  = Power::Run;
    DiskPosition   disk   = DiskPosition::Pos0;
    FilterPosition filter = FilterPosition::Pos1;
    CalLed         cal    = CalLed::Off;
};

/// Ordered key/value results, e.g. {{"disk","pos2"}}.
using Fields = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Map a user-facing name to a CommandKind.
 *
 * Case-insensitive. Names: power|onoff, door, disk, filter|filt, cal|led, serial,
 * version|fw, status|all. Read-only names with is_set == true are rejected.
 *
 * @return true on match.
 */
bool name_to_kind(const std::string& name, bool is_set, CommandKind& out_kind);

/// "on"|"run"|"1" → Run, "off"|"sleep"|"0" → Sleep.
bool parse_power(const std::string& s, Power& out);

/// "0".."3" or "pos0".."pos3".
bool parse_disk_position(const std::string& s, DiskPosition& out);

/// "1".."4" or "pos1".."pos4".
bool parse_filter_position(const std::string& s, FilterPosition& out);

/// "on"|"1" → On, "off"|"0"|"2" → Off.
bool parse_cal_led(const std::string& s, CalLed& out);

/**
 * @brief Resolve name (+ value for SETs) into a Request.
 *
 * Error tokens: "unknown_get:<name>", "unknown_set:<name>", "missing_value:<name>",
 * "bad_value:power(on|off)", "bad_value:disk(0..3)", "bad_value:filter(1..4)",
 * "bad_value:cal(on|off)".
 */
bool build_request(const std::string& name, bool is_set, const std::string& value,
                   Request& out, std::string& err);

/**
 * @brief Run @p req against @p session.
 *
 * SET kinds report the requested value, the echo classification (check_echo) and the
 * raw reply. GET_STATUS reports every FULLSTAT field.
 *
 * @throws clarity::Error from the session (timeout, closed, malformed, ...).
 */
Fields execute(Session& session, const Request& req);

/// "status=ok k1=v1 k2=v2"
std::string format_fields(const Fields& fields);

/// {"status":"ok","k1":"v1",...}
nlohmann::json fields_to_json(const Fields& fields);

} // namespace clarity
