#pragma once
/**
 * @file config.hpp
 * @brief Tool configuration: which backend, which unit, what timing.
 *
 * Stored as a small JSON object, e.g.
 * @code
 *   { "backend": "hidraw", "index": 0, "timeout_ms": 250, "record_length": 16, "trace": false }
 * @endcode
 * Every key is optional; missing keys keep their defaults. Unknown keys are ignored so
 * files written by newer tools still load.
 *
 * Default location: $XDG_CONFIG_HOME/aurox/clarity-cli/config.json, falling back to
 * ~/.config/aurox/clarity-cli/config.json. Command-line options override the file.
 */

#include <cstddef>
#include <string>

#include "nlohmann/json.hpp"

#include "clarity/session.hpp"

namespace clarity {

struct Config {
    std::string backend       = "hidapi";    ///< "hidapi" | "hidraw"
    size_t      index         = 0;           ///< enumeration index of the unit
    int         timeout_ms    = 100;         ///< read bound per transaction
    size_t      record_length = RECORD_LEN;  ///< frame length / read cap
    bool        trace         = false;       ///< print tx/rx lines to stderr
};

/**
 * @brief Overlay the keys present in @p j onto @p cfg.
 *
 * Validation: backend must be hidapi|hidraw, timeout_ms >= 0,
 * record_length within [MIN_RECORD_LEN, MAX_RECORD_LEN].
 *
 * @return false with @p err set ("bad_type:index", "bad_value:backend", ...) on the
 *         first problem; @p cfg may then be partially updated.
 */
bool config_from_json(const nlohmann::json& j, Config& cfg, std::string& err);

nlohmann::json config_to_json(const Config& cfg);

/// $XDG_CONFIG_HOME/aurox/clarity-cli/config.json (or the ~/.config fallback).
std::string default_config_path();

/**
 * @brief Load @p path into @p cfg.
 *
 * A missing file is not an error: @p cfg keeps its values and true is returned.
 * Unreadable files, malformed JSON and bad values return false with @p err set.
 */
bool load_config(const std::string& path, Config& cfg, std::string& err);

/// Write @p cfg as pretty JSON via a temp file + rename. Creates parent directories.
bool save_config(const std::string& path, const Config& cfg, std::string& err);

/// Session defaults derived from a Config (trace stream left for the caller).
SessionOptions to_session_options(const Config& cfg);

} // namespace clarity
