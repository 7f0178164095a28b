// ============================================================================
// config.cpp: implementation for clarity/config.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "clarity/config.hpp"

#include <cstdlib>        // getenv for XDG/HOME lookups
#include <filesystem>     // create_directories, rename, exists
#include <fstream>        // std::ifstream / std::ofstream
#include <system_error>   // std::error_code for non-throwing filesystem ops

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace clarity {

bool config_from_json(const json& j, Config& cfg, std::string& err) {
    if (!j.is_object()) { err = "bad_type:config"; return false; }

    if (j.contains("backend")) {
        const auto& v = j["backend"];
        if (!v.is_string()) { err = "bad_type:backend"; return false; }
        auto s = v.get<std::string>();
        if (s != "hidapi" && s != "hidraw") { err = "bad_value:backend(hidapi|hidraw)"; return false; }
        cfg.backend = s;
    }

    if (j.contains("index")) {
        const auto& v = j["index"];
        if (!v.is_number_unsigned()) { err = "bad_type:index"; return false; }
        cfg.index = v.get<size_t>();
    }

    if (j.contains("timeout_ms")) {
        const auto& v = j["timeout_ms"];
        if (!v.is_number_integer()) { err = "bad_type:timeout_ms"; return false; }
        auto ms = v.get<long long>();
        if (ms < 0 || ms > 60000) { err = "bad_value:timeout_ms(0..60000)"; return false; }
        cfg.timeout_ms = static_cast<int>(ms);
    }

    if (j.contains("record_length")) {
        const auto& v = j["record_length"];
        if (!v.is_number_unsigned()) { err = "bad_type:record_length"; return false; }
        auto n = v.get<size_t>();
        if (n < MIN_RECORD_LEN || n > MAX_RECORD_LEN) { err = "bad_value:record_length(3..64)"; return false; }
        cfg.record_length = n;
    }

    if (j.contains("trace")) {
        const auto& v = j["trace"];
        if (!v.is_boolean()) { err = "bad_type:trace"; return false; }
        cfg.trace = v.get<bool>();
    }
    return true;
}

json config_to_json(const Config& cfg) {
    json j;
    j["backend"]       = cfg.backend;
    j["index"]         = cfg.index;
    j["timeout_ms"]    = cfg.timeout_ms;
    j["record_length"] = cfg.record_length;
    j["trace"]         = cfg.trace;
    return j;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    fs::path base = (xdg && *xdg) ? fs::path(xdg) : fs::path(home ? home : "") / ".config";
    return (base / "aurox" / "clarity-cli" / "config.json").string();
}

bool load_config(const std::string& path, Config& cfg, std::string& err) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return true;              // nothing to overlay

    std::ifstream in(path);
    if (!in) { err = "config_unreadable:" + path; return false; }

    json j = json::parse(in, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded()) { err = "config_parse_error:" + path; return false; }

    return config_from_json(j, cfg, err);
}

bool save_config(const std::string& path, const Config& cfg, std::string& err) {
    std::error_code ec;
    fs::path p(path);
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) { err = "config_dir_error:" + ec.message(); return false; }
    }

    fs::path tmp = p;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) { err = "config_write_error:" + tmp.string(); return false; }
        out << config_to_json(cfg).dump(2) << "\n";
        if (!out) { err = "config_write_error:" + tmp.string(); return false; }
    }
    fs::rename(tmp, p, ec);
    if (ec) { err = "config_rename_error:" + ec.message(); return false; }
    return true;
}

SessionOptions to_session_options(const Config& cfg) {
    SessionOptions o;
    o.record_length = cfg.record_length;
    o.timeout_ms    = cfg.timeout_ms;
    return o;
}

} // namespace clarity
