#include <doctest/doctest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "clarity/config.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace clarity;

static fs::path temp_dir(const char* tag) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return fs::temp_directory_path() / (std::string("clarity-") + tag + "-" + std::to_string(stamp));
}

TEST_CASE("defaults match the wire defaults") {
    Config c;
    CHECK(c.backend == "hidapi");
    CHECK(c.index == 0);
    CHECK(c.timeout_ms == 100);
    CHECK(c.record_length == RECORD_LEN);
    CHECK_FALSE(c.trace);
}

TEST_CASE("config_from_json overlays only the keys present") {
    Config c;
    std::string err;
    REQUIRE(config_from_json(json{{"backend", "hidraw"}, {"timeout_ms", 250}, {"extra", 1}}, c, err));
    CHECK(c.backend == "hidraw");
    CHECK(c.timeout_ms == 250);
    CHECK(c.index == 0);
    CHECK(c.record_length == RECORD_LEN);
}

TEST_CASE("config_from_json rejects bad types and values") {
    Config c;
    std::string err;
    CHECK_FALSE(config_from_json(json::array(), c, err));
    CHECK(err == "bad_type:config");
    CHECK_FALSE(config_from_json(json{{"backend", "serial"}}, c, err));
    CHECK(err == "bad_value:backend(hidapi|hidraw)");
    CHECK_FALSE(config_from_json(json{{"index", "0"}}, c, err));
    CHECK(err == "bad_type:index");
    CHECK_FALSE(config_from_json(json{{"timeout_ms", -1}}, c, err));
    CHECK(err == "bad_value:timeout_ms(0..60000)");
    CHECK_FALSE(config_from_json(json{{"record_length", 2}}, c, err));
    CHECK(err == "bad_value:record_length(3..64)");
    CHECK_FALSE(config_from_json(json{{"record_length", 65}}, c, err));
    CHECK_FALSE(config_from_json(json{{"trace", 1}}, c, err));
    CHECK(err == "bad_type:trace");
}

TEST_CASE("load_config: a missing file keeps the current values") {
    Config c;
    c.index = 3;
    std::string err;
    CHECK(load_config((temp_dir("missing") / "config.json").string(), c, err));
    CHECK(c.index == 3);
}

TEST_CASE("save_config then load_config round-trips through disk") {
    fs::path dir = temp_dir("save");
    fs::path file = dir / "nested" / "config.json";

    Config out;
    out.backend = "hidraw";
    out.index = 2;
    out.timeout_ms = 500;
    out.record_length = 64;
    out.trace = true;
    std::string err;
    REQUIRE(save_config(file.string(), out, err));
    CHECK_FALSE(fs::exists(file.string() + ".tmp"));

    Config in;
    REQUIRE(load_config(file.string(), in, err));
    CHECK(in.backend == "hidraw");
    CHECK(in.index == 2);
    CHECK(in.timeout_ms == 500);
    CHECK(in.record_length == 64);
    CHECK(in.trace);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("load_config reports malformed JSON") {
    fs::path dir = temp_dir("bad");
    fs::create_directories(dir);
    fs::path file = dir / "config.json";
    std::ofstream(file) << "{ \"backend\": ";

    Config c;
    std::string err;
    CHECK_FALSE(load_config(file.string(), c, err));
    CHECK(err.rfind("config_parse_error:", 0) == 0);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("to_session_options copies timing and length") {
    Config c;
    c.timeout_ms = 42;
    c.record_length = 8;
    SessionOptions o = to_session_options(c);
    CHECK(o.timeout_ms == 42);
    CHECK(o.record_length == 8);
    CHECK(o.trace == nullptr);
}

TEST_CASE("default_config_path follows XDG_CONFIG_HOME") {
    std::string p = default_config_path();
    CHECK(p.size() > std::string("aurox/clarity-cli/config.json").size());
    CHECK(p.find("aurox/clarity-cli/config.json") != std::string::npos);
}
