#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "exit_codes.hpp"

using namespace clarity;

namespace {

// Same option shapes as clarity-cli; returns the exit code main() would use.
int run(std::vector<std::string> args) {
    CLI::App app{"exit code check"};
    int timeout_ms = 0;
    std::string backend;
    std::vector<std::string> set_kv;
    app.add_option("--timeout", timeout_ms)->check(CLI::Range(0, 60000));
    app.add_option("--backend", backend)->check(CLI::IsMember({"hidapi", "hidraw"}));
    app.add_option("--set", set_kv)->expected(2);

    std::vector<char*> argv;
    std::string prog = "clarity-cli";
    argv.push_back(&prog[0]);
    for (auto& a : args) argv.push_back(&a[0]);
    try {
        app.parse(static_cast<int>(argv.size()), argv.data());
    } catch (const CLI::ParseError& e) {
        return cli::exit_code_for(app, e);
    }
    return cli::RC_OK;
}

} // namespace

TEST_CASE("usage errors from option parsing exit with 2") {
    CHECK(run({"--timeout", "99999"}) == cli::RC_USAGE);     // out of range
    CHECK(run({"--backend", "serial"}) == cli::RC_USAGE);    // not a member
    CHECK(run({"--bogus"}) == cli::RC_USAGE);                // unknown flag
    CHECK(run({"--set", "disk"}) == cli::RC_USAGE);          // missing value
    CHECK(run({"--timeout", "abc"}) == cli::RC_USAGE);       // not a number
}

TEST_CASE("help and valid input exit with 0") {
    CHECK(run({"--help"}) == cli::RC_OK);
    CHECK(run({"--timeout", "250", "--backend", "hidraw"}) == cli::RC_OK);
}

TEST_CASE("session errors map onto their exit codes") {
    CHECK(cli::exit_code_for(ErrorCode::TransportTimeout) == 3);
    CHECK(cli::exit_code_for(ErrorCode::DeviceNotFound) == 4);
    CHECK(cli::exit_code_for(ErrorCode::TransportOpen) == 1);
    CHECK(cli::exit_code_for(ErrorCode::TransportRead) == 1);
    CHECK(cli::exit_code_for(ErrorCode::MalformedResponse) == 1);
}
