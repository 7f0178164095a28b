#pragma once
/**
 * @file exit_codes.hpp
 * @brief Process exit codes of clarity-cli.
 *
 *   0  ok (also --help)
 *   1  other failure (open, write, read, malformed reply, config write)
 *   2  usage: bad option, bad value, unknown name, unreadable config
 *   3  timeout
 *   4  device not found
 */

#include "CLI/CLI11.hpp"
#include "clarity/error.hpp"

namespace clarity::cli {

constexpr int RC_OK = 0;
constexpr int RC_FAILURE = 1;
constexpr int RC_USAGE = 2;
constexpr int RC_TIMEOUT = 3;
constexpr int RC_NOT_FOUND = 4;

inline int exit_code_for(ErrorCode code) {
  switch (code) {
    case ErrorCode::TransportTimeout: return RC_TIMEOUT;
    case ErrorCode::DeviceNotFound:   return RC_NOT_FOUND;
    default:                          return RC_FAILURE;
  }
}

// Print CLI11's message for @p e and map it: help/version keep CLI11's 0, the rest are usage errors.
inline int exit_code_for(CLI::App& app, const CLI::ParseError& e) {
  const int rc = app.exit(e);
  if (dynamic_cast<const CLI::Success*>(&e)) return rc;
  return RC_USAGE;
}

} // namespace clarity::cli
