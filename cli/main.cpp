/**
 * @file main.cpp
 * @brief clarity-cli: one-shot command line control of an Aurox Clarity unit.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and overlay them on the JSON config file.
 *  - Pick a HID backend (hidapi or Linux hidraw) and open the unit by index.
 *  - Resolve exactly one command through command_dispatch and print the result.
 *
 * Output:
 *  - stdout: "status=ok key=value ..." or a JSON object with --format json.
 *  - stderr: "status=error reason=<token> ..." and, with --trace, one tx/rx line per transaction.
 *
 * Exit codes: 0 ok, 2 usage / bad value, 3 timeout, 4 device not found, 1 other failure.
 */

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "clarity/config.hpp"
#include "clarity/error.hpp"
#include "clarity/session.hpp"
#include "clarity/transport/transport_hidapi.hpp"
#include "clarity/transport/transport_hidraw.hpp"
#include "command_dispatch.hpp"
#include "exit_codes.hpp"
#include "device_registry.hpp"

using json = nlohmann::json;

static std::unique_ptr<clarity::transport::IHidProvider> make_provider(const std::string& backend) {
  if (backend == "hidraw") return std::make_unique<clarity::transport::HidrawProvider>();
  return std::make_unique<clarity::transport::HidApiProvider>();
}


int main(int argc, char** argv) {
  CLI::App app{"Aurox Clarity CLI"};

  // ---- commands ----
  bool do_scan=false, turn_on=false, turn_off=false, save_cfg=false;
  std::string get_name;                 // --get <name>
  std::vector<std::string> set_kv;      // --set <name> <value>

  // ---- targeting / io (override the config file when given) ----
  size_t index=0;
  std::string backend;
  int timeout_ms=0;
  bool trace=false;

  // ---- presentation / config ----
  std::string format="pretty";
  std::string config_path = clarity::default_config_path();

  app.add_flag("--scan", do_scan, "List attached Clarity units (index/path/serial)");
  app.add_option("--get", get_name, "Get: power|door|disk|filter|cal|serial|version|status");
  app.add_option("--set", set_kv, "Set: --set <power|disk|filter|cal> <value>")->expected(2);
  app.add_flag("--on",  turn_on,  "Switch the unit on (same as --set power on)");
  app.add_flag("--off", turn_off, "Put the unit to sleep (same as --set power off)");

  CLI::Option* opt_index   = app.add_option("--index", index, "Unit index in enumeration order");
  CLI::Option* opt_backend = app.add_option("--backend", backend, "HID backend: hidapi|hidraw")
                               ->check(CLI::IsMember({"hidapi", "hidraw"}));
  CLI::Option* opt_timeout = app.add_option("--timeout", timeout_ms, "Read timeout (ms)")
                               ->check(CLI::Range(0, 60000));
  app.add_flag("--trace", trace, "Print tx/rx bytes of every transaction to stderr");

  app.add_option("--format", format, "Output format: pretty|json")
      ->check(CLI::IsMember({"pretty", "json"}));
  app.add_option("--config", config_path, "Config file path")->capture_default_str();
  app.add_flag("--save-config", save_cfg, "Write the effective settings to the config file");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return clarity::cli::exit_code_for(app, e);
  }

  // -------- config: file first, then command-line overrides --------
  clarity::Config cfg;
  std::string reason;
  if (!clarity::load_config(config_path, cfg, reason)) {
    std::cerr << "status=error reason=" << reason << "\n";
    return clarity::cli::RC_USAGE;
  }
  if (opt_index->count())   cfg.index = index;
  if (opt_backend->count()) cfg.backend = backend;
  if (opt_timeout->count()) cfg.timeout_ms = timeout_ms;
  if (trace)                cfg.trace = true;

  if (save_cfg) {
    if (!clarity::save_config(config_path, cfg, reason)) {
      std::cerr << "status=error reason=" << reason << "\n";
      return clarity::cli::RC_FAILURE;
    }
    if (format == "json") {
      json j = clarity::config_to_json(cfg);
      j["status"] = "ok";
      j["config"] = config_path;
      std::cout << j.dump(2) << "\n";
    } else {
      std::cout << "status=ok config=" << config_path << "\n";
    }
  }

  auto provider = make_provider(cfg.backend);

  // -------- scan mode --------
  if (do_scan) {
    auto devices = clarity::discover_devices(*provider);
    if (format == "json") {
      std::cout << clarity::registry_to_json(devices).dump(2) << "\n";
    } else {
      for (size_t i = 0; i < devices.size(); ++i) {
        const auto& d = devices[i];
        std::cout << "index=" << i
                  << " path=" << d.path
                  << " serial=" << (d.serial.empty() ? "-" : d.serial)
                  << " backend=" << provider->name() << "\n";
      }
    }
    return clarity::cli::RC_OK;
  }

  // -------- choose exactly one device command --------
  int cmds = 0;
  cmds += (!get_name.empty()) ? 1 : 0;
  cmds += (set_kv.size()==2) ? 1 : 0;
  cmds += turn_on  ? 1 : 0;
  cmds += turn_off ? 1 : 0;

  if (cmds == 0 && save_cfg) return clarity::cli::RC_OK;
  if (cmds != 1) {
    std::cerr << "status=error reason=need_exactly_one_command\n";
    return clarity::cli::RC_USAGE;
  }

  // -------- build request via dispatcher --------
  clarity::Request req;
  std::string derr;
  bool ok = false;
  if (!get_name.empty())      ok = clarity::build_request(get_name, false, "", req, derr);
  else if (set_kv.size()==2)  ok = clarity::build_request(set_kv[0], true, set_kv[1], req, derr);
  else                        ok = clarity::build_request("power", true, turn_on ? "on" : "off", req, derr);
  if (!ok) {
    std::cerr << "status=error reason=" << derr << "\n";
    return clarity::cli::RC_USAGE;
  }

  // -------- open, run, report --------
  clarity::SessionOptions sopts = clarity::to_session_options(cfg);
  if (cfg.trace) sopts.trace = &std::cerr;

  try {
    clarity::Session session(*provider, cfg.index, sopts);
    clarity::Fields fields = clarity::execute(session, req);
    if (format == "json") std::cout << clarity::fields_to_json(fields).dump(2) << "\n";
    else                  std::cout << clarity::format_fields(fields) << "\n";
  } catch (const clarity::Error& e) {
    std::cerr << "status=error reason=" << clarity::to_string(e.code())
              << " backend=" << provider->name()
              << " detail=\"" << e.what() << "\"\n";
    return clarity::cli::exit_code_for(e.code());
  } catch (const std::invalid_argument& e) {
    std::cerr << "status=error reason=bad_argument detail=\"" << e.what() << "\"\n";
    return clarity::cli::RC_USAGE;
  }
  return clarity::cli::RC_OK;
}
