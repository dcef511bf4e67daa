#include "clawguard/cli/commands.hpp"

#include "clawguard/common/fs.hpp"
#include "clawguard/config/config.hpp"
#include "clawguard/guard/factory.hpp"
#include "clawguard/guard/invocation.hpp"
#include "clawguard/guard/verdict.hpp"
#include "clawguard/net/ip_range.hpp"
#include "clawguard/observability/factory.hpp"
#include "clawguard/observability/global.hpp"
#include "clawguard/security/command_patterns.hpp"
#include "clawguard/security/file_protection.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace clawguard::cli {

namespace {

std::string version_string() {
#ifdef CLAWGUARD_VERSION
  return std::string("clawguard ") + CLAWGUARD_VERSION;
#else
  return "clawguard 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

// A config that cannot be loaded never disables guarding: the defaults take over.
config::Config load_effective_config() {
  auto loaded = config::load_config();
  config::Config config;
  if (loaded.ok()) {
    config = std::move(loaded.value());
  } else {
    config::apply_env_overrides(config);
  }
  observability::set_global_observer(observability::create_observer(config));
  if (!loaded.ok()) {
    observability::record_config_fallback("config", loaded.error() + "; using defaults");
  }
  return config;
}

guard::GuardVerdict evaluate_once(const guard::ToolInvocation &invocation) {
  const auto config = load_effective_config();
  guard::GuardService service(guard::default_dependencies(config));
  service.reload(config);
  const auto verdict = service.evaluate(invocation);
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return verdict;
}

int run_hook(std::vector<std::string> args) {
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args.front() << "\n";
    return 1;
  }
  const auto request = guard::parse_hook_request(read_stdin_all());
  if (!request.ok()) {
    std::cout << guard::to_hook_json(guard::GuardVerdict::block(
                     "clawguard", "ClawGuard could not read the tool call (" + request.error() +
                                      "), blocking as a precaution."))
              << "\n";
    return 1;
  }
  std::cout << guard::to_hook_json(evaluate_once(request.value())) << "\n";
  return 0;
}

int run_check(std::vector<std::string> args) {
  guard::ToolInvocation invocation;
  std::string value;
  if (!take_option(args, "--tool", "-t", invocation.tool_name)) {
    std::cerr << "usage: clawguard check --tool NAME [--param key=value]... [--agent ID] "
                 "[--cwd DIR] [--session KEY]\n";
    return 1;
  }
  if (take_option(args, "--agent", "-a", value)) {
    invocation.caller_id = value;
  }
  if (take_option(args, "--cwd", "", value)) {
    invocation.cwd = value;
  }
  if (take_option(args, "--session", "", value)) {
    invocation.session_key = value;
  }
  while (take_option(args, "--param", "-p", value)) {
    const auto eq = value.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "invalid --param (expected key=value): " << value << "\n";
      return 1;
    }
    invocation.parameters[value.substr(0, eq)] = value.substr(eq + 1);
  }
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args.front() << "\n";
    return 1;
  }

  const auto verdict = evaluate_once(invocation);
  std::cout << guard::verdict_kind_name(verdict.kind);
  if (!verdict.guard.empty()) {
    std::cout << " [" << verdict.guard << "]";
  }
  std::cout << "\n";
  if (!verdict.message.empty()) {
    std::cout << verdict.message << "\n";
  }
  return verdict.blocked() ? 2 : 0;
}

int run_ip(const std::vector<std::string> &args) {
  if (args.size() != 1) {
    std::cerr << "usage: clawguard ip <address>\n";
    return 1;
  }
  const std::string &address = args.front();
  if (!net::is_ip_literal(address)) {
    std::cout << address << ": not an IP address (treated as non-public)\n";
    return 2;
  }
  const bool blocked = net::is_private_or_reserved(address);
  std::cout << address << ": " << (blocked ? "private/reserved" : "public") << "\n";
  return blocked ? 2 : 0;
}

int run_config(std::vector<std::string> args) {
  if (args.empty() || args.front() != "validate") {
    std::cerr << "usage: clawguard config validate\n";
    return 1;
  }
  const auto path = config::config_path();
  const auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return 1;
  }
  const auto report = config::validate_config(loaded.value());
  if (!report.ok()) {
    std::cerr << "invalid configuration: " << report.error() << "\n";
    return 1;
  }
  for (const auto &warning : report.value()) {
    std::cout << "warning: " << warning << "\n";
  }
  std::cout << "configuration OK";
  if (path.ok()) {
    std::cout << " (" << path.value().string() << ")";
  }
  std::cout << "\n";
  return 0;
}

common::Status write_if_missing(const std::filesystem::path &path, const std::string &content,
                                const bool force) {
  std::error_code ec;
  if (!force && std::filesystem::exists(path, ec)) {
    std::cout << "kept existing " << path.string() << "\n";
    return common::Status::success();
  }
  if (const auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
    return common::Status::error(dir.error(), common::ErrorKind::Config);
  }
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    return common::Status::error("Unable to write " + path.string(), common::ErrorKind::Config);
  }
  out << content;
  std::cout << "wrote " << path.string() << "\n";
  return common::Status::success();
}

int run_init(std::vector<std::string> args) {
  const bool force = take_flag(args, "--force");
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args.front() << "\n";
    return 1;
  }

  const config::Config defaults{};
  const auto path = config::config_path();
  if (!path.ok()) {
    std::cerr << path.error() << "\n";
    return 1;
  }
  std::error_code ec;
  if (force || !std::filesystem::exists(path.value(), ec)) {
    if (const auto saved = config::save_config(defaults); !saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    std::cout << "wrote " << path.value().string() << "\n";
  } else {
    std::cout << "kept existing " << path.value().string() << "\n";
  }

  const auto patterns = write_if_missing(
      common::expand_path(defaults.command_guard.patterns_file),
      security::pattern_set_to_json(security::fallback_command_patterns()), force);
  if (!patterns.ok()) {
    std::cerr << patterns.error() << "\n";
    return 1;
  }
  const auto protection = write_if_missing(
      common::expand_path(defaults.file_guard.protection_file),
      security::file_protection_to_json(security::default_file_protection()), force);
  if (!protection.ok()) {
    std::cerr << protection.error() << "\n";
    return 1;
  }
  return 0;
}

} // namespace

void print_help() {
  std::cout << version_string() << " - tool-call guard pipeline for AI agents\n\n";
  std::cout << "USAGE\n";
  std::cout << "  clawguard [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  hook              Read a tool call as JSON on stdin, print the verdict as JSON\n";
  std::cout << "  check             Evaluate a tool call given on the command line\n";
  std::cout << "                      --tool NAME --param key=value ... [--agent ID] [--cwd DIR]\n";
  std::cout << "                      [--session KEY]\n";
  std::cout << "  ip ADDRESS        Report whether an address is private/reserved\n";
  std::cout << "  config validate   Check the configuration file\n";
  std::cout << "  init [--force]    Write default config, pattern and protection files\n";
  std::cout << "  version           Show version\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "hook") {
    return run_hook(std::move(args));
  }
  if (subcommand == "check") {
    return run_check(std::move(args));
  }
  if (subcommand == "ip") {
    return run_ip(args);
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }
  if (subcommand == "init") {
    return run_init(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n\n";
  print_help();
  return 1;
}

} // namespace clawguard::cli
