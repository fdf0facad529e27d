// scopelink - Model linker Command Line Interface
//
// Usage:
//   scopelink link    <model.json>... [--dump]
//   scopelink check   <model.json>...
//   scopelink resolve <qualified-name> <model.json>... [--from <qualified-name>]
//   scopelink init    <project-dir>
//
#include <unistd.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "scopelink/basic/diagnostic_printer.hpp"
#include "scopelink/driver/link_driver.hpp"
#include "scopelink/link/scope.hpp"
#include "scopelink/model/json_writer.hpp"
#include "scopelink/model/qualified_name.hpp"
#include "scopelink/project/link_config.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_failure = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "scopelink v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  link <model.json>...          Link model files\n"
            << "  check <model.json>...         Link and report unresolved references\n"
            << "  resolve <name> <model.json>.. Resolve a qualified name in the linked model\n"
            << "  init <project-dir>            Initialize a new project\n\n"
            << "Options:\n"
            << "  --config <file>               Project configuration (default: scopelink.yaml\n"
            << "                                in the current directory or its parents)\n"
            << "  --base <model.json>           Link on top of an environment built from\n"
            << "                                this file (repeatable)\n"
            << "  --from <name>                 Node whose scope `resolve` starts from\n"
            << "  --dump                        Print the linked environment as JSON\n"
            << "  --no-stdlib                   Disable automatic standard library detection\n"
            << "  -v, --verbose                 Verbose output\n"
            << "  -h, --help                    Show this help message\n";
}

void print_diagnostics(const scopelink::DiagnosticBag & diagnostics)
{
  if (diagnostics.empty()) {
    return;
  }
  const bool use_color = isatty(fileno(stderr)) != 0;
  scopelink::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
  printer.print_summary(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::optional<std::string> config_path;
  std::vector<std::string> base_paths;
  std::optional<std::string> from;
  bool dump = false;
  bool no_stdlib = false;
  bool verbose = false;
  bool show_help = false;
  std::string usage_error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  auto take_value = [&](int & i, const std::string & flag) -> std::optional<std::string> {
    if (i + 1 < argc) {
      return std::string(argv[++i]);
    }
    args.usage_error = "missing value for " + flag;
    return std::nullopt;
  };

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--config") {
      args.config_path = take_value(i, arg);
    } else if (arg == "--base") {
      if (auto value = take_value(i, arg)) {
        args.base_paths.push_back(*value);
      }
    } else if (arg == "--from") {
      args.from = take_value(i, arg);
    } else if (arg == "--dump") {
      args.dump = true;
    } else if (arg == "--no-stdlib") {
      args.no_stdlib = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.usage_error = "unknown option: " + arg;
    } else {
      args.positional.push_back(arg);
    }
  }

  return args;
}

scopelink::DriverOptions make_driver_options(
  const CommandArgs & args, const std::vector<std::string> & inputs)
{
  scopelink::DriverOptions options;
  options.verbose = args.verbose;
  options.auto_detect_stdlib = !args.no_stdlib;

  if (args.config_path) {
    options.config_path = fs::absolute(*args.config_path);
  } else if (auto found = scopelink::find_link_config(fs::current_path())) {
    options.config_path = *found;
    if (args.verbose) {
      std::cerr << "Using configuration: " << found->string() << "\n";
    }
  }

  for (const auto & input : inputs) {
    options.inputs.emplace_back(fs::absolute(input));
  }
  for (const auto & base : args.base_paths) {
    options.base_inputs.emplace_back(fs::absolute(base));
  }
  return options;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_link(const CommandArgs & args)
{
  auto options = make_driver_options(args, args.positional);
  options.check_references = false;

  const auto result = scopelink::LinkDriver::run(options);
  print_diagnostics(result.diagnostics);
  if (!result.success) {
    return k_exit_failure;
  }

  if (args.dump) {
    std::cout << scopelink::to_json(result.linked.environment).dump(2) << "\n";
  } else {
    std::cout << "linked " << result.linked.environment->members.size()
              << " top-level packages\n";
  }
  return k_exit_ok;
}

int cmd_check(const CommandArgs & args)
{
  auto options = make_driver_options(args, args.positional);
  options.check_references = true;

  const auto result = scopelink::LinkDriver::run(options);
  print_diagnostics(result.diagnostics);
  if (!result.success) {
    return k_exit_failure;
  }

  std::cout << "OK\n";
  return k_exit_ok;
}

int cmd_resolve(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: name to resolve required\n";
    std::cerr << "usage: scopelink resolve <qualified-name> <model.json>... [--from <name>]\n";
    return k_exit_usage;
  }

  const std::string name = args.positional.front();
  const std::vector<std::string> inputs(args.positional.begin() + 1, args.positional.end());

  auto options = make_driver_options(args, inputs);
  options.check_references = false;

  const auto result = scopelink::LinkDriver::run(options);
  print_diagnostics(result.diagnostics);
  if (!result.success) {
    return k_exit_failure;
  }

  const scopelink::Node * origin = result.linked.environment;
  if (args.from) {
    origin = result.linked.environment->scope->resolve(*args.from);
    if (origin == nullptr) {
      std::cerr << "error: cannot resolve origin '" << *args.from << "'\n";
      return k_exit_failure;
    }
  }

  const scopelink::Node * target = origin->scope->resolve(name);
  if (target == nullptr) {
    std::cerr << "error: '" << name << "' does not resolve from '"
              << (args.from ? *args.from : std::string("<environment>")) << "'\n";
    return k_exit_failure;
  }

  nlohmann::json out{
    {"name", name},
    {"kind", std::string(scopelink::to_string(target->kind))},
    {"id", scopelink::to_string(target->id)},
    {"qualifiedName", scopelink::qualified_name(target)}};
  if (args.dump) {
    out["node"] = scopelink::to_json(target);
    out["scope"] = scopelink::to_json(*target->scope);
  }
  std::cout << out.dump(2) << "\n";
  return k_exit_ok;
}

int cmd_init(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: project directory required\n";
    std::cerr << "usage: scopelink init <project-dir>\n";
    return k_exit_usage;
  }

  const fs::path project_dir = fs::current_path() / args.positional.front();

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return k_exit_failure;
  }

  std::error_code ec;
  fs::create_directories(project_dir / "model", ec);
  if (ec) {
    std::cerr << "error: cannot create " << project_dir.string() << ": " << ec.message() << "\n";
    return k_exit_failure;
  }

  std::ofstream config(project_dir / scopelink::k_link_config_file_name);
  config << "link:\n"
         << "  global_packages: [std.lang, std.lib, std.game]\n"
         << "  ids: counter\n"
         << "check:\n"
         << "  unresolved_references: true\n"
         << "inputs:\n"
         << "  - model/app.json\n";

  std::ofstream model(project_dir / "model" / "app.json");
  model << "{\n"
        << "  \"kind\": \"Package\",\n"
        << "  \"name\": \"app\",\n"
        << "  \"fileName\": \"app\",\n"
        << "  \"members\": [\n"
        << "    { \"kind\": \"Program\", \"name\": \"main\", \"body\": [] }\n"
        << "  ]\n"
        << "}\n";

  if (!config || !model) {
    std::cerr << "error: failed to write project files in " << project_dir.string() << "\n";
    return k_exit_failure;
  }

  std::cout << "Initialized new scopelink project in " << project_dir.string() << "\n";
  std::cout << "\nNext steps:\n"
            << "  cd " << args.positional.front() << "\n"
            << "  scopelink check\n";
  return k_exit_ok;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return args.command.empty() ? k_exit_usage : k_exit_ok;
  }
  if (!args.usage_error.empty()) {
    std::cerr << "error: " << args.usage_error << "\n\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  if (args.command == "link") {
    return cmd_link(args);
  }
  if (args.command == "check") {
    return cmd_check(args);
  }
  if (args.command == "resolve") {
    return cmd_resolve(args);
  }
  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command: " << args.command << "\n\n";
  print_usage(argv[0]);
  return k_exit_usage;
}
