// wbc - wirebind generator command line interface
//
// Usage:
//   wbc generate [schema.wb.yaml | --project] [-o dir]
//   wbc check [schema.wb.yaml | --project]
//   wbc plan [schema.wb.yaml | --project]
//   wbc scan-proto <file.proto>... -o lookup.json
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "wirebind/analysis/side_channel.hpp"
#include "wirebind/basic/diagnostic_printer.hpp"
#include "wirebind/driver/generator.hpp"
#include "wirebind/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "wirebind generator v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  generate [schema]            Generate conversion headers\n"
            << "  check [schema]               Analyse schemas (no output)\n"
            << "  plan [schema]                Print the conversion plan as JSON\n"
            << "  scan-proto <file.proto>...   Write an optionality lookup table\n\n"
            << "Options:\n"
            << "  -o, --output <path>          Output directory (generate) or file (scan-proto)\n"
            << "  --project                    Use wirebind.yaml\n"
            << "  --side-channel <file.json>   Optionality lookup table (repeatable)\n"
            << "  --proto <file.proto>         Scan a .proto for optionality (repeatable)\n"
            << "  --plan-comments              Annotate generated code with strategies\n"
            << "  --no-color                   Disable coloured diagnostics\n"
            << "  -v, --verbose                Verbose output\n"
            << "  -h, --help                   Show this help message\n";
}

void print_diagnostics(const wirebind::DiagnosticBag & diagnostics, bool color)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = color && isatty(fileno(stderr)) != 0;
  wirebind::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> inputs;
  std::string output_path;
  std::vector<std::string> lookup_files;
  std::vector<std::string> proto_files;
  bool use_project = false;
  bool plan_comments = false;
  bool color = true;
  bool verbose = false;
  bool show_help = false;
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

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--side-channel") {
      if (i + 1 < argc) {
        args.lookup_files.emplace_back(argv[++i]);
      }
    } else if (arg == "--proto") {
      if (i + 1 < argc) {
        args.proto_files.emplace_back(argv[++i]);
      }
    } else if (arg == "--plan-comments") {
      args.plan_comments = true;
    } else if (arg == "--no-color") {
      args.color = false;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.inputs.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

/// Shared by generate, check and plan.
bool run_generator(
  const CommandArgs & args, wirebind::GenerateMode mode, wirebind::GenerateResult & result)
{
  wirebind::GenerateOptions options;
  options.mode = mode;
  options.config.verbose = args.verbose;
  options.config.emit_plan_comments = args.plan_comments;
  if (!args.output_path.empty()) {
    options.output_dir = args.output_path;
  }
  for (const auto & f : args.lookup_files) {
    options.lookup_files.emplace_back(f);
  }
  for (const auto & f : args.proto_files) {
    options.proto_files.emplace_back(f);
  }

  if (args.use_project || args.inputs.empty()) {
    // Project mode: find wirebind.yaml
    auto config_path = wirebind::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << wirebind::k_project_config_file_name
                << " found in current directory or parents\n";
      return false;
    }

    const auto config_result = wirebind::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return false;
    }

    result = wirebind::Generator::generate_project(config_result.config, options);
  } else {
    // Single file mode
    const fs::path input_path = fs::absolute(args.inputs.front());

    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return false;
    }

    if (args.verbose) {
      std::cerr << "Processing: " << input_path.string() << "\n";
    }

    result = wirebind::Generator::generate_file(input_path, options);
  }

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, args.color);
  }
  return result.success;
}

int cmd_generate(const CommandArgs & args)
{
  wirebind::GenerateResult result;
  if (!run_generator(args, wirebind::GenerateMode::Generate, result)) {
    return 1;
  }

  for (const auto & file : result.generated_files) {
    std::cerr << "Generated: " << file.string() << "\n";
  }
  return 0;
}

int cmd_check(const CommandArgs & args)
{
  wirebind::GenerateResult result;
  if (!run_generator(args, wirebind::GenerateMode::Check, result)) {
    return 1;
  }

  std::cout << (args.inputs.empty() ? "project" : args.inputs.front()) << ": OK\n";
  return 0;
}

int cmd_plan(const CommandArgs & args)
{
  wirebind::GenerateResult result;
  if (!run_generator(args, wirebind::GenerateMode::Plan, result)) {
    return 1;
  }

  if (result.plan_json.size() == 1) {
    std::cout << result.plan_json.front().dump(2) << "\n";
  } else {
    std::cout << result.plan_json.dump(2) << "\n";
  }
  return 0;
}

int cmd_scan_proto(const CommandArgs & args)
{
  if (args.inputs.empty()) {
    std::cerr << "error: at least one .proto file required\n";
    std::cerr << "usage: wbc scan-proto <file.proto>... -o lookup.json\n";
    return 1;
  }

  wirebind::ProtoScanner scanner;
  for (const auto & input : args.inputs) {
    if (!scanner.scan_file(input)) {
      std::cerr << "error: failed to read file: " << input << "\n";
      return 1;
    }
    if (args.verbose) {
      std::cerr << "Scanned: " << input << "\n";
    }
  }

  const wirebind::TableSideChannel table = scanner.build();
  const std::string text = table.to_json().dump(2) + "\n";

  if (args.output_path.empty()) {
    // Output to stdout
    std::cout << text;
    return 0;
  }

  std::ofstream out(args.output_path);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << args.output_path << "\n";
    return 1;
  }
  out << text;
  std::cerr << "Wrote " << table.size() << " field entries to " << args.output_path << "\n";
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "generate") {
    return cmd_generate(args);
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "plan") {
    return cmd_plan(args);
  }

  if (args.command == "scan-proto") {
    return cmd_scan_proto(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
