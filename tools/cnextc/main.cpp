// cnextc - C-Next to C compiler command line interface
//
// Usage:
//   cnextc build <file.cnx | dir> [-o output] [-I dir]...
//   cnextc check <file.cnx | dir>
//   cnextc clean <file.cnx | dir>
//
#include <fmt/format.h>

#include <cstdio>
#include <filesystem>
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

#include "cnext/basic/diagnostic_json.hpp"
#include "cnext/basic/diagnostic_printer.hpp"
#include "cnext/driver/compiler.hpp"

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_errors = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "C-Next Compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> <file.cnx | dir> [options]\n\n"
            << "Commands:\n"
            << "  build                    Generate .c and .h files\n"
            << "  check                    Analyze without writing output\n"
            << "  clean                    Remove generated files and the cache\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output .c file (single input) or directory\n"
            << "  -I <dir>                 Add an include search path (repeatable)\n"
            << "  --config <file>          Use this cnext.yaml\n"
            << "  --no-cache               Do not read or write the symbol cache\n"
            << "  --cache-dir <dir>        Cache directory (default: .cnx-cache)\n"
            << "  --format <text|json>     Diagnostic output format\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

enum class OutputFormat { Text, Json };

struct CommandArgs
{
  std::string command;
  std::string input;
  std::string output_path;
  std::string config_file;
  std::string cache_dir;
  std::vector<std::string> include_paths;
  OutputFormat format = OutputFormat::Text;
  bool no_cache = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  /// Set when the command line is malformed
  std::string usage_error;
};

void print_diagnostics(
  const cnext::DiagnosticBag & diagnostics, const cnext::SourceRegistry & sources,
  const CommandArgs & args)
{
  if (args.format == OutputFormat::Json) {
    std::cout << cnext::diagnostics_to_json(diagnostics, sources).dump(2) << "\n";
    return;
  }
  if (diagnostics.empty()) {
    return;
  }

  // Colors only when stderr is a terminal
  const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
  cnext::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, sources);
  printer.print_summary(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.usage_error = "missing command";
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  auto take_value = [&](int & i, const std::string & flag, std::string & out) {
    if (i + 1 >= argc) {
      args.usage_error = "option " + flag + " requires a value";
      return;
    }
    out = argv[++i];
  };

  for (int i = 2; i < argc && args.usage_error.empty(); ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      take_value(i, arg, args.output_path);
    } else if (arg == "-I") {
      std::string dir;
      take_value(i, arg, dir);
      args.include_paths.push_back(dir);
    } else if (arg.rfind("-I", 0) == 0 && arg.size() > 2) {
      args.include_paths.push_back(arg.substr(2));
    } else if (arg == "--config") {
      take_value(i, arg, args.config_file);
    } else if (arg == "--cache-dir") {
      take_value(i, arg, args.cache_dir);
    } else if (arg == "--no-cache") {
      args.no_cache = true;
    } else if (arg == "--format") {
      std::string format;
      take_value(i, arg, format);
      if (format == "json") {
        args.format = OutputFormat::Json;
      } else if (format != "text" && args.usage_error.empty()) {
        args.usage_error = "unknown format '" + format + "' (expected text or json)";
      }
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input.empty()) {
      args.input = arg;
    } else {
      args.usage_error = "unexpected argument '" + arg + "'";
    }
  }

  if (args.usage_error.empty() && !args.show_help && args.input.empty()) {
    args.usage_error = "missing input file or directory";
  }
  return args;
}

cnext::CompileOptions make_options(const CommandArgs & args, cnext::CompileMode mode)
{
  cnext::CompileOptions options;
  options.mode = mode;
  options.verbose = args.verbose;
  options.use_cache = !args.no_cache;
  if (!args.output_path.empty()) {
    options.output = args.output_path;
  }
  if (!args.cache_dir.empty()) {
    options.cache_dir = args.cache_dir;
  }
  if (!args.config_file.empty()) {
    options.config_file = args.config_file;
  }
  for (const auto & path : args.include_paths) {
    options.include_paths.emplace_back(path);
  }
  return options;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_compile(const CommandArgs & args, cnext::CompileMode mode)
{
  const cnext::CompileOptions options = make_options(args, mode);

  if (args.verbose) {
    fmt::print(
      stderr, "{}: {}\n", mode == cnext::CompileMode::Build ? "Building" : "Checking", args.input);
  }

  const cnext::CompileResult result = cnext::Compiler::compile(args.input, options);

  if (args.verbose) {
    if (result.config_file) {
      fmt::print(stderr, "Config: {}\n", result.config_file->string());
    }
    for (const auto & source : result.inputs) {
      fmt::print(stderr, "Source: {}\n", source.string());
    }
    const cnext::CompileStats & s = result.stats;
    fmt::print(
      stderr, "Headers: {} parsed, {} from cache, {} system; {} symbols\n", s.headersParsed,
      s.headersFromCache, s.systemHeaders, s.symbolsInserted);
    fmt::print(stderr, "Modules analyzed: {}\n", s.modulesAnalyzed);
    if (!result.cache_file.empty()) {
      fmt::print(stderr, "Cache: {}\n", result.cache_file.string());
    }
  }

  print_diagnostics(result.diagnostics, result.sources, args);

  if (!result.success) {
    return k_exit_errors;
  }

  if (args.format == OutputFormat::Text) {
    if (mode == cnext::CompileMode::Build) {
      for (const auto & file : result.generated_files) {
        fmt::print(stderr, "Generated: {}\n", file.string());
      }
    } else {
      fmt::print("{}: OK\n", args.input);
    }
  }
  return k_exit_ok;
}

int cmd_clean(const CommandArgs & args)
{
  const cnext::CleanResult result =
    cnext::Compiler::clean(args.input, make_options(args, cnext::CompileMode::Build));

  const cnext::SourceRegistry no_sources;
  print_diagnostics(result.diagnostics, no_sources, args);

  if (args.format == OutputFormat::Text) {
    for (const auto & file : result.removed_files) {
      fmt::print(stderr, "Removed: {}\n", file.string());
    }
  }
  return result.success ? k_exit_ok : k_exit_errors;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.usage_error.empty()) {
    fmt::print(stderr, "error: {}\n\n", args.usage_error);
    print_usage(argv[0]);
    return k_exit_usage;
  }

  if (args.command == "build") {
    return cmd_compile(args, cnext::CompileMode::Build);
  }

  if (args.command == "check") {
    return cmd_compile(args, cnext::CompileMode::Check);
  }

  if (args.command == "clean") {
    return cmd_clean(args);
  }

  fmt::print(stderr, "error: unknown command '{}'\n\n", args.command);
  print_usage(argv[0]);
  return k_exit_usage;
}
