// odxm - Orchestration model builder and gap analyzer
//
// Usage:
//   odxm analyze [dir | --project] [-o report.json]
//   odxm parse <file.odx> [-o model.json]
//   odxm diagnose <file.odx>
//   odxm receives <file.odx>
//
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "odx/analysis/gap_analyzer.hpp"
#include "odx/analysis/receive_pattern.hpp"
#include "odx/analysis/report_json.hpp"
#include "odx/analysis/report_printer.hpp"
#include "odx/basic/diagnostic_printer.hpp"
#include "odx/basic/error.hpp"
#include "odx/model/model_json.hpp"
#include "odx/model/shape_dumper.hpp"
#include "odx/parse/orchestration_loader.hpp"
#include "odx/project/project_config.hpp"
#include "odx/xml/source_extractor.hpp"

namespace fs = std::filesystem;

namespace
{

std::atomic<bool> g_cancel{false};

extern "C" void handle_sigint(int) { g_cancel.store(true); }

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "odxm - orchestration model builder v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  analyze [dir]            Gap analysis of every orchestration in a directory\n"
            << "  parse <file.odx>         Build the model and print it as JSON\n"
            << "  diagnose <file.odx>      Print shape totals and the shape hierarchy\n"
            << "  receives <file.odx>      Classify the activating receives\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output file (JSON)\n"
            << "  --project                Use odxm.yaml (searched upward from here)\n"
            << "  -r, --recursive          Descend into subdirectories (analyze)\n"
            << "  --top <n>                Rows in the shape frequency table (analyze)\n"
            << "  --json                   JSON output (receives)\n"
            << "  --no-color               Disable terminal colors\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

bool stdout_color(bool disabled) { return !disabled && isatty(fileno(stdout)) != 0; }
bool stderr_color(bool disabled) { return !disabled && isatty(fileno(stderr)) != 0; }

void print_diagnostics(
  const odx::DiagnosticBag & diagnostics, std::string_view xml_text, bool verbose, bool no_color)
{
  odx::DiagnosticBag shown;
  for (const auto & diag : diagnostics) {
    if (verbose || diag.severity == odx::Severity::Error ||
        diag.severity == odx::Severity::Warning) {
      shown.add(diag);
    }
  }
  if (shown.empty()) {
    return;
  }
  odx::DiagnosticPrinter printer(std::cerr, stderr_color(no_color));
  printer.print_all(shown, xml_text);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input;
  std::string output_path;
  int top_shapes = 0;
  bool use_project = false;
  bool recursive = false;
  bool json = false;
  bool no_color = false;
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
    } else if (arg == "--top") {
      if (i + 1 < argc) {
        args.top_shapes = std::atoi(argv[++i]);
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "-r" || arg == "--recursive") {
      args.recursive = true;
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input.empty()) {
      args.input = arg;
    }
  }

  return args;
}

// Load one file, printing diagnostics; returns false on failure
bool load_file(const CommandArgs & args, odx::OrchestrationModel & model)
{
  if (args.input.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: odxm " << args.command << " <file.odx>\n";
    return false;
  }

  odx::DiagnosticBag diags;
  std::string xml;
  try {
    const fs::path input_path = fs::absolute(args.input);
    const std::string text = odx::read_source_file(input_path);
    xml = odx::extract_xml(text, input_path.filename().string());
    model = odx::load_orchestration_from_text(text, input_path.filename().string(), &diags);
  } catch (const odx::OdxError & e) {
    print_diagnostics(diags, xml, args.verbose, args.no_color);
    std::cerr << "error[" << odx::to_string(e.kind()) << "]: " << e.what() << "\n";
    return false;
  } catch (const std::exception & e) {
    print_diagnostics(diags, xml, args.verbose, args.no_color);
    std::cerr << "error: " << e.what() << "\n";
    return false;
  }

  print_diagnostics(diags, xml, args.verbose, args.no_color);
  return true;
}

bool write_text(const std::string & path, const std::string & text)
{
  std::ofstream out(path);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << path << "\n";
    return false;
  }
  out << text;
  return static_cast<bool>(out);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_analyze(const CommandArgs & args)
{
  fs::path dir;
  std::optional<fs::path> output;
  odx::DirectoryScanOptions options;
  size_t top_shapes = odx::ReportPrinter::k_default_top_shapes;

  if (args.use_project || args.input.empty()) {
    auto config_path = odx::find_project_config(fs::current_path());
    if (!config_path) {
      if (args.use_project) {
        std::cerr << "error: no " << odx::k_project_config_file_name
                  << " found in current directory or parents\n";
        return 1;
      }
      dir = fs::current_path();
    } else {
      const auto config_result = odx::load_project_config(*config_path);
      if (!config_result.success) {
        std::cerr << "error: " << config_result.error << "\n";
        return 1;
      }
      const auto & config = config_result.config;
      if (args.verbose) {
        std::cerr << "Analyzing project: " << config.project.name << "\n";
      }
      dir = config.resolved_input_dir();
      output = config.resolved_report_output();
      options.extensions = config.analysis.extensions;
      options.recursive = config.analysis.recursive;
      top_shapes = static_cast<size_t>(config.report.top_shapes);
    }
  } else {
    dir = fs::absolute(args.input);
  }

  if (!args.output_path.empty()) output = fs::path(args.output_path);
  if (args.recursive) options.recursive = true;
  if (args.top_shapes > 0) top_shapes = static_cast<size_t>(args.top_shapes);

  std::signal(SIGINT, handle_sigint);
  options.cancel = &g_cancel;

  odx::ReportPrinter printer(std::cout, stdout_color(args.no_color), top_shapes);
  std::cout << "\n=== ODX FILE GAP ANALYSIS ===\n"
            << "Directory: " << dir.string() << "\n\n";

  // Diagnostics accumulate across files; each progress line shows the new ones
  odx::DiagnosticBag diags;
  size_t shown = 0;
  options.on_files_found = [](size_t count) {
    std::cout << "Found " << count << " orchestration files\n\n";
  };
  options.on_file = [&](const odx::AnalysisResult & result) {
    printer.print_progress(result);
    if (args.verbose) {
      odx::DiagnosticBag file_diags;
      for (size_t i = shown; i < diags.size(); ++i) {
        file_diags.add(diags.all()[i]);
      }
      print_diagnostics(file_diags, {}, true, args.no_color);
    }
    shown = diags.size();
  };

  odx::GapAnalysisReport report;
  try {
    report = odx::analyze_directory(dir, options, &diags);
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  printer.print(report);

  if (output) {
    try {
      odx::save_report_json(report, *output);
      std::cout << "\nDetailed report saved to: " << output->string() << "\n";
    } catch (const odx::OdxError & e) {
      std::cerr << "error: " << e.what() << "\n";
      return 1;
    }
  }

  return report.cancelled ? 130 : 0;
}

int cmd_parse(const CommandArgs & args)
{
  odx::OrchestrationModel model;
  if (!load_file(args, model)) {
    return 1;
  }

  const std::string text = odx::to_json(model).dump(2) + "\n";
  if (args.output_path.empty()) {
    std::cout << text;
    return 0;
  }
  if (!write_text(args.output_path, text)) {
    return 1;
  }
  std::cerr << "Wrote " << model.arena.size() << " shapes to " << args.output_path << "\n";
  return 0;
}

int cmd_diagnose(const CommandArgs & args)
{
  odx::OrchestrationModel model;
  if (!load_file(args, model)) {
    return 1;
  }

  odx::ShapeDumper dumper(std::cout, model);
  dumper.dump_totals();
  std::cout << "\n";
  dumper.dump();
  return 0;
}

int cmd_receives(const CommandArgs & args)
{
  odx::OrchestrationModel model;
  if (!load_file(args, model)) {
    return 1;
  }

  const auto analysis = odx::analyze_receive_pattern(model);
  if (args.json) {
    std::cout << odx::to_json(model, analysis).dump(2) << "\n";
  } else {
    odx::ReportPrinter printer(std::cout, stdout_color(args.no_color));
    printer.print_receive_pattern(model, analysis);
  }
  return analysis.is_valid() ? 0 : 2;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  try {
    if (args.command == "analyze") {
      return cmd_analyze(args);
    }

    if (args.command == "parse") {
      return cmd_parse(args);
    }

    if (args.command == "diagnose") {
      return cmd_diagnose(args);
    }

    if (args.command == "receives") {
      return cmd_receives(args);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
