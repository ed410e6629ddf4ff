#include <mwb2dbm/converter.hpp>
#include <mwb2dbm/dbm_merge.hpp>
#include <mwb2dbm/diagnostics.hpp>
#include <mwb2dbm/error.hpp>
#include <mwb2dbm/trigger_config.hpp>
#include <mwb2dbm/xml_element.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_convert = 4;

struct cli_options {
  std::string input_file;
  std::string output_file;
  std::string trigger_file;
  std::vector<std::string> merge_files;
  bool citext = true;
  bool fk_indexes = true;
  bool verbose = false;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: mwb2dbm [options] <model.mwb>\n"
     << "\n"
     << "Convert a MySQL Workbench model to a pgModeler model.\n"
     << "\n"
     << "Options:\n"
     << "  --triggers <file>  Trigger definition file ([Triggers] name = "
        "signature)\n"
     << "  --merge <file>     Merge functions and aggregates from this .dbm "
        "(repeatable)\n"
     << "  --nocitext         Do not convert char/varchar to citext\n"
     << "  --nofkidx          Do not create indexes for foreign keys\n"
     << "  -o <file>          Output file (default: <model>.dbm)\n"
     << "  --verbose          Print informational messages\n"
     << "  -h, --help         Show this help message\n"
     << "  --version          Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "mwb2dbm " << MWB2DBM_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "--nocitext") {
      opts.citext = false;
      continue;
    }

    if (arg == "--nofkidx") {
      opts.fk_indexes = false;
      continue;
    }

    if (arg == "--verbose") {
      opts.verbose = true;
      continue;
    }

    if (arg == "--triggers") {
      if (i + 1 >= argc) {
        std::cerr << "mwb2dbm: --triggers requires an argument\n";
        std::exit(exit_usage);
      }
      opts.trigger_file = argv[++i];
      continue;
    }

    if (arg == "--merge") {
      if (i + 1 >= argc) {
        std::cerr << "mwb2dbm: --merge requires an argument\n";
        std::exit(exit_usage);
      }
      opts.merge_files.push_back(argv[++i]);
      continue;
    }

    if (arg == "-o") {
      if (i + 1 >= argc) {
        std::cerr << "mwb2dbm: -o requires an argument\n";
        std::exit(exit_usage);
      }
      opts.output_file = argv[++i];
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "mwb2dbm: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    if (!opts.input_file.empty()) {
      std::cerr << "mwb2dbm: only one input file is supported\n";
      std::exit(exit_usage);
    }
    opts.input_file = arg;
  }

  return opts;
}

static std::optional<std::string>
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static void
print_diagnostics(const mwb2dbm::diagnostics& diag, bool verbose) {
  for (const auto& d : diag.entries()) {
    if (d.level == mwb2dbm::severity::warning)
      std::cerr << "mwb2dbm: warning: " << d.message << "\n";
    else if (verbose)
      std::cerr << "mwb2dbm: info: " << d.message << "\n";
  }
}

static int
run(const cli_options& opts) {
  // Trigger configuration
  std::optional<mwb2dbm::trigger_config> triggers;
  if (!opts.trigger_file.empty()) {
    auto text = read_file(opts.trigger_file);
    if (!text) {
      std::cerr << "mwb2dbm: cannot open trigger file: " << opts.trigger_file
                << "\n";
      return exit_io;
    }
    try {
      std::istringstream in(*text);
      triggers = mwb2dbm::trigger_config::load(in);
    } catch (const std::exception& e) {
      std::cerr << "mwb2dbm: error reading trigger file " << opts.trigger_file
                << ": " << e.what() << "\n";
      return exit_parse;
    }
  }

  if (!std::ifstream(opts.input_file, std::ios::binary)) {
    std::cerr << "mwb2dbm: cannot open file: " << opts.input_file << "\n";
    return exit_io;
  }

  // Read the model document out of the container
  mwb2dbm::xml_element source;
  try {
    source = mwb2dbm::load_model_document(opts.input_file);
  } catch (const std::exception& e) {
    std::cerr << "mwb2dbm: error reading model " << opts.input_file << ": "
              << e.what() << "\n";
    return exit_parse;
  }

  mwb2dbm::synthesis_options synth_opts;
  synth_opts.citext = opts.citext;
  synth_opts.keep_fk_indexes = opts.fk_indexes;
  synth_opts.triggers = triggers ? &*triggers : nullptr;

  // Convert
  mwb2dbm::diagnostics diag;
  mwb2dbm::xml_element result;
  try {
    result = mwb2dbm::convert_document(source, synth_opts, diag);
  } catch (const mwb2dbm::invalid_file_format& e) {
    print_diagnostics(diag, opts.verbose);
    std::cerr << "mwb2dbm: invalid model " << opts.input_file << ": "
              << e.what() << "\n";
    return exit_parse;
  } catch (const std::exception& e) {
    print_diagnostics(diag, opts.verbose);
    std::cerr << "mwb2dbm: conversion error: " << e.what() << "\n";
    return exit_convert;
  }
  print_diagnostics(diag, opts.verbose);

  // Merge hand-written fragments
  for (const auto& path : opts.merge_files) {
    std::cout << "Merging from " << path << "\n";
    auto text = read_file(path);
    if (!text) {
      std::cerr << "mwb2dbm: cannot open file: " << path << "\n";
      return exit_io;
    }
    try {
      mwb2dbm::merge_dbm(result, mwb2dbm::parse_document(*text));
    } catch (const std::exception& e) {
      std::cerr << "mwb2dbm: error parsing " << path << ": " << e.what()
                << "\n";
      return exit_parse;
    }
  }

  // Serialize before touching the output file
  std::string document = mwb2dbm::serialize_document(result);

  std::string output = opts.output_file.empty()
                           ? mwb2dbm::output_path_for(opts.input_file)
                           : opts.output_file;
  std::cout << "Saving converted file as " << output << "\n";
  std::ofstream out(output, std::ios::binary);
  if (!out) {
    std::cerr << "mwb2dbm: cannot write file: " << output << "\n";
    return exit_io;
  }
  out << document;
  if (!out) {
    std::cerr << "mwb2dbm: error writing file: " << output << "\n";
    return exit_io;
  }

  return exit_success;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.input_file.empty()) {
    std::cerr << "mwb2dbm: no input file\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
