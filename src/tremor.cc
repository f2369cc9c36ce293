/*
 * Copyright (C) 2014-2018 Olzhas Rakhimov
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

/// @file
/// Main entrance.

#include <cerrno>
#include <cstdarg>
#include <cstdio>  // vsnprintf
#include <cstring>  // strerror

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/core/typeinfo.hpp>
#include <boost/exception/all.hpp>
#include <boost/program_options.hpp>
#include <boost/scope_exit.hpp>

#include <libxml/parser.h>  // xmlInitParser, xmlCleanupParser
#include <libxml/xmlerror.h>  // initGenericErrorDefaultFunc
#include <libxml/xmlversion.h>  // LIBXML_TEST_VERSION

#include "config.h"
#include "error.h"
#include "logger.h"
#include "logic_tree_analysis.h"
#include "logic_tree_reader.h"
#include "reporter.h"
#include "settings.h"
#include "source_model_reader.h"
#include "version.h"

namespace po = boost::program_options;

namespace {

/// Provides an options value type.
#define OPT_VALUE(type) po::value<type>()->value_name(#type)

/// @returns Command-line option descriptions.
po::options_description ConstructOptions() {
  using path = std::string;  // To print argument type as path.

  po::options_description desc("Options");
  // clang-format off
  desc.add_options()
      ("help", "Display this help message")
      ("version", "Display version information")
      ("config-file", OPT_VALUE(path), "XML file with configurations")
      ("source-model", OPT_VALUE(path),
       "XML file with the source model to transform")
      ("validate", "Validate input files without processing")
      ("num-samples", OPT_VALUE(int),
       "Number of realizations to sample (0 to enumerate all paths)")
      ("seed", OPT_VALUE(int), "Seed for the pseudo-random number generator")
      ("limit-paths", OPT_VALUE(int),
       "Upper limit for the reported paths of the enumeration")
      ("output-path,o", OPT_VALUE(path), "Output path for reports")
      ("no-indent", "Omit indentation whitespace in output XML")
      ("verbosity", OPT_VALUE(int), "Set log verbosity");
  // clang-format on
  return desc;
}
#undef OPT_VALUE

/// Parses the command-line arguments.
///
/// @param[in] argc  Count of arguments.
/// @param[in] argv  Values of arguments.
/// @param[out] vm  Variables map of program options.
///
/// @returns 0 for success.
/// @returns 1 for errored state.
/// @returns -1 for information only state like help and version.
int ParseArguments(int argc, char* argv[], po::variables_map* vm) {
  const char* usage = "Usage:    tremor [options] logic-tree-file";
  po::options_description desc = ConstructOptions();
  po::options_description options("All options with the positional input.");
  options.add(desc).add_options()("logic-tree", po::value<std::string>(),
                                  "XML file with the logic tree");
  po::positional_options_description p;
  p.add("logic-tree", 1);
  try {
    po::store(
        po::command_line_parser(argc, argv).options(options).positional(p).run(),
        *vm);
  } catch (std::exception& err) {
    std::cerr << "Option error: " << err.what() << "\n\n"
              << usage << "\n\n"
              << desc << std::endl;
    return 1;
  }
  po::notify(*vm);

  auto print_help = [&usage, &desc](std::ostream& out) {
    out << usage << "\n\n" << desc << std::endl;
  };

  if (vm->count("help")) {
    print_help(std::cout);
    return -1;
  }
  if (vm->count("version")) {
    std::cout << "tremor " << tremor::version::core() << " ("
              << tremor::version::build() << ")"
              << "\n\nDependencies:\n"
              << "   Boost       " << tremor::version::boost() << "\n"
              << "   libxml2     " << tremor::version::xml() << std::endl;
    return -1;
  }

  if (vm->count("verbosity")) {
    int level = (*vm)["verbosity"].as<int>();
    if (level < 0 || level > tremor::kMaxVerbosity) {
      std::cerr << "Log verbosity must be between 0 and "
                << tremor::kMaxVerbosity << ".\n\n";
      print_help(std::cerr);
      return 1;
    }
  }

  if (!vm->count("logic-tree") && !vm->count("config-file")) {
    std::cerr << "No logic tree or configuration file is given.\n\n";
    print_help(std::cerr);
    return 1;
  }
  return 0;
}

// clang-format off
/// Helper macro for ConstructSettings
/// to set the value in "settings"
/// only if provided by "vm" arguments.
#define SET(tag, type, member) \
  if (vm.count(tag)) settings->member(vm[tag].as<type>())
// clang-format on

/// Updates settings from command-line arguments.
///
/// @param[in] vm  Variables map of program options.
/// @param[in,out] settings  Pre-configured or default settings.
///
/// @throws SettingsError  The indication of an error in arguments.
void ConstructSettings(const po::variables_map& vm,
                       tremor::core::Settings* settings) {
  SET("num-samples", int, num_samples);
  SET("seed", int, seed);
  SET("limit-paths", int, limit_paths);
}
#undef SET

/// Main body of command-line entrance to run the program.
///
/// @param[in] vm  Variables map of program options.
///
/// @throws Error  Exceptions specific to tremor.
/// @throws boost::exception  Boost errors with the variables map.
/// @throws std::exception  All other problems.
void RunTremor(const po::variables_map& vm) {
  tremor::core::Settings settings;
  std::string logic_tree_file;
  std::string source_model_file;
  std::string output_path;
  // Command-line values overwrite the configurations.
  if (vm.count("config-file")) {
    auto config =
        std::make_unique<tremor::Config>(vm["config-file"].as<std::string>());
    settings = config->settings();
    logic_tree_file = config->logic_tree_file();
    source_model_file = config->source_model_file();
    output_path = config->output_path();
  }
  ConstructSettings(vm, &settings);
  if (vm.count("logic-tree"))
    logic_tree_file = vm["logic-tree"].as<std::string>();
  if (vm.count("source-model"))
    source_model_file = vm["source-model"].as<std::string>();
  if (vm.count("output-path"))
    output_path = vm["output-path"].as<std::string>();

  std::unique_ptr<tremor::lt::BranchSet> root =
      tremor::lt::LogicTreeReader(logic_tree_file).root();
  std::vector<tremor::model::SourceGroup> groups;
  if (!source_model_file.empty())
    groups = tremor::model::SourceModelReader(source_model_file).groups();
  if (vm.count("validate"))
    return;  // Stop if only validation is requested.

  tremor::core::LogicTreeAnalysis analysis(*root, groups, settings);
  analysis.Analyze();

  tremor::Reporter reporter;
  bool indent = vm.count("no-indent") ? false : true;
  if (output_path.empty()) {
    reporter.Report(analysis, stdout, indent);
  } else {
    reporter.Report(analysis, output_path, indent);
  }
}

/// Callback function to redirect XML library error/warning messages to logging.
/// Otherwise, the messages are printed to the standard error.
///
/// @param[in] msg  The printf-style format string.
/// @param[in] ...  The variadic arguments for the format string.
///
/// @pre The library strictly follows validity conditions of printf.
void LogXmlError(void* /*ctx*/, const char* msg, ...) noexcept {
  std::va_list args;
  va_start(args, msg);

  std::va_list args_for_nchar;  // Only used to determine the string length.
  va_copy(args_for_nchar, args);
  int nchar = std::vsnprintf(nullptr, 0, msg, args_for_nchar);
  va_end(args_for_nchar);
  if (nchar < 0) {
    va_end(args);
    LOG(tremor::ERROR) << "String formatting failure: "
                       << std::strerror(errno);
    return;
  }

  std::vector<char> buffer(nchar + /*null terminator*/ 1);
  std::vsnprintf(buffer.data(), buffer.size(), msg, args);
  va_end(args);
  LOG(tremor::WARNING) << buffer.data();
}

/// Prints error information into the standard error.
///
/// @tparam Tag  The error info tag to retrieve the error value.
///
/// @param[in] tag_string  The string for the tag type.
/// @param[in] err  The error.
template <class Tag>
void PrintErrorInfo(const char* tag_string, const tremor::Error& err) {
  if (const auto* value = boost::get_error_info<Tag>(err))
    std::cerr << tag_string << ": " << *value << "\n";
}

}  // namespace

/// Command-line tremor entrance.
///
/// @param[in] argc  Argument count.
/// @param[in] argv  Argument vector.
///
/// @returns 0 for success.
/// @returns 1 for errored state.
int main(int argc, char* argv[]) {
  LIBXML_TEST_VERSION
  xmlInitParser();
  BOOST_SCOPE_EXIT_ALL(&) { xmlCleanupParser(); };

  xmlGenericErrorFunc xml_error_printer = LogXmlError;
  initGenericErrorDefaultFunc(&xml_error_printer);

  try {
    po::variables_map vm;
    int ret = ParseArguments(argc, argv, &vm);
    if (ret == 1)
      return 1;

    if (vm.count("verbosity"))
      tremor::Logger::SetVerbosity(vm["verbosity"].as<int>());

    if (ret == 0)
      RunTremor(vm);
  } catch (const tremor::LogicError& err) {
    LOG(tremor::ERROR) << "Logic Error:\n"
                       << boost::diagnostic_information(err);
    return 1;
  } catch (const tremor::IOError& err) {
    LOG(tremor::DEBUG1) << boost::diagnostic_information(err);
    std::cerr << boost::core::demangled_name(typeid(err)) << "\n\n";
    PrintErrorInfo<boost::errinfo_file_name>("File", err);
    PrintErrorInfo<boost::errinfo_file_open_mode>("Open mode", err);
    if (const int* errnum = boost::get_error_info<boost::errinfo_errno>(err)) {
      std::cerr << "Error code: " << *errnum << "\n";
      std::cerr << "Error string: " << std::strerror(*errnum) << "\n";
    }
    std::cerr << "\n" << err.what() << std::endl;
    return 1;
  } catch (const tremor::Error& err) {
    using namespace tremor;  // NOLINT
    LOG(DEBUG1) << boost::diagnostic_information(err);
    std::cerr << boost::core::demangled_name(typeid(err)) << "\n\n";
    PrintErrorInfo<errinfo_value>("Value", err);
    PrintErrorInfo<boost::errinfo_file_name>("File", err);
    PrintErrorInfo<boost::errinfo_at_line>("Line", err);
    PrintErrorInfo<lt::errinfo_branchset_id>("Branch set", err);
    PrintErrorInfo<lt::errinfo_branch_id>("Branch", err);
    PrintErrorInfo<lt::errinfo_uncertainty>("Uncertainty", err);
    PrintErrorInfo<lt::errinfo_filter>("Filter", err);
    PrintErrorInfo<model::errinfo_source_id>("Source", err);
    PrintErrorInfo<model::errinfo_operation>("Operation", err);
    PrintErrorInfo<core::errinfo_realization>("Realization", err);
    PrintErrorInfo<xml::errinfo_element>("XML element", err);
    PrintErrorInfo<xml::errinfo_attribute>("XML attribute", err);
    std::cerr << "\n" << err.what() << std::endl;
    return 1;
  } catch (const boost::exception& boost_err) {
    LOG(tremor::ERROR) << "Unexpected Boost Exception:\n"
                       << boost::diagnostic_information(boost_err);
    return 1;
  } catch (const std::exception& err) {
    LOG(tremor::ERROR) << "Unexpected Exception: "
                       << boost::core::demangled_name(typeid(err)) << ":\n"
                       << err.what();
    return 1;
  }
}  // End of main.
