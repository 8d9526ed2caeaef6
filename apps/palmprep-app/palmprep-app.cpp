// Copyright (c) 2024-2025 palmprep contributors

// This file is part of palmprep

// palmprep is free software: you can redistribute it and/or modify it under
// the terms of the GNU General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version. palmprep is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General
// Public License for more details. You should have received a copy of the GNU
// General Public License along with palmprep. If not, see
// <https://www.gnu.org/licenses/>.


#include <cstdlib>
#include <exception>
#include <palmprep/common/datastructures.hpp>
#include <palmprep/logger/logger.h>

#include "config.hpp"
#include "pipeline.hpp"

int main(int argc, const char* argv[]) {
  auto& logger = palmprep::logger::Logger::get_logger();

  CLIArgs cli_args(argc, argv);
  PalmprepConfigHandler handler;

  // Parse basic command line arguments (not yet the configuration parameters)
  try {
    handler.parse_cli_first_pass(cli_args);
  } catch (const std::exception& e) {
    logger.error("Failed to parse command line arguments.");
    logger.error("{} Use '-h' to print usage information.", e.what());
    return EXIT_FAILURE;
  }
  if (handler._print_help) {
    handler.print_help(cli_args.program_name);
    return EXIT_SUCCESS;
  }
  if (handler._print_version) {
    handler.print_version();
    return EXIT_SUCCESS;
  }
  logger.set_level(handler._loglevel);

  // Read configuration file, config path has already been checked for existence
  if (handler._config_path.size()) {
    logger.info("Reading configuration from file {}", handler._config_path);
    try {
      handler.parse_config_file();
    } catch (const std::exception& e) {
      logger.error(
          "Unable to parse config file {}. {} Use '-h' to print usage "
          "information.",
          handler._config_path, e.what());
      return EXIT_FAILURE;
    }
  }

  // Further command line arguments override values from the config file
  try {
    handler.parse_cli_second_pass(cli_args);
  } catch (const std::exception& e) {
    logger.error(
        "Failed to parse command line arguments. {} Use '-h' to print usage "
        "information.",
        e.what());
    return EXIT_FAILURE;
  }

  try {
    handler.validate();
  } catch (const std::exception& e) {
    logger.error(
        "Failed to validate parameter values. {} Use '-h' to print usage "
        "information.",
        e.what());
    return EXIT_FAILURE;
  }

  logger.debug("{}", handler);

  try {
    run_pipeline(handler.cfg_);
  } catch (const palmprep::GeometryRepairFailed& e) {
    logger.error("{}", e.what());
    logger.error("Suggested conversion: {}", e.remediation());
    return EXIT_FAILURE;
  } catch (const palmprep::palmprepException& e) {
    logger.error("{}", e.what());
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    logger.critical("Unexpected error: {}", e.what());
    return EXIT_FAILURE;
  }

  logger.info("Done. Outputs written to {}", handler.cfg_.output_path);
  return EXIT_SUCCESS;
}
