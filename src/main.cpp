// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include "application.hpp"
#include "config.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  using namespace signalhub;

  std::vector<std::string> args(argv + 1, argv + argc);
  app::ConfigResult result = app::LoadConfig(args);

  switch (result.status) {
  case app::ConfigStatus::ShowHelp:
    std::cout << app::GetUsage(argv[0]);
    return 0;
  case app::ConfigStatus::ShowVersion:
    std::cout << GetFullVersionString() << "\n" << GetCopyrightString() << "\n";
    return 0;
  case app::ConfigStatus::Error:
    std::cerr << "Error: " << result.error << "\n"
              << "Run '" << argv[0] << " --help' for usage.\n";
    return 1;
  case app::ConfigStatus::Ok:
    break;
  }

  const app::AppConfig& config = result.config;
  util::LogManager::Initialize(config.log_level, !config.log_file.empty(),
                               config.log_file.empty() ? "signalhub.log" : config.log_file);

  int exit_code = 0;
  try {
    app::Application application(config);

    if (!application.initialize()) {
      LOG_ERROR("Failed to initialize application");
      exit_code = 1;
    } else if (!application.start()) {
      LOG_ERROR("Failed to start application");
      exit_code = 1;
    } else {
      application.wait_for_shutdown();
    }
  } catch (const std::exception& e) {
    LOG_ERROR("Fatal error: {}", e.what());
    exit_code = 1;
  }

  util::LogManager::Shutdown();
  return exit_code;
}
