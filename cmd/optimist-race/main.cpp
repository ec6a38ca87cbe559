#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/race/scenario.hpp"

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: optimist-race <config.yaml> OR optimist-race --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = optimist::config::ConfigLoader::LoadFromYaml(config_path);
    optimist::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build repository and run the scenario once
    // ------------------------------------------------------------
    auto repository = optimist::factory::BuildRepository(config);
    auto options    = optimist::factory::BuildScenarioOptions(config);

    optimist::race::ScenarioRunner runner(repository);
    const auto                     report = runner.Run(options);

    std::cout << optimist::race::Describe(report);
    optimist::observability::ShutdownLogging();
    return report.passed ? 0 : 3;
  } catch (const std::exception& e) {
    OPTIMIST_LOG_ERROR("Fatal error", {optimist::observability::StringField("error", e.what())});
    optimist::observability::ShutdownLogging();
    return 2;
  }
}
