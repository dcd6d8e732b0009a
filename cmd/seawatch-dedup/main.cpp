#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/dedup/dedup_summary.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using seawatch::observability::IntField;

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: seawatch-dedup <config.yaml> OR seawatch-dedup --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = seawatch::config::ConfigLoader::LoadFromYaml(config_path);

    seawatch::observability::InitializeTracing(config);
    seawatch::observability::InitializeMetrics(config);
    seawatch::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // One bounded pass, then exit
    // ------------------------------------------------------------
    auto runtime = seawatch::factory::Build(config);
    auto summary = runtime.orchestrator->RunDeduplicationPass();

    std::cout << "recordsAnalyzed=" << summary.records_analyzed << " potentialMatchesChecked=" << summary.potential_matches_checked
              << " highConfidenceMatches=" << summary.high_confidence_matches
              << " mediumConfidenceMatches=" << summary.medium_confidence_matches << " mergesAttempted=" << summary.merges_attempted
              << " mergesSucceeded=" << summary.merges_succeeded << " mergeErrors=" << summary.merge_errors << std::endl;

    SEAWATCH_LOG_INFO("seawatch-dedup finished", {IntField("merges_succeeded", summary.merges_succeeded), IntField("merge_errors", summary.merge_errors)});

    seawatch::observability::ShutdownLogging();
    seawatch::observability::ShutdownMetrics();
    seawatch::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    SEAWATCH_LOG_ERROR("Fatal error", {seawatch::observability::StringField("error", e.what())});
    seawatch::observability::ShutdownLogging();
    seawatch::observability::ShutdownMetrics();
    seawatch::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
