#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/incident_store.hpp"
#include "internal/dedup/dedup_orchestrator.hpp"
#include "internal/matching/candidate_finder.hpp"

namespace seawatch::factory {

/*
  Runtime

  Everything a dedup pass or an ingest-time lookup needs, wired from
  one RuntimeConfig.
*/
struct Runtime {
  std::shared_ptr<db::IncidentStore>          store;
  std::shared_ptr<dedup::DedupOrchestrator>   orchestrator;
  std::shared_ptr<matching::CandidateFinder>  finder;
};

/*
  BuildStore

  Opens the configured backend and bootstraps its schema. This is the
  only place that knows concrete store types.
*/
std::shared_ptr<db::IncidentStore> BuildStore(const seawatch::runtime::config::RuntimeConfig& config);

Runtime Build(const seawatch::runtime::config::RuntimeConfig& config);

} // namespace seawatch::factory
