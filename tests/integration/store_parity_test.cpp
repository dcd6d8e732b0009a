#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/incident_store.hpp"
#include "internal/dedup/dedup_orchestrator.hpp"
#include "internal/factory.hpp"

#if SEAWATCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#endif

#if SEAWATCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace {

using seawatch::db::BoundingBox;
using seawatch::db::ErrorCode;
using seawatch::db::IncidentStore;
using seawatch::db::TimeWindow;
using seawatch::db::model::ByImo;
using seawatch::db::model::ByName;
using seawatch::db::model::MergeStateUpdate;
using seawatch::db::model::MergeStatus;
using seawatch::db::model::ProcessingStatus;
using seawatch::db::model::RawRecord;
using seawatch::db::model::RawRecordPatch;
using seawatch::db::model::VesselReferenceRecord;
using seawatch::runtime::config::RuntimeConfig;

const auto kBase = seawatch::util::ParseTimestamp("2024-03-01T12:00:00Z").value();

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                     name;
  std::function<std::shared_ptr<IncidentStore>()> make_store;
  std::function<void()>                           cleanup;
};

RawRecord MakeRecord(const std::string& id, const std::string& source, double lat, double lon, int hours_offset = 0) {
  RawRecord r;
  r.id          = id;
  r.source      = source;
  r.occurred_at = kBase + std::chrono::hours(hours_offset);
  r.latitude    = lat;
  r.longitude   = lon;
  return r;
}

void Insert(IncidentStore& store, const std::vector<RawRecord>& records) {
  auto tx = store.Begin();
  for (const auto& r : records) {
    assert(store.InsertRecord(*tx, r));
  }
  tx->Commit();
}

RawRecord Load(IncidentStore& store, const std::string& id) {
  auto tx = store.Begin();
  auto r  = store.GetRecord(*tx, id);
  tx->Commit();
  assert(r.has_value());
  return *r;
}

std::vector<std::string> Ids(const std::vector<RawRecord>& records) {
  std::vector<std::string> ids;
  for (const auto& r : records) ids.push_back(r.id);
  return ids;
}

void VerifyInsertAndGet(IncidentStore& store) {
  RawRecord r             = MakeRecord("full", "RECAAP", 1.25, 103.85);
  r.reference_id          = "RC-2024-031";
  r.title                 = "Robbery";
  r.description           = "Three robbers boarded.\nNothing stolen.";
  r.region                = "Asia";
  r.location              = "Singapore Strait";
  r.incident_type_name    = "Robbery";
  r.vessel_name           = "OCEAN STAR";
  r.vessel_type           = "Bulk carrier";
  r.vessel_flag           = "PA";
  r.vessel_imo            = "9123456";
  r.vessel_status         = "Underway";
  r.update_text           = "Crew safe.";
  r.processing_notes      = "Imported.";
  r.raw_json              = R"({"id":"RC-2024-031"})";
  r.canonical_incident_id = "INC-9";
  r.processing_status     = ProcessingStatus::kProcessing;
  r.merged_at             = kBase;
  r.merged_sources        = {"RECAAP", "ICC"};
  r.merged_record_ids     = {"older-1", "older-2"};
  r.vessel_ref_id         = "vessel-1";
  r.last_processed_at     = kBase + std::chrono::minutes(5);
  r.merge_status          = MergeStatus::kMerged;
  Insert(store, {r});

  const auto read = Load(store, "full");
  assert(read.source == r.source);
  assert(read.reference_id == r.reference_id);
  assert(read.occurred_at == r.occurred_at);
  assert(read.latitude == r.latitude && read.longitude == r.longitude);
  assert(read.description == r.description);
  assert(read.location == r.location);
  assert(read.vessel_imo == r.vessel_imo);
  assert(read.vessel_status == r.vessel_status);
  assert(read.update_text == r.update_text);
  assert(read.raw_json == r.raw_json);
  assert(read.merge_status == MergeStatus::kMerged);
  assert(!read.merged_into_id);
  assert(read.canonical_incident_id == r.canonical_incident_id);
  assert(read.processing_status == ProcessingStatus::kProcessing);
  assert(read.merged_at == r.merged_at);
  assert(read.merged_sources == r.merged_sources);
  assert(read.merged_record_ids == r.merged_record_ids);
  assert(read.vessel_ref_id == r.vessel_ref_id);
  assert(read.last_processed_at == r.last_processed_at);

  // missing optionals stay missing
  RawRecord bare;
  bare.id     = "bare";
  bare.source = "CWD";
  Insert(store, {bare});
  const auto bare_read = Load(store, "bare");
  assert(!bare_read.occurred_at && !bare_read.latitude && !bare_read.longitude);
  assert(bare_read.merged_sources.empty());
  assert(bare_read.processing_status == ProcessingStatus::kNew);

  {
    auto tx = store.Begin();
    assert(!store.GetRecord(*tx, "missing").has_value());
    tx->Commit();
  }

  // duplicate ids are rejected; the failed transaction is abandoned
  {
    auto tx     = store.Begin();
    auto result = store.InsertRecord(*tx, bare);
    assert(!result);
    assert(result.code == ErrorCode::AlreadyExists);
  }
}

void VerifyQueryRecent(IncidentStore& store) {
  auto absorbed           = MakeRecord("absorbed", "MDAT", 1.0, 104.0, 3);
  absorbed.merge_status   = MergeStatus::kMergedInto;
  absorbed.merged_into_id = "r1";

  auto undated        = MakeRecord("undated", "ICC", 1.0, 104.0);
  undated.occurred_at = std::nullopt;

  Insert(store, {
                    MakeRecord("r1", "UKMTO", 1.0, 104.0, 0),
                    MakeRecord("r2", "MDAT", 1.0, 104.0, 2),
                    MakeRecord("r0", "ICC", 1.0, 104.0, 2),
                    MakeRecord("old", "CWD", 1.0, 104.0, -100),
                    absorbed,
                    undated,
                });

  auto tx     = store.Begin();
  auto recent = store.QueryRecent(*tx, kBase - std::chrono::hours(1), 10);
  assert(Ids(recent) == std::vector<std::string>({"r0", "r2", "r1"}));

  auto capped = store.QueryRecent(*tx, kBase - std::chrono::hours(1), 2);
  assert(Ids(capped) == std::vector<std::string>({"r0", "r2"}));
  tx->Commit();
}

void VerifyQueryCandidates(IncidentStore& store) {
  auto linked                  = MakeRecord("c-in", "UKMTO", 1.20, 103.80, 1);
  linked.canonical_incident_id = "INC-1";
  auto second                  = MakeRecord("c-also", "ICC", 1.25, 103.85, -1);
  second.canonical_incident_id = "INC-2";
  auto unlinked                = MakeRecord("c-unlinked", "MDAT", 1.20, 103.80, 0);
  auto late                    = MakeRecord("c-late", "CWD", 1.20, 103.80, 100);
  late.canonical_incident_id   = "INC-3";
  auto far                     = MakeRecord("c-far", "RECAAP", 5.0, 103.80, 0);
  far.canonical_incident_id    = "INC-4";
  auto absorbed                = MakeRecord("c-absorbed", "UKMTO", 1.20, 103.80, 0);
  absorbed.canonical_incident_id = "INC-1";
  absorbed.merge_status          = MergeStatus::kMergedInto;
  absorbed.merged_into_id        = "c-in";
  Insert(store, {linked, second, unlinked, late, far, absorbed});

  TimeWindow  window{kBase - std::chrono::hours(48), kBase + std::chrono::hours(48)};
  BoundingBox box{0.8, 1.6, 103.4, 104.2};

  auto tx         = store.Begin();
  auto candidates = store.QueryCandidates(*tx, window, box);
  tx->Commit();
  assert(Ids(candidates) == std::vector<std::string>({"c-also", "c-in"}));
}

void VerifyConditionalMergeState(IncidentStore& store) {
  Insert(store, {MakeRecord("p", "RECAAP", 1.0, 104.0), MakeRecord("s", "UKMTO", 1.0, 104.0)});

  MergeStateUpdate absorbed;
  absorbed.merge_status      = MergeStatus::kMergedInto;
  absorbed.merged_into_id    = "p";
  absorbed.processing_status = ProcessingStatus::kReady;
  absorbed.note              = "Merged into p (RECAAP)";

  {
    auto tx = store.Begin();
    assert(store.UpdateMergeState(*tx, "s", absorbed, MergeStatus::kNone));
    tx->Commit();
  }

  // the second writer expected the old state and loses
  {
    auto tx     = store.Begin();
    auto result = store.UpdateMergeState(*tx, "s", absorbed, MergeStatus::kNone);
    assert(!result);
    assert(result.code == ErrorCode::Conflict);
  }

  {
    auto tx     = store.Begin();
    auto result = store.UpdateMergeState(*tx, "nope", absorbed, MergeStatus::kNone);
    assert(!result);
    assert(result.code == ErrorCode::NotFound);
  }

  const auto s = Load(store, "s");
  assert(s.merge_status == MergeStatus::kMergedInto);
  assert(s.merged_into_id == std::string("p"));
  assert(s.processing_status == ProcessingStatus::kReady);
  assert(s.processing_notes == "Merged into p (RECAAP)");

  // a second note goes on its own line; no status change requested
  MergeStateUpdate survivor;
  survivor.merge_status = MergeStatus::kMerged;
  survivor.note         = "Absorbed s";
  {
    auto tx = store.Begin();
    assert(store.UpdateMergeState(*tx, "p", survivor, MergeStatus::kNone));
    survivor.merge_status = MergeStatus::kMerged;
    survivor.note         = "Absorbed t";
    assert(store.UpdateMergeState(*tx, "p", survivor, MergeStatus::kMerged));
    tx->Commit();
  }
  const auto p = Load(store, "p");
  assert(p.merge_status == MergeStatus::kMerged);
  assert(p.processing_status == ProcessingStatus::kNew);
  assert(p.processing_notes == "Absorbed s\nAbsorbed t");
}

void VerifyUpdateFields(IncidentStore& store) {
  auto r  = MakeRecord("u", "RECAAP", 1.0, 104.0);
  r.title = "Original";
  Insert(store, {r});

  RawRecordPatch patch;
  patch.description       = "Added text";
  patch.vessel_flag       = "SG";
  patch.merged_sources    = std::vector<std::string>{"RECAAP", "UKMTO"};
  patch.processing_status = ProcessingStatus::kReady;
  patch.last_processed_at = kBase;
  {
    auto tx = store.Begin();
    assert(store.UpdateFields(*tx, "u", patch));
    assert(store.UpdateFields(*tx, "u", RawRecordPatch{}));
    tx->Commit();
  }

  const auto read = Load(store, "u");
  assert(read.title == "Original");
  assert(read.description == "Added text");
  assert(read.vessel_flag == "SG");
  assert(read.merged_sources == std::vector<std::string>({"RECAAP", "UKMTO"}));
  assert(read.processing_status == ProcessingStatus::kReady);
  assert(read.last_processed_at == kBase);
  assert(read.merge_status == MergeStatus::kNone);

  auto tx     = store.Begin();
  auto result = store.UpdateFields(*tx, "nope", patch);
  assert(!result);
  assert(result.code == ErrorCode::NotFound);
}

void VerifyRollback(IncidentStore& store) {
  {
    auto tx = store.Begin();
    assert(store.InsertRecord(*tx, MakeRecord("rolled-back", "UKMTO", 1.0, 104.0)));
    tx->Rollback();
  }
  {
    auto tx = store.Begin();
    assert(store.InsertRecord(*tx, MakeRecord("dropped", "UKMTO", 1.0, 104.0)));
    // destroyed without Commit()
  }

  auto tx = store.Begin();
  assert(!store.GetRecord(*tx, "rolled-back").has_value());
  assert(!store.GetRecord(*tx, "dropped").has_value());
  tx->Commit();
}

void VerifyIntegrityViolations(IncidentStore& store) {
  auto x           = MakeRecord("x", "UKMTO", 1.0, 104.0);
  x.merge_status   = MergeStatus::kMergedInto;
  x.merged_into_id = "y";
  auto y           = MakeRecord("y", "MDAT", 1.0, 104.0);
  y.merge_status   = MergeStatus::kMergedInto;
  y.merged_into_id = "z";
  auto z           = MakeRecord("z", "ICC", 1.0, 104.0);
  z.merge_status   = MergeStatus::kMerged;
  auto w           = MakeRecord("w", "CWD", 1.0, 104.0);
  w.merge_status   = MergeStatus::kMergedInto;
  w.merged_into_id = "gone";
  Insert(store, {x, y, z, w});

  auto tx         = store.Begin();
  auto violations = store.ListMergeIntegrityViolations(*tx);
  tx->Commit();

  std::sort(violations.begin(), violations.end(), [](const auto& a, const auto& b) { return a.record_id < b.record_id; });
  assert(violations.size() == 2);
  assert(violations[0].record_id == "w" && violations[0].reason == "dangling_merge");
  assert(violations[1].record_id == "x" && violations[1].merged_into_id == "y" && violations[1].reason == "chained_merge");
}

void VerifyVesselReferences(IncidentStore& store) {
  VesselReferenceRecord ocean{"v-ocean", "9123456", "OCEANSTAR", "Ocean Star"};
  VesselReferenceRecord nordic{"v-nordic", "", "NORDICACE", "Nordic Ace"};
  {
    auto tx = store.Begin();
    assert(store.InsertVesselReference(*tx, ocean));
    assert(store.InsertVesselReference(*tx, nordic));
    tx->Commit();
  }

  auto tx = store.Begin();
  auto by_imo = store.FindVesselReference(*tx, ByImo{"9123456"});
  assert(by_imo && by_imo->id == "v-ocean" && by_imo->display_name == "Ocean Star");

  auto by_name = store.FindVesselReference(*tx, ByName{"NORDICACE"});
  assert(by_name && by_name->id == "v-nordic");

  assert(!store.FindVesselReference(*tx, ByImo{"0000000"}));
  // an empty IMO never matches a reference without one
  assert(!store.FindVesselReference(*tx, ByImo{""}));
  tx->Commit();
}

void VerifyDedupPass(IncidentStore& store, const std::shared_ptr<IncidentStore>& shared) {
  auto a               = MakeRecord("a", "RECAAP", 4.0, 3.0);
  a.title              = "Armed robbery";
  a.description        = "Robbers boarded the anchored vessel and stole engine spares.";
  a.vessel_name        = "MV DELTA";
  a.incident_type_name = "Robbery";

  auto b               = MakeRecord("b", "UKMTO", 4.01, 3.01, 1);
  b.vessel_name        = "DELTA";
  b.incident_type_name = "Theft";
  Insert(store, {a, b});

  seawatch::dedup::DedupOrchestrator orchestrator(shared);
  auto summary = orchestrator.RunDeduplicationPass(kBase + std::chrono::hours(2));
  assert(summary.merges_succeeded == 1);
  assert(summary.merge_errors == 0);

  const auto secondary = Load(store, "b");
  assert(secondary.merge_status == MergeStatus::kMergedInto);
  assert(secondary.merged_into_id == std::string("a"));

  const auto primary = Load(store, "a");
  assert(primary.merge_status == MergeStatus::kMerged);
  assert(primary.merged_record_ids == std::vector<std::string>({"b"}));
  assert(primary.merged_sources == std::vector<std::string>({"RECAAP", "UKMTO"}));
  assert(orchestrator.CheckMergeIntegrity().empty());
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name = "memory",
      .make_store =
          []() {
            RuntimeConfig config;
            config.mutable_database()->mutable_memory();
            return seawatch::factory::BuildStore(config);
          },
      .cleanup = []() {},
  };
}

#if SEAWATCH_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto dir = std::filesystem::temp_directory_path() / ("seawatch_integration_sqlite_" + std::to_string(NowMs()));
  std::filesystem::create_directories(dir);

  auto counter = std::make_shared<int>(0);
  return BackendFactory{
      .name = "sqlite",
      .make_store =
          [dir, counter]() {
            RuntimeConfig config;
            auto*         sqlite = config.mutable_database()->mutable_sqlite();
            sqlite->set_path((dir / ("store_" + std::to_string((*counter)++) + ".db")).string());
            return seawatch::factory::BuildStore(config);
          },
      .cleanup = [dir]() { std::filesystem::remove_all(dir); },
  };
}
#endif

#if SEAWATCH_DB_SQLITE
std::string JournalMode(const std::string& path) {
  seawatch::db::sqlite::SqliteDB db(path, false);
  sqlite3_stmt*                  stmt = db.Prepare("PRAGMA journal_mode;");
  std::string                    mode;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    mode = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return mode;
}

void VerifySqliteJournalMode() {
  auto dir = std::filesystem::temp_directory_path() / ("seawatch_integration_journal_" + std::to_string(NowMs()));
  std::filesystem::create_directories(dir);

  // an sqlite block without options runs in WAL mode
  const auto default_path = (dir / "default.db").string();
  {
    RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(default_path);
    auto store = seawatch::factory::BuildStore(config);
  }
  assert(JournalMode(default_path) == "wal");

  const auto rollback_path = (dir / "rollback_journal.db").string();
  {
    RuntimeConfig config;
    auto*         sqlite = config.mutable_database()->mutable_sqlite();
    sqlite->set_path(rollback_path);
    sqlite->set_disable_wal(true);
    auto store = seawatch::factory::BuildStore(config);
  }
  assert(JournalMode(rollback_path) == "delete");

  std::filesystem::remove_all(dir);
}
#endif

#if SEAWATCH_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("SEAWATCH_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("SEAWATCH_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  return BackendFactory{
      .name = "postgres",
      .make_store =
          [conninfo]() {
            RuntimeConfig config;
            config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
            auto store = seawatch::factory::BuildStore(config);

            // every suite starts from empty tables
            auto       pool = std::make_shared<seawatch::db::postgres::PgPool>(conninfo, 1);
            auto       conn = pool->Acquire();
            pqxx::work tx(*conn);
            tx.exec("DELETE FROM raw_record;");
            tx.exec("DELETE FROM vessel_reference;");
            tx.commit();
            return store;
          },
      .cleanup = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  VerifyInsertAndGet(*backend.make_store());
  VerifyQueryRecent(*backend.make_store());
  VerifyQueryCandidates(*backend.make_store());
  VerifyConditionalMergeState(*backend.make_store());
  VerifyUpdateFields(*backend.make_store());
  VerifyRollback(*backend.make_store());
  VerifyIntegrityViolations(*backend.make_store());
  VerifyVesselReferences(*backend.make_store());

  auto store = backend.make_store();
  VerifyDedupPass(*store, store);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SEAWATCH_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if SEAWATCH_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

#if SEAWATCH_DB_SQLITE
  VerifySqliteJournalMode();
#endif

  std::cout << "seawatch_integration_store_parity: pass\n";
  return 0;
}
