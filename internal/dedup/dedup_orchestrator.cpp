#include "dedup_orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>

#include "internal/merge/merge_planner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/ranking/record_quality.hpp"
#include "internal/reference/reference_cache.hpp"
#include "internal/util/errors.hpp"

namespace seawatch::dedup {

using db::model::MergeStateUpdate;
using db::model::MergeStatus;
using db::model::ProcessingStatus;
using db::model::RawRecord;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
      throw util::WriteConflict(message);
    case db::ErrorCode::Busy:
    case db::ErrorCode::IOError:
      throw util::StoreUnavailable(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::InvalidState(message + " (" + db::ToString(result.code) + ")");
  }
}

std::string SourceKey(const std::string& source) {
  const auto first = source.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = source.find_last_not_of(" \t\r\n");

  std::string key = source.substr(first, last - first + 1);
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return key;
}

std::string SourceLabel(const RawRecord& r) {
  return r.source.empty() ? std::string("unknown source") : r.source;
}

} // namespace

DedupSettings DedupSettings::FromConfig(const seawatch::runtime::config::DedupConfig& config) {
  DedupSettings settings;
  if (config.lookback_days() > 0) settings.lookback_days = static_cast<int>(config.lookback_days());
  if (config.max_records() > 0) settings.max_records = config.max_records();
  if (config.confidence_threshold() > 0.0) settings.confidence_threshold = config.confidence_threshold();
  if (config.high_confidence_threshold() > 0.0) settings.high_confidence_threshold = config.high_confidence_threshold();
  settings.scoring = scoring::ScoringSettings::FromConfig(config.scoring(), scoring::ScoringSettings::BatchDefaults());
  return settings;
}

DedupOrchestrator::DedupOrchestrator(std::shared_ptr<db::IncidentStore> store, DedupSettings settings)
    : store_(std::move(store)), settings_(settings), scorer_(settings.scoring) {
}

std::vector<db::MergeIntegrityViolation> DedupOrchestrator::CheckMergeIntegrity() {
  auto tx         = store_->Begin();
  auto violations = store_->ListMergeIntegrityViolations(*tx);
  tx->Commit();

  for (const auto& v : violations) {
    SEAWATCH_LOG_WARN("data integrity violation, manual review required",
                      {StringField("record_id", v.record_id), StringField("merged_into_id", v.merged_into_id),
                       StringField("reason", v.reason)});
  }
  return violations;
}

DedupSummary DedupOrchestrator::RunDeduplicationPass() {
  return RunDeduplicationPass(util::Now());
}

DedupSummary DedupOrchestrator::RunDeduplicationPass(util::TimePoint now) {
  observability::SpanScope span("seawatch.dedup.pass");
  const auto               started = std::chrono::steady_clock::now();

  DedupSummary summary;

  CheckMergeIntegrity();

  const auto since = now - std::chrono::hours(24) * settings_.lookback_days;

  std::vector<RawRecord> records;
  {
    auto tx = store_->Begin();
    records = store_->QueryRecent(*tx, since, settings_.max_records);
    tx->Commit();
  }
  summary.records_analyzed = static_cast<int64_t>(records.size());

  SEAWATCH_LOG_INFO("dedup pass started", {StringField("since", util::FormatTimestamp(since)), IntField("records", summary.records_analyzed),
                                           IntField("max_records", static_cast<int64_t>(settings_.max_records))});

  reference::ReferenceCache  cache;
  reference::VesselResolver  resolver(*store_, cache);
  std::vector<bool>          consumed(records.size(), false);

  for (std::size_t i = 0; i < records.size(); ++i) {
    if (consumed[i]) continue;

    for (std::size_t j = i + 1; j < records.size(); ++j) {
      if (consumed[j]) continue;

      const auto& a = records[i];
      const auto& b = records[j];
      if (SourceKey(a.source) == SourceKey(b.source)) continue;

      ++summary.potential_matches_checked;
      const auto score = scorer_.Score(a, b);

      if (score.total < settings_.confidence_threshold) {
        observability::Metrics::Instance().RecordPairScored("none");
        continue;
      }

      const bool high = score.total >= settings_.high_confidence_threshold;
      if (high) {
        ++summary.high_confidence_matches;
      } else {
        ++summary.medium_confidence_matches;
      }
      observability::Metrics::Instance().RecordPairScored(high ? "high" : "medium");

      SEAWATCH_LOG_INFO("potential duplicate", {StringField("record1", a.id), StringField("source1", a.source), StringField("record2", b.id),
                                                StringField("source2", b.source), DoubleField("total", score.total),
                                                StringField("confidence", high ? "high" : "medium")});

      auto selection = ranking::DeterminePrimary(a, b);
      if (selection.secondary->merge_status == MergeStatus::kMerged) {
        if (selection.primary->merge_status == MergeStatus::kMerged) {
          SEAWATCH_LOG_INFO("both records already absorb others, skipping",
                            {StringField("record1", a.id), StringField("record2", b.id)});
          continue;
        }
        // an existing primary is never demoted, merges stay one level deep
        std::swap(selection.primary, selection.secondary);
      }

      ++summary.merges_attempted;
      switch (Merge(*selection.primary, *selection.secondary, now, resolver)) {
        case MergeOutcome::kSucceeded:
          ++summary.merges_succeeded;
          observability::Metrics::Instance().RecordMergeOutcome("succeeded");
          consumed[i] = true;
          consumed[j] = true;
          break;
        case MergeOutcome::kConflict:
          ++summary.merge_errors;
          observability::Metrics::Instance().RecordMergeOutcome("conflict");
          break;
        case MergeOutcome::kFailed:
          ++summary.merge_errors;
          observability::Metrics::Instance().RecordMergeOutcome("failed");
          break;
      }

      if (consumed[i]) break;
    }
  }

  const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObservePassDurationMs(elapsed_ms);
  span.SetAttribute("records_analyzed", summary.records_analyzed);
  span.SetAttribute("merges_succeeded", summary.merges_succeeded);

  SEAWATCH_LOG_INFO("dedup pass finished",
                    {IntField("records_analyzed", summary.records_analyzed), IntField("potential_matches_checked", summary.potential_matches_checked),
                     IntField("high_confidence_matches", summary.high_confidence_matches),
                     IntField("medium_confidence_matches", summary.medium_confidence_matches),
                     IntField("merges_attempted", summary.merges_attempted), IntField("merges_succeeded", summary.merges_succeeded),
                     IntField("merge_errors", summary.merge_errors), DoubleField("elapsed_ms", elapsed_ms)});

  for (const auto& problem : ValidateSummary(summary)) {
    SEAWATCH_LOG_ERROR("dedup summary invariant violated", {StringField("problem", problem)});
  }
  return summary;
}

DedupOrchestrator::MergeOutcome DedupOrchestrator::Merge(const RawRecord& primary, const RawRecord& secondary, util::TimePoint now,
                                                         reference::VesselResolver& resolver) {
  try {
    auto tx = store_->Begin();

    MergeStateUpdate absorbed;
    absorbed.merge_status      = MergeStatus::kMergedInto;
    absorbed.merged_into_id    = primary.id;
    absorbed.processing_status = ProcessingStatus::kReady;
    absorbed.note = "Merged into " + primary.id + " (" + SourceLabel(primary) + ") at " + util::FormatTimestamp(now);
    ThrowIfDbError(store_->UpdateMergeState(*tx, secondary.id, absorbed, MergeStatus::kNone), "mark secondary " + secondary.id);

    // Conditional on the primary's status as read, so a primary absorbed
    // elsewhere in the meantime fails the merge instead of forming a chain.
    MergeStateUpdate survivor;
    survivor.merge_status      = MergeStatus::kMerged;
    survivor.processing_status = ProcessingStatus::kReady;
    ThrowIfDbError(store_->UpdateMergeState(*tx, primary.id, survivor, primary.merge_status), "mark primary " + primary.id);

    // Re-read after the status writes, which hold both rows, so merges
    // committed into the primary since the window query are kept.
    const auto current_primary   = store_->GetRecord(*tx, primary.id);
    const auto current_secondary = store_->GetRecord(*tx, secondary.id);
    if (!current_primary || !current_secondary) {
      throw util::NotFound("merge pair " + primary.id + "/" + secondary.id + " no longer stored");
    }

    auto plan = merge::PlanMerge(*current_primary, *current_secondary, now);
    if (!current_primary->vessel_ref_id && !plan.patch.vessel_ref_id) {
      plan.patch.vessel_ref_id = resolver.Resolve(*tx, *current_primary);
      if (!plan.patch.vessel_ref_id) plan.patch.vessel_ref_id = resolver.Resolve(*tx, *current_secondary);
    }
    plan.patch.processing_status = ProcessingStatus::kReady;
    plan.patch.last_processed_at = now;
    ThrowIfDbError(store_->UpdateFields(*tx, primary.id, plan.patch), "update primary " + primary.id);

    db::model::RawRecordPatch touched;
    touched.last_processed_at = now;
    ThrowIfDbError(store_->UpdateFields(*tx, secondary.id, touched), "update secondary " + secondary.id);

    tx->Commit();

    SEAWATCH_LOG_INFO("records merged", {StringField("primary_id", primary.id), StringField("primary_source", primary.source),
                                         StringField("secondary_id", secondary.id), StringField("secondary_source", secondary.source),
                                         observability::BoolField("canonical_conflict", plan.canonical_conflict)});
    return MergeOutcome::kSucceeded;
  } catch (const util::WriteConflict& e) {
    SEAWATCH_LOG_WARN("merge lost to a concurrent writer", {StringField("primary_id", primary.id), StringField("secondary_id", secondary.id),
                                                            StringField("error", e.what())});
    return MergeOutcome::kConflict;
  } catch (const std::exception& e) {
    SEAWATCH_LOG_ERROR("merge failed", {StringField("primary_id", primary.id), StringField("secondary_id", secondary.id),
                                        StringField("error", e.what())});
    return MergeOutcome::kFailed;
  }
}

} // namespace seawatch::dedup
