#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace seawatch::db::model {

enum class MergeStatus {
  kNone,
  kMerged,     // primary that absorbed at least one other record
  kMergedInto, // secondary, absorbed into merged_into_id
};

enum class ProcessingStatus {
  kNew,
  kProcessing,
  kReady,
  kComplete,
  kError,
};

const char* ToString(MergeStatus status);
const char* ToString(ProcessingStatus status);

// Unknown text maps to nullopt; callers decide how strict to be.
std::optional<MergeStatus>      ParseMergeStatus(std::string_view text);
std::optional<ProcessingStatus> ParseProcessingStatus(std::string_view text);

/*
  One incident report as ingested from a single source.

  Empty strings mean "not reported". Coordinates and dates are optional
  because feeds routinely omit them.
*/
struct RawRecord {
  std::string id;
  std::string source;
  std::string reference_id;

  std::optional<util::TimePoint> occurred_at;
  std::optional<double>          latitude;
  std::optional<double>          longitude;

  std::string title;
  std::string description;
  std::string region;
  std::string location;
  std::string incident_type_name;

  std::string vessel_name;
  std::string vessel_type;
  std::string vessel_flag;
  std::string vessel_imo;
  std::string vessel_status;

  std::string update_text;
  std::string processing_notes;
  std::string raw_json;

  MergeStatus                    merge_status = MergeStatus::kNone;
  std::optional<std::string>     merged_into_id;
  std::optional<std::string>     canonical_incident_id;
  ProcessingStatus               processing_status = ProcessingStatus::kNew;
  std::optional<util::TimePoint> merged_at;
  std::vector<std::string>       merged_sources;
  std::vector<std::string>       merged_record_ids;
  std::optional<std::string>     vessel_ref_id;
  std::optional<util::TimePoint> last_processed_at;
};

} // namespace seawatch::db::model
