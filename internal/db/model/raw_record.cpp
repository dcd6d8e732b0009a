#include "raw_record.hpp"

namespace seawatch::db::model {

const char* ToString(MergeStatus status) {
  switch (status) {
    case MergeStatus::kNone:
      return "none";
    case MergeStatus::kMerged:
      return "merged";
    case MergeStatus::kMergedInto:
      return "merged_into";
  }
  return "none";
}

const char* ToString(ProcessingStatus status) {
  switch (status) {
    case ProcessingStatus::kNew:
      return "new";
    case ProcessingStatus::kProcessing:
      return "processing";
    case ProcessingStatus::kReady:
      return "ready";
    case ProcessingStatus::kComplete:
      return "complete";
    case ProcessingStatus::kError:
      return "error";
  }
  return "new";
}

std::optional<MergeStatus> ParseMergeStatus(std::string_view text) {
  if (text == "none" || text.empty()) return MergeStatus::kNone;
  if (text == "merged") return MergeStatus::kMerged;
  if (text == "merged_into") return MergeStatus::kMergedInto;
  return std::nullopt;
}

std::optional<ProcessingStatus> ParseProcessingStatus(std::string_view text) {
  if (text == "new" || text.empty()) return ProcessingStatus::kNew;
  if (text == "processing") return ProcessingStatus::kProcessing;
  if (text == "ready") return ProcessingStatus::kReady;
  if (text == "complete") return ProcessingStatus::kComplete;
  if (text == "error") return ProcessingStatus::kError;
  return std::nullopt;
}

} // namespace seawatch::db::model
