#include "memory_store.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace seawatch::db::memory {

namespace {

MemoryTransaction& TX(Transaction& t) {
  return static_cast<MemoryTransaction&>(t);
}

bool InBox(const model::RawRecord& r, const BoundingBox& box) {
  return r.latitude && r.longitude && *r.latitude >= box.min_lat && *r.latitude <= box.max_lat && *r.longitude >= box.min_lon &&
         *r.longitude <= box.max_lon;
}

} // namespace

MemoryStore::MemoryStore() = default;

std::unique_ptr<Transaction> MemoryStore::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

Result MemoryStore::InsertRecord(Transaction& t, const model::RawRecord& r) {
  auto& state = TX(t).Mutable();
  if (state.records.contains(r.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "record exists: " + r.id);
  }
  state.records.emplace(r.id, r);
  return Result::Ok();
}

std::optional<model::RawRecord> MemoryStore::GetRecord(Transaction& t, const std::string& id) {
  const auto& state = TX(t).View();
  auto        it    = state.records.find(id);
  if (it == state.records.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RawRecord> MemoryStore::QueryRecent(Transaction& t, util::TimePoint since, std::size_t limit) {
  std::vector<model::RawRecord> out;
  for (const auto& [id, r] : TX(t).View().records) {
    if (r.merge_status == model::MergeStatus::kMergedInto) continue;
    if (!r.occurred_at || *r.occurred_at < since) continue;
    out.push_back(r);
  }

  std::sort(out.begin(), out.end(), [](const model::RawRecord& a, const model::RawRecord& b) {
    if (*a.occurred_at != *b.occurred_at) return *a.occurred_at > *b.occurred_at;
    return a.id < b.id;
  });

  if (out.size() > limit) out.resize(limit);
  return out;
}

std::vector<model::RawRecord> MemoryStore::QueryCandidates(Transaction& t, const TimeWindow& window, const BoundingBox& box) {
  std::vector<model::RawRecord> out;
  for (const auto& [id, r] : TX(t).View().records) {
    if (r.merge_status == model::MergeStatus::kMergedInto) continue;
    if (!r.canonical_incident_id) continue;
    if (!r.occurred_at || *r.occurred_at < window.from || *r.occurred_at > window.to) continue;
    if (!InBox(r, box)) continue;
    out.push_back(r);
  }
  return out; // std::map iteration is already ordered by id
}

Result MemoryStore::UpdateMergeState(Transaction& t, const std::string& id, const model::MergeStateUpdate& update,
                                     model::MergeStatus expected_prior) {
  auto& state = TX(t).Mutable();
  auto  it    = state.records.find(id);
  if (it == state.records.end()) {
    return Result::Err(ErrorCode::NotFound, "record not found: " + id);
  }

  auto& r = it->second;
  if (r.merge_status != expected_prior) {
    return Result::Err(ErrorCode::Conflict, "record " + id + " is " + model::ToString(r.merge_status) + ", expected " +
                                                model::ToString(expected_prior));
  }

  r.merge_status   = update.merge_status;
  r.merged_into_id = update.merged_into_id;
  if (update.processing_status) r.processing_status = *update.processing_status;
  if (!update.note.empty()) {
    r.processing_notes = r.processing_notes.empty() ? update.note : r.processing_notes + "\n" + update.note;
  }
  return Result::Ok();
}

Result MemoryStore::UpdateFields(Transaction& t, const std::string& id, const model::RawRecordPatch& patch) {
  auto& state = TX(t).Mutable();
  auto  it    = state.records.find(id);
  if (it == state.records.end()) {
    return Result::Err(ErrorCode::NotFound, "record not found: " + id);
  }
  model::ApplyPatch(it->second, patch);
  return Result::Ok();
}

std::vector<MergeIntegrityViolation> MemoryStore::ListMergeIntegrityViolations(Transaction& t) {
  const auto&                          records = TX(t).View().records;
  std::vector<MergeIntegrityViolation> out;

  for (const auto& [id, r] : records) {
    if (r.merge_status != model::MergeStatus::kMergedInto) continue;

    const std::string target = r.merged_into_id.value_or("");
    auto              it     = records.find(target);
    if (!r.merged_into_id || it == records.end()) {
      out.push_back({id, target, "dangling_merge"});
    } else if (target == id) {
      out.push_back({id, target, "self_merge"});
    } else if (it->second.merge_status == model::MergeStatus::kMergedInto) {
      out.push_back({id, target, "chained_merge"});
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Vessel references
// ------------------------------------------------------------------

std::optional<model::VesselReferenceRecord> MemoryStore::FindVesselReference(Transaction& t, const model::VesselReferenceKey& key) {
  for (const auto& [id, v] : TX(t).View().vessels) {
    if (const auto* by_imo = std::get_if<model::ByImo>(&key)) {
      if (!v.imo.empty() && v.imo == by_imo->imo) return v;
    } else if (const auto* by_name = std::get_if<model::ByName>(&key)) {
      if (!v.normalized_name.empty() && v.normalized_name == by_name->normalized_name) return v;
    }
  }
  return std::nullopt;
}

Result MemoryStore::InsertVesselReference(Transaction& t, const model::VesselReferenceRecord& v) {
  auto& state = TX(t).Mutable();
  if (state.vessels.contains(v.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "vessel reference exists: " + v.id);
  }
  state.vessels.emplace(v.id, v);
  return Result::Ok();
}

} // namespace seawatch::db::memory
