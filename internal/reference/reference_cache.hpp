#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/api/incident_store.hpp"
#include "internal/db/model/vessel_reference_record.hpp"

namespace seawatch::reference {

using db::model::ByImo;
using db::model::ByName;
using db::model::VesselReferenceKey;

struct VesselReferenceKeyHash {
  std::size_t operator()(const VesselReferenceKey& key) const;
};

/*
  Per-run map from vessel identity to reference entity id.

  Owned by one dedup pass or one lookup and discarded with it. Only
  resolved ids are cached, so Clear() never changes an outcome.
*/
class ReferenceCache {
 public:
  std::optional<std::string> Get(const VesselReferenceKey& key) const;
  void                       Put(const VesselReferenceKey& key, std::string reference_id);
  void                       Clear();
  std::size_t                Size() const;

 private:
  std::unordered_map<VesselReferenceKey, std::string, VesselReferenceKeyHash> entries_;
};

/*
  Resolves a record's vessel to a reference entity: IMO first, then the
  normalized name.
*/
class VesselResolver {
 public:
  VesselResolver(db::IncidentStore& store, ReferenceCache& cache);

  std::optional<std::string> Resolve(db::Transaction& tx, const db::model::RawRecord& record);

 private:
  std::optional<std::string> Lookup(db::Transaction& tx, const VesselReferenceKey& key);

  db::IncidentStore& store_;
  ReferenceCache&    cache_;
};

} // namespace seawatch::reference
