#include "reference_cache.hpp"

#include <functional>
#include <type_traits>
#include <variant>

#include "internal/similarity/identity.hpp"

namespace seawatch::reference {

std::size_t VesselReferenceKeyHash::operator()(const VesselReferenceKey& key) const {
  const std::size_t tag   = key.index();
  const std::size_t value = std::visit(
      [](const auto& k) -> std::size_t {
        using T = std::decay_t<decltype(k)>;
        if constexpr (std::is_same_v<T, ByImo>) {
          return std::hash<std::string>{}(k.imo);
        } else {
          return std::hash<std::string>{}(k.normalized_name);
        }
      },
      key);
  return value ^ (tag + 0x9e3779b97f4a7c15ULL + (value << 6) + (value >> 2));
}

std::optional<std::string> ReferenceCache::Get(const VesselReferenceKey& key) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

void ReferenceCache::Put(const VesselReferenceKey& key, std::string reference_id) {
  entries_[key] = std::move(reference_id);
}

void ReferenceCache::Clear() {
  entries_.clear();
}

std::size_t ReferenceCache::Size() const {
  return entries_.size();
}

VesselResolver::VesselResolver(db::IncidentStore& store, ReferenceCache& cache) : store_(store), cache_(cache) {
}

std::optional<std::string> VesselResolver::Lookup(db::Transaction& tx, const VesselReferenceKey& key) {
  if (auto cached = cache_.Get(key)) {
    return cached;
  }
  auto found = store_.FindVesselReference(tx, key);
  if (!found) {
    return std::nullopt;
  }
  cache_.Put(key, found->id);
  return found->id;
}

std::optional<std::string> VesselResolver::Resolve(db::Transaction& tx, const db::model::RawRecord& record) {
  const similarity::ImoNumber imo(record.vessel_imo);
  if (!imo.Empty()) {
    if (auto id = Lookup(tx, ByImo{imo.Text()})) {
      return id;
    }
  }

  const auto name = similarity::NormalizeVesselName(record.vessel_name);
  if (!name.empty()) {
    return Lookup(tx, ByName{name});
  }
  return std::nullopt;
}

} // namespace seawatch::reference
