#pragma once

#include <string>
#include <variant>

namespace seawatch::db::model {

/*
  Vessel reference entity: one known ship, addressed by IMO number or by
  normalized name.
*/
struct VesselReferenceRecord {
  std::string id;
  std::string imo;
  std::string normalized_name;
  std::string display_name;
};

struct ByImo {
  std::string imo;

  bool operator==(const ByImo&) const = default;
};

struct ByName {
  std::string normalized_name;

  bool operator==(const ByName&) const = default;
};

using VesselReferenceKey = std::variant<ByImo, ByName>;

} // namespace seawatch::db::model
