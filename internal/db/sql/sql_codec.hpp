#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "internal/db/model/raw_record.hpp"
#include "internal/db/model/raw_record_patch.hpp"
#include "internal/db/model/vessel_reference_record.hpp"
#include "sql_row.hpp"

namespace seawatch::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding, so one parameter list serves both.
*/

using Param = std::variant<std::nullptr_t, int64_t, double, std::string>;

using Params = std::vector<Param>;

struct Assignment {
  const char* column;
  Param       value;
};

// List columns are JSON arrays of strings.
std::string              EncodeStringList(const std::vector<std::string>& values);
std::vector<std::string> DecodeStringList(const std::string& json);

// INSERT parameters in RECORD_COLUMNS order.
Params RecordParams(const model::RawRecord& record);

// Columns touched by a patch, in a fixed order.
std::vector<Assignment> PatchAssignments(const model::RawRecordPatch& patch);

model::RawRecord DecodeRecord(const Row& row);

model::VesselReferenceRecord DecodeVesselReference(const Row& row);

} // namespace seawatch::db::sql
