#pragma once

namespace seawatch::db::sql {

/*
  Canonical SQL shared by the relational backends.

  Written in the SQLite placeholder dialect (?); the Postgres pool
  prepares the same statements with $n placeholders. Column order of
  RECORD_COLUMNS is the order DecodeRecord() and RecordParams() use.
*/

#define SEAWATCH_RECORD_COLUMNS                                                                                                           \
  "id,source,reference_id,occurred_at_ms,latitude,longitude,title,description,region,location,incident_type_name,"                     \
  "vessel_name,vessel_type,vessel_flag,vessel_imo,vessel_status,update_text,processing_notes,raw_json,merge_status,merged_into_id,"    \
  "canonical_incident_id,processing_status,merged_at_ms,merged_sources,merged_record_ids,vessel_ref_id,last_processed_at_ms"

static constexpr int RECORD_COLUMN_COUNT = 28;

static constexpr const char* RECORD_COLUMNS = SEAWATCH_RECORD_COLUMNS;

static constexpr const char* INSERT_RECORD =
    "INSERT INTO raw_record(" SEAWATCH_RECORD_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_RECORD = "SELECT " SEAWATCH_RECORD_COLUMNS " FROM raw_record WHERE id=?;";

static constexpr const char* SELECT_RECENT =
    "SELECT " SEAWATCH_RECORD_COLUMNS " FROM raw_record"
    " WHERE occurred_at_ms >= ? AND merge_status <> 'merged_into'"
    " ORDER BY occurred_at_ms DESC, id ASC LIMIT ?;";

static constexpr const char* SELECT_CANDIDATES =
    "SELECT " SEAWATCH_RECORD_COLUMNS " FROM raw_record"
    " WHERE occurred_at_ms BETWEEN ? AND ?"
    " AND latitude BETWEEN ? AND ? AND longitude BETWEEN ? AND ?"
    " AND canonical_incident_id IS NOT NULL AND merge_status <> 'merged_into'"
    " ORDER BY id ASC;";

static constexpr const char* UPDATE_MERGE_STATE =
    "UPDATE raw_record SET merge_status=?, merged_into_id=?,"
    " processing_status=COALESCE(?, processing_status),"
    " processing_notes=CASE WHEN ?='' THEN processing_notes"
    "   WHEN processing_notes='' THEN ? ELSE processing_notes || char(10) || ? END"
    " WHERE id=? AND merge_status=?;";

static constexpr const char* SELECT_RECORD_EXISTS = "SELECT 1 FROM raw_record WHERE id=?;";

// merged_into rows whose target is missing, itself merged_into, or the row itself
static constexpr const char* SELECT_INTEGRITY_VIOLATIONS =
    "SELECT r.id, COALESCE(r.merged_into_id,''),"
    " CASE WHEN r.merged_into_id IS NULL OR t.id IS NULL THEN 'dangling_merge'"
    "   WHEN r.merged_into_id = r.id THEN 'self_merge'"
    "   ELSE 'chained_merge' END"
    " FROM raw_record r LEFT JOIN raw_record t ON t.id = r.merged_into_id"
    " WHERE r.merge_status = 'merged_into'"
    " AND (r.merged_into_id IS NULL OR t.id IS NULL OR r.merged_into_id = r.id OR t.merge_status = 'merged_into')"
    " ORDER BY r.id ASC;";

// vessel references

static constexpr const char* INSERT_VESSEL_REFERENCE =
    "INSERT INTO vessel_reference(id,imo,normalized_name,display_name) VALUES(?,?,?,?);";

static constexpr const char* SELECT_VESSEL_BY_IMO =
    "SELECT id,imo,normalized_name,display_name FROM vessel_reference WHERE imo<>'' AND imo=? ORDER BY id ASC LIMIT 1;";

static constexpr const char* SELECT_VESSEL_BY_NAME =
    "SELECT id,imo,normalized_name,display_name FROM vessel_reference WHERE normalized_name<>'' AND normalized_name=? ORDER BY id ASC LIMIT 1;";

} // namespace seawatch::db::sql
