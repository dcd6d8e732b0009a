#pragma once

#include <cstdint>
#include <string>

namespace seawatch::db::sql {

/*
  Generic row reader.

  Backends wrap their result row:
    postgres -> pqxx::row
    sqlite   -> sqlite3_stmt

  Prevents driver types leaking into the shared record codec.
*/

class Row {
 public:
  virtual ~Row() = default;

  virtual std::string GetText(int col) const   = 0;
  virtual int64_t     GetInt64(int col) const  = 0;
  virtual double      GetDouble(int col) const = 0;
  virtual bool        IsNull(int col) const    = 0;
};

} // namespace seawatch::db::sql
