#include "sqlite_util.hpp"

#include "internal/util/context.hpp"

namespace healthd::db::sqlite {

ErrorCode TranslateCode(int rc) {
  switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_ROW:
    case SQLITE_DONE:
      return ErrorCode::OK;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_CONSTRAINT:
      return ErrorCode::ConstraintViolation;
    case SQLITE_READONLY:
      return ErrorCode::ReadOnly;
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorCode::Corruption;
    default:
      return ErrorCode::InternalError;
  }
}

void ThrowIfError(sqlite3* db, int rc, std::string_view what) {
  if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE) return;
  throw Error(TranslateCode(rc), std::string(what) + ": " + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, std::string_view s) {
  // a null pointer would bind SQL NULL
  const char* data = s.data() != nullptr ? s.data() : "";
  sqlite3_bind_text(st, idx, data, static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindInt64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  if (!t) return "";
  return std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColInt64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

bool StepRow(sqlite3* db, sqlite3_stmt* st, const util::Context& ctx, std::string_view what) {
  ctx.ThrowIfDone(what);
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  ThrowIfError(db, rc, what);
  return false;
}

void StepDone(sqlite3* db, sqlite3_stmt* st, std::string_view what) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) rc = SQLITE_DONE;
  ThrowIfError(db, rc, what);
}

} // namespace healthd::db::sqlite
