#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/api/error.hpp"

namespace healthd::util {
class Context;
}

namespace healthd::db::sqlite {

// Maps a sqlite result code (primary or extended) to the portable code.
ErrorCode TranslateCode(int rc);

// Throws db::Error("<what>: <sqlite message>") unless rc is OK/ROW/DONE.
void ThrowIfError(sqlite3* db, int rc, std::string_view what);

void BindText(sqlite3_stmt* st, int idx, std::string_view s);
void BindInt64(sqlite3_stmt* st, int idx, int64_t v);
void BindDouble(sqlite3_stmt* st, int idx, double v);

std::string                ColText(sqlite3_stmt* st, int col);
std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col);
int64_t                    ColInt64(sqlite3_stmt* st, int col);
double                     ColDouble(sqlite3_stmt* st, int col);

/*
  Steps a query once. Returns true while a row is available.
  The context is checked before every step.
*/
bool StepRow(sqlite3* db, sqlite3_stmt* st, const util::Context& ctx, std::string_view what);

// Steps a statement that returns no rows.
void StepDone(sqlite3* db, sqlite3_stmt* st, std::string_view what);

} // namespace healthd::db::sqlite
