#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/util/context.hpp"

namespace healthd::state {

struct CompactResult {
  std::uintmax_t size_before_bytes = 0;
  std::uintmax_t size_after_bytes  = 0;
};

// VACUUM on the write handle. Throws db::Error / util::ContextError.
CompactResult Compact(db::sqlite::SqliteDB& db_rw, const util::Context& ctx);

/*
  Periodic Compact() on the state database. A zero period disables it.
*/
class Compactor {
 public:
  Compactor(std::shared_ptr<db::sqlite::SqliteDB> db_rw, std::chrono::nanoseconds period);
  ~Compactor();

  Compactor(const Compactor&)            = delete;
  Compactor& operator=(const Compactor&) = delete;

  void Start();
  void Stop();

  bool Enabled() const {
    return period_ > std::chrono::nanoseconds::zero();
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB>  db_rw_;
  std::chrono::nanoseconds               period_;
  util::Context                          ctx_;
  std::unique_ptr<runtime::PeriodicTask> task_;
};

} // namespace healthd::state
