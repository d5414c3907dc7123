#include "stagehand/storage/request_store.hpp"

#include "stagehand/util/log.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <array>

namespace stagehand {

namespace {

constexpr std::array<std::string_view, 7> kOpenStatuses{
    "pending",      "processing", "planning", "waiting_approval",
    "implementing", "active",     "running",
};

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

}  // namespace

auto is_open_request_status(std::string_view status) noexcept -> bool {
  return std::ranges::find(kOpenStatuses, status) != kOpenStatuses.end();
}

auto InMemoryRequestStore::list_requests(const ProjectId& project)
    -> Result<std::vector<RequestRecord>> {
  std::lock_guard lock(mu_);
  std::vector<RequestRecord> out;
  for (const auto& [_, rec] : records_) {
    if (rec.project == project) {
      out.push_back(rec);
    }
  }
  std::ranges::sort(out, {}, &RequestRecord::created_at);
  return out;
}

auto InMemoryRequestStore::upsert(RequestRecord record) -> void {
  std::lock_guard lock(mu_);
  auto id = record.id;
  records_.insert_or_assign(std::move(id), std::move(record));
}

auto InMemoryRequestStore::set_status(std::string_view id,
                                      std::string_view status) -> bool {
  std::lock_guard lock(mu_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return false;
  }
  it->second.status = std::string(status);
  return true;
}

auto InMemoryRequestStore::remove(std::string_view id) -> bool {
  std::lock_guard lock(mu_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return false;
  }
  records_.erase(it);
  return true;
}

auto SqliteRequestStore::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

SqliteRequestStore::Statement::~Statement() {
  reset();
}

auto SqliteRequestStore::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

SqliteRequestStore::SqliteRequestStore(std::string_view db_path)
    : db_path_(db_path) {
}

SqliteRequestStore::~SqliteRequestStore() {
  close();
}

auto SqliteRequestStore::open() -> Result<void> {
  std::lock_guard lock(mu_);
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}", sqlite3_errmsg(raw_db));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), 1000);

  if (auto r = ensure_schema(); !r) {
    db_.reset();
    return r;
  }

  log::info("Request store opened: {}", db_path_);
  return ok();
}

auto SqliteRequestStore::close() -> void {
  std::lock_guard lock(mu_);
  db_.reset();
}

auto SqliteRequestStore::ensure_schema() -> Result<void> {
  constexpr auto sql = R"(
    CREATE TABLE IF NOT EXISTS user_requests (
      id TEXT PRIMARY KEY,
      project_id TEXT NOT NULL,
      status TEXT NOT NULL DEFAULT 'pending',
      created_at INTEGER NOT NULL DEFAULT 0
    );
    CREATE INDEX IF NOT EXISTS idx_user_requests_project
      ON user_requests(project_id);
  )";

  char* err_msg = nullptr;
  if (sqlite3_exec(db_.get(), sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteRequestStore::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

auto SqliteRequestStore::list_requests(const ProjectId& project)
    -> Result<std::vector<RequestRecord>> {
  constexpr auto sql = R"(
    SELECT id, status, created_at FROM user_requests
    WHERE project_id = ? ORDER BY created_at;
  )";

  std::lock_guard lock(mu_);
  if (!db_) {
    return fail(Error::DatabaseError);
  }

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_text(stmt.get(), 1, project.str().c_str(), -1, SQLITE_TRANSIENT);

  std::vector<RequestRecord> records;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    records.push_back({.id = col_text(stmt.get(), 0),
                       .project = project,
                       .status = col_text(stmt.get(), 1),
                       .created_at = sqlite3_column_int64(stmt.get(), 2)});
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to read requests: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return records;
}

}  // namespace stagehand
