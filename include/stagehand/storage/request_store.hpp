#pragma once

#include "stagehand/core/error.hpp"
#include "stagehand/util/id.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace stagehand {

struct RequestRecord {
  std::string id;
  ProjectId project;
  std::string status;
  std::int64_t created_at{0};
};

// Statuses that count as an in-flight request: pending, processing,
// planning, waiting_approval, implementing, active, running.
[[nodiscard]] auto is_open_request_status(std::string_view status) noexcept
    -> bool;

class IRequestStore {
public:
  virtual ~IRequestStore() = default;

  [[nodiscard]] virtual auto list_requests(const ProjectId& project)
      -> Result<std::vector<RequestRecord>> = 0;

  [[nodiscard]] virtual auto is_open_status(std::string_view status) const
      noexcept -> bool {
    return is_open_request_status(status);
  }
};

class InMemoryRequestStore : public IRequestStore {
public:
  [[nodiscard]] auto list_requests(const ProjectId& project)
      -> Result<std::vector<RequestRecord>> override;

  auto upsert(RequestRecord record) -> void;
  auto set_status(std::string_view id, std::string_view status) -> bool;
  auto remove(std::string_view id) -> bool;

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, RequestRecord, StringHash, StringEqual>
      records_;
};

// Reads `user_requests(id, project_id, status, created_at)`.
class SqliteRequestStore : public IRequestStore {
public:
  explicit SqliteRequestStore(std::string_view db_path);
  ~SqliteRequestStore() override;

  SqliteRequestStore(const SqliteRequestStore&) = delete;
  SqliteRequestStore& operator=(const SqliteRequestStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  [[nodiscard]] auto list_requests(const ProjectId& project)
      -> Result<std::vector<RequestRecord>> override;

private:
  [[nodiscard]] auto ensure_schema() -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::mutex mu_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace stagehand
