#pragma once

#include <memory>
#include <mutex>

#include "content_cache.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace graphflow::cache {

/*
  Durable content cache in a single SQLite table.

  Each Put runs in its own BEGIN IMMEDIATE transaction, so a crash in
  the middle of a write never leaves a partial entry behind.
*/
class SqliteContentCache final : public ContentCache {
 public:
  explicit SqliteContentCache(std::shared_ptr<db::sqlite::SqliteDB> db);

  std::optional<std::vector<std::string>> Get(const std::string& graph, const std::string& node, const std::string& input_key) override;

  void Put(const std::string& graph, const std::string& node, const std::string& input_key, const std::vector<std::string>& outputs) override;

  const char* Name() const override {
    return "sqlite";
  }

  // Creates the content_cache table if missing.
  static void Bootstrap(db::sqlite::SqliteDB& db);

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;

  // One connection is shared; statements and transactions on it must not interleave.
  std::mutex mutex_;
};

} // namespace graphflow::cache
