#include "sqlite_content_cache.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/codec/record_codec.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/time.hpp"

namespace graphflow::cache {

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  if (!data || size <= 0) return {};
  return std::string(static_cast<const char*>(data), static_cast<std::size_t>(size));
}

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st);
}

} // namespace

SqliteContentCache::SqliteContentCache(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
  if (!db_) {
    throw std::invalid_argument("sqlite content cache requires a database");
  }
}

void SqliteContentCache::Bootstrap(db::sqlite::SqliteDB& db) {
  db.Exec(db::sql::SQLITE_CREATE_CONTENT_CACHE);
  db.Exec("SELECT graph,node,input_key,outputs,created_at_ms FROM content_cache LIMIT 1;");
}

std::optional<std::vector<std::string>> SqliteContentCache::Get(const std::string& graph, const std::string& node, const std::string& input_key) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();
  auto            st = Prepare(db, db::sql::SQLITE_SELECT_CACHE_ENTRY);

  BindText(st.get(), 1, graph);
  BindText(st.get(), 2, node);
  BindBlob(st.get(), 3, input_key);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) {
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    throw std::runtime_error("content cache lookup " + graph + "/" + node + ": " + sqlite3_errmsg(db));
  }

  return codec::DecodeOutputs(ColBlob(st.get(), 0));
}

void SqliteContentCache::Put(const std::string& graph, const std::string& node, const std::string& input_key,
                             const std::vector<std::string>& outputs) {
  const auto blob = codec::EncodeOutputs(outputs);

  std::lock_guard                lock(mutex_);
  db::sqlite::SqliteTransaction tx(db_);
  auto*                         db = tx.Handle();

  {
    auto st = Prepare(db, db::sql::SQLITE_UPSERT_CACHE_ENTRY);
    BindText(st.get(), 1, graph);
    BindText(st.get(), 2, node);
    BindBlob(st.get(), 3, input_key);
    BindBlob(st.get(), 4, blob);
    BindU64(st.get(), 5, util::ToUnixMillis(util::Now()));

    if (sqlite3_step(st.get()) != SQLITE_DONE) {
      throw std::runtime_error("content cache store " + graph + "/" + node + ": " + sqlite3_errmsg(db));
    }
  }

  tx.Commit();
}

} // namespace graphflow::cache
