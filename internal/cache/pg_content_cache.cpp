#include "pg_content_cache.hpp"

#include <cstddef>
#include <stdexcept>

#include "internal/codec/record_codec.hpp"
#include "internal/db/postgres/pg_tx.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/time.hpp"

namespace graphflow::cache {

namespace {

std::string FromBytea(const pqxx::field& field) {
  const auto bytes = field.as<std::basic_string<std::byte>>();
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

} // namespace

PgContentCache::PgContentCache(std::shared_ptr<db::postgres::PgPool> pool) : pool_(std::move(pool)) {
  if (!pool_) {
    throw std::invalid_argument("postgres content cache requires a connection pool");
  }
}

void PgContentCache::Bootstrap(db::postgres::PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);
  tx.exec(db::sql::PG_CREATE_CONTENT_CACHE);
  tx.commit();
}

std::optional<std::vector<std::string>> PgContentCache::Get(const std::string& graph, const std::string& node, const std::string& input_key) {
  db::postgres::PgTransaction tx(pool_);
  auto res = tx.Work().exec_prepared("get_cache_entry", graph, node, pqxx::binary_cast(input_key));
  tx.Commit();

  if (res.empty()) return std::nullopt;
  return codec::DecodeOutputs(FromBytea(res[0][0]));
}

void PgContentCache::Put(const std::string& graph, const std::string& node, const std::string& input_key,
                         const std::vector<std::string>& outputs) {
  const auto blob = codec::EncodeOutputs(outputs);

  db::postgres::PgTransaction tx(pool_);
  tx.Work().exec_prepared("upsert_cache_entry", graph, node, pqxx::binary_cast(input_key), pqxx::binary_cast(blob),
                          static_cast<int64_t>(util::ToUnixMillis(util::Now())));
  tx.Commit();
}

} // namespace graphflow::cache
