#pragma once

#include <memory>

#include "content_cache.hpp"
#include "internal/db/postgres/pg_pool.hpp"

namespace graphflow::cache {

/*
  Content cache shared by several graphflow processes through PostgreSQL.

  Keys and values are raw bytes in BYTEA columns.
*/
class PgContentCache final : public ContentCache {
 public:
  explicit PgContentCache(std::shared_ptr<db::postgres::PgPool> pool);

  std::optional<std::vector<std::string>> Get(const std::string& graph, const std::string& node, const std::string& input_key) override;

  void Put(const std::string& graph, const std::string& node, const std::string& input_key, const std::vector<std::string>& outputs) override;

  const char* Name() const override {
    return "postgres";
  }

  static void Bootstrap(db::postgres::PgPool& pool);

 private:
  std::shared_ptr<db::postgres::PgPool> pool_;
};

} // namespace graphflow::cache
