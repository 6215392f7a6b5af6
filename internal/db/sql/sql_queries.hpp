#pragma once

namespace graphflow::db::sql {

/*
  Canonical SQL for the content cache.

  SQLite statements use ? placeholders, PostgreSQL statements use $n.
  Both schemas key entries by (graph, node, input_key).
*/

// sqlite

static constexpr const char* SQLITE_CREATE_CONTENT_CACHE =
    "CREATE TABLE IF NOT EXISTS content_cache ("
    " graph TEXT NOT NULL,"
    " node TEXT NOT NULL,"
    " input_key BLOB NOT NULL,"
    " outputs BLOB NOT NULL,"
    " created_at_ms INTEGER NOT NULL,"
    " PRIMARY KEY (graph, node, input_key));";

static constexpr const char* SQLITE_SELECT_CACHE_ENTRY =
    "SELECT outputs FROM content_cache"
    " WHERE graph=? AND node=? AND input_key=?;";

static constexpr const char* SQLITE_UPSERT_CACHE_ENTRY =
    "INSERT INTO content_cache(graph,node,input_key,outputs,created_at_ms)"
    " VALUES(?,?,?,?,?)"
    " ON CONFLICT(graph,node,input_key) DO UPDATE SET"
    " outputs=excluded.outputs,"
    " created_at_ms=excluded.created_at_ms;";

// postgres

static constexpr const char* PG_CREATE_CONTENT_CACHE =
    "CREATE TABLE IF NOT EXISTS content_cache ("
    " graph TEXT NOT NULL,"
    " node TEXT NOT NULL,"
    " input_key BYTEA NOT NULL,"
    " outputs BYTEA NOT NULL,"
    " created_at_ms BIGINT NOT NULL,"
    " PRIMARY KEY (graph, node, input_key));";

static constexpr const char* PG_SELECT_CACHE_ENTRY =
    "SELECT outputs FROM content_cache"
    " WHERE graph=$1 AND node=$2 AND input_key=$3";

static constexpr const char* PG_UPSERT_CACHE_ENTRY =
    "INSERT INTO content_cache(graph,node,input_key,outputs,created_at_ms)"
    " VALUES($1,$2,$3,$4,$5)"
    " ON CONFLICT(graph,node,input_key) DO UPDATE SET"
    " outputs=EXCLUDED.outputs,"
    " created_at_ms=EXCLUDED.created_at_ms";

}
