#pragma once

namespace graphflow::db {

/*
  Backend transaction used by the durable content caches.

  A cache Put replaces a whole (graph, node, input) entry inside one
  transaction, so a concurrent Get sees either the previous outputs or
  the complete new list.

  The destructor rolls back anything not committed.

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;
  virtual bool IsCommitted() const = 0;
};

}
