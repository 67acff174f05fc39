#pragma once

namespace mprisrelay::db {

enum class TxMode {
  kRead,
  kWrite,
};

/*
  Unit of work against the trust table.

  A kRead transaction sees one committed state for its whole life and
  never blocks writers for longer than the snapshot takes; the relay
  authorizer opens one per request. Writes through it are refused with
  ErrorCode::ReadOnly.

  A kWrite transaction serializes against other writers. Nothing it does
  is visible to other transactions before Commit(); dropping it without
  Commit() discards its writes.
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual TxMode Mode() const = 0;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace mprisrelay::db
