#pragma once

#include <functional>
#include <utility>
#include <vector>

namespace stockroom::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes and pending commit hooks
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
  Memory: snapshot copy, version-checked on commit

  Commit hooks run once, after the backend commit succeeded. Used for side
  effects that must never be observed for a rolled back write (notification
  delivery).
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;

  void OnCommit(std::function<void()> hook) {
    hooks_.push_back(std::move(hook));
  }

protected:
  void RunCommitHooks() {
    auto hooks = std::move(hooks_);
    hooks_.clear();
    for (auto& hook : hooks) {
      hook();
    }
  }

  void DropCommitHooks() {
    hooks_.clear();
  }

private:
  std::vector<std::function<void()>> hooks_;
};

} // namespace stockroom::db
