#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace resync::db::postgres {

/*
  Bounded connection pool for relay hosts and the cloud.

  A connection is checked out as a Lease for the life of one transaction;
  libpqxx connections must never be shared between threads. Acquire()
  blocks while max_connections leases are outstanding. A connection that
  the server dropped is discarded on return instead of being reused.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
  struct Slot {
    std::unique_ptr<pqxx::connection> conn;
    bool                              prepared = false;
  };

 public:
  class Lease {
   public:
    Lease(Lease&&) noexcept            = default;
    Lease& operator=(Lease&&)          = delete;
    ~Lease();

    pqxx::connection& operator*() const {
      return *slot_->conn;
    }

    // The connection with the replay and check statements prepared. Kept
    // lazy so schema bootstrap can run on a fresh database first.
    pqxx::connection& Prepared();

   private:
    friend class PgPool;
    Lease(std::shared_ptr<PgPool> pool, std::unique_ptr<Slot> slot);

    std::shared_ptr<PgPool> pool_;
    std::unique_ptr<Slot>   slot_;
  };

  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  Lease Acquire();

 private:
  static void PrepareStatements(pqxx::connection& conn);
  void        Return(std::unique_ptr<Slot> slot);

  const std::string conninfo_;
  const std::size_t max_connections_;

  std::mutex                         mutex_;
  std::condition_variable            returned_;
  std::vector<std::unique_ptr<Slot>> idle_;
  std::size_t                        open_ = 0;
};

} // namespace resync::db::postgres
