#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace coolrouter::db::postgres {

/*
  Bounded pool of libpqxx connections for PgRepository.

  A PgTransaction holds one connection from BEGIN to COMMIT; libpqxx
  connections are never shared between threads. Every connection gets
  the request statements prepared when it is opened. A connection that
  comes back closed is dropped and its slot freed.

  Connections handed out keep a weak reference to the pool, so one that
  outlives the pool is simply closed.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  static constexpr std::size_t               kDefaultMaxConnections = 16;
  static constexpr std::chrono::milliseconds kDefaultAcquireTimeout{5000};

  explicit PgPool(std::string               conninfo,
                  std::size_t               max_connections = kDefaultMaxConnections,
                  std::chrono::milliseconds acquire_timeout = kDefaultAcquireTimeout);

  // Throws std::runtime_error when no connection frees up within the timeout.
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Hand(std::unique_ptr<pqxx::connection> conn);
  void                              Return(pqxx::connection* conn);

  const std::string               conninfo_;
  const std::size_t               max_connections_;
  const std::chrono::milliseconds acquire_timeout_;

  std::mutex                                     mutex_;
  std::condition_variable                        available_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    open_ = 0;
};

} // namespace coolrouter::db::postgres
