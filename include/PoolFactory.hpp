#pragma once

#include "ConnectionInfo.hpp"
#include "ErrorHandler.hpp"

#ifdef WITH_MYSQL
#include "MySQLConnectionPool.hpp"
#endif

#ifdef WITH_POSTGRESQL
#include "PostgreSQLConnectionPool.hpp"
#endif

#ifdef WITH_SQLITE
#include "SQLiteConnectionPool.hpp"
#endif

#include <chrono>
#include <memory>
#include <type_traits>
#include <variant>

namespace sqlbridge {

// One alternative per compiled-in backend
using Pool = std::variant<
    std::monostate
#ifdef WITH_MYSQL
    , std::shared_ptr<MySQLConnectionPool>
#endif
#ifdef WITH_POSTGRESQL
    , std::shared_ptr<PostgreSQLConnectionPool>
#endif
#ifdef WITH_SQLITE
    , std::shared_ptr<SQLiteConnectionPool>
#endif
>;

struct PoolStats {
    size_t total = 0;    // open connections, idle + in use
    size_t idle = 0;
    size_t waiting = 0;  // callers blocked in acquire
    size_t maxSize = 0;
};

class PoolFactory {
public:
    // Build the pool for info.type. Throws DatabaseError(ValidationError) when the
    // backend is not compiled in.
    static Pool create(const ConnectionInfo& info);

    static PoolStats stats(const Pool& pool);

    // Close idle connections and refuse further acquires; in-use connections
    // are closed when they are released
    static void drain(const Pool& pool);
};

// Borrow one connection for the duration of fn. fn receives the backend
// connection type (MySQLConnection&, PostgreSQLConnection& or SQLiteConnection&)
// and must return R.
template <typename R, typename Fn>
R withConnection(const Pool& pool, std::chrono::milliseconds timeout, Fn&& fn) {
    return std::visit([&](const auto& p) -> R {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            throw DatabaseError(ErrorKind::ConnectionFailure, "Connection has no pool");
        } else {
            auto conn = p->acquire(timeout);
            return fn(*conn);
        }
    }, pool);
}

}  // namespace sqlbridge
