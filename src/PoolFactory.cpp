#include "PoolFactory.hpp"

namespace sqlbridge {

Pool PoolFactory::create(const ConnectionInfo& info) {
    switch (info.type) {
#ifdef WITH_MYSQL
        case DatabaseType::MySQL:
            return std::make_shared<MySQLConnectionPool>(info);
#endif
#ifdef WITH_POSTGRESQL
        case DatabaseType::PostgreSQL:
            return std::make_shared<PostgreSQLConnectionPool>(info);
#endif
#ifdef WITH_SQLITE
        case DatabaseType::SQLite:
            return std::make_shared<SQLiteConnectionPool>(info);
#endif
        default:
            break;
    }

    throw DatabaseError(ErrorKind::ValidationError,
                        "Backend not compiled in: " + databaseTypeToString(info.type));
}

PoolStats PoolFactory::stats(const Pool& pool) {
    return std::visit([](const auto& p) -> PoolStats {
        using T = std::decay_t<decltype(p)>;
        PoolStats stats;
        if constexpr (!std::is_same_v<T, std::monostate>) {
            stats.total = p->totalCount();
            stats.idle = p->availableCount();
            stats.waiting = p->waitingCount();
            stats.maxSize = p->maxSize();
        }
        return stats;
    }, pool);
}

void PoolFactory::drain(const Pool& pool) {
    std::visit([](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (!std::is_same_v<T, std::monostate>) {
            p->drain();
        }
    }, pool);
}

}  // namespace sqlbridge
