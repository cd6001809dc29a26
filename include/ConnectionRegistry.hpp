#pragma once

#include "ConnectionInfo.hpp"
#include "PoolFactory.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sqlbridge {

// Point-in-time view of a registered connection. The password is masked.
struct ConnectionHandle {
    ConnectionInfo info;
    ConnectionStatus status = ConnectionStatus::Created;
    std::optional<std::chrono::system_clock::time_point> lastUsed;
    std::optional<std::string> lastError;
    PoolStats pool;
};

struct ConnectionHealth {
    std::string id;
    ConnectionStatus status = ConnectionStatus::Created;
    std::optional<std::string> error;
};

struct HealthReport {
    size_t total = 0;
    size_t healthy = 0;
    std::vector<ConnectionHealth> connections;
};

// One registered connection: immutable parameters, its pool, and health state.
// Shared with in-flight calls, so a concurrent remove never invalidates it.
class ConnectionEntry {
public:
    ConnectionEntry(ConnectionInfo info, Pool pool);

    const ConnectionInfo& info() const { return m_info; }
    const Pool& pool() const { return m_pool; }
    std::chrono::milliseconds acquireTimeout() const { return m_info.acquireTimeout; }

    ConnectionStatus status() const;
    ConnectionHandle snapshot() const;

    void markConnected();
    void markError(const std::string& error);
    void markDisconnected();
    void touch();

private:
    const ConnectionInfo m_info;
    const Pool m_pool;

    mutable std::mutex m_mutex;  // guards the fields below
    ConnectionStatus m_status = ConnectionStatus::Created;
    std::optional<std::chrono::system_clock::time_point> m_lastUsed;
    std::optional<std::string> m_lastError;
};

// Named connections and their pools.
//
// Lookups take a shared lock; add and remove take it exclusively. add reserves
// the id, then builds and checks the pool without holding the lock.
class ConnectionRegistry {
public:
    ConnectionRegistry() = default;
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Build a pool for info, check it with the validation query and register it.
    // Throws ConnectionAlreadyExists, ValidationError or ConnectionFailure; on
    // any failure nothing is registered.
    ConnectionHandle addConnection(const ConnectionInfo& info);

    // Run the validation query on a pooled connection. Throws ConnectionNotFound
    // for an unknown id; every failed check yields false and status ERROR.
    bool testConnection(const std::string& id);

    // Drain the pool and forget the id. false when the id is unknown.
    bool removeConnection(const std::string& id) noexcept;

    // Snapshots ordered by id
    std::vector<ConnectionHandle> listConnections() const;

    // testConnection() on every registered id
    HealthReport healthCheck();

    // Drain every pool and clear the registry
    void shutdown() noexcept;

    // Entry for id; throws ConnectionNotFound
    std::shared_ptr<ConnectionEntry> resolve(const std::string& id) const;

    bool contains(const std::string& id) const;
    size_t size() const;

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, std::shared_ptr<ConnectionEntry>> m_entries;
    std::set<std::string> m_pending;  // ids whose pool is being built
};

}  // namespace sqlbridge
