#include "ConnectionRegistry.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqlbridge {

namespace {

bool checkPool(const Pool& pool, std::chrono::milliseconds timeout, std::string& error) {
    try {
        bool ok = withConnection<bool>(pool, timeout, [](auto& conn) { return conn.ping(); });
        if (!ok) {
            error = "Validation query failed";
        }
        return ok;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

// Releases an id reservation unless the add completed
class PendingReservation {
public:
    PendingReservation(std::shared_mutex& mutex, std::set<std::string>& pending, std::string id)
        : m_mutex(mutex), m_pending(pending), m_id(std::move(id)) {}

    ~PendingReservation() {
        if (m_active) {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            m_pending.erase(m_id);
        }
    }

    void complete() { m_active = false; }

private:
    std::shared_mutex& m_mutex;
    std::set<std::string>& m_pending;
    std::string m_id;
    bool m_active = true;
};

}  // namespace

// ============================================================================
// ConnectionEntry
// ============================================================================

ConnectionEntry::ConnectionEntry(ConnectionInfo info, Pool pool)
    : m_info(std::move(info)), m_pool(std::move(pool)) {
}

ConnectionStatus ConnectionEntry::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

ConnectionHandle ConnectionEntry::snapshot() const {
    ConnectionHandle handle;
    handle.info = m_info.redacted();
    handle.pool = PoolFactory::stats(m_pool);

    std::lock_guard<std::mutex> lock(m_mutex);
    handle.status = m_status;
    handle.lastUsed = m_lastUsed;
    handle.lastError = m_lastError;
    return handle;
}

void ConnectionEntry::markConnected() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_status = ConnectionStatus::Connected;
    m_lastUsed = std::chrono::system_clock::now();
    m_lastError.reset();
}

void ConnectionEntry::markError(const std::string& error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_status = ConnectionStatus::Error;
    m_lastError = ErrorHandler::redact(error, m_info.password);
}

void ConnectionEntry::markDisconnected() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_status = ConnectionStatus::Disconnected;
}

void ConnectionEntry::touch() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lastUsed = std::chrono::system_clock::now();
}

// ============================================================================
// ConnectionRegistry
// ============================================================================

ConnectionRegistry::~ConnectionRegistry() {
    shutdown();
}

ConnectionHandle ConnectionRegistry::addConnection(const ConnectionInfo& info) {
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (m_entries.count(info.id) || m_pending.count(info.id)) {
            throw DatabaseError(ErrorKind::ConnectionAlreadyExists,
                                "Connection already exists: " + info.id);
        }
        if (auto problem = info.validate()) {
            throw DatabaseError(ErrorKind::ValidationError,
                                "Invalid connection '" + info.id + "': " + *problem);
        }
        m_pending.insert(info.id);
    }
    PendingReservation reservation(m_mutex, m_pending, info.id);

    spdlog::info("Adding connection '{}' ({})", info.id, info.describe());

    Pool pool = PoolFactory::create(info);

    std::string error;
    if (!checkPool(pool, info.connectTimeout, error)) {
        PoolFactory::drain(pool);
        error = ErrorHandler::redact(error, info.password);
        spdlog::error("Connection '{}' failed its health check: {}", info.id, error);
        throw DatabaseError(ErrorKind::ConnectionFailure,
                            "Failed to connect '" + info.id + "': " + error);
    }

    auto entry = std::make_shared<ConnectionEntry>(info, std::move(pool));
    entry->markConnected();

    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_pending.erase(info.id);
        m_entries.emplace(info.id, entry);
        reservation.complete();
    }

    spdlog::info("Connection '{}' registered", info.id);
    return entry->snapshot();
}

bool ConnectionRegistry::testConnection(const std::string& id) {
    auto entry = resolve(id);

    std::string error;
    if (checkPool(entry->pool(), entry->acquireTimeout(), error)) {
        entry->markConnected();
        return true;
    }

    entry->markError(error);
    spdlog::warn("Connection '{}' is unhealthy: {}", id,
                 ErrorHandler::redact(error, entry->info().password));
    return false;
}

bool ConnectionRegistry::removeConnection(const std::string& id) noexcept {
    std::shared_ptr<ConnectionEntry> entry;
    try {
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            auto it = m_entries.find(id);
            if (it == m_entries.end()) {
                return false;
            }
            entry = std::move(it->second);
            m_entries.erase(it);
        }

        entry->markDisconnected();
        PoolFactory::drain(entry->pool());
        spdlog::info("Connection '{}' removed", id);
    } catch (const std::exception& e) {
        spdlog::error("Error while removing connection '{}': {}", id, e.what());
    }
    return entry != nullptr;
}

std::vector<ConnectionHandle> ConnectionRegistry::listConnections() const {
    std::vector<std::shared_ptr<ConnectionEntry>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        entries.reserve(m_entries.size());
        for (const auto& [id, entry] : m_entries) {
            entries.push_back(entry);
        }
    }

    std::vector<ConnectionHandle> handles;
    handles.reserve(entries.size());
    for (const auto& entry : entries) {
        handles.push_back(entry->snapshot());
    }
    return handles;
}

HealthReport ConnectionRegistry::healthCheck() {
    std::vector<std::string> ids;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        for (const auto& [id, entry] : m_entries) {
            ids.push_back(id);
        }
    }

    HealthReport report;
    for (const auto& id : ids) {
        std::shared_ptr<ConnectionEntry> entry;
        bool healthy = false;
        try {
            entry = resolve(id);
            healthy = testConnection(id);
        } catch (const DatabaseError& e) {
            // Removed while the check was running
            spdlog::debug("Skipping '{}' in health check: {}", id, e.what());
            continue;
        }

        ConnectionHandle handle = entry->snapshot();
        report.total++;
        if (healthy) report.healthy++;
        report.connections.push_back({id, handle.status, handle.lastError});
    }

    spdlog::info("Health check: {}/{} connections healthy", report.healthy, report.total);
    return report;
}

void ConnectionRegistry::shutdown() noexcept {
    std::map<std::string, std::shared_ptr<ConnectionEntry>> entries;
    try {
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            entries.swap(m_entries);
        }
        for (auto& [id, entry] : entries) {
            entry->markDisconnected();
            PoolFactory::drain(entry->pool());
        }
    } catch (const std::exception& e) {
        spdlog::error("Error during registry shutdown: {}", e.what());
    }
}

std::shared_ptr<ConnectionEntry> ConnectionRegistry::resolve(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        throw DatabaseError(ErrorKind::ConnectionNotFound, "Connection not found: " + id);
    }
    return it->second;
}

bool ConnectionRegistry::contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.count(id) > 0;
}

size_t ConnectionRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.size();
}

}  // namespace sqlbridge
