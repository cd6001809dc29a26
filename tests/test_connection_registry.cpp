#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ConnectionRegistry.hpp"
#include "ErrorHandler.hpp"
#include <atomic>
#include <filesystem>
#include <thread>

using namespace sqlbridge;
using ::testing::HasSubstr;

class ConnectionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "sql_bridge_registry_test";
        std::filesystem::remove_all(tempDir_);
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        registry_.shutdown();
        std::filesystem::remove_all(tempDir_);
    }

    ConnectionInfo sqliteInfo(const std::string& id) {
        ConnectionInfo info;
        info.id = id;
        info.type = DatabaseType::SQLite;
        info.database = (tempDir_ / (id + ".db")).string();
        info.poolSize = 2;
        info.connectTimeout = std::chrono::seconds(2);
        info.acquireTimeout = std::chrono::seconds(2);
        return info;
    }

    std::filesystem::path tempDir_;
    ConnectionRegistry registry_;
};

TEST_F(ConnectionRegistryTest, AddConnectionRegistersAndConnects) {
    ConnectionHandle handle = registry_.addConnection(sqliteInfo("main"));

    EXPECT_EQ(handle.info.id, "main");
    EXPECT_EQ(handle.status, ConnectionStatus::Connected);
    EXPECT_EQ(handle.pool.maxSize, 2u);
    EXPECT_TRUE(registry_.contains("main"));
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(ConnectionRegistryTest, AddDuplicateIdFails) {
    registry_.addConnection(sqliteInfo("main"));

    try {
        registry_.addConnection(sqliteInfo("main"));
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConnectionAlreadyExists);
    }
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(ConnectionRegistryTest, AddInvalidInfoFails) {
    ConnectionInfo info = sqliteInfo("bad");
    info.poolSize = 0;

    try {
        registry_.addConnection(info);
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ValidationError);
    }
    EXPECT_FALSE(registry_.contains("bad"));
}

TEST_F(ConnectionRegistryTest, AddUnreachableDatabaseFails) {
    ConnectionInfo info = sqliteInfo("missing");
    info.database = (tempDir_ / "no_such_dir" / "missing.db").string();

    try {
        registry_.addConnection(info);
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConnectionFailure);
        EXPECT_THAT(e.what(), HasSubstr("missing"));
    }
    EXPECT_FALSE(registry_.contains("missing"));

    // The id is free again after the failure
    ConnectionInfo retry = sqliteInfo("missing");
    EXPECT_NO_THROW(registry_.addConnection(retry));
}

TEST_F(ConnectionRegistryTest, ReadOnlyRequiresExistingFile) {
    ConnectionInfo info = sqliteInfo("ro");
    info.readOnly = true;

    EXPECT_THROW(registry_.addConnection(info), DatabaseError);
}

TEST_F(ConnectionRegistryTest, HandleNeverExposesPassword) {
    ConnectionInfo info = sqliteInfo("secret");
    info.password = "hunter2";

    ConnectionHandle handle = registry_.addConnection(info);

    EXPECT_NE(handle.info.password, "hunter2");
    for (const auto& listed : registry_.listConnections()) {
        EXPECT_NE(listed.info.password, "hunter2");
    }
}

TEST_F(ConnectionRegistryTest, TestConnectionUnknownIdThrows) {
    try {
        registry_.testConnection("nope");
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConnectionNotFound);
    }
}

TEST_F(ConnectionRegistryTest, TestConnectionHealthy) {
    registry_.addConnection(sqliteInfo("main"));

    EXPECT_TRUE(registry_.testConnection("main"));
}

TEST_F(ConnectionRegistryTest, RemoveConnection) {
    registry_.addConnection(sqliteInfo("main"));

    EXPECT_TRUE(registry_.removeConnection("main"));
    EXPECT_FALSE(registry_.contains("main"));
    EXPECT_FALSE(registry_.removeConnection("main"));
}

TEST_F(ConnectionRegistryTest, RemovedIdCanBeAddedAgain) {
    registry_.addConnection(sqliteInfo("main"));
    registry_.removeConnection("main");

    EXPECT_NO_THROW(registry_.addConnection(sqliteInfo("main")));
}

TEST_F(ConnectionRegistryTest, ResolveUnknownIdThrows) {
    EXPECT_THROW(registry_.resolve("nope"), DatabaseError);
}

TEST_F(ConnectionRegistryTest, EntryOutlivesRemoval) {
    registry_.addConnection(sqliteInfo("main"));
    auto entry = registry_.resolve("main");

    registry_.removeConnection("main");

    EXPECT_EQ(entry->info().id, "main");
    EXPECT_EQ(entry->status(), ConnectionStatus::Disconnected);
}

TEST_F(ConnectionRegistryTest, ListConnectionsSortedById) {
    registry_.addConnection(sqliteInfo("zeta"));
    registry_.addConnection(sqliteInfo("alpha"));
    registry_.addConnection(sqliteInfo("mid"));

    auto handles = registry_.listConnections();

    ASSERT_EQ(handles.size(), 3u);
    EXPECT_EQ(handles[0].info.id, "alpha");
    EXPECT_EQ(handles[1].info.id, "mid");
    EXPECT_EQ(handles[2].info.id, "zeta");
}

TEST_F(ConnectionRegistryTest, HealthCheckReportsEveryConnection) {
    registry_.addConnection(sqliteInfo("a"));
    registry_.addConnection(sqliteInfo("b"));

    HealthReport report = registry_.healthCheck();

    EXPECT_EQ(report.total, 2u);
    EXPECT_EQ(report.healthy, 2u);
    ASSERT_EQ(report.connections.size(), 2u);
    EXPECT_EQ(report.connections[0].status, ConnectionStatus::Connected);
    EXPECT_FALSE(report.connections[0].error.has_value());
}

TEST_F(ConnectionRegistryTest, HealthCheckEmptyRegistry) {
    HealthReport report = registry_.healthCheck();

    EXPECT_EQ(report.total, 0u);
    EXPECT_EQ(report.healthy, 0u);
}

TEST_F(ConnectionRegistryTest, ShutdownClearsRegistry) {
    registry_.addConnection(sqliteInfo("a"));
    registry_.addConnection(sqliteInfo("b"));

    registry_.shutdown();

    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_TRUE(registry_.listConnections().empty());
}

TEST_F(ConnectionRegistryTest, ConcurrentAddOfSameIdRegistersOnce) {
    std::atomic<int> added{0};
    std::atomic<int> rejected{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            try {
                registry_.addConnection(sqliteInfo("shared"));
                added++;
            } catch (const DatabaseError& e) {
                if (e.kind() == ErrorKind::ConnectionAlreadyExists) {
                    rejected++;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(added.load(), 1);
    EXPECT_EQ(rejected.load(), 3);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(ConnectionRegistryTest, PoolStatsTrackBorrowedConnections) {
    registry_.addConnection(sqliteInfo("main"));
    auto entry = registry_.resolve("main");

    withConnection<bool>(entry->pool(), std::chrono::seconds(1), [&](auto& conn) {
        PoolStats stats = PoolFactory::stats(entry->pool());
        EXPECT_GE(stats.total, 1u);
        EXPECT_LE(stats.total, 2u);
        return conn.ping();
    });

    PoolStats after = PoolFactory::stats(entry->pool());
    EXPECT_GE(after.idle, 1u);
    EXPECT_EQ(after.waiting, 0u);
}

TEST_F(ConnectionRegistryTest, AcquireTimesOutWhenPoolExhausted) {
    ConnectionInfo info = sqliteInfo("small");
    info.poolSize = 1;
    registry_.addConnection(info);
    auto entry = registry_.resolve("small");

    withConnection<bool>(entry->pool(), std::chrono::seconds(1), [&](auto&) {
        try {
            withConnection<bool>(entry->pool(), std::chrono::milliseconds(50),
                                 [](auto& inner) { return inner.ping(); });
            ADD_FAILURE() << "expected TimeoutError";
        } catch (const DatabaseError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::TimeoutError);
        }
        return true;
    });
}
