#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <pqxx/pqxx>

namespace sightline {

/// Fixed-size pool of PostgreSQL connections. acquire() blocks until a
/// connection is free; the Lease hands it back on destruction.
class DbPool {
public:
    struct Config {
        std::string host = "localhost";
        int port = 5432;
        std::string user;
        std::string password;
        std::string database;
        int pool_size = 2;
    };

    class Lease {
    public:
        Lease(DbPool* pool, std::unique_ptr<pqxx::connection> conn)
            : pool_(pool), conn_(std::move(conn)) {}
        ~Lease();

        Lease(Lease&& other) noexcept = default;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        pqxx::connection& operator*() { return *conn_; }
        pqxx::connection* operator->() { return conn_.get(); }

    private:
        DbPool* pool_;
        std::unique_ptr<pqxx::connection> conn_;
    };

    /// Opens all connections up front. Throws pqxx::broken_connection if the
    /// server is unreachable.
    explicit DbPool(const Config& config);

    DbPool(const DbPool&) = delete;
    DbPool& operator=(const DbPool&) = delete;

    Lease acquire();

    size_t size() const { return static_cast<size_t>(config_.pool_size); }

private:
    void release(std::unique_ptr<pqxx::connection> conn);
    std::unique_ptr<pqxx::connection> connect() const;

    Config config_;
    std::string conninfo_;

    std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<pqxx::connection>> idle_;
};

}  // namespace sightline
