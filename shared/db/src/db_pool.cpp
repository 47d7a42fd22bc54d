#include "db_pool.h"

#include <spdlog/spdlog.h>

namespace sightline {

DbPool::Lease::~Lease() {
    if (pool_ && conn_) pool_->release(std::move(conn_));
}

DbPool::DbPool(const Config& config)
    : config_(config)
{
    if (config_.pool_size < 1) config_.pool_size = 1;

    conninfo_ = "host=" + config_.host +
                " port=" + std::to_string(config_.port) +
                " user=" + config_.user +
                " dbname=" + config_.database +
                " connect_timeout=5";
    if (!config_.password.empty()) conninfo_ += " password=" + config_.password;

    for (int i = 0; i < config_.pool_size; ++i) {
        idle_.push_back(connect());
    }
    spdlog::info("DbPool: {} connections to {}@{}:{}/{}",
                 config_.pool_size, config_.user, config_.host, config_.port,
                 config_.database);
}

std::unique_ptr<pqxx::connection> DbPool::connect() const {
    return std::make_unique<pqxx::connection>(conninfo_);
}

DbPool::Lease DbPool::acquire() {
    std::unique_ptr<pqxx::connection> conn;
    {
        std::unique_lock lock(mutex_);
        available_.wait(lock, [this] { return !idle_.empty(); });
        conn = std::move(idle_.back());
        idle_.pop_back();
    }

    // Server restarts leave dead handles behind; replace them lazily
    if (!conn->is_open()) {
        spdlog::warn("DbPool: connection lost, reconnecting");
        try {
            conn = connect();
        } catch (...) {
            release(std::move(conn));
            throw;
        }
    }
    return Lease(this, std::move(conn));
}

void DbPool::release(std::unique_ptr<pqxx::connection> conn) {
    {
        std::lock_guard lock(mutex_);
        idle_.push_back(std::move(conn));
    }
    available_.notify_one();
}

}  // namespace sightline
