/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/server.hpp"
#include "quay/coordinator.hpp"
#include "quay/inbox.hpp"
#include "quay/logger.hpp"
#include "quay/monitor.hpp"
#include "quay/pool.hpp"
#include "quay/queue.hpp"
#include "quay/store.hpp"
#include <chrono>

namespace quay {

// Note: Signal handling is done by the CLI (quayd.cpp), not by Server class

Server::Server(const std::filesystem::path& workspace, Config config, Handler handler)
    : workspace_(workspace), config_(std::move(config)), handler_(std::move(handler)), clock_(systemClock_) {
    LOG_DEBUG("Server created - workspace: " + workspace_.string() +
              ", slots: " + std::to_string(config_.pool.slots));
}

Server::Server(const std::filesystem::path& workspace, Config config, Handler handler, const Clock& clock)
    : workspace_(workspace), config_(std::move(config)), handler_(std::move(handler)), clock_(clock) {
    LOG_DEBUG("Server created - workspace: " + workspace_.string() +
              ", slots: " + std::to_string(config_.pool.slots));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting quay server...");

    auto problems = config_.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            LOG_ERROR("Invalid configuration: " + problem);
        }
        return false;
    }

    setThreadName("Main");

    LOG_DEBUG("========================================");
    LOG_DEBUG("Workspace: " + workspace_.string());
    LOG_DEBUG("Slots: " + std::to_string(config_.pool.slots));
    LOG_DEBUG("Lease: " + std::to_string(config_.supervisor.leaseDuration.count()) + "ms, timeout: " +
              std::to_string(config_.supervisor.executionTimeout.count()) + "ms");
    LOG_DEBUG("Heartbeat: " + std::to_string(config_.coordinator.heartbeatInterval.count()) +
              "ms, reaper: " + std::to_string(config_.reaperInterval.count()) + "ms");
    LOG_DEBUG("========================================");

    try {
        store_ = std::make_unique<FileStore>(workspace_);
        if (!store_->open()) {
            LOG_ERROR("Failed to open workspace store");
            return false;
        }

        inbox_ = std::make_unique<Inbox>(workspace_);
        if (!inbox_->ready()) {
            LOG_ERROR("Failed to create inbox");
            return false;
        }
        inbox_->setMaxSize(config_.queue.maxPayloadBytes);

        queue_ = std::make_unique<Queue>(*store_, clock_, config_.queue);
        if (!queue_->recover()) {
            LOG_ERROR("Failed to recover queue state");
            return false;
        }

        coordinator_ = std::make_unique<Coordinator>(*queue_, clock_, config_.coordinator);
        supervisor_ = std::make_unique<Supervisor>(*queue_, clock_, handler_, config_.supervisor, config_.retry);
        pool_ = std::make_unique<Pool>(*coordinator_, *queue_, *supervisor_, config_.pool);

        draining_.store(false);
        if (!pool_->start()) {
            LOG_ERROR("Failed to start worker pool");
            return false;
        }

        running_.store(true);

        maintenanceStop_ = false;
        maintenanceThread_ = std::thread(&Server::maintenanceLoop, this);

        LOG_INFO("Server started");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        if (pool_) {
            pool_->stop();
        }
        return false;
    }
}

void Server::drain() noexcept {
    if (!running_.load() || draining_.exchange(true)) {
        return;
    }
    LOG_INFO("Draining: no new jobs accepted");
    queue_->setDraining(true);
    writeStatus();
}

void Server::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down server...");
    drain();

    // The maintenance loop keeps reaping and sweeping while slots finish.
    if (pool_) {
        pool_->stop();
    }

    {
        std::lock_guard<std::mutex> lock(maintenanceMutex_);
        maintenanceStop_ = true;
    }
    maintenanceWake_.notify_all();
    if (maintenanceThread_.joinable()) {
        maintenanceThread_.join();
    }

    writeStatus();
    running_.store(false);

    pool_.reset();
    supervisor_.reset();
    coordinator_.reset();

    LOG_INFO("Server shutdown complete");
}

void Server::runMaintenance() {
    if (!draining_.load()) {
        inbox_->accept(*queue_);
    }
    std::size_t promoted = queue_->promoteDelayed();
    std::size_t reclaimed = queue_->reap();
    std::size_t died = coordinator_->sweep();
    if (promoted + reclaimed + died > 0) {
        LOG_DEBUG("Maintenance: promoted " + std::to_string(promoted) + ", reclaimed " +
                  std::to_string(reclaimed) + ", workers died " + std::to_string(died));
    }
    writeStatus();
}

Health Server::health() const {
    Health health;
    health.updatedAt = clock_.now();
    health.stale = false;
    health.queueReachable = running_.load() && queue_ && queue_->reachable();
    health.coordinatorReachable = running_.load() && coordinator_ != nullptr;
    health.readiness = draining_.load() ? "draining" : "accepting";
    health.live = health.queueReachable && health.coordinatorReachable;
    health.ready = health.live && !draining_.load();
    return health;
}

void Server::maintenanceLoop() {
    setThreadName("Reaper");
    LOG_DEBUG("Maintenance loop started");

    std::unique_lock<std::mutex> lock(maintenanceMutex_);
    while (!maintenanceStop_) {
        lock.unlock();
        try {
            runMaintenance();
        } catch (const std::exception& e) {
            LOG_ERROR("Maintenance loop error: " + std::string(e.what()));
        }
        lock.lock();
        maintenanceWake_.wait_for(lock, config_.reaperInterval, [this] { return maintenanceStop_; });
    }

    LOG_DEBUG("Maintenance loop stopped");
    clearThreadName();
}

void Server::writeStatus() noexcept {
    if (!queue_ || !coordinator_) {
        return;
    }
    try {
        StatusSnapshot snapshot;
        snapshot.updatedAt = clock_.now();
        snapshot.queueReachable = queue_->reachable();
        snapshot.coordinatorReachable = true;
        snapshot.draining = draining_.load();
        snapshot.reaperInterval = config_.reaperInterval;
        snapshot.workers = coordinator_->workers();
        if (!writeStatusSnapshot(workspace_, snapshot)) {
            LOG_WARN("Failed to write status snapshot");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Status snapshot error: " + std::string(e.what()));
    }
}

} // namespace quay
