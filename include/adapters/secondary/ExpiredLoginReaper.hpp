#pragma once

#include "ports/output/IPersistentLoginRepository.hpp"
#include "ports/output/ISessionRepository.hpp"
#include "settings/WebAuthSettings.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace webauth::adapters::secondary {

/**
 * @brief Фоновая очистка истёкших persistent login и сессий
 *
 * Срок действия по-прежнему проверяется в resolve(), здесь
 * удаляются только строки, которые уже никогда не будут приняты.
 */
class ExpiredLoginReaper {
public:
    ExpiredLoginReaper(
        std::shared_ptr<ports::output::IPersistentLoginRepository> persistentLoginRepo,
        std::shared_ptr<ports::output::ISessionRepository> sessionRepo,
        std::shared_ptr<settings::WebAuthSettings> settings)
        : persistentLoginRepo_(std::move(persistentLoginRepo))
        , sessionRepo_(std::move(sessionRepo))
        , interval_(settings->getReaperIntervalSeconds())
        , running_(false)
        , runCount_(0)
    {}

    ~ExpiredLoginReaper() {
        stop();
    }

    ExpiredLoginReaper(const ExpiredLoginReaper&) = delete;
    ExpiredLoginReaper& operator=(const ExpiredLoginReaper&) = delete;

    void start() {
        if (running_.exchange(true)) return;

        thread_ = std::thread([this]() {
            std::unique_lock<std::mutex> lock(mutex_);
            while (running_) {
                lock.unlock();
                runOnce();
                lock.lock();
                wakeup_.wait_for(lock, interval_, [this]() { return !running_; });
            }
        });
        std::cout << "[ExpiredLoginReaper] Started, interval " << interval_.count() << "s" << std::endl;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.exchange(false)) return;
        }
        wakeup_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool isRunning() const { return running_; }

    uint64_t runCount() const { return runCount_; }

    /**
     * @brief Один проход очистки
     * @return Количество удалённых persistent login записей
     */
    std::size_t runOnce() {
        std::size_t logins = 0;
        try {
            logins = persistentLoginRepo_->deleteExpired(std::chrono::system_clock::now());
            std::size_t sessions = sessionRepo_ ? sessionRepo_->deleteExpired() : 0;
            if (logins > 0 || sessions > 0) {
                std::cout << "[ExpiredLoginReaper] Removed " << logins << " persistent logins, "
                          << sessions << " sessions" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[ExpiredLoginReaper] Cleanup failed: " << e.what() << std::endl;
        }
        ++runCount_;
        return logins;
    }

private:
    std::shared_ptr<ports::output::IPersistentLoginRepository> persistentLoginRepo_;
    std::shared_ptr<ports::output::ISessionRepository> sessionRepo_;
    std::chrono::seconds interval_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> runCount_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wakeup_;
};

} // namespace webauth::adapters::secondary
