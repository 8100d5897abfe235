#pragma once

#include "ports/output/IAccountRepository.hpp"
#include <map>
#include <mutex>
#include <stdexcept>

namespace webauth::tests::mocks {

/**
 * @brief In-Memory реализация репозитория аккаунтов для unit-тестов
 */
class InMemoryAccountRepository : public ports::output::IAccountRepository {
public:
    std::optional<domain::Account> findById(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failReads_) throw std::runtime_error("storage unavailable");
        auto it = accounts_.find(id);
        if (it == accounts_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<domain::Account> findByEmail(const std::string& email) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failReads_) throw std::runtime_error("storage unavailable");
        for (const auto& [id, account] : accounts_) {
            if (account.email == email) return account;
        }
        return std::nullopt;
    }

    bool existsByEmail(const std::string& email) override {
        return findByEmail(email).has_value();
    }

    bool save(domain::Account& account) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failSaves_) return false;
        if (account.id == 0) {
            account.id = nextId_++;
        }
        accounts_[account.id] = account;
        return true;
    }

    bool deleteById(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return accounts_.erase(id) > 0;
    }

    // Test helpers
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        accounts_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return accounts_.size();
    }

    void setFailSaves(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failSaves_ = fail;
    }

    void setFailReads(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failReads_ = fail;
    }

private:
    mutable std::mutex mutex_;
    std::map<int64_t, domain::Account> accounts_;
    int64_t nextId_ = 1;
    bool failSaves_ = false;
    bool failReads_ = false;
};

} // namespace webauth::tests::mocks
