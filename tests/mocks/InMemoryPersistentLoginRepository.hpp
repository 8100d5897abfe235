#pragma once

#include "ports/output/IPersistentLoginRepository.hpp"
#include <map>
#include <mutex>
#include <vector>
#include <stdexcept>

namespace webauth::tests::mocks {

/**
 * @brief In-Memory репозиторий persistent login
 *
 * Соблюдает уникальность lookupKey и пары (accountId, clientSignature).
 */
class InMemoryPersistentLoginRepository : public ports::output::IPersistentLoginRepository {
public:
    std::optional<domain::PersistentLogin> findByLookupKey(const std::string& lookupKey) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failReads_) throw std::runtime_error("storage unavailable");
        for (const auto& [id, row] : rows_) {
            if (row.lookupKey == lookupKey) return row;
        }
        return std::nullopt;
    }

    std::optional<domain::PersistentLogin> findByAccountAndSignature(
        int64_t accountId,
        const std::string& clientSignature
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failReads_) throw std::runtime_error("storage unavailable");
        for (const auto& [id, row] : rows_) {
            if (row.accountId == accountId && row.clientSignature == clientSignature) return row;
        }
        return std::nullopt;
    }

    bool save(domain::PersistentLogin& persistentLogin) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failSaves_) return false;

        for (const auto& [id, row] : rows_) {
            if (id == persistentLogin.id) continue;
            if (row.lookupKey == persistentLogin.lookupKey) return false;
            if (row.accountId == persistentLogin.accountId
                && row.clientSignature == persistentLogin.clientSignature) return false;
        }

        if (persistentLogin.id == 0) {
            persistentLogin.id = nextId_++;
        }
        rows_[persistentLogin.id] = persistentLogin;
        return true;
    }

    bool deleteById(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failDeletes_) return false;
        return rows_.erase(id) > 0;
    }

    bool deleteByAccountId(int64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failDeletes_) return false;
        for (auto it = rows_.begin(); it != rows_.end();) {
            if (it->second.accountId == accountId) {
                it = rows_.erase(it);
            } else {
                ++it;
            }
        }
        return true;
    }

    std::size_t deleteExpired(std::chrono::system_clock::time_point now) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failDeletes_) throw std::runtime_error("storage unavailable");
        std::size_t removed = 0;
        for (auto it = rows_.begin(); it != rows_.end();) {
            if (it->second.isExpired(now)) {
                it = rows_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    // Test helpers
    std::vector<domain::PersistentLogin> all() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::PersistentLogin> result;
        for (const auto& [id, row] : rows_) {
            result.push_back(row);
        }
        return result;
    }

    void setExpiry(int64_t id, std::chrono::system_clock::time_point timeExpires) {
        std::lock_guard<std::mutex> lock(mutex_);
        rows_.at(id).timeExpires = timeExpires;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rows_.size();
    }

    void setFailSaves(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failSaves_ = fail;
    }

    void setFailDeletes(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failDeletes_ = fail;
    }

    void setFailReads(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failReads_ = fail;
    }

private:
    mutable std::mutex mutex_;
    std::map<int64_t, domain::PersistentLogin> rows_;
    int64_t nextId_ = 1;
    bool failSaves_ = false;
    bool failDeletes_ = false;
    bool failReads_ = false;
};

} // namespace webauth::tests::mocks
