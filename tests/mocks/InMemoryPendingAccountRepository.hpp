#pragma once

#include "ports/output/IPendingAccountRepository.hpp"
#include <map>
#include <mutex>

namespace webauth::tests::mocks {

class InMemoryPendingAccountRepository : public ports::output::IPendingAccountRepository {
public:
    std::optional<domain::PendingAccount> findByActivationCode(const std::string& activationCode) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, row] : rows_) {
            if (row.activationCode == activationCode) return row;
        }
        return std::nullopt;
    }

    bool existsByEmail(const std::string& email) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, row] : rows_) {
            if (row.email == email) return true;
        }
        return false;
    }

    bool save(domain::PendingAccount& pendingAccount) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pendingAccount.id == 0) {
            pendingAccount.id = nextId_++;
        }
        rows_[pendingAccount.id] = pendingAccount;
        return true;
    }

    bool deleteById(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failDeletes_) return false;
        return rows_.erase(id) > 0;
    }

    // Test helpers
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rows_.size();
    }

    void setFailDeletes(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failDeletes_ = fail;
    }

private:
    mutable std::mutex mutex_;
    std::map<int64_t, domain::PendingAccount> rows_;
    int64_t nextId_ = 1;
    bool failDeletes_ = false;
};

} // namespace webauth::tests::mocks
