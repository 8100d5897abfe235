#pragma once

#include "ports/output/IPasswordResetRepository.hpp"
#include <map>
#include <mutex>

namespace webauth::tests::mocks {

class InMemoryPasswordResetRepository : public ports::output::IPasswordResetRepository {
public:
    std::optional<domain::PasswordReset> findByResetCode(const std::string& resetCode) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, row] : rows_) {
            if (row.resetCode == resetCode) return row;
        }
        return std::nullopt;
    }

    std::optional<domain::PasswordReset> findByAccountId(int64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, row] : rows_) {
            if (row.accountId == accountId) return row;
        }
        return std::nullopt;
    }

    bool save(domain::PasswordReset& passwordReset) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (passwordReset.id == 0) {
            passwordReset.id = nextId_++;
        }
        rows_[passwordReset.id] = passwordReset;
        return true;
    }

    bool deleteById(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return rows_.erase(id) > 0;
    }

    bool deleteByAccountId(int64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = rows_.begin(); it != rows_.end();) {
            if (it->second.accountId == accountId) {
                it = rows_.erase(it);
            } else {
                ++it;
            }
        }
        return true;
    }

    // Test helpers
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rows_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<int64_t, domain::PasswordReset> rows_;
    int64_t nextId_ = 1;
};

} // namespace webauth::tests::mocks
