#pragma once

#include "ports/output/IAccountRoleRepository.hpp"
#include <map>
#include <mutex>

namespace webauth::tests::mocks {

class InMemoryAccountRoleRepository : public ports::output::IAccountRoleRepository {
public:
    std::optional<domain::AccountRole> findByAccountId(int64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = roles_.find(accountId);
        if (it == roles_.end()) return std::nullopt;
        return it->second;
    }

    bool save(domain::AccountRole& accountRole) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (accountRole.id == 0) {
            accountRole.id = nextId_++;
        }
        roles_[accountRole.accountId] = accountRole;
        return true;
    }

    bool deleteByAccountId(int64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failDeletes_) return false;
        roles_.erase(accountId);
        return true;
    }

    // Test helpers
    void assign(int64_t accountId, domain::Role role) {
        domain::AccountRole accountRole(accountId, role);
        save(accountRole);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return roles_.size();
    }

    void setFailDeletes(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failDeletes_ = fail;
    }

private:
    mutable std::mutex mutex_;
    std::map<int64_t, domain::AccountRole> roles_;  // accountId -> role
    int64_t nextId_ = 1;
    bool failDeletes_ = false;
};

} // namespace webauth::tests::mocks
