#pragma once

#include "application/hooks/IAccountDeletionHook.hpp"
#include "ports/output/IAccountRoleRepository.hpp"
#include <memory>
#include <stdexcept>

namespace webauth::application::hooks {

class AccountRoleDeletionHook : public IAccountDeletionHook {
public:
    explicit AccountRoleDeletionHook(std::shared_ptr<ports::output::IAccountRoleRepository> roleRepo)
        : roleRepo_(std::move(roleRepo))
    {}

    void onDeleteAccount(const domain::Account& account) override {
        if (!roleRepo_->deleteByAccountId(account.id)) {
            throw std::runtime_error("Failed to delete account roles.");
        }
    }

private:
    std::shared_ptr<ports::output::IAccountRoleRepository> roleRepo_;
};

} // namespace webauth::application::hooks
