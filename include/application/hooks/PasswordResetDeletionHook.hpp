#pragma once

#include "application/hooks/IAccountDeletionHook.hpp"
#include "ports/output/IPasswordResetRepository.hpp"
#include <memory>
#include <stdexcept>

namespace webauth::application::hooks {

class PasswordResetDeletionHook : public IAccountDeletionHook {
public:
    explicit PasswordResetDeletionHook(std::shared_ptr<ports::output::IPasswordResetRepository> resetRepo)
        : resetRepo_(std::move(resetRepo))
    {}

    void onDeleteAccount(const domain::Account& account) override {
        if (!resetRepo_->deleteByAccountId(account.id)) {
            throw std::runtime_error("Failed to delete password resets.");
        }
    }

private:
    std::shared_ptr<ports::output::IPasswordResetRepository> resetRepo_;
};

} // namespace webauth::application::hooks
