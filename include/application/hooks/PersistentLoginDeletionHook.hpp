#pragma once

#include "application/hooks/IAccountDeletionHook.hpp"
#include "ports/input/IPersistentLoginManager.hpp"
#include <memory>

namespace webauth::application::hooks {

/**
 * @brief Отзывает "запомнить меня" на всех устройствах аккаунта
 */
class PersistentLoginDeletionHook : public IAccountDeletionHook {
public:
    explicit PersistentLoginDeletionHook(std::shared_ptr<ports::input::IPersistentLoginManager> manager)
        : manager_(std::move(manager))
    {}

    void onDeleteAccount(const domain::Account& account) override {
        manager_->removeAllForAccount(account.id);
    }

private:
    std::shared_ptr<ports::input::IPersistentLoginManager> manager_;
};

} // namespace webauth::application::hooks
