#pragma once

#include "domain/Account.hpp"

namespace webauth::application::hooks {

/**
 * @brief Действие перед удалением аккаунта
 *
 * Удаляет данные, ссылающиеся на аккаунт.
 * @throws std::runtime_error при ошибке хранилища (удаление прерывается)
 */
class IAccountDeletionHook {
public:
    virtual ~IAccountDeletionHook() = default;

    virtual void onDeleteAccount(const domain::Account& account) = 0;
};

} // namespace webauth::application::hooks
