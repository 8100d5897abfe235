#pragma once

#include "domain/Account.hpp"
#include "domain/enums/Role.hpp"
#include <string>
#include <optional>

namespace webauth::ports::input {

/**
 * @brief Интерфейс управления аутентифицированной сессией
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    /**
     * @brief Имя cookie с доказательством целостности сессии
     */
    virtual std::string integrityCookieName() const = 0;

    /**
     * @brief Привязать новую сессию к аккаунту
     *
     * Генерирует integrity token, обновляет идентификатор сессии,
     * сохраняет ID и роль аккаунта, выставляет integrity cookie.
     * @return false при ошибке хранилища
     */
    virtual bool establishSessionIntegrity(const domain::Account& account) = 0;

    /**
     * @brief Текущий аутентифицированный аккаунт
     *
     * При несовпадении integrity token или отсутствии аккаунта
     * сессия уничтожается.
     */
    virtual std::optional<domain::Account> loggedInAccount() = 0;

    virtual std::optional<domain::Role> loggedInAccountRole() = 0;

    virtual bool createSession(const domain::Account& account) = 0;

    /**
     * @brief Уничтожить сессию и удалить integrity cookie
     */
    virtual void deleteSession() = 0;
};

} // namespace webauth::ports::input
