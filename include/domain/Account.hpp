#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>

namespace webauth::domain {

/**
 * @brief Аккаунт пользователя
 *
 * Пустой passwordHash означает внешний аккаунт без локального пароля
 * (например, созданный через стороннего провайдера). Войти по паролю
 * в такой аккаунт нельзя.
 */
struct Account {
    int64_t id = 0;                 ///< ID аккаунта (0: ещё не сохранён)
    std::string email;              ///< Email, используется как логин
    std::string passwordHash;       ///< Хэш пароля (PBKDF2)
    std::string displayName;        ///< Отображаемое имя
    std::chrono::system_clock::time_point timeActivated;               ///< Дата активации
    std::optional<std::chrono::system_clock::time_point> timeLastLogin; ///< Последний вход

    Account() = default;

    Account(const std::string& email,
            const std::string& passwordHash,
            const std::string& displayName)
        : email(email)
        , passwordHash(passwordHash)
        , displayName(displayName)
        , timeActivated(std::chrono::system_clock::now())
    {}

    bool isLocal() const {
        return !passwordHash.empty();
    }
};

} // namespace webauth::domain
