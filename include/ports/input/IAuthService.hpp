#pragma once

#include "domain/Account.hpp"
#include <string>
#include <optional>

namespace webauth::ports::input {

enum class AuthStatus {
    Ok,
    InvalidInput,
    InvalidCredentials,
    NotLoggedIn,
    AlreadyLoggedIn,
    Forbidden,
    NotFound,
    Conflict,
    Failed
};

/**
 * @brief Результат сценария аутентификации
 */
struct AuthResult {
    AuthStatus status = AuthStatus::Ok;
    std::string message;

    bool success() const { return status == AuthStatus::Ok; }
};

/**
 * @brief Сценарии аутентификации и управления аккаунтом
 *
 * Работает в рамках одного HTTP запроса.
 */
class IAuthService {
public:
    virtual ~IAuthService() = default;

    virtual AuthResult login(
        const std::string& email,
        const std::string& password,
        bool keepLoggedIn
    ) = 0;

    virtual AuthResult logout() = 0;

    /**
     * @brief Текущий аккаунт, с восстановлением сессии по persistent login
     */
    virtual std::optional<domain::Account> currentAccount() = 0;

    virtual AuthResult registerAccount(
        const std::string& email,
        const std::string& password,
        const std::string& displayName
    ) = 0;

    virtual AuthResult activateAccount(const std::string& activationCode) = 0;

    /**
     * @brief Запросить сброс пароля
     *
     * Ответ одинаков для существующего и несуществующего email.
     */
    virtual AuthResult sendPasswordReset(const std::string& email) = 0;

    virtual AuthResult resetPassword(const std::string& resetCode, const std::string& newPassword) = 0;

    virtual AuthResult changePassword(const std::string& currentPassword, const std::string& newPassword) = 0;

    virtual AuthResult changeDisplayName(const std::string& displayName) = 0;

    virtual AuthResult deleteAccount() = 0;

    /**
     * @brief Выпустить CSRF токен и выставить CSRF cookie
     * @return Токен для формы или заголовка x-csrf-token
     */
    virtual std::string issueCsrfToken() = 0;
};

} // namespace webauth::ports::input
