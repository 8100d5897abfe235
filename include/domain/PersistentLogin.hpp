#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace webauth::domain {

/**
 * @brief Запись "запомнить меня" для повторного входа после истечения сессии
 *
 * Схема selector/validator:
 * - lookupKey: открытая часть (64 бита), индексируется для быстрого поиска;
 * - tokenHash: хэш секретной части, сам токен хранится только в cookie.
 *
 * Одна запись на пару (accountId, clientSignature).
 */
struct PersistentLogin {
    int64_t id = 0;
    int64_t accountId = 0;
    std::string clientSignature;    ///< Хэш (IP клиента + User-Agent)
    std::string lookupKey;          ///< 16 hex-символов
    std::string tokenHash;          ///< Хэш токена
    std::chrono::system_clock::time_point timeExpires;

    PersistentLogin() = default;

    PersistentLogin(int64_t accountId, const std::string& clientSignature)
        : accountId(accountId)
        , clientSignature(clientSignature)
    {}

    bool isExpired(std::chrono::system_clock::time_point now) const {
        return timeExpires < now;
    }
};

} // namespace webauth::domain
