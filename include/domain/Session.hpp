#pragma once

#include <string>
#include <chrono>
#include <map>

namespace webauth::domain {

/**
 * @brief Серверная сессия пользователя
 *
 * Хранит произвольные пары ключ-значение. Идентификатор сессии
 * передаётся клиенту в cookie.
 */
struct Session {
    std::string sessionId;                          ///< Случайный hex-идентификатор
    std::map<std::string, std::string> values;      ///< Данные сессии
    std::chrono::system_clock::time_point expiresAt;    ///< Время истечения
    std::chrono::system_clock::time_point updatedAt;    ///< Время последней записи

    Session() = default;

    Session(const std::string& sessionId,
            const std::map<std::string, std::string>& values,
            std::chrono::seconds lifetime)
        : sessionId(sessionId)
        , values(values)
        , expiresAt(std::chrono::system_clock::now() + lifetime)
        , updatedAt(std::chrono::system_clock::now())
    {}

    /**
     * @brief Проверить, истекла ли сессия
     */
    bool isExpired() const {
        return std::chrono::system_clock::now() > expiresAt;
    }
};

} // namespace webauth::domain
