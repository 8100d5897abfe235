#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace webauth::domain {

/**
 * @brief Регистрация, ожидающая активации по ссылке из письма
 *
 * После активации данные переносятся в Account, а запись удаляется.
 */
struct PendingAccount {
    int64_t id = 0;
    std::string email;
    std::string passwordHash;
    std::string displayName;
    std::string activationCode;
    std::chrono::system_clock::time_point timeRegistered;
};

} // namespace webauth::domain
