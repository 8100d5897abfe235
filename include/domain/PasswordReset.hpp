#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace webauth::domain {

/**
 * @brief Одноразовый запрос на сброс пароля
 */
struct PasswordReset {
    int64_t id = 0;
    int64_t accountId = 0;
    std::string resetCode;
    std::chrono::system_clock::time_point timeRequested;
};

} // namespace webauth::domain
