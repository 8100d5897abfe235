#pragma once

#include "domain/enums/Role.hpp"
#include <cstdint>

namespace webauth::domain {

/**
 * @brief Роль, назначенная аккаунту
 */
struct AccountRole {
    int64_t id = 0;
    int64_t accountId = 0;
    Role role = Role::None;

    AccountRole() = default;

    AccountRole(int64_t accountId, Role role)
        : accountId(accountId)
        , role(role)
    {}
};

} // namespace webauth::domain
