#pragma once

#include "domain/AccountRole.hpp"
#include <optional>
#include <cstdint>

namespace webauth::ports::output {

/**
 * @brief Интерфейс репозитория ролей аккаунтов
 */
class IAccountRoleRepository {
public:
    virtual ~IAccountRoleRepository() = default;

    virtual std::optional<domain::AccountRole> findByAccountId(int64_t accountId) = 0;
    virtual bool save(domain::AccountRole& accountRole) = 0;

    /**
     * @brief Удалить все роли аккаунта
     * @return false только при ошибке хранилища (отсутствие ролей: не ошибка)
     */
    virtual bool deleteByAccountId(int64_t accountId) = 0;
};

} // namespace webauth::ports::output
