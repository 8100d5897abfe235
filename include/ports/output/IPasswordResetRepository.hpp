#pragma once

#include "domain/PasswordReset.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace webauth::ports::output {

/**
 * @brief Интерфейс репозитория запросов на сброс пароля
 */
class IPasswordResetRepository {
public:
    virtual ~IPasswordResetRepository() = default;

    virtual std::optional<domain::PasswordReset> findByResetCode(const std::string& resetCode) = 0;
    virtual std::optional<domain::PasswordReset> findByAccountId(int64_t accountId) = 0;
    virtual bool save(domain::PasswordReset& passwordReset) = 0;
    virtual bool deleteById(int64_t id) = 0;

    /**
     * @return false только при ошибке хранилища
     */
    virtual bool deleteByAccountId(int64_t accountId) = 0;
};

} // namespace webauth::ports::output
