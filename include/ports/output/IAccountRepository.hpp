#pragma once

#include "domain/Account.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace webauth::ports::output {

/**
 * @brief Интерфейс репозитория аккаунтов
 *
 * Output Port для работы с хранилищем аккаунтов.
 * find*: nullopt только для отсутствующей записи, ошибка хранилища
 * выбрасывается исключением.
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /**
     * @brief Найти аккаунт по ID
     * @return Account или nullopt
     */
    virtual std::optional<domain::Account> findById(int64_t id) = 0;

    /**
     * @brief Найти аккаунт по email
     * @return Account или nullopt
     */
    virtual std::optional<domain::Account> findByEmail(const std::string& email) = 0;

    /**
     * @brief Проверить существование аккаунта по email
     */
    virtual bool existsByEmail(const std::string& email) = 0;

    /**
     * @brief Сохранить аккаунт
     *
     * Новому аккаунту (id == 0) присваивается ID.
     * @return false при ошибке хранилища
     */
    virtual bool save(domain::Account& account) = 0;

    virtual bool deleteById(int64_t id) = 0;
};

} // namespace webauth::ports::output
