#pragma once

#include "domain/PersistentLogin.hpp"
#include <string>
#include <optional>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace webauth::ports::output {

/**
 * @brief Интерфейс репозитория persistent login записей
 *
 * Поиск при ошибке хранилища бросает исключение, а не отдаёт nullopt.
 */
class IPersistentLoginRepository {
public:
    virtual ~IPersistentLoginRepository() = default;

    virtual std::optional<domain::PersistentLogin> findByLookupKey(const std::string& lookupKey) = 0;

    virtual std::optional<domain::PersistentLogin> findByAccountAndSignature(
        int64_t accountId,
        const std::string& clientSignature
    ) = 0;

    /**
     * @brief Сохранить запись (insert при id == 0, иначе update)
     * @return false при ошибке хранилища
     */
    virtual bool save(domain::PersistentLogin& persistentLogin) = 0;

    virtual bool deleteById(int64_t id) = 0;

    /**
     * @return false только при ошибке хранилища
     */
    virtual bool deleteByAccountId(int64_t accountId) = 0;

    /**
     * @brief Удалить записи, истёкшие к моменту now
     * @return Количество удалённых записей
     */
    virtual std::size_t deleteExpired(std::chrono::system_clock::time_point now) = 0;
};

} // namespace webauth::ports::output
