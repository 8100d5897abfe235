#pragma once

#include <optional>
#include <cstdint>

namespace webauth::ports::input {

/**
 * @brief Интерфейс "запомнить меня"
 *
 * Cookie содержит "{lookupKey}.{token}", в БД хранится только хэш токена,
 * запись привязана к подписи клиента (IP + User-Agent).
 */
class IPersistentLoginManager {
public:
    virtual ~IPersistentLoginManager() = default;

    /**
     * @brief Выпустить учётные данные для аккаунта
     *
     * Для пары (аккаунт, подпись клиента) существует не более одной записи.
     * @throws std::runtime_error при ошибке хранилища
     */
    virtual void create(int64_t accountId) = 0;

    /**
     * @brief ID аккаунта по cookie текущего запроса
     */
    virtual std::optional<int64_t> resolve() = 0;

    /**
     * @brief Перевыпустить токен для текущего клиента (no-op, если записи нет)
     * @throws std::runtime_error при ошибке хранилища
     */
    virtual void rotate(int64_t accountId) = 0;

    /**
     * @brief Удалить cookie и соответствующую запись
     *
     * Отсутствующая или некорректная cookie не является ошибкой.
     */
    virtual void remove() = 0;

    /**
     * @brief Отозвать все учётные данные аккаунта на всех устройствах
     */
    virtual void removeAllForAccount(int64_t accountId) = 0;
};

} // namespace webauth::ports::input
