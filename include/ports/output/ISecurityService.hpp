#pragma once

#include "domain/CsrfToken.hpp"
#include <string>
#include <cstddef>

namespace webauth::ports::output {

/**
 * @brief Интерфейс криптографических примитивов
 *
 * Хэширование паролей, генерация токенов, выпуск и проверка CSRF токенов.
 */
class ISecurityService {
public:
    /// Размер токена по умолчанию в байтах (64 hex-символа)
    static constexpr std::size_t TOKEN_DEFAULT_BYTES = 32;

    /// Размер ключа поиска persistent login (64 бита, 16 hex-символов)
    static constexpr std::size_t LOOKUP_KEY_BYTES = 8;

    static constexpr std::size_t PASSWORD_MIN_LENGTH = 8;
    static constexpr std::size_t PASSWORD_MAX_LENGTH = 72;

    virtual ~ISecurityService() = default;

    /**
     * @brief Захэшировать пароль
     *
     * Соль случайна для каждого вызова, поэтому два хэша одного
     * пароля никогда не совпадают.
     */
    virtual std::string hashPassword(const std::string& password) = 0;

    /**
     * @brief Проверить пароль по хэшу
     * @return false для пустого или повреждённого хэша
     */
    virtual bool verifyPassword(const std::string& password, const std::string& hash) = 0;

    /**
     * @brief Сгенерировать криптостойкий токен
     * @param byteLength Количество случайных байт
     * @return Строка из 2 * byteLength hex-символов
     */
    virtual std::string generateToken(std::size_t byteLength = TOKEN_DEFAULT_BYTES) = 0;

    /**
     * @brief Выпустить CSRF токен и значение для cookie
     */
    virtual domain::CsrfToken generateCsrfToken() = 0;

    /**
     * @brief Проверить, что токен соответствует значению из cookie
     */
    virtual bool verifyCsrfToken(const domain::CsrfToken& csrfToken) = 0;

    /**
     * @brief Короткий отпечаток данных (не секрет, только для сравнения)
     */
    virtual std::string fingerprint(const std::string& data) = 0;
};

} // namespace webauth::ports::output
