#pragma once

#include <string>
#include <chrono>
#include <optional>

namespace webauth::ports::output {

/**
 * @brief Интерфейс чтения и записи cookie
 *
 * getCookie() читает cookie входящего запроса. setCookie() и
 * deleteCookie() формируют cookie ответа и не влияют на getCookie()
 * в рамках того же запроса.
 */
class ICookieService {
public:
    virtual ~ICookieService() = default;

    /**
     * @brief Имя cookie с префиксом приложения
     *
     * Префикс исключает конфликты, когда несколько приложений
     * работают на одном домене.
     */
    virtual std::string appSpecificCookieName(const std::string& suffix) const = 0;

    /**
     * @brief Имя cookie, в которой хранится CSRF хэш
     */
    virtual std::string csrfCookieName() const = 0;

    virtual std::optional<std::string> getCookie(const std::string& name) const = 0;

    /**
     * @brief Установить cookie
     * @param expires Время истечения; nullopt: cookie сессии браузера
     */
    virtual void setCookie(
        const std::string& name,
        const std::string& value,
        std::optional<std::chrono::system_clock::time_point> expires
    ) = 0;

    virtual void deleteCookie(const std::string& name) = 0;

    void deleteCsrfCookie() {
        deleteCookie(csrfCookieName());
    }
};

} // namespace webauth::ports::output
