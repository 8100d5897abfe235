#pragma once

#include <string>

namespace webauth::domain {

/**
 * @brief CSRF токен и его хэшированная пара для cookie
 *
 * token передаётся вместе с запросом (поле формы, заголовок или сессия),
 * cookieValue хранится в cookie и содержит обфусцированный хэш токена.
 */
struct CsrfToken {
    std::string token;
    std::string cookieValue;

    CsrfToken() = default;

    CsrfToken(const std::string& token, const std::string& cookieValue)
        : token(token)
        , cookieValue(cookieValue)
    {}
};

} // namespace webauth::domain
