#pragma once

#include "guards/TokenGuard.hpp"
#include "ports/output/IRequestContext.hpp"
#include <memory>
#include <string>

namespace webauth::guards {

/**
 * @brief CSRF проверка по заголовку (по умолчанию "x-csrf-token")
 *
 * Для запросов из скриптов (fetch / XHR).
 */
class HeaderTokenGuard : public TokenGuard {
public:
    static constexpr const char* DEFAULT_HEADER = "x-csrf-token";

    HeaderTokenGuard(
        const ports::output::IRequestContext& request,
        std::shared_ptr<ports::output::ICookieService> cookies,
        std::shared_ptr<ports::output::ISecurityService> security,
        const std::string& headerName = DEFAULT_HEADER
    ) : TokenGuard(
            request.header(headerName).value_or(""),
            cookies->csrfCookieName(),
            cookies,
            std::move(security))
    {}
};

} // namespace webauth::guards
