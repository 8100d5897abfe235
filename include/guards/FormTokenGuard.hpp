#pragma once

#include "guards/TokenGuard.hpp"
#include "ports/output/IRequestContext.hpp"
#include <memory>
#include <string>

namespace webauth::guards {

/**
 * @brief CSRF проверка по полю формы (по умолчанию "csrfToken")
 */
class FormTokenGuard : public TokenGuard {
public:
    static constexpr const char* DEFAULT_FIELD = "csrfToken";

    FormTokenGuard(
        const ports::output::IRequestContext& request,
        std::shared_ptr<ports::output::ICookieService> cookies,
        std::shared_ptr<ports::output::ISecurityService> security,
        const std::string& fieldName = DEFAULT_FIELD
    ) : TokenGuard(
            request.formField(fieldName).value_or(""),
            cookies->csrfCookieName(),
            cookies,
            std::move(security))
    {}
};

} // namespace webauth::guards
