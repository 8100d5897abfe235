#pragma once

#include "guards/IGuard.hpp"
#include "ports/output/ICookieService.hpp"
#include "ports/output/ISecurityService.hpp"
#include <memory>
#include <string>

namespace webauth::guards {

/**
 * @brief Проверка токена по доказательству из cookie (double-submit cookie)
 *
 * Серверная сторона не хранит ожидаемый токен: запрос допускается, если
 * переданный токен соответствует хэшу, лежащему в cookie с именем cookieName.
 */
class TokenGuard : public IGuard {
public:
    TokenGuard(
        std::string token,
        std::string cookieName,
        std::shared_ptr<ports::output::ICookieService> cookies,
        std::shared_ptr<ports::output::ISecurityService> security
    ) : token_(std::move(token))
      , cookieName_(std::move(cookieName))
      , cookies_(std::move(cookies))
      , security_(std::move(security))
    {}

    bool verify() override {
        auto cookieValue = cookies_->getCookie(cookieName_);
        if (!cookieValue) {
            return false;
        }
        return security_->verifyCsrfToken(domain::CsrfToken(token_, *cookieValue));
    }

private:
    std::string token_;
    std::string cookieName_;
    std::shared_ptr<ports::output::ICookieService> cookies_;
    std::shared_ptr<ports::output::ISecurityService> security_;
};

} // namespace webauth::guards
