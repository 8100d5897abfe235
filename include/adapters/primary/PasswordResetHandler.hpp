#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpResponses.hpp"
#include "adapters/primary/RequestScopeFactory.hpp"
#include <memory>
#include <iostream>

namespace webauth::adapters::primary {

/**
 * @brief Запрос письма для сброса пароля
 *
 * POST /api/v1/auth/password-reset {"email": "..."}
 *
 * Ответ не зависит от того, зарегистрирован ли email.
 */
class PasswordResetHandler : public IHttpHandler {
public:
    explicit PasswordResetHandler(std::shared_ptr<RequestScopeFactory> scopes)
        : scopes_(std::move(scopes)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto scope = scopes_->create(req);
            if (scope.request->hasMalformedBody()) {
                http::sendError(res, 400, "Invalid JSON");
                return;
            }
            if (!http::csrfGuard(scope)->verify()) {
                http::sendError(res, 403, "Invalid CSRF token.");
                return;
            }

            auto result = scope.authService->sendPasswordReset(
                scope.request->formField("email").value_or(""));
            http::sendResult(res, result, *scope.cookies);

        } catch (const std::exception& e) {
            std::cerr << "[PasswordResetHandler] " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<RequestScopeFactory> scopes_;
};

} // namespace webauth::adapters::primary
