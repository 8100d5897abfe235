#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpResponses.hpp"
#include "adapters/primary/RequestScopeFactory.hpp"
#include <memory>
#include <iostream>

namespace webauth::adapters::primary {

/**
 * @brief POST /api/v1/auth/password-reset/confirm {"resetCode", "password"}
 */
class PasswordResetConfirmHandler : public IHttpHandler {
public:
    explicit PasswordResetConfirmHandler(std::shared_ptr<RequestScopeFactory> scopes)
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

            auto result = scope.authService->resetPassword(
                scope.request->formField("resetCode").value_or(""),
                scope.request->formField("password").value_or("")
            );
            http::sendResult(res, result, *scope.cookies);

        } catch (const std::exception& e) {
            std::cerr << "[PasswordResetConfirmHandler] " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<RequestScopeFactory> scopes_;
};

} // namespace webauth::adapters::primary
