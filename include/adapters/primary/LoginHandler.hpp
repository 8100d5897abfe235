#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpResponses.hpp"
#include "adapters/primary/RequestScopeFactory.hpp"
#include <memory>
#include <iostream>

namespace webauth::adapters::primary {

/**
 * @brief Вход по email и паролю
 *
 * POST /api/v1/auth/login
 * {
 *   "email": "john@example.com",
 *   "password": "secret123",
 *   "keepLoggedIn": true,
 *   "csrfToken": "..."          // или заголовок x-csrf-token
 * }
 */
class LoginHandler : public IHttpHandler {
public:
    explicit LoginHandler(std::shared_ptr<RequestScopeFactory> scopes)
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

            auto keep = scope.request->formField("keepLoggedIn").value_or("");
            auto result = scope.authService->login(
                scope.request->formField("email").value_or(""),
                scope.request->formField("password").value_or(""),
                keep == "true" || keep == "1" || keep == "on"
            );
            http::sendResult(res, result, *scope.cookies);

        } catch (const std::exception& e) {
            std::cerr << "[LoginHandler] " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<RequestScopeFactory> scopes_;
};

} // namespace webauth::adapters::primary
