#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpResponses.hpp"
#include "adapters/primary/RequestScopeFactory.hpp"
#include "guards/SessionGuard.hpp"
#include <memory>
#include <iostream>

namespace webauth::adapters::primary {

/**
 * @brief POST /api/v1/account/password {"currentPassword", "newPassword"}
 */
class ChangePasswordHandler : public IHttpHandler {
public:
    explicit ChangePasswordHandler(std::shared_ptr<RequestScopeFactory> scopes)
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

            guards::SessionGuard loggedIn(scope.accountService);
            if (!loggedIn.verify()) {
                http::applyCookies(res, *scope.cookies);
                http::sendError(res, 401, "You are not logged in.");
                return;
            }

            auto result = scope.authService->changePassword(
                scope.request->formField("currentPassword").value_or(""),
                scope.request->formField("newPassword").value_or("")
            );
            http::sendResult(res, result, *scope.cookies);

        } catch (const std::exception& e) {
            std::cerr << "[ChangePasswordHandler] " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<RequestScopeFactory> scopes_;
};

} // namespace webauth::adapters::primary
