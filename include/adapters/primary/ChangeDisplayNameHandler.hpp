#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpResponses.hpp"
#include "adapters/primary/RequestScopeFactory.hpp"
#include "guards/SessionGuard.hpp"
#include <memory>
#include <iostream>

namespace webauth::adapters::primary {

/**
 * @brief POST /api/v1/account/display-name {"displayName"}
 */
class ChangeDisplayNameHandler : public IHttpHandler {
public:
    explicit ChangeDisplayNameHandler(std::shared_ptr<RequestScopeFactory> scopes)
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

            auto result = scope.authService->changeDisplayName(
                scope.request->formField("displayName").value_or(""));
            http::sendResult(res, result, *scope.cookies);

        } catch (const std::exception& e) {
            std::cerr << "[ChangeDisplayNameHandler] " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<RequestScopeFactory> scopes_;
};

} // namespace webauth::adapters::primary
