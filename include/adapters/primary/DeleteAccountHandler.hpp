#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpResponses.hpp"
#include "adapters/primary/RequestScopeFactory.hpp"
#include "guards/SessionGuard.hpp"
#include <memory>
#include <iostream>

namespace webauth::adapters::primary {

/**
 * @brief DELETE /api/v1/account, CSRF токен в заголовке или в теле
 */
class DeleteAccountHandler : public IHttpHandler {
public:
    explicit DeleteAccountHandler(std::shared_ptr<RequestScopeFactory> scopes)
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

            auto result = scope.authService->deleteAccount();
            http::sendResult(res, result, *scope.cookies);

        } catch (const std::exception& e) {
            std::cerr << "[DeleteAccountHandler] " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<RequestScopeFactory> scopes_;
};

} // namespace webauth::adapters::primary
