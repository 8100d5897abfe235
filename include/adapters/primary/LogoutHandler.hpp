#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpResponses.hpp"
#include "adapters/primary/RequestScopeFactory.hpp"
#include "guards/HeaderTokenGuard.hpp"
#include <memory>
#include <iostream>

namespace webauth::adapters::primary {

/**
 * @brief POST /api/v1/auth/logout, CSRF токен только в заголовке x-csrf-token
 */
class LogoutHandler : public IHttpHandler {
public:
    explicit LogoutHandler(std::shared_ptr<RequestScopeFactory> scopes)
        : scopes_(std::move(scopes)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto scope = scopes_->create(req);

            guards::HeaderTokenGuard csrf(*scope.request, scope.cookies, scope.security);
            if (!csrf.verify()) {
                http::sendError(res, 403, "Invalid CSRF token.");
                return;
            }

            http::sendResult(res, scope.authService->logout(), *scope.cookies);

        } catch (const std::exception& e) {
            std::cerr << "[LogoutHandler] " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<RequestScopeFactory> scopes_;
};

} // namespace webauth::adapters::primary
