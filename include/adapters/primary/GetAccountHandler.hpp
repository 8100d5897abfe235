#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpResponses.hpp"
#include "adapters/primary/RequestScopeFactory.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace webauth::adapters::primary {

/**
 * @brief Текущий аккаунт
 *
 * GET /api/v1/account
 *
 * Response:
 * {
 *   "id": 7,
 *   "email": "john@example.com",
 *   "displayName": "John",
 *   "role": "NONE"
 * }
 *
 * При истёкшей сессии вход восстанавливается по persistent login cookie.
 */
class GetAccountHandler : public IHttpHandler {
public:
    explicit GetAccountHandler(std::shared_ptr<RequestScopeFactory> scopes)
        : scopes_(std::move(scopes)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto scope = scopes_->create(req);

            auto account = scope.authService->currentAccount();
            if (!account) {
                http::applyCookies(res, *scope.cookies);
                http::sendError(res, 401, "You are not logged in.");
                return;
            }

            auto role = scope.accountService->loggedInAccountRole().value_or(domain::Role::None);
            http::applyCookies(res, *scope.cookies);

            nlohmann::json response;
            response["id"] = account->id;
            response["email"] = account->email;
            response["displayName"] = account->displayName;
            response["role"] = domain::toString(role);
            http::sendJson(res, 200, response);

        } catch (const std::exception& e) {
            std::cerr << "[GetAccountHandler] " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<RequestScopeFactory> scopes_;
};

} // namespace webauth::adapters::primary
