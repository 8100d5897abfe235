#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpResponses.hpp"
#include "adapters/primary/RequestScopeFactory.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace webauth::adapters::primary {

/**
 * @brief Выдать CSRF токен для форм и fetch-запросов
 *
 * GET /api/v1/auth/csrf-token
 *
 * Response:
 * {
 *   "csrfToken": "9f86d0..."
 * }
 *
 * Хэш токена уходит в запись <APP>_CSRF cookie <APP>_STATE.
 */
class CsrfTokenHandler : public IHttpHandler {
public:
    explicit CsrfTokenHandler(std::shared_ptr<RequestScopeFactory> scopes)
        : scopes_(std::move(scopes)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto scope = scopes_->create(req);
            auto token = scope.authService->issueCsrfToken();

            nlohmann::json response;
            response["csrfToken"] = token;

            http::applyCookies(res, *scope.cookies);
            http::sendJson(res, 200, response);

        } catch (const std::exception& e) {
            std::cerr << "[CsrfTokenHandler] " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<RequestScopeFactory> scopes_;
};

} // namespace webauth::adapters::primary
