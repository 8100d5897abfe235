#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpResponses.hpp"
#include "adapters/primary/RequestScopeFactory.hpp"
#include "adapters/secondary/ExpiredLoginReaper.hpp"
#include "guards/CompositeGuard.hpp"
#include "guards/SessionGuard.hpp"
#include "guards/WhitelistGuard.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace webauth::adapters::primary {

/**
 * @brief Немедленная очистка истёкших persistent login
 *
 * POST /api/v1/admin/persistent-logins/purge
 *
 * Только с адресов из WEBAUTH_ADMIN_WHITELIST и для роли Admin.
 *
 * Response:
 * {
 *   "removed": 3
 * }
 */
class PurgePersistentLoginsHandler : public IHttpHandler {
public:
    PurgePersistentLoginsHandler(
        std::shared_ptr<RequestScopeFactory> scopes,
        std::shared_ptr<secondary::ExpiredLoginReaper> reaper
    ) : scopes_(std::move(scopes))
      , reaper_(std::move(reaper)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto scope = scopes_->create(req);

            guards::CompositeGuard access(
                std::make_shared<guards::WhitelistGuard>(
                    scopes_->settings()->getAdminWhitelist(), *scope.request),
                std::make_shared<guards::SessionGuard>(scope.accountService, domain::Role::Admin)
            );
            if (!access.verify()) {
                std::cout << "[PurgePersistentLoginsHandler] Access denied for "
                          << scope.request->clientAddress() << std::endl;
                http::applyCookies(res, *scope.cookies);
                http::sendError(res, 403, "Access denied.");
                return;
            }

            nlohmann::json response;
            response["removed"] = reaper_->runOnce();

            http::applyCookies(res, *scope.cookies);
            http::sendJson(res, 200, response);

        } catch (const std::exception& e) {
            std::cerr << "[PurgePersistentLoginsHandler] " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<RequestScopeFactory> scopes_;
    std::shared_ptr<secondary::ExpiredLoginReaper> reaper_;
};

} // namespace webauth::adapters::primary
