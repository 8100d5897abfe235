#pragma once

#include <IRequest.hpp>
#include "adapters/primary/HttpRequestContext.hpp"
#include "adapters/secondary/ResponseCookieJar.hpp"
#include "adapters/secondary/CookieSessionStore.hpp"
#include "application/AccountService.hpp"
#include "application/AuthService.hpp"
#include "application/PersistentLoginManager.hpp"
#include "application/TransactionalEmailSender.hpp"
#include "application/hooks/AccountRoleDeletionHook.hpp"
#include "application/hooks/PasswordResetDeletionHook.hpp"
#include "application/hooks/PersistentLoginDeletionHook.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IAccountRoleRepository.hpp"
#include "ports/output/IPasswordResetRepository.hpp"
#include "ports/output/IPendingAccountRepository.hpp"
#include "ports/output/IPersistentLoginRepository.hpp"
#include "ports/output/ISecurityService.hpp"
#include "ports/output/ISessionRepository.hpp"
#include "settings/WebAuthSettings.hpp"
#include <memory>

namespace webauth::adapters::primary {

/**
 * @brief Объекты одного HTTP запроса
 *
 * Сессия, cookie и сервисы поверх них живут ровно один запрос.
 */
struct RequestScope {
    std::shared_ptr<HttpRequestContext> request;
    std::shared_ptr<secondary::ResponseCookieJar> cookies;
    std::shared_ptr<secondary::CookieSessionStore> session;
    std::shared_ptr<application::AccountService> accountService;
    std::shared_ptr<application::PersistentLoginManager> persistentLogins;
    std::shared_ptr<application::AuthService> authService;
    std::shared_ptr<ports::output::ISecurityService> security;
};

/**
 * @brief Собирает RequestScope из singleton-зависимостей
 *
 * Сам создаётся через Boost.DI, handlers получают его в конструкторе.
 */
class RequestScopeFactory {
public:
    RequestScopeFactory(
        std::shared_ptr<settings::WebAuthSettings> settings,
        std::shared_ptr<ports::output::ISecurityService> security,
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::IAccountRoleRepository> roleRepo,
        std::shared_ptr<ports::output::IPersistentLoginRepository> persistentLoginRepo,
        std::shared_ptr<ports::output::IPendingAccountRepository> pendingRepo,
        std::shared_ptr<ports::output::IPasswordResetRepository> resetRepo,
        std::shared_ptr<ports::output::ISessionRepository> sessionRepo,
        std::shared_ptr<application::TransactionalEmailSender> emailSender
    ) : settings_(std::move(settings))
      , security_(std::move(security))
      , accountRepo_(std::move(accountRepo))
      , roleRepo_(std::move(roleRepo))
      , persistentLoginRepo_(std::move(persistentLoginRepo))
      , pendingRepo_(std::move(pendingRepo))
      , resetRepo_(std::move(resetRepo))
      , sessionRepo_(std::move(sessionRepo))
      , emailSender_(std::move(emailSender))
    {}

    RequestScope create(const IRequest& req) const {
        RequestScope scope;
        scope.security = security_;
        scope.request = std::make_shared<HttpRequestContext>(req);
        scope.cookies = std::make_shared<secondary::ResponseCookieJar>(
            scope.request->cookies(), settings_);
        scope.session = std::make_shared<secondary::CookieSessionStore>(
            sessionRepo_, scope.cookies, security_, settings_);

        scope.accountService = std::make_shared<application::AccountService>(
            scope.session, scope.cookies, security_, accountRepo_, roleRepo_);
        scope.persistentLogins = std::make_shared<application::PersistentLoginManager>(
            persistentLoginRepo_, scope.cookies, security_, scope.request, settings_);

        std::vector<std::shared_ptr<application::hooks::IAccountDeletionHook>> hooks = {
            std::make_shared<application::hooks::AccountRoleDeletionHook>(roleRepo_),
            std::make_shared<application::hooks::PersistentLoginDeletionHook>(scope.persistentLogins),
            std::make_shared<application::hooks::PasswordResetDeletionHook>(resetRepo_)
        };

        scope.authService = std::make_shared<application::AuthService>(
            scope.accountService,
            scope.persistentLogins,
            security_,
            scope.cookies,
            accountRepo_,
            pendingRepo_,
            resetRepo_,
            emailSender_,
            std::move(hooks)
        );
        return scope;
    }

    std::shared_ptr<settings::WebAuthSettings> settings() const {
        return settings_;
    }

private:
    std::shared_ptr<settings::WebAuthSettings> settings_;
    std::shared_ptr<ports::output::ISecurityService> security_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::output::IAccountRoleRepository> roleRepo_;
    std::shared_ptr<ports::output::IPersistentLoginRepository> persistentLoginRepo_;
    std::shared_ptr<ports::output::IPendingAccountRepository> pendingRepo_;
    std::shared_ptr<ports::output::IPasswordResetRepository> resetRepo_;
    std::shared_ptr<ports::output::ISessionRepository> sessionRepo_;
    std::shared_ptr<application::TransactionalEmailSender> emailSender_;
};

} // namespace webauth::adapters::primary
