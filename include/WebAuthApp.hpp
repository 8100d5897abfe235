#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/WebAuthSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/MailerSettings.hpp"

// Ports
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IAccountRoleRepository.hpp"
#include "ports/output/IPersistentLoginRepository.hpp"
#include "ports/output/IPendingAccountRepository.hpp"
#include "ports/output/IPasswordResetRepository.hpp"
#include "ports/output/ISessionRepository.hpp"
#include "ports/output/ISecurityService.hpp"
#include "ports/output/IMailer.hpp"

// Application
#include "application/TransactionalEmailSender.hpp"

// Secondary Adapters
#include "adapters/secondary/OpenSslSecurityService.hpp"
#include "adapters/secondary/FakeMailerAdapter.hpp"
#include "adapters/secondary/ExpiredLoginReaper.hpp"
#include "adapters/secondary/PostgresAccountRepository.hpp"
#include "adapters/secondary/PostgresAccountRoleRepository.hpp"
#include "adapters/secondary/PostgresPersistentLoginRepository.hpp"
#include "adapters/secondary/PostgresPendingAccountRepository.hpp"
#include "adapters/secondary/PostgresPasswordResetRepository.hpp"
#include "adapters/secondary/PostgresSessionRepository.hpp"

// Primary Adapters
#include "adapters/primary/RequestScopeFactory.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/CsrfTokenHandler.hpp"
#include "adapters/primary/LoginHandler.hpp"
#include "adapters/primary/LogoutHandler.hpp"
#include "adapters/primary/RegisterHandler.hpp"
#include "adapters/primary/ActivateAccountHandler.hpp"
#include "adapters/primary/PasswordResetHandler.hpp"
#include "adapters/primary/PasswordResetConfirmHandler.hpp"
#include "adapters/primary/GetAccountHandler.hpp"
#include "adapters/primary/ChangePasswordHandler.hpp"
#include "adapters/primary/ChangeDisplayNameHandler.hpp"
#include "adapters/primary/DeleteAccountHandler.hpp"
#include "adapters/primary/PurgePersistentLoginsHandler.hpp"

#include <memory>
#include <iostream>

namespace di = boost::di;

namespace webauth {

/**
 * @brief WebAuth Service Application
 *
 * Сессии, CSRF и "запомнить меня" поверх PostgreSQL.
 * Singleton-зависимости собирает Boost.DI, объекты запроса
 * создаёт RequestScopeFactory.
 */
class WebAuthApp : public BoostBeastApplication {
public:
    WebAuthApp() {
        std::cout << "[WebAuthApp] Initializing..." << std::endl;
    }

    ~WebAuthApp() override {
        if (reaper_) {
            reaper_->stop();
        }
        std::cout << "[WebAuthApp] Shutting down..." << std::endl;
    }

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[WebAuthApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[WebAuthApp] Configuring Boost.DI injection..." << std::endl;

        auto injector = di::make_injector(

            // ================================================================
            // Layer 1: Settings
            // ================================================================
            di::bind<settings::WebAuthSettings>()
                .to(std::make_shared<settings::WebAuthSettings>()),

            di::bind<settings::DbSettings>()
                .to(std::make_shared<settings::DbSettings>()),

            di::bind<settings::MailerSettings>()
                .to(std::make_shared<settings::MailerSettings>()),

            // ================================================================
            // Layer 2: Secondary Adapters (Output Ports implementations)
            // ================================================================
            di::bind<ports::output::IAccountRepository>()
                .to<adapters::secondary::PostgresAccountRepository>()
                .in(di::singleton),

            di::bind<ports::output::IAccountRoleRepository>()
                .to<adapters::secondary::PostgresAccountRoleRepository>()
                .in(di::singleton),

            di::bind<ports::output::IPersistentLoginRepository>()
                .to<adapters::secondary::PostgresPersistentLoginRepository>()
                .in(di::singleton),

            di::bind<ports::output::IPendingAccountRepository>()
                .to<adapters::secondary::PostgresPendingAccountRepository>()
                .in(di::singleton),

            di::bind<ports::output::IPasswordResetRepository>()
                .to<adapters::secondary::PostgresPasswordResetRepository>()
                .in(di::singleton),

            di::bind<ports::output::ISessionRepository>()
                .to<adapters::secondary::PostgresSessionRepository>()
                .in(di::singleton),

            di::bind<ports::output::ISecurityService>()
                .to<adapters::secondary::OpenSslSecurityService>()
                .in(di::singleton),

            di::bind<ports::output::IMailer>()
                .to<adapters::secondary::FakeMailerAdapter>()
                .in(di::singleton),

            di::bind<adapters::secondary::ExpiredLoginReaper>()
                .in(di::singleton),

            // ================================================================
            // Layer 3: Application
            // ================================================================
            di::bind<application::TransactionalEmailSender>()
                .in(di::singleton),

            di::bind<adapters::primary::RequestScopeFactory>()
                .in(di::singleton)
        );

        std::cout << "[WebAuthApp] DI Injector configured:" << std::endl;
        std::cout << "  ✓ Secondary Adapters (9 bindings)" << std::endl;
        std::cout << "  ✓ Request scope factory" << std::endl;

        // ====================================================================
        // Layer 4: Primary Adapters (HTTP Handlers)
        // ====================================================================

        std::cout << "[WebAuthApp] Registering HTTP Handlers via DI..." << std::endl;

        registerHandler<adapters::primary::HealthHandler>(injector, "GET", "/health");

        registerHandler<adapters::primary::CsrfTokenHandler>(injector, "GET", "/api/v1/auth/csrf-token");
        registerHandler<adapters::primary::LoginHandler>(injector, "POST", "/api/v1/auth/login");
        registerHandler<adapters::primary::LogoutHandler>(injector, "POST", "/api/v1/auth/logout");
        registerHandler<adapters::primary::RegisterHandler>(injector, "POST", "/api/v1/auth/register");
        registerHandler<adapters::primary::ActivateAccountHandler>(injector, "POST", "/api/v1/auth/activate");
        registerHandler<adapters::primary::PasswordResetHandler>(injector, "POST", "/api/v1/auth/password-reset");
        registerHandler<adapters::primary::PasswordResetConfirmHandler>(
            injector, "POST", "/api/v1/auth/password-reset/confirm");

        registerHandler<adapters::primary::GetAccountHandler>(injector, "GET", "/api/v1/account");
        registerHandler<adapters::primary::ChangePasswordHandler>(injector, "POST", "/api/v1/account/password");
        registerHandler<adapters::primary::ChangeDisplayNameHandler>(
            injector, "POST", "/api/v1/account/display-name");
        registerHandler<adapters::primary::DeleteAccountHandler>(injector, "DELETE", "/api/v1/account");

        registerHandler<adapters::primary::PurgePersistentLoginsHandler>(
            injector, "POST", "/api/v1/admin/persistent-logins/purge");

        // ====================================================================
        // Background
        // ====================================================================
        reaper_ = injector.template create<std::shared_ptr<adapters::secondary::ExpiredLoginReaper>>();
        reaper_->start();

        std::cout << "[WebAuthApp] Configuration complete! 13 handlers registered." << std::endl;
    }

private:
    std::shared_ptr<adapters::secondary::ExpiredLoginReaper> reaper_;

    template <typename Handler, typename Injector>
    void registerHandler(Injector& injector, const std::string& method, const std::string& path) {
        auto handler = injector.template create<std::shared_ptr<Handler>>();
        registerEndpoint(method, path, handler);
        std::cout << "  ✓ " << method << " " << path << std::endl;
    }
};

} // namespace webauth
