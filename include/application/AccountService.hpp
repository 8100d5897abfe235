#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IAccountRoleRepository.hpp"
#include "ports/output/ICookieService.hpp"
#include "ports/output/ISecurityService.hpp"
#include "ports/output/ISessionStore.hpp"
#include "guards/TokenGuard.hpp"
#include <memory>
#include <iostream>

namespace webauth::application {

/**
 * @brief Жизненный цикл аутентифицированной сессии
 *
 * Сессия хранит INTEGRITY_TOKEN, ACCOUNT_ID и ACCOUNT_ROLE.
 * Доказательство integrity token лежит в cookie; на каждом запросе
 * пара проверяется через TokenGuard, при несовпадении сессия уничтожается.
 */
class AccountService : public ports::input::IAccountService {
public:
    static constexpr const char* INTEGRITY_TOKEN = "INTEGRITY_TOKEN";
    static constexpr const char* ACCOUNT_ID = "ACCOUNT_ID";
    static constexpr const char* ACCOUNT_ROLE = "ACCOUNT_ROLE";

    AccountService(
        std::shared_ptr<ports::output::ISessionStore> session,
        std::shared_ptr<ports::output::ICookieService> cookies,
        std::shared_ptr<ports::output::ISecurityService> security,
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::IAccountRoleRepository> roleRepo
    ) : session_(std::move(session))
      , cookies_(std::move(cookies))
      , security_(std::move(security))
      , accountRepo_(std::move(accountRepo))
      , roleRepo_(std::move(roleRepo))
    {}

    std::string integrityCookieName() const override {
        return cookies_->appSpecificCookieName("INTEGRITY");
    }

    bool establishSessionIntegrity(const domain::Account& account) override {
        try {
            auto csrfToken = security_->generateCsrfToken();

            session_->start();
            session_->clear();
            session_->renewId();
            session_->set(INTEGRITY_TOKEN, csrfToken.token);
            session_->set(ACCOUNT_ID, std::to_string(account.id));
            if (auto accountRole = roleRepo_->findByAccountId(account.id)) {
                session_->set(ACCOUNT_ROLE, std::to_string(domain::toValue(accountRole->role)));
            }
            session_->close();

            cookies_->setCookie(integrityCookieName(), csrfToken.cookieValue, std::nullopt);

            std::cout << "[AccountService] Session established for account " << account.id << std::endl;
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[AccountService] establishSessionIntegrity() failed: " << e.what() << std::endl;
            return false;
        }
    }

    std::optional<domain::Account> loggedInAccount() override {
        session_->start();

        guards::TokenGuard integrityGuard(
            session_->get(INTEGRITY_TOKEN).value_or(""),
            integrityCookieName(),
            cookies_,
            security_
        );
        if (!integrityGuard.verify()) {
            session_->destroy();
            return std::nullopt;
        }

        auto accountId = parseAccountId(session_->get(ACCOUNT_ID));
        std::optional<domain::Account> account;
        if (accountId) {
            account = accountRepo_->findById(*accountId);
        }
        if (!account) {
            std::cout << "[AccountService] Session refers to missing account, destroying" << std::endl;
            session_->destroy();
            return std::nullopt;
        }

        session_->close();
        return account;
    }

    std::optional<domain::Role> loggedInAccountRole() override {
        session_->start();
        auto value = session_->get(ACCOUNT_ROLE);
        session_->close();

        if (!value) {
            return std::nullopt;
        }
        try {
            return domain::roleFromValue(std::stoi(*value));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    bool createSession(const domain::Account& account) override {
        return establishSessionIntegrity(account);
    }

    void deleteSession() override {
        session_->destroy();
        cookies_->deleteCookie(integrityCookieName());
    }

private:
    std::shared_ptr<ports::output::ISessionStore> session_;
    std::shared_ptr<ports::output::ICookieService> cookies_;
    std::shared_ptr<ports::output::ISecurityService> security_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::output::IAccountRoleRepository> roleRepo_;

    static std::optional<int64_t> parseAccountId(const std::optional<std::string>& value) {
        if (!value || value->empty()) {
            return std::nullopt;
        }
        try {
            std::size_t consumed = 0;
            int64_t id = std::stoll(*value, &consumed);
            if (consumed != value->size() || id <= 0) {
                return std::nullopt;
            }
            return id;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
};

} // namespace webauth::application
