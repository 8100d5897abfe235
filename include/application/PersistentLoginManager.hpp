#pragma once

#include "ports/input/IPersistentLoginManager.hpp"
#include "ports/output/IPersistentLoginRepository.hpp"
#include "ports/output/ICookieService.hpp"
#include "ports/output/ISecurityService.hpp"
#include "ports/output/IRequestContext.hpp"
#include "settings/WebAuthSettings.hpp"
#include <memory>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace webauth::application {

/**
 * @brief "Запомнить меня" по схеме selector/validator
 *
 * - lookupKey (8 байт) открыт и нужен только для поиска записи;
 * - token (32 байта) секретен, в БД хранится его хэш;
 * - запись привязана к подписи клиента, украденная cookie
 *   с другого IP / User-Agent не принимается.
 */
class PersistentLoginManager : public ports::input::IPersistentLoginManager {
public:
    PersistentLoginManager(
        std::shared_ptr<ports::output::IPersistentLoginRepository> repository,
        std::shared_ptr<ports::output::ICookieService> cookies,
        std::shared_ptr<ports::output::ISecurityService> security,
        std::shared_ptr<ports::output::IRequestContext> request,
        std::shared_ptr<settings::WebAuthSettings> settings
    ) : repository_(std::move(repository))
      , cookies_(std::move(cookies))
      , security_(std::move(security))
      , request_(std::move(request))
      , duration_(std::chrono::hours(24) * settings->getPersistentLoginDays())
    {}

    std::string cookieName() const {
        return cookies_->appSpecificCookieName("PL");
    }

    void create(int64_t accountId) override {
        auto signature = clientSignature();
        auto existing = repository_->findByAccountAndSignature(accountId, signature);

        domain::PersistentLogin persistentLogin = existing
            ? *existing
            : domain::PersistentLogin(accountId, signature);

        issue(persistentLogin);
    }

    std::optional<int64_t> resolve() override {
        auto value = cookies_->getCookie(cookieName());
        if (!value) {
            return std::nullopt;
        }

        auto parts = parseCookieValue(*value);
        if (!parts) {
            return std::nullopt;
        }

        auto persistentLogin = repository_->findByLookupKey(parts->lookupKey);
        if (!persistentLogin) {
            return std::nullopt;
        }
        if (persistentLogin->clientSignature != clientSignature()) {
            return std::nullopt;
        }
        if (!security_->verifyPassword(parts->token, persistentLogin->tokenHash)) {
            return std::nullopt;
        }
        if (persistentLogin->isExpired(std::chrono::system_clock::now())) {
            return std::nullopt;
        }

        return persistentLogin->accountId;
    }

    void rotate(int64_t accountId) override {
        auto existing = repository_->findByAccountAndSignature(accountId, clientSignature());
        if (!existing) {
            return;
        }
        issue(*existing);
    }

    void remove() override {
        auto value = cookies_->getCookie(cookieName());
        cookies_->deleteCookie(cookieName());
        if (!value) {
            return;
        }

        auto parts = parseCookieValue(*value);
        if (!parts) {
            return;
        }

        auto persistentLogin = repository_->findByLookupKey(parts->lookupKey);
        if (!persistentLogin) {
            return;
        }
        if (!repository_->deleteById(persistentLogin->id)) {
            throw std::runtime_error("Failed to delete persistent login.");
        }
    }

    void removeAllForAccount(int64_t accountId) override {
        if (!repository_->deleteByAccountId(accountId)) {
            throw std::runtime_error("Failed to delete persistent logins.");
        }
    }

private:
    struct CookieParts {
        std::string lookupKey;
        std::string token;
    };

    std::shared_ptr<ports::output::IPersistentLoginRepository> repository_;
    std::shared_ptr<ports::output::ICookieService> cookies_;
    std::shared_ptr<ports::output::ISecurityService> security_;
    std::shared_ptr<ports::output::IRequestContext> request_;
    std::chrono::system_clock::duration duration_;

    void issue(domain::PersistentLogin& persistentLogin) {
        auto token = security_->generateToken();
        auto lookupKey = security_->generateToken(ports::output::ISecurityService::LOOKUP_KEY_BYTES);

        persistentLogin.lookupKey = lookupKey;
        persistentLogin.tokenHash = security_->hashPassword(token);
        persistentLogin.timeExpires = std::chrono::system_clock::now() + duration_;

        if (!repository_->save(persistentLogin)) {
            throw std::runtime_error("Failed to save persistent login.");
        }

        cookies_->setCookie(cookieName(), lookupKey + "." + token, persistentLogin.timeExpires);
    }

    std::string clientSignature() const {
        std::string data = request_->clientAddress();
        data.push_back('\0');
        data += request_->userAgent();
        return security_->fingerprint(data);
    }

    // "{lookupKey}.{token}", ровно один разделитель
    static std::optional<CookieParts> parseCookieValue(const std::string& value) {
        auto dot = value.find('.');
        if (dot == std::string::npos || dot == 0 || dot == value.size() - 1) {
            return std::nullopt;
        }
        if (value.find('.', dot + 1) != std::string::npos) {
            return std::nullopt;
        }
        return CookieParts{value.substr(0, dot), value.substr(dot + 1)};
    }
};

} // namespace webauth::application
