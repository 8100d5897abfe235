#pragma once

#include "ports/output/ISessionStore.hpp"
#include "ports/output/ISessionRepository.hpp"
#include "ports/output/ICookieService.hpp"
#include "ports/output/ISecurityService.hpp"
#include "settings/WebAuthSettings.hpp"
#include "utils/Hex.hpp"
#include <map>
#include <memory>
#include <iostream>
#include <vector>
#include <stdexcept>

namespace webauth::adapters::secondary {

/**
 * @brief Сессия текущего запроса: идентификатор в cookie, данные в ISessionRepository
 *
 * - Идентификатор из cookie принимается, только если сессия существует
 *   в хранилище и не истекла (чужой id не "усыновляется").
 * - Новый идентификатор генерируется при первом сохранении непустой сессии.
 * - renewId() переносит данные на новый id, старая запись удаляется в close().
 */
class CookieSessionStore : public ports::output::ISessionStore {
public:
    CookieSessionStore(
        std::shared_ptr<ports::output::ISessionRepository> repository,
        std::shared_ptr<ports::output::ICookieService> cookies,
        std::shared_ptr<ports::output::ISecurityService> security,
        std::shared_ptr<settings::WebAuthSettings> settings
    ) : repository_(std::move(repository))
      , cookies_(std::move(cookies))
      , security_(std::move(security))
      , lifetime_(settings->getSessionLifetimeSeconds())
    {}

    std::string cookieName() const {
        return cookies_->appSpecificCookieName("SID");
    }

    void start() override {
        load();
        started_ = true;
    }

    std::optional<std::string> get(const std::string& key) const override {
        requireStarted();
        auto it = values_.find(key);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set(const std::string& key, const std::string& value) override {
        requireStarted();
        values_[key] = value;
    }

    void remove(const std::string& key) override {
        requireStarted();
        values_.erase(key);
    }

    void clear() override {
        requireStarted();
        values_.clear();
    }

    void renewId() override {
        requireStarted();
        if (!id_.empty() && id_ == persistedId_) {
            retired_.push_back(id_);
            persistedId_.clear();
        }
        id_ = security_->generateToken();
    }

    void close() override {
        requireStarted();
        started_ = false;

        dropRetired();

        if (id_.empty()) {
            if (values_.empty()) {
                return;
            }
            id_ = security_->generateToken();
        }

        domain::Session session(id_, values_, lifetime_);
        if (!repository_->save(session)) {
            throw std::runtime_error("Failed to save session.");
        }
        persistedId_ = id_;
        if (id_ != incomingId_) {
            cookies_->setCookie(cookieName(), id_, std::nullopt);
        }
    }

    void destroy() override {
        load();
        started_ = false;

        if (!persistedId_.empty()) {
            retired_.push_back(persistedId_);
        }
        dropRetired();
        if (cookies_->getCookie(cookieName()) || !id_.empty()) {
            cookies_->deleteCookie(cookieName());
        }

        id_.clear();
        persistedId_.clear();
        values_.clear();
    }

    std::string id() const override {
        return id_;
    }

private:
    std::shared_ptr<ports::output::ISessionRepository> repository_;
    std::shared_ptr<ports::output::ICookieService> cookies_;
    std::shared_ptr<ports::output::ISecurityService> security_;
    std::chrono::seconds lifetime_;

    bool loaded_ = false;
    bool started_ = false;
    std::string id_;
    std::string incomingId_;
    std::string persistedId_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> retired_;

    void load() {
        if (loaded_) {
            return;
        }
        loaded_ = true;

        auto cookie = cookies_->getCookie(cookieName());
        if (!cookie || cookie->size() != ports::output::ISecurityService::TOKEN_DEFAULT_BYTES * 2
            || !utils::Hex::isLowerHex(*cookie)) {
            return;
        }

        auto session = repository_->findById(*cookie);
        if (!session || session->isExpired()) {
            return;
        }

        id_ = session->sessionId;
        incomingId_ = session->sessionId;
        persistedId_ = session->sessionId;
        values_ = session->values;
    }

    void dropRetired() {
        for (const auto& retiredId : retired_) {
            if (!repository_->deleteById(retiredId)) {
                std::cerr << "[CookieSessionStore] Retired session already removed" << std::endl;
            }
        }
        retired_.clear();
    }

    void requireStarted() const {
        if (!started_) {
            throw std::runtime_error("Session is not started.");
        }
    }
};

} // namespace webauth::adapters::secondary
