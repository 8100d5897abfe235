#pragma once

#include <string>
#include <cstdlib>

namespace webauth::settings {

/**
 * @brief Настройки исходящей почты
 *
 * Читает из ENV:
 * - WEBAUTH_MAIL_FROM (default: "no-reply@localhost")
 * - WEBAUTH_BASE_URL (default: "http://localhost:8080"): база для ссылок в письмах
 */
class MailerSettings {
public:
    MailerSettings() {
        if (const char* val = std::getenv("WEBAUTH_MAIL_FROM")) {
            sender_ = val;
        }
        if (const char* val = std::getenv("WEBAUTH_BASE_URL")) {
            baseUrl_ = val;
        }
    }

    std::string getSender() const { return sender_; }
    std::string getBaseUrl() const { return baseUrl_; }

    void setBaseUrl(const std::string& url) { baseUrl_ = url; }

private:
    std::string sender_ = "no-reply@localhost";
    std::string baseUrl_ = "http://localhost:8080";
};

} // namespace webauth::settings
