#pragma once

#include <string>
#include <vector>
#include <cstdlib>
#include <sstream>

namespace webauth::settings {

/**
 * @brief Настройки аутентификации
 *
 * Читает из ENV:
 * - WEBAUTH_APP_NAME (default: "WEBAUTH"): префикс имён cookie
 * - WEBAUTH_PERSISTENT_LOGIN_DAYS (default: 30)
 * - WEBAUTH_SESSION_LIFETIME_SECONDS (default: 7200)
 * - WEBAUTH_HASH_ITERATIONS (default: 100000)
 * - WEBAUTH_SECURE_COOKIES (default: false)
 * - WEBAUTH_ADMIN_WHITELIST (default: "127.0.0.1"): список IP/CIDR через запятую
 * - WEBAUTH_REAPER_INTERVAL_SECONDS (default: 3600)
 */
class WebAuthSettings {
public:
    WebAuthSettings() {
        if (const char* val = std::getenv("WEBAUTH_APP_NAME")) {
            appName_ = val;
        }
        if (const char* val = std::getenv("WEBAUTH_PERSISTENT_LOGIN_DAYS")) {
            persistentLoginDays_ = std::stoi(val);
        }
        if (const char* val = std::getenv("WEBAUTH_SESSION_LIFETIME_SECONDS")) {
            sessionLifetimeSeconds_ = std::stoi(val);
        }
        if (const char* val = std::getenv("WEBAUTH_HASH_ITERATIONS")) {
            hashIterations_ = std::stoi(val);
        }
        if (const char* val = std::getenv("WEBAUTH_SECURE_COOKIES")) {
            secureCookies_ = std::string(val) == "true" || std::string(val) == "1";
        }
        if (const char* val = std::getenv("WEBAUTH_ADMIN_WHITELIST")) {
            adminWhitelist_ = splitList(val);
        }
        if (const char* val = std::getenv("WEBAUTH_REAPER_INTERVAL_SECONDS")) {
            reaperIntervalSeconds_ = std::stoi(val);
        }
    }

    std::string getAppName() const { return appName_; }
    int getPersistentLoginDays() const { return persistentLoginDays_; }
    int getSessionLifetimeSeconds() const { return sessionLifetimeSeconds_; }
    int getHashIterations() const { return hashIterations_; }
    bool isSecureCookies() const { return secureCookies_; }
    std::vector<std::string> getAdminWhitelist() const { return adminWhitelist_; }
    int getReaperIntervalSeconds() const { return reaperIntervalSeconds_; }

    // Для тестов
    void setAppName(const std::string& name) { appName_ = name; }
    void setPersistentLoginDays(int days) { persistentLoginDays_ = days; }
    void setHashIterations(int iterations) { hashIterations_ = iterations; }
    void setSecureCookies(bool secure) { secureCookies_ = secure; }
    void setAdminWhitelist(std::vector<std::string> whitelist) { adminWhitelist_ = std::move(whitelist); }

private:
    std::string appName_ = "WEBAUTH";
    int persistentLoginDays_ = 30;
    int sessionLifetimeSeconds_ = 7200;
    int hashIterations_ = 100000;
    bool secureCookies_ = false;
    std::vector<std::string> adminWhitelist_ = {"127.0.0.1"};
    int reaperIntervalSeconds_ = 3600;

    static std::vector<std::string> splitList(const std::string& value) {
        std::vector<std::string> items;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            auto first = item.find_first_not_of(' ');
            auto last = item.find_last_not_of(' ');
            if (first != std::string::npos) {
                items.push_back(item.substr(first, last - first + 1));
            }
        }
        return items;
    }
};

} // namespace webauth::settings
