#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace webauth::settings {

/**
 * @brief Подключение к PostgreSQL
 *
 * WEBAUTH_DB_URL (libpq conninfo или postgresql://...) имеет приоритет.
 * Иначе строка собирается из WEBAUTH_DB_HOST / _PORT / _NAME / _USER /
 * _PASSWORD (пароль обязателен) и WEBAUTH_DB_SSLMODE.
 */
class DbSettings {
public:
    DbSettings() {
        if (const char* url = std::getenv("WEBAUTH_DB_URL")) {
            url_ = url;
            return;
        }

        host_ = envOr("WEBAUTH_DB_HOST", "localhost");
        port_ = std::stoi(envOr("WEBAUTH_DB_PORT", "5432"));
        database_ = envOr("WEBAUTH_DB_NAME", "webauth");
        user_ = envOr("WEBAUTH_DB_USER", "webauth");
        sslMode_ = envOr("WEBAUTH_DB_SSLMODE", "prefer");

        const char* password = std::getenv("WEBAUTH_DB_PASSWORD");
        if (!password) {
            throw std::runtime_error("WEBAUTH_DB_PASSWORD is not set");
        }
        password_ = password;
    }

    std::string getConnectionString() const {
        if (!url_.empty()) {
            return url_;
        }
        return "host=" + host_
            + " port=" + std::to_string(port_)
            + " dbname=" + database_
            + " user=" + user_
            + " password=" + password_
            + " sslmode=" + sslMode_
            + " application_name=webauth-service";
    }

    /// Для логов, без пароля
    std::string describe() const {
        if (!url_.empty()) {
            return "WEBAUTH_DB_URL";
        }
        return user_ + "@" + host_ + ":" + std::to_string(port_) + "/" + database_;
    }

private:
    std::string url_;
    std::string host_;
    int port_ = 5432;
    std::string database_;
    std::string user_;
    std::string password_;
    std::string sslMode_;

    static std::string envOr(const char* name, const char* fallback) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(fallback);
    }
};

} // namespace webauth::settings
