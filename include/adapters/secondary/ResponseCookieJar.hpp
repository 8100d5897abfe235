#pragma once

#include "ports/output/ICookieService.hpp"
#include "settings/WebAuthSettings.hpp"
#include "utils/EpochTime.hpp"
#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <ctime>

namespace webauth::adapters::secondary {

/**
 * @brief ICookieService поверх заголовков Cookie / Set-Cookie
 *
 * Cookie приложения (<APP>_SID, <APP>_INTEGRITY, <APP>_CSRF, <APP>_PL)
 * уходят клиенту одной физической cookie <APP>_STATE: IResponse::setHeader
 * хранит одно значение на имя, поэтому ответ несёт не больше одного Set-Cookie.
 *
 * Значение <APP>_STATE: записи через '&', запись "name=value" или
 * "name=value@expiresEpoch", name и value в percent-encoding.
 * При разборе некорректные и истёкшие записи отбрасываются.
 * Физическая cookie живёт до самого позднего срока среди записей,
 * а без сроков до конца сессии браузера.
 *
 * Все cookie: Path=/; HttpOnly; SameSite=Strict, Secure при включённой настройке.
 */
class ResponseCookieJar : public ports::output::ICookieService {
public:
    ResponseCookieJar(
        std::map<std::string, std::string> incoming,
        std::shared_ptr<settings::WebAuthSettings> settings
    ) : incoming_(std::move(incoming))
      , appName_(settings->getAppName())
      , secure_(settings->isSecureCookies())
    {
        auto state = incoming_.find(stateCookieName());
        if (state != incoming_.end()) {
            entries_ = parseState(state->second, std::chrono::system_clock::now());
        }
    }

    std::string appSpecificCookieName(const std::string& suffix) const override {
        return appName_ + "_" + suffix;
    }

    std::string csrfCookieName() const override {
        return appSpecificCookieName("CSRF");
    }

    std::string stateCookieName() const {
        return appSpecificCookieName("STATE");
    }

    std::optional<std::string> getCookie(const std::string& name) const override {
        auto entry = entries_.find(name);
        if (entry != entries_.end()) {
            return entry->second.value;
        }

        auto it = incoming_.find(name);
        if (it == incoming_.end() || name == stateCookieName()) {
            return std::nullopt;
        }
        return it->second;
    }

    void setCookie(
        const std::string& name,
        const std::string& value,
        std::optional<std::chrono::system_clock::time_point> expires
    ) override {
        pending_[name] = Entry{value, expires};
    }

    void deleteCookie(const std::string& name) override {
        pending_[name] = std::nullopt;
    }

    /**
     * @brief Заголовок Set-Cookie для <APP>_STATE
     *
     * nullopt, если за запрос cookie не менялись. Если записей
     * не осталось, физическая cookie удаляется.
     */
    std::optional<std::string> setCookieHeader() const {
        if (pending_.empty()) {
            return std::nullopt;
        }

        auto entries = entries_;
        for (const auto& [name, entry] : pending_) {
            if (entry) {
                entries[name] = *entry;
            } else {
                entries.erase(name);
            }
        }

        if (entries.empty()) {
            return withAttributes(stateCookieName() + "=; Expires=Thu, 01 Jan 1970 00:00:00 GMT; Max-Age=0");
        }

        std::string value;
        std::optional<std::chrono::system_clock::time_point> latest;
        for (const auto& [name, entry] : entries) {
            if (!value.empty()) {
                value.push_back('&');
            }
            value += percentEncode(name) + "=" + percentEncode(entry.value);
            if (entry.expires) {
                value += "@" + std::to_string(utils::toEpochSeconds(*entry.expires));
                latest = latest ? std::max(*latest, *entry.expires) : *entry.expires;
            }
        }

        std::string header = stateCookieName() + "=" + value;
        if (latest) {
            auto maxAge = std::chrono::duration_cast<std::chrono::seconds>(
                *latest - std::chrono::system_clock::now()).count();
            header += "; Expires=" + formatHttpDate(*latest);
            header += "; Max-Age=" + std::to_string(maxAge > 0 ? maxAge : 0);
        }
        return withAttributes(header);
    }

    /**
     * @brief Разобрать заголовок Cookie ("a=1; b=2")
     *
     * Пары без '=' пропускаются, при повторе имени берётся первое значение.
     */
    static std::map<std::string, std::string> parseCookieHeader(const std::string& header) {
        std::map<std::string, std::string> cookies;
        std::size_t pos = 0;
        while (pos < header.size()) {
            auto end = header.find(';', pos);
            auto pair = header.substr(pos, end == std::string::npos ? std::string::npos : end - pos);

            auto eq = pair.find('=');
            if (eq != std::string::npos) {
                auto name = trim(pair.substr(0, eq));
                auto value = trim(pair.substr(eq + 1));
                if (!name.empty()) {
                    cookies.emplace(name, value);
                }
            }

            if (end == std::string::npos) break;
            pos = end + 1;
        }
        return cookies;
    }

private:
    struct Entry {
        std::string value;
        std::optional<std::chrono::system_clock::time_point> expires;
    };

    std::map<std::string, std::string> incoming_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, std::optional<Entry>> pending_;
    std::string appName_;
    bool secure_;

    std::string withAttributes(std::string header) const {
        header += "; Path=/; HttpOnly; SameSite=Strict";
        if (secure_) {
            header += "; Secure";
        }
        return header;
    }

    static std::map<std::string, Entry> parseState(
        const std::string& state,
        std::chrono::system_clock::time_point now
    ) {
        std::map<std::string, Entry> entries;
        std::size_t pos = 0;
        while (pos < state.size()) {
            auto end = state.find('&', pos);
            auto item = state.substr(pos, end == std::string::npos ? std::string::npos : end - pos);

            auto eq = item.find('=');
            if (eq != std::string::npos && eq > 0) {
                auto rest = item.substr(eq + 1);
                auto at = rest.find('@');

                auto name = percentDecode(item.substr(0, eq));
                auto value = percentDecode(rest.substr(0, at));
                std::optional<std::chrono::system_clock::time_point> expires;
                bool valid = name && value && !name->empty();

                if (valid && at != std::string::npos) {
                    auto epoch = parseEpoch(rest.substr(at + 1));
                    valid = epoch.has_value();
                    if (valid) {
                        expires = utils::fromEpochSeconds(*epoch);
                        valid = *expires > now;
                    }
                }
                if (valid) {
                    entries.emplace(*name, Entry{*value, expires});
                }
            }

            if (end == std::string::npos) break;
            pos = end + 1;
        }
        return entries;
    }

    static std::optional<int64_t> parseEpoch(const std::string& text) {
        if (text.empty() || text.size() > 12 ||
            !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            return std::nullopt;
        }
        return std::stoll(text);
    }

    static bool isUnreserved(unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
            || c == '-' || c == '.' || c == '_' || c == '~';
    }

    static std::string percentEncode(const std::string& value) {
        static const char digits[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(value.size());
        for (unsigned char c : value) {
            if (isUnreserved(c)) {
                out.push_back(static_cast<char>(c));
            } else {
                out.push_back('%');
                out.push_back(digits[c >> 4]);
                out.push_back(digits[c & 0x0F]);
            }
        }
        return out;
    }

    static std::optional<std::string> percentDecode(const std::string& value) {
        std::string out;
        out.reserve(value.size());
        for (std::size_t i = 0; i < value.size(); ++i) {
            if (value[i] != '%') {
                out.push_back(value[i]);
                continue;
            }
            if (i + 2 >= value.size()) {
                return std::nullopt;
            }
            int high = hexDigit(value[i + 1]);
            int low = hexDigit(value[i + 2]);
            if (high < 0 || low < 0) {
                return std::nullopt;
            }
            out.push_back(static_cast<char>((high << 4) | low));
            i += 2;
        }
        return out;
    }

    static int hexDigit(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    static std::string formatHttpDate(std::chrono::system_clock::time_point tp) {
        std::time_t time = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&time, &tm);
        char buffer[64];
        std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &tm);
        return buffer;
    }

    static std::string trim(const std::string& value) {
        auto first = value.find_first_not_of(" \t");
        if (first == std::string::npos) {
            return "";
        }
        auto last = value.find_last_not_of(" \t");
        return value.substr(first, last - first + 1);
    }
};

} // namespace webauth::adapters::secondary
