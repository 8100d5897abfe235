#pragma once

#include <IRequest.hpp>
#include "ports/output/IRequestContext.hpp"
#include "adapters/secondary/ResponseCookieJar.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <map>
#include <string>

namespace webauth::adapters::primary {

/**
 * @brief IRequestContext поверх IRequest из http-server-core
 *
 * Данные копируются при создании, поэтому контекст можно держать
 * в shared_ptr дольше, чем живёт ссылка на запрос.
 *
 * Поля формы:
 * - application/x-www-form-urlencoded: "a=1&b=2" с %-декодированием;
 * - иначе тело разбирается как JSON-объект (строки как есть,
 *   bool как "true"/"false", числа через dump()).
 */
class HttpRequestContext : public ports::output::IRequestContext {
public:
    explicit HttpRequestContext(const IRequest& req)
        : clientAddress_(req.getIp())
    {
        for (const auto& [name, value] : req.getHeaders()) {
            headers_.emplace(toLower(name), value);
        }

        auto body = req.getBody();
        auto contentType = header("content-type").value_or("");
        if (contentType.find("application/x-www-form-urlencoded") != std::string::npos) {
            fields_ = parseUrlEncoded(body);
        } else if (!body.empty()) {
            parseJson(body);
        }
    }

    std::optional<std::string> formField(const std::string& name) const override {
        auto it = fields_.find(name);
        if (it == fields_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::string> header(const std::string& name) const override {
        auto it = headers_.find(toLower(name));
        if (it == headers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::string clientAddress() const override {
        return clientAddress_;
    }

    /**
     * @brief Тело не пустое, но не является JSON-объектом
     */
    bool hasMalformedBody() const {
        return malformedBody_;
    }

    std::map<std::string, std::string> cookies() const {
        return secondary::ResponseCookieJar::parseCookieHeader(header("cookie").value_or(""));
    }

    static std::map<std::string, std::string> parseUrlEncoded(const std::string& body) {
        std::map<std::string, std::string> fields;
        std::size_t start = 0;
        while (start < body.size()) {
            auto amp = body.find('&', start);
            auto pair = body.substr(start, amp == std::string::npos ? std::string::npos : amp - start);

            auto eq = pair.find('=');
            auto key = urlDecode(pair.substr(0, eq));
            auto value = eq == std::string::npos ? std::string() : urlDecode(pair.substr(eq + 1));
            if (!key.empty()) {
                fields.emplace(key, value);
            }

            if (amp == std::string::npos) break;
            start = amp + 1;
        }
        return fields;
    }

private:
    std::string clientAddress_;
    std::map<std::string, std::string> headers_;
    std::map<std::string, std::string> fields_;
    bool malformedBody_ = false;

    void parseJson(const std::string& body) {
        auto json = nlohmann::json::parse(body, nullptr, false);
        if (json.is_discarded() || !json.is_object()) {
            malformedBody_ = true;
            return;
        }

        for (auto it = json.begin(); it != json.end(); ++it) {
            if (it->is_string()) {
                fields_[it.key()] = it->get<std::string>();
            } else if (it->is_boolean()) {
                fields_[it.key()] = it->get<bool>() ? "true" : "false";
            } else if (it->is_number()) {
                fields_[it.key()] = it->dump();
            }
        }
    }

    static std::string urlDecode(const std::string& value) {
        std::string out;
        out.reserve(value.size());
        for (std::size_t i = 0; i < value.size(); ++i) {
            char c = value[i];
            if (c == '+') {
                out.push_back(' ');
            } else if (c == '%' && i + 2 < value.size()
                       && std::isxdigit(static_cast<unsigned char>(value[i + 1]))
                       && std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
                out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
                i += 2;
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

    static std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }
};

} // namespace webauth::adapters::primary
