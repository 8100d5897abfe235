#pragma once

#include "ports/output/ISecurityService.hpp"
#include "utils/Hex.hpp"
#include <cctype>
#include <regex>
#include <string>

namespace webauth::application {

/**
 * @brief Проверка пользовательского ввода сценариев аутентификации
 */
class InputValidator {
public:
    static constexpr std::size_t EMAIL_MAX_LENGTH = 254;
    static constexpr std::size_t DISPLAY_NAME_MAX_LENGTH = 50;

    static bool isEmail(const std::string& value) {
        if (value.empty() || value.size() > EMAIL_MAX_LENGTH) {
            return false;
        }
        static const std::regex pattern(R"(^[^\s@]+@[^\s@]+\.[^\s@]+$)");
        return std::regex_match(value, pattern);
    }

    static bool isPassword(const std::string& value) {
        return value.size() >= ports::output::ISecurityService::PASSWORD_MIN_LENGTH
            && value.size() <= ports::output::ISecurityService::PASSWORD_MAX_LENGTH;
    }

    /**
     * @brief Отображаемое имя
     *
     * Начинается с буквы или цифры, далее буквы, цифры, пробел, точка,
     * дефис, апостроф; не длиннее 50 символов. Байты UTF-8 вне ASCII
     * считаются буквами.
     */
    static bool isDisplayName(const std::string& value) {
        if (value.empty()) {
            return false;
        }

        std::size_t characters = 0;
        for (std::size_t i = 0; i < value.size(); ++i) {
            auto c = static_cast<unsigned char>(value[i]);
            bool continuation = (c & 0xC0) == 0x80;
            if (!continuation) {
                ++characters;
            }

            bool alnum = std::isalnum(c) || c >= 0x80;
            if (i == 0 && !alnum) {
                return false;
            }
            if (!alnum && c != ' ' && c != '.' && c != '-' && c != '\'') {
                return false;
            }
        }
        return characters <= DISPLAY_NAME_MAX_LENGTH;
    }

    /**
     * @brief Код активации / сброса: ровно 64 hex-символа в нижнем регистре
     */
    static bool isToken(const std::string& value) {
        return value.size() == ports::output::ISecurityService::TOKEN_DEFAULT_BYTES * 2
            && utils::Hex::isLowerHex(value);
    }
};

} // namespace webauth::application
