#pragma once

#include <openssl/crypto.h>
#include <openssl/err.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <optional>
#include <vector>

namespace webauth::utils {

/**
 * @brief Кодирование и декодирование hex поверх OPENSSL_buf2hexstr_ex / OPENSSL_hexstr2buf_ex
 *
 * encode() отдаёт строчные цифры. decode() не бросает исключений:
 * нечётная длина или символ вне [0-9a-fA-F] дают nullopt.
 */
class Hex {
public:
    static std::string encode(const unsigned char* data, std::size_t length) {
        if (length == 0) {
            return "";
        }

        std::vector<char> buffer(length * 2 + 1);
        std::size_t written = 0;
        if (OPENSSL_buf2hexstr_ex(buffer.data(), buffer.size(), &written, data, length, '\0') != 1) {
            ERR_clear_error();
            return "";
        }

        // written включает завершающий '\0'
        std::string out(buffer.data(), written > 0 ? written - 1 : 0);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    static std::string encode(const std::string& data) {
        return encode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
    }

    static std::optional<std::string> decode(const std::string& hex) {
        if (hex.empty()) {
            return std::string();
        }
        if (hex.size() % 2 != 0 || hex.find('\0') != std::string::npos) {
            return std::nullopt;
        }

        std::vector<unsigned char> buffer(hex.size() / 2);
        std::size_t length = 0;
        if (OPENSSL_hexstr2buf_ex(buffer.data(), buffer.size(), &length, hex.c_str(), '\0') != 1) {
            ERR_clear_error();
            return std::nullopt;
        }
        return std::string(buffer.begin(), buffer.begin() + length);
    }

    static bool isLowerHex(const std::string& value) {
        for (char c : value) {
            if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
                return false;
            }
        }
        return true;
    }
};

} // namespace webauth::utils
