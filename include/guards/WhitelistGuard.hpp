#pragma once

#include "guards/IGuard.hpp"
#include "ports/output/IRequestContext.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace webauth::guards {

/**
 * @brief Допуск по IPv4 адресу клиента
 *
 * Элемент списка: точный адрес ("10.0.0.5") или CIDR ("10.0.0.0/24").
 * Пустой список запрещает всё. Адреса не-IPv4 не совпадают ни с чем.
 */
class WhitelistGuard : public IGuard {
public:
    WhitelistGuard(
        std::vector<std::string> whitelist,
        const ports::output::IRequestContext& request
    ) : whitelist_(std::move(whitelist))
      , clientAddress_(request.clientAddress())
    {}

    bool verify() override {
        if (whitelist_.empty()) {
            return false;
        }

        auto client = parseIpv4(clientAddress_);
        if (!client) {
            return false;
        }

        for (const auto& entry : whitelist_) {
            if (matches(*client, entry)) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Разобрать IPv4 адрес в точечной нотации
     */
    static std::optional<uint32_t> parseIpv4(const std::string& address) {
        uint32_t result = 0;
        int octets = 0;
        std::size_t pos = 0;

        while (true) {
            std::size_t end = address.find('.', pos);
            std::string part = address.substr(pos, end == std::string::npos ? std::string::npos : end - pos);

            if (part.empty() || part.size() > 3 || octets == 4) return std::nullopt;
            for (char c : part) {
                if (c < '0' || c > '9') return std::nullopt;
            }
            int value = std::stoi(part);
            if (value > 255) return std::nullopt;

            result = (result << 8) | static_cast<uint32_t>(value);
            ++octets;

            if (end == std::string::npos) break;
            pos = end + 1;
        }

        if (octets != 4) {
            return std::nullopt;
        }
        return result;
    }

private:
    std::vector<std::string> whitelist_;
    std::string clientAddress_;

    static bool matches(uint32_t client, const std::string& entry) {
        auto slash = entry.find('/');
        if (slash == std::string::npos) {
            auto address = parseIpv4(entry);
            return address && *address == client;
        }

        auto network = parseIpv4(entry.substr(0, slash));
        auto bitsText = entry.substr(slash + 1);
        if (!network || bitsText.empty() || bitsText.size() > 2) {
            return false;
        }
        for (char c : bitsText) {
            if (c < '0' || c > '9') return false;
        }

        int bits = std::stoi(bitsText);
        if (bits > 32) {
            return false;
        }

        // Сдвиг на 32 для uint32_t не определён, /0 обрабатывается отдельно
        uint32_t mask = bits == 0 ? 0u : ~0u << (32 - bits);
        return (client & mask) == (*network & mask);
    }
};

} // namespace webauth::guards
