#pragma once

#include "ports/output/ISecurityService.hpp"
#include "settings/WebAuthSettings.hpp"
#include <memory>
#include <string>

namespace webauth::adapters::secondary {

/**
 * @brief Реализация ISecurityService на OpenSSL
 *
 * - Пароли: PBKDF2-HMAC-SHA256, соль 16 байт, формат
 *   "$pbkdf2-sha256$<iterations>$<salt hex>$<hash hex>"
 * - Токены: RAND_bytes, hex
 * - CSRF: token + obfuscate(hashPassword(token)) для cookie; при проверке
 *   число итераций в хэше из cookie не может превышать настроенное
 * - Отпечаток: MD5 → base64 без '='
 */
class OpenSslSecurityService : public ports::output::ISecurityService {
public:
    static constexpr int MAX_ITERATIONS = 1000000;

    explicit OpenSslSecurityService(std::shared_ptr<settings::WebAuthSettings> settings);

    std::string hashPassword(const std::string& password) override;
    bool verifyPassword(const std::string& password, const std::string& hash) override;
    std::string generateToken(std::size_t byteLength = TOKEN_DEFAULT_BYTES) override;
    domain::CsrfToken generateCsrfToken() override;
    bool verifyCsrfToken(const domain::CsrfToken& csrfToken) override;
    std::string fingerprint(const std::string& data) override;

    /**
     * @brief Обратимое преобразование: разворот байтов + hex
     */
    static std::string obfuscate(const std::string& data);

    /**
     * @brief Обратное к obfuscate(); пустая строка для некорректного ввода
     */
    static std::string deobfuscate(const std::string& data);

private:
    int iterations_;

    bool verifyHash(const std::string& password, const std::string& hash, int maxIterations) const;

    std::string derive(const std::string& password, const std::string& salt, int iterations) const;
};

} // namespace webauth::adapters::secondary
