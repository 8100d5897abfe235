#include "adapters/secondary/OpenSslSecurityService.hpp"
#include "utils/Hex.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <vector>

namespace webauth::adapters::secondary {

namespace {

constexpr std::size_t SALT_BYTES = 16;
constexpr std::size_t DERIVED_BYTES = 32;
const std::string HASH_PREFIX = "$pbkdf2-sha256$";

struct ParsedHash {
    int iterations = 0;
    std::string salt;
    std::string derived;
};

// "$pbkdf2-sha256$<iterations>$<salt>$<hash>"
std::optional<ParsedHash> parseHash(const std::string& hash) {
    if (hash.compare(0, HASH_PREFIX.size(), HASH_PREFIX) != 0) {
        return std::nullopt;
    }

    auto rest = hash.substr(HASH_PREFIX.size());
    auto first = rest.find('$');
    if (first == std::string::npos) return std::nullopt;
    auto second = rest.find('$', first + 1);
    if (second == std::string::npos) return std::nullopt;

    auto iterText = rest.substr(0, first);
    if (iterText.empty() || iterText.size() > 7 ||
        !std::all_of(iterText.begin(), iterText.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }

    ParsedHash parsed;
    parsed.iterations = std::stoi(iterText);
    if (parsed.iterations < 1 || parsed.iterations > OpenSslSecurityService::MAX_ITERATIONS) {
        return std::nullopt;
    }

    auto salt = utils::Hex::decode(rest.substr(first + 1, second - first - 1));
    auto derived = utils::Hex::decode(rest.substr(second + 1));
    if (!salt || !derived || salt->size() != SALT_BYTES || derived->size() != DERIVED_BYTES) {
        return std::nullopt;
    }

    parsed.salt = *salt;
    parsed.derived = *derived;
    return parsed;
}

std::string randomBytes(std::size_t length) {
    std::vector<unsigned char> buffer(length);
    if (length > 0 && RAND_bytes(buffer.data(), static_cast<int>(length)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return std::string(buffer.begin(), buffer.end());
}

} // namespace

OpenSslSecurityService::OpenSslSecurityService(std::shared_ptr<settings::WebAuthSettings> settings)
    : iterations_(settings->getHashIterations())
{
    if (iterations_ < 1 || iterations_ > MAX_ITERATIONS) {
        throw std::invalid_argument("Hash iterations out of range: " + std::to_string(iterations_));
    }
    std::cout << "[OpenSslSecurityService] Created (iterations=" << iterations_ << ")" << std::endl;
}

std::string OpenSslSecurityService::hashPassword(const std::string& password) {
    auto salt = randomBytes(SALT_BYTES);
    auto derived = derive(password, salt, iterations_);

    return HASH_PREFIX + std::to_string(iterations_) + "$" +
           utils::Hex::encode(salt) + "$" + utils::Hex::encode(derived);
}

bool OpenSslSecurityService::verifyPassword(const std::string& password, const std::string& hash) {
    return verifyHash(password, hash, MAX_ITERATIONS);
}

bool OpenSslSecurityService::verifyHash(
    const std::string& password,
    const std::string& hash,
    int maxIterations
) const {
    if (hash.empty()) {
        return false;
    }

    auto parsed = parseHash(hash);
    if (!parsed || parsed->iterations > maxIterations) {
        return false;
    }

    auto derived = derive(password, parsed->salt, parsed->iterations);
    return CRYPTO_memcmp(derived.data(), parsed->derived.data(), DERIVED_BYTES) == 0;
}

std::string OpenSslSecurityService::generateToken(std::size_t byteLength) {
    return utils::Hex::encode(randomBytes(byteLength));
}

domain::CsrfToken OpenSslSecurityService::generateCsrfToken() {
    auto token = generateToken();
    return domain::CsrfToken(token, obfuscate(hashPassword(token)));
}

bool OpenSslSecurityService::verifyCsrfToken(const domain::CsrfToken& csrfToken) {
    if (csrfToken.token.empty()) {
        return false;
    }
    // Хэш пришёл из cookie клиента: больше итераций, чем выпускает сервис, не считаем
    return verifyHash(csrfToken.token, deobfuscate(csrfToken.cookieValue), iterations_);
}

std::string OpenSslSecurityService::fingerprint(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digestLength, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed");
    }

    // 4 * ceil(n / 3) + терминатор
    std::vector<unsigned char> encoded(4 * ((digestLength + 2) / 3) + 1);
    int encodedLength = EVP_EncodeBlock(encoded.data(), digest, static_cast<int>(digestLength));

    std::string result(encoded.begin(), encoded.begin() + encodedLength);
    while (!result.empty() && result.back() == '=') {
        result.pop_back();
    }
    return result;
}

std::string OpenSslSecurityService::obfuscate(const std::string& data) {
    std::string reversed(data.rbegin(), data.rend());
    return utils::Hex::encode(reversed);
}

std::string OpenSslSecurityService::deobfuscate(const std::string& data) {
    auto decoded = utils::Hex::decode(data);
    if (!decoded) {
        return "";
    }
    return std::string(decoded->rbegin(), decoded->rend());
}

std::string OpenSslSecurityService::derive(
    const std::string& password,
    const std::string& salt,
    int iterations
) const {
    unsigned char out[DERIVED_BYTES];
    int ok = PKCS5_PBKDF2_HMAC(
        password.data(), static_cast<int>(password.size()),
        reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
        iterations,
        EVP_sha256(),
        static_cast<int>(DERIVED_BYTES),
        out
    );
    if (ok != 1) {
        throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
    }
    return std::string(reinterpret_cast<const char*>(out), DERIVED_BYTES);
}

} // namespace webauth::adapters::secondary
