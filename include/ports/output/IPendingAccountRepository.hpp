#pragma once

#include "domain/PendingAccount.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace webauth::ports::output {

/**
 * @brief Интерфейс репозитория неактивированных регистраций
 */
class IPendingAccountRepository {
public:
    virtual ~IPendingAccountRepository() = default;

    virtual std::optional<domain::PendingAccount> findByActivationCode(const std::string& activationCode) = 0;
    virtual bool existsByEmail(const std::string& email) = 0;
    virtual bool save(domain::PendingAccount& pendingAccount) = 0;
    virtual bool deleteById(int64_t id) = 0;
};

} // namespace webauth::ports::output
