#pragma once

#include "ports/output/IAccountRoleRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace webauth::adapters::secondary {

class PostgresAccountRoleRepository : public ports::output::IAccountRoleRepository {
public:
    explicit PostgresAccountRoleRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresAccountRoleRepository] Connecting to " << settings_->describe() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresAccountRoleRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRoleRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresAccountRoleRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::AccountRole> findByAccountId(int64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "SELECT id, account_id, role FROM account_role WHERE account_id = $1",
                accountId
            );
            txn.commit();

            if (result.empty()) return std::nullopt;

            auto role = domain::roleFromValue(result[0]["role"].as<int>());
            if (!role) {
                std::cerr << "[PostgresAccountRoleRepository] Unknown role value for account "
                          << accountId << std::endl;
                return std::nullopt;
            }

            domain::AccountRole accountRole(result[0]["account_id"].as<int64_t>(), *role);
            accountRole.id = result[0]["id"].as<int64_t>();
            return accountRole;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRoleRepository] findByAccountId() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool save(domain::AccountRole& accountRole) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                R"(
                    INSERT INTO account_role (account_id, role)
                    VALUES ($1, $2)
                    ON CONFLICT (account_id) DO UPDATE SET role = EXCLUDED.role
                    RETURNING id
                )",
                accountRole.accountId,
                domain::toValue(accountRole.role)
            );
            txn.commit();
            accountRole.id = result[0]["id"].as<int64_t>();
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRoleRepository] save() failed: " << e.what() << std::endl;
            return false;
        }
    }

    bool deleteByAccountId(int64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec_params("DELETE FROM account_role WHERE account_id = $1", accountId);
            txn.commit();
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRoleRepository] deleteByAccountId() failed: " << e.what() << std::endl;
            return false;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

} // namespace webauth::adapters::secondary
