#pragma once

#include "ports/output/IPendingAccountRepository.hpp"
#include "settings/DbSettings.hpp"
#include "utils/EpochTime.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace webauth::adapters::secondary {

class PostgresPendingAccountRepository : public ports::output::IPendingAccountRepository {
public:
    explicit PostgresPendingAccountRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresPendingAccountRepository] Connecting to " << settings_->describe() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresPendingAccountRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresPendingAccountRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresPendingAccountRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::PendingAccount> findByActivationCode(const std::string& activationCode) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                R"(SELECT id, email, password_hash, display_name, activation_code,
                          EXTRACT(EPOCH FROM time_registered)::bigint AS registered_epoch
                   FROM pending_account WHERE activation_code = $1)",
                activationCode
            );
            txn.commit();

            if (result.empty()) return std::nullopt;

            const auto& row = result[0];
            domain::PendingAccount pendingAccount;
            pendingAccount.id = row["id"].as<int64_t>();
            pendingAccount.email = row["email"].as<std::string>();
            pendingAccount.passwordHash = row["password_hash"].as<std::string>();
            pendingAccount.displayName = row["display_name"].as<std::string>();
            pendingAccount.activationCode = row["activation_code"].as<std::string>();
            pendingAccount.timeRegistered = utils::fromEpochSeconds(row["registered_epoch"].as<int64_t>());
            return pendingAccount;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPendingAccountRepository] findByActivationCode() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool existsByEmail(const std::string& email) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params("SELECT 1 FROM pending_account WHERE email = $1", email);
            txn.commit();
            return !result.empty();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPendingAccountRepository] existsByEmail() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool save(domain::PendingAccount& pendingAccount) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                R"(
                    INSERT INTO pending_account
                        (email, password_hash, display_name, activation_code, time_registered)
                    VALUES ($1, $2, $3, $4, to_timestamp($5))
                    RETURNING id
                )",
                pendingAccount.email,
                pendingAccount.passwordHash,
                pendingAccount.displayName,
                pendingAccount.activationCode,
                utils::toEpochSeconds(pendingAccount.timeRegistered)
            );
            txn.commit();
            pendingAccount.id = result[0]["id"].as<int64_t>();
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPendingAccountRepository] save() failed: " << e.what() << std::endl;
            return false;
        }
    }

    bool deleteById(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params("DELETE FROM pending_account WHERE id = $1", id);
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPendingAccountRepository] deleteById() failed: " << e.what() << std::endl;
            return false;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

} // namespace webauth::adapters::secondary
