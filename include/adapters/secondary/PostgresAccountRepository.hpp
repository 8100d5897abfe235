#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "settings/DbSettings.hpp"
#include "utils/EpochTime.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace webauth::adapters::secondary {

class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresAccountRepository] Connecting to " << settings_->describe() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresAccountRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresAccountRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::Account> findById(int64_t id) override {
        return findOne("id = $1", std::to_string(id), "findById");
    }

    std::optional<domain::Account> findByEmail(const std::string& email) override {
        return findOne("email = $1", email, "findByEmail");
    }

    bool existsByEmail(const std::string& email) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "SELECT 1 FROM account WHERE email = $1",
                email
            );
            txn.commit();
            return !result.empty();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] existsByEmail() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool save(domain::Account& account) override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::optional<int64_t> lastLogin;
        if (account.timeLastLogin) {
            lastLogin = utils::toEpochSeconds(*account.timeLastLogin);
        }

        try {
            pqxx::work txn(*connection_);

            if (account.id == 0) {
                auto result = txn.exec_params(
                    R"(
                        INSERT INTO account (email, password_hash, display_name, time_activated, time_last_login)
                        VALUES ($1, $2, $3, to_timestamp($4), to_timestamp($5))
                        RETURNING id
                    )",
                    account.email,
                    account.passwordHash,
                    account.displayName,
                    utils::toEpochSeconds(account.timeActivated),
                    lastLogin
                );
                txn.commit();
                account.id = result[0]["id"].as<int64_t>();
                return true;
            }

            auto result = txn.exec_params(
                R"(
                    UPDATE account SET
                        email = $2,
                        password_hash = $3,
                        display_name = $4,
                        time_activated = to_timestamp($5),
                        time_last_login = to_timestamp($6)
                    WHERE id = $1
                )",
                account.id,
                account.email,
                account.passwordHash,
                account.displayName,
                utils::toEpochSeconds(account.timeActivated),
                lastLogin
            );
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] save() failed: " << e.what() << std::endl;
            return false;
        }
    }

    bool deleteById(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params("DELETE FROM account WHERE id = $1", id);
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] deleteById() failed: " << e.what() << std::endl;
            return false;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    std::optional<domain::Account> findOne(
        const std::string& condition,
        const std::string& value,
        const char* operation
    ) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                R"(SELECT id, email, password_hash, display_name,
                          EXTRACT(EPOCH FROM time_activated)::bigint AS activated_epoch,
                          EXTRACT(EPOCH FROM time_last_login)::bigint AS last_login_epoch
                   FROM account WHERE )" + condition,
                value
            );
            txn.commit();

            if (result.empty()) return std::nullopt;
            return rowToAccount(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] " << operation << "() failed: " << e.what() << std::endl;
            throw;
        }
    }

    domain::Account rowToAccount(const pqxx::row& row) const {
        domain::Account account;
        account.id = row["id"].as<int64_t>();
        account.email = row["email"].as<std::string>();
        account.passwordHash = row["password_hash"].is_null() ? "" : row["password_hash"].as<std::string>();
        account.displayName = row["display_name"].as<std::string>();
        account.timeActivated = utils::fromEpochSeconds(row["activated_epoch"].as<int64_t>());
        if (!row["last_login_epoch"].is_null()) {
            account.timeLastLogin = utils::fromEpochSeconds(row["last_login_epoch"].as<int64_t>());
        }
        return account;
    }
};

} // namespace webauth::adapters::secondary
