#pragma once

#include "ports/output/IPasswordResetRepository.hpp"
#include "settings/DbSettings.hpp"
#include "utils/EpochTime.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace webauth::adapters::secondary {

class PostgresPasswordResetRepository : public ports::output::IPasswordResetRepository {
public:
    explicit PostgresPasswordResetRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresPasswordResetRepository] Connecting to " << settings_->describe() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresPasswordResetRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresPasswordResetRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresPasswordResetRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::PasswordReset> findByResetCode(const std::string& resetCode) override {
        return findOne("reset_code = $1", resetCode, "findByResetCode");
    }

    std::optional<domain::PasswordReset> findByAccountId(int64_t accountId) override {
        return findOne("account_id = $1", std::to_string(accountId), "findByAccountId");
    }

    bool save(domain::PasswordReset& passwordReset) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                R"(
                    INSERT INTO password_reset (account_id, reset_code, time_requested)
                    VALUES ($1, $2, to_timestamp($3))
                    ON CONFLICT (account_id) DO UPDATE SET
                        reset_code = EXCLUDED.reset_code,
                        time_requested = EXCLUDED.time_requested
                    RETURNING id
                )",
                passwordReset.accountId,
                passwordReset.resetCode,
                utils::toEpochSeconds(passwordReset.timeRequested)
            );
            txn.commit();
            passwordReset.id = result[0]["id"].as<int64_t>();
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPasswordResetRepository] save() failed: " << e.what() << std::endl;
            return false;
        }
    }

    bool deleteById(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params("DELETE FROM password_reset WHERE id = $1", id);
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPasswordResetRepository] deleteById() failed: " << e.what() << std::endl;
            return false;
        }
    }

    bool deleteByAccountId(int64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec_params("DELETE FROM password_reset WHERE account_id = $1", accountId);
            txn.commit();
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPasswordResetRepository] deleteByAccountId() failed: " << e.what() << std::endl;
            return false;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    std::optional<domain::PasswordReset> findOne(
        const std::string& condition,
        const std::string& value,
        const char* operation
    ) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                R"(SELECT id, account_id, reset_code,
                          EXTRACT(EPOCH FROM time_requested)::bigint AS requested_epoch
                   FROM password_reset WHERE )" + condition,
                value
            );
            txn.commit();

            if (result.empty()) return std::nullopt;

            const auto& row = result[0];
            domain::PasswordReset passwordReset;
            passwordReset.id = row["id"].as<int64_t>();
            passwordReset.accountId = row["account_id"].as<int64_t>();
            passwordReset.resetCode = row["reset_code"].as<std::string>();
            passwordReset.timeRequested = utils::fromEpochSeconds(row["requested_epoch"].as<int64_t>());
            return passwordReset;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPasswordResetRepository] " << operation << "() failed: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace webauth::adapters::secondary
