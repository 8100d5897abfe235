#pragma once

#include "ports/output/IPersistentLoginRepository.hpp"
#include "settings/DbSettings.hpp"
#include "utils/EpochTime.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace webauth::adapters::secondary {

/**
 * @brief persistent_login: индекс по lookup_key, UNIQUE (account_id, client_signature)
 */
class PostgresPersistentLoginRepository : public ports::output::IPersistentLoginRepository {
public:
    explicit PostgresPersistentLoginRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresPersistentLoginRepository] Connecting to " << settings_->describe() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresPersistentLoginRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresPersistentLoginRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresPersistentLoginRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::PersistentLogin> findByLookupKey(const std::string& lookupKey) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) + " WHERE lookup_key = $1",
                lookupKey
            );
            txn.commit();

            if (result.empty()) return std::nullopt;
            return rowToPersistentLogin(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPersistentLoginRepository] findByLookupKey() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::PersistentLogin> findByAccountAndSignature(
        int64_t accountId,
        const std::string& clientSignature
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) + " WHERE account_id = $1 AND client_signature = $2",
                accountId,
                clientSignature
            );
            txn.commit();

            if (result.empty()) return std::nullopt;
            return rowToPersistentLogin(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPersistentLoginRepository] findByAccountAndSignature() failed: "
                      << e.what() << std::endl;
            throw;
        }
    }

    bool save(domain::PersistentLogin& persistentLogin) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            if (persistentLogin.id == 0) {
                auto result = txn.exec_params(
                    R"(
                        INSERT INTO persistent_login
                            (account_id, client_signature, lookup_key, token_hash, time_expires)
                        VALUES ($1, $2, $3, $4, to_timestamp($5))
                        RETURNING id
                    )",
                    persistentLogin.accountId,
                    persistentLogin.clientSignature,
                    persistentLogin.lookupKey,
                    persistentLogin.tokenHash,
                    utils::toEpochSeconds(persistentLogin.timeExpires)
                );
                txn.commit();
                persistentLogin.id = result[0]["id"].as<int64_t>();
                return true;
            }

            auto result = txn.exec_params(
                R"(
                    UPDATE persistent_login SET
                        lookup_key = $2,
                        token_hash = $3,
                        time_expires = to_timestamp($4)
                    WHERE id = $1
                )",
                persistentLogin.id,
                persistentLogin.lookupKey,
                persistentLogin.tokenHash,
                utils::toEpochSeconds(persistentLogin.timeExpires)
            );
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPersistentLoginRepository] save() failed: " << e.what() << std::endl;
            return false;
        }
    }

    bool deleteById(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params("DELETE FROM persistent_login WHERE id = $1", id);
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPersistentLoginRepository] deleteById() failed: " << e.what() << std::endl;
            return false;
        }
    }

    bool deleteByAccountId(int64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec_params("DELETE FROM persistent_login WHERE account_id = $1", accountId);
            txn.commit();
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPersistentLoginRepository] deleteByAccountId() failed: " << e.what() << std::endl;
            return false;
        }
    }

    std::size_t deleteExpired(std::chrono::system_clock::time_point now) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "DELETE FROM persistent_login WHERE time_expires < to_timestamp($1)",
                utils::toEpochSeconds(now)
            );
            txn.commit();
            return static_cast<std::size_t>(result.affected_rows());

        } catch (const std::exception& e) {
            std::cerr << "[PostgresPersistentLoginRepository] deleteExpired() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    static constexpr const char* SELECT_COLUMNS =
        "SELECT id, account_id, client_signature, lookup_key, token_hash, "
        "EXTRACT(EPOCH FROM time_expires)::bigint AS expires_epoch FROM persistent_login";

    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    domain::PersistentLogin rowToPersistentLogin(const pqxx::row& row) const {
        domain::PersistentLogin persistentLogin(
            row["account_id"].as<int64_t>(),
            row["client_signature"].as<std::string>()
        );
        persistentLogin.id = row["id"].as<int64_t>();
        persistentLogin.lookupKey = row["lookup_key"].as<std::string>();
        persistentLogin.tokenHash = row["token_hash"].as<std::string>();
        persistentLogin.timeExpires = utils::fromEpochSeconds(row["expires_epoch"].as<int64_t>());
        return persistentLogin;
    }
};

} // namespace webauth::adapters::secondary
