#pragma once

#include "ports/output/ISessionRepository.hpp"
#include "settings/DbSettings.hpp"
#include "utils/EpochTime.hpp"
#include <pqxx/pqxx>
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <iostream>

namespace webauth::adapters::secondary {

/**
 * @brief Сессии в таблице session_data, значения хранятся JSON-объектом
 */
class PostgresSessionRepository : public ports::output::ISessionRepository {
public:
    explicit PostgresSessionRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresSessionRepository] Connecting to " << settings_->describe() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresSessionRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresSessionRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::Session> findById(const std::string& sessionId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                R"(SELECT session_id, payload::text AS payload,
                          EXTRACT(EPOCH FROM expires_at)::bigint AS exp_epoch,
                          EXTRACT(EPOCH FROM updated_at)::bigint AS upd_epoch
                   FROM session_data WHERE session_id = $1)",
                sessionId
            );
            txn.commit();

            if (result.empty()) return std::nullopt;
            return rowToSession(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionRepository] findById() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool save(const domain::Session& session) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            nlohmann::json payload = session.values;

            txn.exec_params(
                R"(
                    INSERT INTO session_data (session_id, payload, expires_at, updated_at)
                    VALUES ($1, $2::jsonb, to_timestamp($3), NOW())
                    ON CONFLICT (session_id) DO UPDATE SET
                        payload = EXCLUDED.payload,
                        expires_at = EXCLUDED.expires_at,
                        updated_at = NOW()
                )",
                session.sessionId,
                payload.dump(),
                utils::toEpochSeconds(session.expiresAt)
            );
            txn.commit();
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionRepository] save() failed: " << e.what() << std::endl;
            return false;
        }
    }

    bool deleteById(const std::string& sessionId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params("DELETE FROM session_data WHERE session_id = $1", sessionId);
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionRepository] deleteById() failed: " << e.what() << std::endl;
            return false;
        }
    }

    std::size_t deleteExpired() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec("DELETE FROM session_data WHERE expires_at < NOW()");
            txn.commit();
            return static_cast<std::size_t>(result.affected_rows());

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionRepository] deleteExpired() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    domain::Session rowToSession(const pqxx::row& row) const {
        domain::Session session;
        session.sessionId = row["session_id"].as<std::string>();
        session.values = nlohmann::json::parse(row["payload"].as<std::string>())
            .get<std::map<std::string, std::string>>();
        session.expiresAt = utils::fromEpochSeconds(row["exp_epoch"].as<int64_t>());
        session.updatedAt = utils::fromEpochSeconds(row["upd_epoch"].as<int64_t>());
        return session;
    }
};

} // namespace webauth::adapters::secondary
