#pragma once

#include <IHttpHandler.hpp>
#include "utils/EpochTime.hpp"
#include <nlohmann/json.hpp>
#include <chrono>

namespace webauth::adapters::primary {

/**
 * @brief GET /health
 *
 * Не трогает БД и сессию: отвечает, пока процесс принимает запросы.
 */
class HealthHandler : public IHttpHandler {
public:
    HealthHandler() : startedAt_(std::chrono::system_clock::now()) {}

    void handle(IRequest& /*req*/, IResponse& res) override {
        auto now = std::chrono::system_clock::now();

        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "webauth-service";
        response["version"] = "1.0.0";
        response["time"] = utils::toEpochSeconds(now);
        response["uptimeSeconds"] =
            std::chrono::duration_cast<std::chrono::seconds>(now - startedAt_).count();

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::chrono::system_clock::time_point startedAt_;
};

} // namespace webauth::adapters::primary
