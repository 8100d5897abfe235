#pragma once

#include <IResponse.hpp>
#include "adapters/primary/RequestScopeFactory.hpp"
#include "adapters/secondary/ResponseCookieJar.hpp"
#include "guards/CompositeGuard.hpp"
#include "guards/FormTokenGuard.hpp"
#include "guards/HeaderTokenGuard.hpp"
#include "ports/input/IAuthService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace webauth::adapters::primary::http {

inline int toHttpStatus(ports::input::AuthStatus status) {
    switch (status) {
        case ports::input::AuthStatus::Ok:                 return 200;
        case ports::input::AuthStatus::InvalidInput:       return 400;
        case ports::input::AuthStatus::InvalidCredentials: return 401;
        case ports::input::AuthStatus::NotLoggedIn:        return 401;
        case ports::input::AuthStatus::Forbidden:          return 403;
        case ports::input::AuthStatus::NotFound:           return 404;
        case ports::input::AuthStatus::AlreadyLoggedIn:    return 409;
        case ports::input::AuthStatus::Conflict:           return 409;
        default: return 500;
    }
}

/**
 * @brief Перенести накопленные cookie в ответ
 *
 * Все cookie приложения упакованы в один заголовок Set-Cookie.
 */
inline void applyCookies(IResponse& res, const secondary::ResponseCookieJar& cookies) {
    if (auto header = cookies.setCookieHeader()) {
        res.setHeader("Set-Cookie", *header);
    }
}

inline void sendJson(IResponse& res, int status, const nlohmann::json& body) {
    res.setResult(status, "application/json", body.dump());
}

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    sendJson(res, status, error);
}

/**
 * @brief Ответ по результату сценария: {"message"} или {"error"}
 */
inline void sendResult(IResponse& res, const ports::input::AuthResult& result,
                       const secondary::ResponseCookieJar& cookies) {
    applyCookies(res, cookies);
    if (!result.success()) {
        sendError(res, toHttpStatus(result.status), result.message);
        return;
    }

    nlohmann::json body;
    body["message"] = result.message;
    sendJson(res, 200, body);
}

/**
 * @brief CSRF токен из поля формы или из заголовка x-csrf-token
 */
inline std::shared_ptr<guards::IGuard> csrfGuard(const RequestScope& scope) {
    return std::make_shared<guards::AnyGuard>(
        std::make_shared<guards::FormTokenGuard>(*scope.request, scope.cookies, scope.security),
        std::make_shared<guards::HeaderTokenGuard>(*scope.request, scope.cookies, scope.security)
    );
}

} // namespace webauth::adapters::primary::http
