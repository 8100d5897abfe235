#pragma once

#include "domain/Session.hpp"
#include <string>
#include <optional>
#include <cstddef>

namespace webauth::ports::output {

/**
 * @brief Интерфейс репозитория серверных сессий
 */
class ISessionRepository {
public:
    virtual ~ISessionRepository() = default;

    virtual std::optional<domain::Session> findById(const std::string& sessionId) = 0;

    /**
     * @return false при ошибке хранилища
     */
    virtual bool save(const domain::Session& session) = 0;

    virtual bool deleteById(const std::string& sessionId) = 0;

    /**
     * @return Количество удалённых сессий
     */
    virtual std::size_t deleteExpired() = 0;
};

} // namespace webauth::ports::output
