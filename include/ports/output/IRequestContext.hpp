#pragma once

#include <string>
#include <optional>

namespace webauth::ports::output {

/**
 * @brief Доступ к данным входящего HTTP запроса
 */
class IRequestContext {
public:
    virtual ~IRequestContext() = default;

    /**
     * @brief Поле формы (JSON или application/x-www-form-urlencoded)
     */
    virtual std::optional<std::string> formField(const std::string& name) const = 0;

    /**
     * @brief Заголовок запроса, имя без учёта регистра
     */
    virtual std::optional<std::string> header(const std::string& name) const = 0;

    /**
     * @brief IP адрес клиента
     */
    virtual std::string clientAddress() const = 0;

    std::string userAgent() const {
        return header("user-agent").value_or("");
    }
};

} // namespace webauth::ports::output
