#pragma once

#include <string>

namespace webauth::ports::output {

/**
 * @brief Исходящее письмо
 */
struct MailMessage {
    std::string address;
    std::string subject;
    std::string body;
};

/**
 * @brief Интерфейс отправки почты
 */
class IMailer {
public:
    virtual ~IMailer() = default;

    /**
     * @return true, если письмо принято к отправке
     */
    virtual bool send(const MailMessage& message) = 0;
};

} // namespace webauth::ports::output
