#pragma once

#include "ports/output/IMailer.hpp"
#include "settings/MailerSettings.hpp"
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>

namespace webauth::adapters::secondary {

/**
 * @brief Fake реализация IMailer
 *
 * Ничего не отправляет: пишет письмо в лог и запоминает его.
 * Используется локально и в тестах.
 */
class FakeMailerAdapter : public ports::output::IMailer {
public:
    explicit FakeMailerAdapter(std::shared_ptr<settings::MailerSettings> settings)
        : sender_(settings->getSender())
    {
        std::cout << "[FakeMailerAdapter] Created (from=" << sender_ << ")" << std::endl;
    }

    bool send(const ports::output::MailMessage& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failing_) {
            std::cerr << "[FakeMailerAdapter] Delivery to " << message.address << " failed" << std::endl;
            return false;
        }

        std::cout << "[FakeMailerAdapter] " << sender_ << " -> " << message.address
                  << ": " << message.subject << std::endl;
        sent_.push_back(message);
        return true;
    }

    // Для тестов
    std::vector<ports::output::MailMessage> sentMessages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    void setFailing(bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

private:
    std::string sender_;
    mutable std::mutex mutex_;
    std::vector<ports::output::MailMessage> sent_;
    bool failing_ = false;
};

} // namespace webauth::adapters::secondary
