#pragma once

#include "guards/IGuard.hpp"
#include "ports/input/IAccountService.hpp"
#include <memory>
#include <optional>

namespace webauth::guards {

/**
 * @brief Допуск только для вошедшего пользователя с ролью не ниже заданной
 *
 * Отсутствие роли в сессии равносильно Role::None.
 */
class SessionGuard : public IGuard {
public:
    explicit SessionGuard(
        std::shared_ptr<ports::input::IAccountService> accountService,
        std::optional<domain::Role> minimumRole = std::nullopt
    ) : accountService_(std::move(accountService))
      , minimumRole_(minimumRole)
    {}

    bool verify() override {
        if (!accountService_->loggedInAccount()) {
            return false;
        }
        if (!minimumRole_) {
            return true;
        }
        auto role = accountService_->loggedInAccountRole().value_or(domain::Role::None);
        return domain::atLeast(role, *minimumRole_);
    }

private:
    std::shared_ptr<ports::input::IAccountService> accountService_;
    std::optional<domain::Role> minimumRole_;
};

} // namespace webauth::guards
