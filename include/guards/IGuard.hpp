#pragma once

namespace webauth::guards {

/**
 * @brief Предикат допуска запроса
 *
 * verify() возвращает false для отказа и никогда не бросает исключений
 * из-за данных запроса. Исключение означает сбой инфраструктуры.
 */
class IGuard {
public:
    virtual ~IGuard() = default;

    virtual bool verify() = 0;
};

} // namespace webauth::guards
