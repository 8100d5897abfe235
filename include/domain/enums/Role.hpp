#pragma once

#include <string>
#include <optional>

namespace webauth::domain {

/**
 * @brief Роль аккаунта
 *
 * Значения упорядочены: чем больше число, тем больше прав.
 * Сравнение ролей выполняется по числовому значению.
 */
enum class Role : int {
    None   = 0,     ///< Обычный пользователь
    Editor = 10,    ///< Редактор
    Admin  = 20     ///< Администратор
};

/**
 * @brief Преобразовать Role в строку
 */
inline std::string toString(Role role) {
    switch (role) {
        case Role::None:   return "NONE";
        case Role::Editor: return "EDITOR";
        case Role::Admin:  return "ADMIN";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Получить числовое значение роли
 */
inline int toValue(Role role) {
    return static_cast<int>(role);
}

/**
 * @brief Преобразовать числовое значение в Role
 * @return Role или nullopt, если значение не соответствует ни одной роли
 */
inline std::optional<Role> roleFromValue(int value) {
    switch (value) {
        case 0:  return Role::None;
        case 10: return Role::Editor;
        case 20: return Role::Admin;
        default: return std::nullopt;
    }
}

/**
 * @brief Проверить, что роль не ниже минимальной
 */
inline bool atLeast(Role role, Role minimum) {
    return toValue(role) >= toValue(minimum);
}

} // namespace webauth::domain
