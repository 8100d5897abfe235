#pragma once

#include <string>
#include <optional>

namespace webauth::ports::output {

/**
 * @brief Интерфейс хранилища сессии текущего запроса
 *
 * Жизненный цикл: start() → get/set/remove/clear/renewId → close() | destroy().
 * Ошибки хранилища бросают std::runtime_error.
 */
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    virtual void start() = 0;
    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual void remove(const std::string& key) = 0;
    virtual void clear() = 0;

    /**
     * @brief Выдать сессии новый идентификатор
     *
     * Данные сохраняются, старый идентификатор становится недействительным.
     * Обязательно при входе в систему (защита от session fixation).
     */
    virtual void renewId() = 0;

    /**
     * @brief Записать изменения и завершить работу с сессией
     */
    virtual void close() = 0;

    /**
     * @brief Удалить сессию вместе с данными и cookie
     */
    virtual void destroy() = 0;

    /**
     * @brief Текущий идентификатор (пустой, если сессии нет)
     */
    virtual std::string id() const = 0;
};

} // namespace webauth::ports::output
