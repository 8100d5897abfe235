#pragma once

#include "guards/IGuard.hpp"
#include <memory>
#include <vector>

namespace webauth::guards {

/**
 * @brief Все вложенные guard должны пройти (проверка до первого отказа)
 *
 * Пустой список запрещает запрос.
 */
class CompositeGuard : public IGuard {
public:
    template <typename... Guards>
    explicit CompositeGuard(Guards&&... guards) {
        (guards_.push_back(std::forward<Guards>(guards)), ...);
    }

    bool verify() override {
        if (guards_.empty()) {
            return false;
        }
        for (auto& guard : guards_) {
            if (!guard->verify()) {
                return false;
            }
        }
        return true;
    }

private:
    std::vector<std::shared_ptr<IGuard>> guards_;
};

/**
 * @brief Достаточно одного прошедшего guard
 */
class AnyGuard : public IGuard {
public:
    template <typename... Guards>
    explicit AnyGuard(Guards&&... guards) {
        (guards_.push_back(std::forward<Guards>(guards)), ...);
    }

    bool verify() override {
        for (auto& guard : guards_) {
            if (guard->verify()) {
                return true;
            }
        }
        return false;
    }

private:
    std::vector<std::shared_ptr<IGuard>> guards_;
};

} // namespace webauth::guards
