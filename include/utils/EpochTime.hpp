#pragma once

#include <chrono>
#include <cstdint>

namespace webauth::utils {

/**
 * @brief Перевод time_point <-> секунды Unix (для to_timestamp / EXTRACT(EPOCH))
 */
inline int64_t toEpochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point fromEpochSeconds(int64_t seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

} // namespace webauth::utils
