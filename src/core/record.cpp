/**
 * @file record.cpp
 * @brief Payload formatting
 */

#include "streamiq/core/record.hpp"

#include <sstream>
#include <type_traits>

namespace streamiq {

std::string to_string(const Payload& payload) {
    return std::visit([](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(value);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << value;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return value;
        } else {
            return "(bytes: " + std::to_string(value.size()) + ")";
        }
    }, payload);
}

} // namespace streamiq
