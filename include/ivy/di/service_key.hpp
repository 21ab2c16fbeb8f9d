#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>
#include <variant>

namespace ivy::di {

/**
 * @brief Opaque key distinguishing several registrations of one service
 *
 * A default constructed key is the null key: it selects the unkeyed
 * registration and is rejected by keyed registration calls.
 */
class ServiceKey {
public:
    ServiceKey() = default;
    ServiceKey(const char* value) : value_(std::string(value)) {}
    ServiceKey(std::string value) : value_(std::move(value)) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>,
                               int> = 0>
    ServiceKey(T value) : value_(static_cast<std::int64_t>(value)) {}

    bool is_null() const {
        return std::holds_alternative<std::monostate>(value_);
    }

    std::string to_string() const {
        if (auto text = std::get_if<std::string>(&value_)) {
            return *text;
        }
        if (auto number = std::get_if<std::int64_t>(&value_)) {
            return std::to_string(*number);
        }
        return "<null>";
    }

    std::size_t hash() const { return std::hash<Value>{}(value_); }

    bool operator==(const ServiceKey& other) const {
        return value_ == other.value_;
    }
    bool operator!=(const ServiceKey& other) const {
        return !(*this == other);
    }

private:
    using Value = std::variant<std::monostate, std::string, std::int64_t>;
    Value value_;
};

}  // namespace ivy::di

template <>
struct std::hash<ivy::di::ServiceKey> {
    std::size_t operator()(const ivy::di::ServiceKey& key) const noexcept {
        return key.hash();
    }
};
