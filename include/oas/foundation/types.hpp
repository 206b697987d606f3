#pragma once

/// @file types.hpp
/// @brief Strong ID types shared across the service.

#include <charconv>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace oas::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    [[nodiscard]] std::string toString() const { return std::to_string(value_); }

    /// Parse the decimal form written by toString().
    ///
    /// Returns nullopt for empty input, trailing garbage, overflow, or the
    /// reserved zero value.
    [[nodiscard]] static std::optional<StrongId> parse(std::string_view text) {
        if (text.empty()) {
            return std::nullopt;
        }
        T parsed{};
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (ec != std::errc{} || ptr != text.data() + text.size() || parsed == 0) {
            return std::nullopt;
        }
        return StrongId(parsed);
    }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct IdentityIdTag {};

/// Unique identifier of an account able to authenticate.
using IdentityId = StrongId<IdentityIdTag>;

} // namespace oas::foundation

template <typename Tag, typename T>
struct std::hash<oas::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const oas::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
