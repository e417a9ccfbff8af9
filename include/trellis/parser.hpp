#pragma once

#include "error.hpp"

#include <algorithm>
#include <array>
#include <concepts>
#include <fmt/ranges.h>
#include <limits>
#include <optional>
#include <string>

namespace trellis {
    struct parser_error : std::runtime_error {
        parser_error(const std::string& what) : runtime_error(what) {}
    };

    template <typename T>
    struct parser {};

    template <typename T>
    requires
        std::same_as<T, std::string> ||
        std::same_as<T, std::string_view>
    struct parser<T> {
        static auto parse(std::string_view text) -> T { return T(text); }
    };

    /// An empty value yields an empty optional.
    template <typename T>
    struct parser<std::optional<T>> {
        static auto parse(std::string_view text) -> std::optional<T> {
            if (text.empty()) return std::nullopt;
            return std::optional<T>(parser<T>::parse(text));
        }
    };

    template <>
    struct parser<bool> {
        static auto parse(std::string_view text) -> bool {
            static constexpr auto yes = std::array<std::string_view, 4> {
                "t", "true", "y", "yes"
            };
            static constexpr auto no = std::array<std::string_view, 4> {
                "f", "false", "n", "no"
            };

            if (std::ranges::find(yes, text) != yes.end()) return true;
            if (std::ranges::find(no, text) != no.end()) return false;

            throw parser_error(fmt::format(
                "Expect one of {} or {}",
                fmt::join(yes, "/"),
                fmt::join(no, "/")
            ));
        }
    };

    template <std::integral T>
    class parser<T> {
        static constexpr auto min = std::numeric_limits<T>::min();
        static constexpr auto max = std::numeric_limits<T>::max();

        [[noreturn]]
        static auto out_of_range(std::string_view argument) -> void {
            throw parser_error(fmt::format(
                "Argument '{}' is outside the range of {} and {}",
                argument,
                min,
                max
            ));
        }
    public:
        static auto parse(std::string_view argument) -> T {
            const auto string = std::string(argument);
            auto pos = std::size_t();

            try {
                if constexpr (std::is_signed_v<T>) {
                    const auto value = std::stoll(string, &pos);
                    if (pos != string.size()) {
                        throw std::invalid_argument(string);
                    }
                    if (value > max || value < min) out_of_range(argument);
                    return static_cast<T>(value);
                }
                else {
                    if (string.starts_with('-')) out_of_range(argument);
                    const auto value = std::stoull(string, &pos);
                    if (pos != string.size()) {
                        throw std::invalid_argument(string);
                    }
                    if (value > max) out_of_range(argument);
                    return static_cast<T>(value);
                }
            }
            catch (const std::invalid_argument&) {
                throw parser_error("Expect an integer");
            }
            catch (const std::out_of_range&) {
                out_of_range(argument);
            }
        }
    };
}
