#pragma once

#include "header_map.hpp"
#include "parser.hpp"

#include <unordered_map>

namespace trellis {
    namespace detail {
        template <typename T>
        struct is_optional : std::false_type {};

        template <typename T>
        struct is_optional<std::optional<T>> : std::true_type {};

        template <typename T>
        inline constexpr bool is_optional_v = is_optional<T>::value;

        template <typename T>
        auto parse(
            std::optional<std::string_view> value,
            std::string_view name,
            std::string_view description
        ) -> T {
            if (value) {
                if constexpr (is_optional_v<T>) {
                    if (value->empty()) return T();
                }

                try {
                    return parser<T>::parse(*value);
                }
                catch (const std::exception& ex) {
                    throw error_code(
                        400,
                        "Failed to parse {} '{}': {}",
                        description,
                        name,
                        ex.what()
                    );
                }
            }
            else if constexpr (!is_optional_v<T>) {
                throw error_code(
                    400,
                    "Missing required {} '{}'",
                    description,
                    name
                );
            }

            return T();
        }
    }

    struct request {
        std::string method = "GET";
        std::string path = "/";
        std::string query;
        header_map headers;
        std::unordered_map<std::string, std::string> params;
        std::string pattern;

        template <typename T>
        auto header(std::string_view name) const -> T {
            auto value = std::optional<std::string_view>();
            if (headers.contains(name)) value = headers.get(name);

            return detail::parse<T>(value, name, "header");
        }

        template <typename T>
        auto path_param(std::string_view name) const -> T {
            auto value = std::optional<std::string_view>();

            const auto result = params.find(std::string(name));
            if (result != params.end()) value = result->second;

            return detail::parse<T>(value, name, "path parameter");
        }

        /// Returns the value captured for the wildcard 'name' by the
        /// matched pattern, or an empty string.
        auto path_value(std::string_view name) const -> std::string_view;
    };
}
