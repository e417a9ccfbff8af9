#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace trellis {
    /// Case-insensitive, multi-valued header storage.
    /// Names are stored lower-cased.
    class header_map {
        using map_type =
            std::unordered_map<std::string, std::vector<std::string>>;

        map_type entries;
    public:
        using const_iterator = map_type::const_iterator;

        auto add(std::string_view name, std::string_view value) -> void;

        auto begin() const noexcept -> const_iterator;

        auto contains(std::string_view name) const -> bool;

        auto empty() const noexcept -> bool;

        auto end() const noexcept -> const_iterator;

        auto erase(std::string_view name) -> void;

        /// Returns the first value for 'name', or an empty string.
        auto get(std::string_view name) const -> std::string_view;

        auto set(std::string_view name, std::string_view value) -> void;

        auto size() const noexcept -> std::size_t;

        auto values(std::string_view name) const -> std::vector<std::string>;
    };
}
