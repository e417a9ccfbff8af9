#include <trellis/header_map.hpp>

#include <algorithm>
#include <cctype>

namespace {
    auto canonical(std::string_view name) -> std::string {
        auto result = std::string(name);

        std::transform(
            result.begin(),
            result.end(),
            result.begin(),
            [](unsigned char c) { return std::tolower(c); }
        );

        return result;
    }
}

namespace trellis {
    auto header_map::add(
        std::string_view name,
        std::string_view value
    ) -> void {
        entries[canonical(name)].emplace_back(value);
    }

    auto header_map::begin() const noexcept -> const_iterator {
        return entries.begin();
    }

    auto header_map::contains(std::string_view name) const -> bool {
        return entries.contains(canonical(name));
    }

    auto header_map::empty() const noexcept -> bool {
        return entries.empty();
    }

    auto header_map::end() const noexcept -> const_iterator {
        return entries.end();
    }

    auto header_map::erase(std::string_view name) -> void {
        entries.erase(canonical(name));
    }

    auto header_map::get(std::string_view name) const -> std::string_view {
        const auto result = entries.find(canonical(name));

        if (result == entries.end() || result->second.empty()) return {};
        return result->second.front();
    }

    auto header_map::set(
        std::string_view name,
        std::string_view value
    ) -> void {
        entries.insert_or_assign(
            canonical(name),
            std::vector<std::string> {std::string(value)}
        );
    }

    auto header_map::size() const noexcept -> std::size_t {
        return entries.size();
    }

    auto header_map::values(
        std::string_view name
    ) const -> std::vector<std::string> {
        const auto result = entries.find(canonical(name));

        if (result == entries.end()) return {};
        return result->second;
    }
}
