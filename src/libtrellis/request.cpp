#include <trellis/request.hpp>

namespace trellis {
    auto request::path_value(std::string_view name) const -> std::string_view {
        const auto result = params.find(std::string(name));

        if (result == params.end()) return {};
        return result->second;
    }
}
