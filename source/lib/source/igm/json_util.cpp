#include <igm/json_util.hpp>

#include <functional>
#include <ranges>
#include <stdexcept>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

namespace
{
auto SplitPath(std::string_view path)
{
    static constexpr auto c_ToStringViews{ std::views::transform(
        [](auto str)
        { return std::string_view(str.data(), str.size()); }) };
    return path | std::views::split('.') | c_ToStringViews;
}

template<class JsonT>
JsonT& GetJsonValueImpl(JsonT& root, std::string_view path)
{
    std::reference_wrapper target_json{ root };
    for (const auto& path_part : SplitPath(path))
    {
        if (!target_json.get().is_object() || !target_json.get().contains(path_part))
        {
            throw std::logic_error{
                fmt::format("Path {} is not part of json object", path)
            };
        }

        target_json = std::ref(target_json.get()[std::string{ path_part }]);
    }
    return target_json;
}
} // namespace

const nlohmann::json& GetJsonValue(const nlohmann::json& root,
                                   std::string_view path)
{
    return GetJsonValueImpl(root, path);
}
nlohmann::json& GetJsonValue(nlohmann::json& root,
                             std::string_view path)
{
    return GetJsonValueImpl(root, path);
}

nlohmann::json& SetJsonValue(nlohmann::json& root,
                             std::string_view path,
                             nlohmann::json value)
{
    std::reference_wrapper target_json{ root };
    for (const auto& path_part : SplitPath(path))
    {
        if (target_json.get().type() != nlohmann::json::value_t::object)
        {
            throw std::logic_error{
                fmt::format("Path {} is not part of json object", path)
            };
        }

        const std::string key{ path_part };
        if (!target_json.get().contains(key))
        {
            target_json.get()[key] = nlohmann::json::object();
        }

        target_json = std::ref(target_json.get()[key]);
    }

    target_json.get() = std::move(value);
    return target_json.get();
}
