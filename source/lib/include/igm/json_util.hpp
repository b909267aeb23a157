#pragma once

#include <string_view>

#include <nlohmann/json_fwd.hpp>

const nlohmann::json& GetJsonValue(const nlohmann::json& root,
                                   std::string_view path);
nlohmann::json& GetJsonValue(nlohmann::json& root,
                             std::string_view path);

nlohmann::json& SetJsonValue(nlohmann::json& root,
                             std::string_view path,
                             nlohmann::json value);

// Source of values that override a settings file, null for paths it does not know
class JsonProvider
{
  public:
    virtual ~JsonProvider() = default;

    virtual nlohmann::json GetJsonValue(std::string_view path) const = 0;
};
