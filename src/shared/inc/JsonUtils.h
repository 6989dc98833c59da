/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    JsonUtils.h

Abstract:

    This file contains various JSON helper methods.

--*/

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "shimlog.h"
#include "shimresult.h"

namespace vmshim::shared {

template <typename T>
std::string ToJson(const T& Value)
{
    nlohmann::json json;
    to_json(json, Value);

    return json.dump();
}

template <typename T, typename TJson = nlohmann::json>
T FromJson(const char* Value)
{
    try
    {
        auto json = TJson::parse(Value);
        T object{};
        from_json(json, object);

        return object;
    }
    catch (const typename TJson::exception& e)
    {
        LOG_ERROR("Failed to deserialize json: '{}'. Error: {}", Value, e.what());
        VMSHIM_THROW_HR_MSG(VMSHIM_E_INVALID_JSON, "{}", e.what());
    }
}

template <typename T, typename TJson = nlohmann::json>
T FromJson(const std::string& Value)
{
    return FromJson<T, TJson>(Value.c_str());
}

template <typename T>
std::string JsonEnumToString(T value)
{
    nlohmann::json json;
    to_json(json, value);

    return json.get<std::string>();
}

} // namespace vmshim::shared

namespace nlohmann {

template <typename T>
struct adl_serializer<std::optional<T>>
{
    static void to_json(json& j, const std::optional<T>& input)
    {
        if (input.has_value())
        {
            j = input.value();
        }
        else
        {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& input)
    {
        if (!j.is_null())
        {
            input.emplace(); // Assumes that object is default constructible.
            adl_serializer<T>::from_json(j, input.value());
        }
    }
};

} // namespace nlohmann
