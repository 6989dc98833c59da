/*++

Copyright (c) Microsoft Corporation. All rights reserved

Parses .gitconfig-style properties files.

--*/

#pragma once

#include <stdio.h>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "stringshared.h"
#include "shimlog.h"

enum class ConfigKeyPresence
{
    Absent,
    Present
};

class ConfigKey
{
public:
    using TParseMethod = std::function<void(const char*, const char*, const char*, unsigned long)>;

    template <typename TType>
    inline ConfigKey(std::vector<const char*>&& names, TType& outValue, ConfigKeyPresence* presence = nullptr) :
        m_names(std::move(names))
    {
        m_parse = [presence = presence, &outValue](const char* name, const char* value, const char* filename, unsigned long line) {
            if (ParseImpl(name, value, filename, line, outValue) && presence != nullptr)
            {
                *presence = ConfigKeyPresence::Present;
            }
        };
    }

    template <typename TType>
    inline ConfigKey(const char* name, TType& value, ConfigKeyPresence* presence = nullptr) :
        ConfigKey(std::vector<const char*>{name}, value, presence)
    {
    }

    inline ConfigKey(const char* name, TParseMethod&& parse) : m_names({name}), m_parse(std::move(parse))
    {
    }

    template <typename TEnum>
    inline ConfigKey(
        const char* name,
        const std::map<std::string, TEnum, vmshim::shared::string::CaseInsensitiveCompare>& values,
        TEnum& outValue,
        ConfigKeyPresence* presence = nullptr) :
        m_names({name})
    {
        m_parse = [presence = presence, values = values, &outValue](const char* name, const char* value, const char* filename, unsigned long line) {
            auto result = ParseEnumString(values, value, name, filename, line);
            if (result.has_value())
            {
                outValue = result.value();
                if (presence != nullptr)
                {
                    *presence = ConfigKeyPresence::Present;
                }
            }
        };
    }

    bool Matches(const char* name) const;
    void Parse(const char* name, const char* value, const char* fileName, unsigned long line);
    const std::vector<const char*>& GetNames() const;

    template <typename TEnum>
    static inline std::optional<TEnum> ParseEnumString(
        const std::map<std::string, TEnum, vmshim::shared::string::CaseInsensitiveCompare>& mappings,
        const char* value,
        const char* name,
        const char* fileName,
        unsigned long line)
    {
        auto it = mappings.find(value);
        if (it == mappings.end())
        {
            std::string validValues;
            for (const auto& e : mappings)
            {
                if (!validValues.empty())
                {
                    validValues += ", ";
                }

                validValues += e.first;
            }

            LOG_WARNING("Invalid value '{}' for config key '{}' in {}:{} (valid values: {})", value, name, fileName, line, validValues);
            return {};
        }

        return it->second;
    }

private:
    static bool ParseImpl(const char* name, const char* value, const char* filePath, unsigned long fileLine, bool& result);
    static bool ParseImpl(const char* name, const char* value, const char* filePath, unsigned long fileLine, int& result);
    static bool ParseImpl(const char* name, const char* value, const char* filePath, unsigned long fileLine, std::string& result);

    template <typename T>
    static inline bool ParseImpl(const char* name, const char* value, const char* filePath, unsigned long fileLine, std::optional<T>& result)
    {
        T storage{};

        if (ParseImpl(name, value, filePath, fileLine, storage))
        {
            result.emplace(std::move(storage));
            return true;
        }

        return false;
    }

    std::vector<const char*> m_names;
    TParseMethod m_parse;
    std::optional<std::pair<std::string, unsigned long>> m_parseResult;
};

enum
{
    CFG_SKIP_INVALID_LINES = 0x1,
    CFG_SKIP_UNKNOWN_VALUES = 0x2,
    CFG_DEBUG = 0x80000000,
};

// Parses a configuration file. If file is NULL, the keys keep their default values.
// Returns 0 on success and -1 on a read error or, unless skipped by the flags, an invalid line or unknown key.
int ParseConfigFile(std::vector<ConfigKey>& keys, FILE* file, int flags, const char* filePath);
