/*++

Copyright (c) Microsoft Corporation. All rights reserved

Parses .gitconfig-style properties files. This consists of key-value pairs
divided into sections.

For example:

[start]
maxParallel = 4

# Comments start with hash
[timeout]
operations = 0xF0    # integers can be in hex
systemStart = 0360   # octal is OK too

[log]
level = " debug "    # quotes preserve leading and trailing spaces
name = this value has a line continuation \
    so that it can wrap to the next line

--*/

#include "configfile.h"
#include <string.h>
#include <strings.h>
#include <algorithm>
#include <string>

using vmshim::shared::string::Trim;

bool ConfigKey::ParseImpl(const char* name, const char* value, const char* filePath, unsigned long fileLine, bool& result)
{
    const auto parsed = vmshim::shared::string::ParseBool(value);
    if (!parsed.has_value())
    {
        LOG_WARNING("Invalid boolean value '{}' for config key '{}' in {}:{}", value, name, filePath, fileLine);
        return false;
    }

    result = parsed.value();
    return true;
}

bool ConfigKey::ParseImpl(const char* name, const char* value, const char* filePath, unsigned long fileLine, int& result)
{
    const auto parsed = vmshim::shared::string::ParseInt(value);
    if (!parsed.has_value())
    {
        LOG_WARNING("Invalid integer value '{}' for config key '{}' in {}:{}", value, name, filePath, fileLine);
        return false;
    }

    result = parsed.value();
    return true;
}

bool ConfigKey::ParseImpl(const char* name, const char* value, const char* filePath, unsigned long fileLine, std::string& result)
{
    result = value;
    return true;
}

bool ConfigKey::Matches(const char* name) const
{
    return std::any_of(m_names.begin(), m_names.end(), [&](const auto& e) { return strcasecmp(e, name) == 0; });
}

void ConfigKey::Parse(const char* name, const char* value, const char* fileName, unsigned long line)
{
    if (m_parseResult.has_value())
    {
        LOG_WARNING(
            "Duplicated config key '{}' in {}:{} (conflicting key: '{}' in {}:{})", name, fileName, line, m_parseResult->first, fileName, m_parseResult->second);
        return;
    }

    m_parse(name, value, fileName, line);
    m_parseResult.emplace(name, line);
}

const std::vector<const char*>& ConfigKey::GetNames() const
{
    return m_names;
}

namespace {

// Updates the configuration with the given value. Returns false if the key is unknown.
bool SetConfig(std::vector<ConfigKey>& keys, const char* keyName, const char* value, const char* filePath, unsigned long fileLine)
{
    const auto key = std::find_if(keys.begin(), keys.end(), [keyName](const auto& e) { return e.Matches(keyName); });
    if (key == keys.end())
    {
        LOG_WARNING("Unknown key '{}' in {}:{}", keyName, filePath, fileLine);
        return false;
    }

    key->Parse(keyName, value, filePath, fileLine);
    return true;
}

bool IsKeyCharacter(char ch)
{
    return isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '-';
}

// Decodes the value part of a key-value line: strips unquoted whitespace,
// removes trailing comments, resolves quotes and escape sequences.
std::optional<std::string> ParseValue(std::string_view raw)
{
    std::string value;
    bool inQuote = false;
    size_t trimmedLength = 0;

    raw = Trim(raw);
    for (size_t i = 0; i < raw.size(); i++)
    {
        const char ch = raw[i];
        if (ch == '"')
        {
            inQuote = !inQuote;
            trimmedLength = value.size();
            continue;
        }

        if (!inQuote && (ch == '#' || ch == ';'))
        {
            break;
        }

        if (ch == '\\')
        {
            if (++i == raw.size())
            {
                return {};
            }

            switch (raw[i])
            {
            case 'n':
                value += '\n';
                break;
            case 't':
                value += '\t';
                break;
            case '\\':
            case '"':
                value += raw[i];
                break;
            default:
                return {};
            }

            trimmedLength = value.size();
            continue;
        }

        value += ch;
        if (inQuote || (ch != ' ' && ch != '\t'))
        {
            trimmedLength = value.size();
        }
    }

    if (inQuote)
    {
        return {};
    }

    value.resize(trimmedLength);
    return value;
}

} // namespace

int ParseConfigFile(std::vector<ConfigKey>& keys, FILE* file, int flags, const char* filePath)
{
    if (file == NULL)
    {
        return 0;
    }

    std::string section;
    std::string line;
    unsigned long lineNumber = 0;
    unsigned long logicalLine = 0;
    char buffer[1024];

    auto invalidLine = [&](const char* reason) {
        if (flags & CFG_DEBUG)
        {
            fprintf(stderr, "%s\n", reason);
        }

        LOG_WARNING("Invalid config line in {}:{}: {}", filePath, logicalLine, reason);
        return (flags & CFG_SKIP_INVALID_LINES) != 0;
    };

    for (;;)
    {
        line.clear();
        bool eof = true;
        while (fgets(buffer, sizeof(buffer), file) != nullptr)
        {
            eof = false;
            line += buffer;
            if (!line.empty() && line.back() != '\n' && !feof(file))
            {
                continue;
            }

            lineNumber++;
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
            {
                line.pop_back();
            }

            // A trailing backslash continues the value on the next line.
            if (!line.empty() && line.back() == '\\')
            {
                line.pop_back();
                continue;
            }

            break;
        }

        if (ferror(file))
        {
            return -1;
        }

        if (eof && line.empty())
        {
            return 0;
        }

        logicalLine = lineNumber;
        const auto content = Trim(line);
        if (content.empty() || content.front() == '#' || content.front() == ';')
        {
            continue;
        }

        if (content.front() == '[')
        {
            const auto end = content.find(']');
            const auto name = end == std::string_view::npos ? std::string_view{} : Trim(content.substr(1, end - 1));
            if (name.empty() || !isalpha(static_cast<unsigned char>(name.front())) || !std::all_of(name.begin(), name.end(), IsKeyCharacter))
            {
                section.clear();
                if (!invalidLine("expected [section]"))
                {
                    return -1;
                }

                continue;
            }

            const auto rest = Trim(content.substr(end + 1));
            if (!rest.empty() && rest.front() != '#' && rest.front() != ';')
            {
                if (!invalidLine("unexpected characters after section"))
                {
                    return -1;
                }
            }

            section = name;
            continue;
        }

        const auto separator = content.find('=');
        const auto keyName = Trim(content.substr(0, separator));
        if (separator == std::string_view::npos || keyName.empty() || !isalpha(static_cast<unsigned char>(keyName.front())) ||
            !std::all_of(keyName.begin(), keyName.end(), IsKeyCharacter))
        {
            if (!invalidLine("expected key = value"))
            {
                return -1;
            }

            continue;
        }

        if (section.empty())
        {
            if (!invalidLine("key outside of a section"))
            {
                return -1;
            }

            continue;
        }

        const auto value = ParseValue(content.substr(separator + 1));
        if (!value.has_value())
        {
            if (!invalidLine("invalid value"))
            {
                return -1;
            }

            continue;
        }

        const auto fullName = section + "." + std::string(keyName);
        if (!SetConfig(keys, fullName.c_str(), value->c_str(), filePath, logicalLine) && (flags & CFG_SKIP_UNKNOWN_VALUES) == 0)
        {
            return -1;
        }
    }
}
