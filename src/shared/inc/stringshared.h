/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    stringshared.h

Abstract:

    This file contains shared string helper functions.

--*/

#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <gsl/gsl>

namespace vmshim::shared::string {

inline char ToLowerChar(char Character)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(Character)));
}

inline size_t Compare(const std::string_view String1, const std::string_view String2, bool CaseInsensitive = false)
{
    // This method counts the number of matching characters at the beginning of two strings.
    const auto& firstString = String1.size() <= String2.size() ? String1 : String2;
    const auto& secondString = String1.size() <= String2.size() ? String2 : String1;

    if (CaseInsensitive)
    {
        auto result = std::mismatch(
            firstString.begin(), firstString.end(), secondString.begin(), [](char a, char b) { return ToLowerChar(a) == ToLowerChar(b); });

        return (result.first - firstString.begin());
    }

    auto result = std::mismatch(firstString.begin(), firstString.end(), secondString.begin());
    return (result.first - firstString.begin());
}

inline bool IsEqual(const std::string_view String1, const std::string_view String2, bool CaseInsensitive = false)
{
    if (String1.size() != String2.size())
    {
        return false;
    }

    return (Compare(String1, String2, CaseInsensitive) == String1.size());
}

inline bool StartsWith(const std::string_view String, const std::string_view Prefix, bool CaseInsensitive = false)
{
    if (String.size() < Prefix.size())
    {
        return false;
    }

    return (Compare(String.substr(0, Prefix.size()), Prefix, CaseInsensitive) == Prefix.size());
}

struct CaseInsensitiveCompare
{
    bool operator()(const std::string& Left, const std::string& Right) const
    {
        return std::lexicographical_compare(
            Left.begin(), Left.end(), Right.begin(), Right.end(), [](char a, char b) { return ToLowerChar(a) < ToLowerChar(b); });
    }
};

inline std::string ToLower(std::string_view String)
{
    std::string result(String);
    std::transform(result.begin(), result.end(), result.begin(), ToLowerChar);
    return result;
}

inline std::string_view Trim(std::string_view String)
{
    constexpr std::string_view whitespace = " \t\r\n";
    const auto begin = String.find_first_not_of(whitespace);
    if (begin == std::string_view::npos)
    {
        return {};
    }

    const auto end = String.find_last_not_of(whitespace);
    return String.substr(begin, end - begin + 1);
}

inline std::optional<bool> ParseBool(const char* String)
{
    if (!String)
    {
        return {};
    }

    const std::string_view StringView(String);
    if (IsEqual(StringView, "1") || IsEqual(StringView, "true", true))
    {
        return true;
    }

    if (IsEqual(StringView, "0") || IsEqual(StringView, "false", true))
    {
        return false;
    }

    return {};
}

// Parses a decimal, hex (0x) or octal (0) integer that fits in an int.
inline std::optional<int> ParseInt(const char* String)
{
    if (String == nullptr || *String == '\0')
    {
        return {};
    }

    char* end{};
    const long number = std::strtol(String, &end, 0);
    if (*end != '\0' || number < INT_MIN || number > INT_MAX)
    {
        return {};
    }

    return gsl::narrow_cast<int>(number);
}

// Returns a random (version 4) GUID in its registry format, without braces.
inline std::string GenerateGuid()
{
    thread_local std::mt19937_64 generator{std::random_device{}()};

    std::array<std::uint8_t, 16> bytes{};
    for (size_t i = 0; i < bytes.size(); i += 8)
    {
        const auto value = generator();
        for (size_t j = 0; j < 8; j++)
        {
            bytes[i + j] = gsl::narrow_cast<std::uint8_t>(value >> (j * 8));
        }
    }

    bytes[6] = gsl::narrow_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = gsl::narrow_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    return std::format(
        "{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
        bytes[0],
        bytes[1],
        bytes[2],
        bytes[3],
        bytes[4],
        bytes[5],
        bytes[6],
        bytes[7],
        bytes[8],
        bytes[9],
        bytes[10],
        bytes[11],
        bytes[12],
        bytes[13],
        bytes[14],
        bytes[15]);
}

} // namespace vmshim::shared::string
