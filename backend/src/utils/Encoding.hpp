#pragma once

#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pb::utils
{

inline std::optional<std::vector<std::uint8_t>>
decode_base64(std::string_view input)
{
    static constexpr char const *kAlphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    static const std::array<int8_t, 256> kLookup = []
    {
        std::array<int8_t, 256> table{};
        table.fill(-1);
        for (int i = 0; kAlphabet[i] != '\0'; ++i)
        {
            table[static_cast<std::uint8_t>(kAlphabet[i])] =
                static_cast<int8_t>(i);
        }
        return table;
    }();

    std::vector<std::uint8_t> result;
    result.reserve((input.size() * 3) / 4);
    unsigned buffer = 0;
    int bits_collected = 0;
    for (char ch : input)
    {
        if (std::isspace(static_cast<unsigned char>(ch)))
        {
            continue;
        }
        if (ch == '=')
        {
            break;
        }
        auto value = kLookup[static_cast<std::uint8_t>(ch)];
        if (value < 0)
        {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<unsigned>(value);
        bits_collected += 6;
        if (bits_collected >= 8)
        {
            bits_collected -= 8;
            result.push_back(
                static_cast<std::uint8_t>((buffer >> bits_collected) & 0xFF));
        }
    }
    return result;
}

inline std::string encode_base64(std::span<std::uint8_t const> data)
{
    static constexpr char const kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);
    unsigned buffer = 0;
    int bits_collected = 0;
    for (auto byte : data)
    {
        buffer = (buffer << 8) | static_cast<unsigned>(byte);
        bits_collected += 8;
        while (bits_collected >= 6)
        {
            bits_collected -= 6;
            encoded.push_back(kAlphabet[(buffer >> bits_collected) & 0x3F]);
        }
    }
    if (bits_collected > 0)
    {
        buffer <<= (6 - bits_collected);
        encoded.push_back(kAlphabet[buffer & 0x3F]);
    }
    while (encoded.size() % 4 != 0)
    {
        encoded.push_back('=');
    }
    return encoded;
}

// RFC 4648 base32 with '=' padding; a 20-byte digest encodes to exactly
// 32 characters.
inline std::string encode_base32(std::span<std::uint8_t const> data)
{
    static constexpr char const kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
    std::string encoded;
    encoded.reserve(((data.size() + 4) / 5) * 8);
    std::uint64_t buffer = 0;
    int bits_collected = 0;
    for (auto byte : data)
    {
        buffer = (buffer << 8) | static_cast<std::uint64_t>(byte);
        bits_collected += 8;
        while (bits_collected >= 5)
        {
            bits_collected -= 5;
            encoded.push_back(kAlphabet[(buffer >> bits_collected) & 0x1F]);
        }
    }
    if (bits_collected > 0)
    {
        buffer <<= (5 - bits_collected);
        encoded.push_back(kAlphabet[buffer & 0x1F]);
    }
    while (encoded.size() % 8 != 0)
    {
        encoded.push_back('=');
    }
    return encoded;
}

inline bool is_unreserved(unsigned char ch)
{
    return std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' ||
           ch == '~';
}

inline void append_percent_escape(std::string &out, unsigned char ch)
{
    static constexpr char kHexDigits[] = "0123456789ABCDEF";
    out.push_back('%');
    out.push_back(kHexDigits[ch >> 4]);
    out.push_back(kHexDigits[ch & 0x0F]);
}

// Form/query component encoding: spaces become '+'.
inline std::string query_escape(std::string_view value)
{
    std::string out;
    out.reserve(value.size() * 3);
    for (char raw : value)
    {
        auto ch = static_cast<unsigned char>(raw);
        if (is_unreserved(ch))
        {
            out.push_back(raw);
        }
        else if (ch == ' ')
        {
            out.push_back('+');
        }
        else
        {
            append_percent_escape(out, ch);
        }
    }
    return out;
}

// Escapes for a URL fragment; sub-delimiters and ':' '@' '/' '?' stay
// verbatim.
inline std::string fragment_escape(std::string_view value)
{
    static constexpr std::string_view kAllowed = "!$&'()*+,;=:@/?";
    std::string out;
    out.reserve(value.size());
    for (char raw : value)
    {
        auto ch = static_cast<unsigned char>(raw);
        if (is_unreserved(ch) || kAllowed.find(raw) != std::string_view::npos)
        {
            out.push_back(raw);
        }
        else
        {
            append_percent_escape(out, ch);
        }
    }
    return out;
}

inline int hex_value(char ch)
{
    if (ch >= '0' && ch <= '9')
    {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f')
    {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F')
    {
        return ch - 'A' + 10;
    }
    return -1;
}

// Returns nullopt on a truncated or non-hex escape.
inline std::optional<std::string> percent_decode(std::string_view value,
                                                 bool plus_as_space)
{
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i)
    {
        char ch = value[i];
        if (ch == '%')
        {
            if (i + 2 >= value.size())
            {
                return std::nullopt;
            }
            int high = hex_value(value[i + 1]);
            int low = hex_value(value[i + 2]);
            if (high < 0 || low < 0)
            {
                return std::nullopt;
            }
            out.push_back(static_cast<char>((high << 4) | low));
            i += 2;
        }
        else if (ch == '+' && plus_as_space)
        {
            out.push_back(' ');
        }
        else
        {
            out.push_back(ch);
        }
    }
    return out;
}

} // namespace pb::utils
