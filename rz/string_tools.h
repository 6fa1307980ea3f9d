// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef STRING_TOOLS_H_0183746592834756
#define STRING_TOOLS_H_0183746592834756

#include <string>
#include <string_view>
#include <charconv>
#include <cstdio>
#include <vector>
#include <algorithm>
#include <type_traits>


//minimal set of string helpers for std::string and std::string_view
namespace rz
{
inline bool isWhiteSpace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }
inline char asciiToLower(char c) { return 'A' <= c && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c; }

inline bool startsWith(std::string_view str, std::string_view prefix) { return str.substr(0, prefix.size()) == prefix; }
inline bool startsWith(std::string_view str, char ch) { return !str.empty() && str.front() == ch; }
inline bool endsWith  (std::string_view str, std::string_view postfix) { return str.size() >= postfix.size() && str.substr(str.size() - postfix.size()) == postfix; }
inline bool endsWith  (std::string_view str, char ch) { return !str.empty() && str.back() == ch; }

bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs);

enum class IfNotFoundReturn
{
    all,
    none
};
std::string_view afterLast  (std::string_view str, char ch, IfNotFoundReturn infr);

void replace(std::string& str, std::string_view oldTerm, std::string_view newTerm);
[[nodiscard]] std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm);

std::string trimCpy(std::string_view str);

template <class S, class Num> S numberTo(const Num& number);
template <class Num> bool tryStringTo(std::string_view str, Num& number); //strict: complete string must be a number

template <class S, class Num> S printNumber(const char* format, const Num& number); //format a single number using std::snprintf()

std::string formatAsHexString(std::string_view blob); //bytes -> (lower-case) hex digits






//######################## implementation ########################
inline
bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) { return asciiToLower(a) == asciiToLower(b); });
}


inline
std::string_view afterLast(std::string_view str, char ch, IfNotFoundReturn infr)
{
    const size_t pos = str.rfind(ch);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : std::string_view();
    return str.substr(pos + 1);
}


inline
void replace(std::string& str, std::string_view oldTerm, std::string_view newTerm)
{
    if (oldTerm.empty())
        return;

    for (size_t pos = str.find(oldTerm); pos != std::string::npos; pos = str.find(oldTerm, pos + newTerm.size()))
        str.replace(pos, oldTerm.size(), newTerm);
}


inline
std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


inline
std::string trimCpy(std::string_view str)
{
    while (!str.empty() && isWhiteSpace(str.front())) str.remove_prefix(1);
    while (!str.empty() && isWhiteSpace(str.back ())) str.remove_suffix(1);
    return std::string(str);
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    char buffer[64] = {};
    const std::to_chars_result rv = std::to_chars(buffer, buffer + sizeof(buffer), number);
    return S(buffer, rv.ptr);
}


template <class Num> inline
bool tryStringTo(std::string_view str, Num& number)
{
    static_assert(std::is_integral_v<Num>);
    if (str.empty())
        return false;
    const std::from_chars_result rv = std::from_chars(str.data(), str.data() + str.size(), number);
    return rv.ec == std::errc() && rv.ptr == str.data() + str.size();
}


template <class S, class Num> inline
S printNumber(const char* format, const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    char buffer[128] = {};
    const int charsWritten = std::snprintf(buffer, sizeof(buffer), format, number);
    if (charsWritten < 0 || static_cast<size_t>(charsWritten) >= sizeof(buffer))
        return S();
    return S(buffer, charsWritten);
}


inline
std::string formatAsHexString(std::string_view blob)
{
    const char hexDigits[] = "0123456789abcdef";
    std::string output;
    output.reserve(blob.size() * 2);
    for (const char c : blob)
    {
        output += hexDigits[static_cast<unsigned char>(c) >> 4];
        output += hexDigits[static_cast<unsigned char>(c) & 0xf];
    }
    return output;
}
}

#endif //STRING_TOOLS_H_0183746592834756
