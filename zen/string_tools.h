// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_213458973046
#define STRING_TOOLS_H_213458973046

#include <cassert>
#include <charconv>
#include <cstdio>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <type_traits>


//enhance *any* string class with useful non-member functions:
namespace zen
{
inline bool isWhiteSpace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }
inline bool isLineBreak (char c) { return c == '\r' || c == '\n'; }
inline bool isDigit     (char c) { return '0' <= c && c <= '9'; } //not locale-dependent like std::isdigit
inline bool isHexDigit  (char c) { return isDigit(c) || ('A' <= c && c <= 'F') || ('a' <= c && c <= 'f'); }
inline bool isAsciiAlpha(char c) { return ('A' <= c && c <= 'Z') || ('a' <= c && c <= 'z'); }

inline char asciiToLower(char c) { return 'A' <= c && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c; }
inline char asciiToUpper(char c) { return 'a' <= c && c <= 'z' ? static_cast<char>(c - 'a' + 'A') : c; }

std::string asciiToLowerCpy(std::string_view str);
bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs);

bool startsWith(std::string_view str, std::string_view prefix);
bool startsWith(std::string_view str, char prefix);
bool endsWith  (std::string_view str, std::string_view postfix);
bool endsWith  (std::string_view str, char postfix);
bool contains  (std::string_view str, std::string_view term);
bool contains  (std::string_view str, char term);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class S> std::vector<S> split(const S& str, char delimiter, SplitOnEmpty soe);

void trim(std::string& str, bool fromLeft = true, bool fromRight = true);
template <class S> S trimCpy(const S& str, bool fromLeft = true, bool fromRight = true);

void replace(std::string& str, std::string_view oldTerm, std::string_view newTerm);
std::string replaceCpy(std::string str, std::string_view oldTerm, std::string_view newTerm);

//convert between numbers and strings (locale-independent!)
template <class S, class Num> S numberTo(const Num& number);
template <class Num> Num stringTo(std::string_view str); //lenient: garbage => 0

template <class Num> std::string printNumber(const char* format, const Num& number); //format a single number using std::snprintf()

std::pair<char, char> hexify(unsigned char c, bool upperCase = true);
char unhexify(char high, char low);

template <class Iterator>
std::string_view makeStringView(Iterator first, Iterator last) { return {&*first, static_cast<size_t>(last - first)}; }






//######################## implementation ########################
inline
std::string asciiToLowerCpy(std::string_view str)
{
    std::string output(str);
    std::transform(output.begin(), output.end(), output.begin(), [](char c) { return asciiToLower(c); });
    return output;
}


inline
bool equalAsciiNoCase(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char c1, char c2) { return asciiToLower(c1) == asciiToLower(c2); });
}


inline bool startsWith(std::string_view str, std::string_view prefix) { return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix; }
inline bool startsWith(std::string_view str, char prefix) { return !str.empty() && str.front() == prefix; }

inline bool endsWith(std::string_view str, std::string_view postfix) { return str.size() >= postfix.size() && str.substr(str.size() - postfix.size()) == postfix; }
inline bool endsWith(std::string_view str, char postfix) { return !str.empty() && str.back() == postfix; }

inline bool contains(std::string_view str, std::string_view term) { return str.find(term) != std::string_view::npos; }
inline bool contains(std::string_view str, char term) { return str.find(term) != std::string_view::npos; }


namespace impl
{
inline std::string_view makeTermView(std::string_view term) { return term; }
inline std::string_view makeTermView(const char& term) { return {&term, 1}; }
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const std::string_view termView = impl::makeTermView(term);
    assert(!termView.empty());
    const size_t pos = std::string_view(str).rfind(termView);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(std::string_view(str).substr(pos + termView.size()));
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const std::string_view termView = impl::makeTermView(term);
    assert(!termView.empty());
    const size_t pos = std::string_view(str).rfind(termView);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(std::string_view(str).substr(0, pos));
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const std::string_view termView = impl::makeTermView(term);
    assert(!termView.empty());
    const size_t pos = std::string_view(str).find(termView);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(std::string_view(str).substr(pos + termView.size()));
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const std::string_view termView = impl::makeTermView(term);
    assert(!termView.empty());
    const size_t pos = std::string_view(str).find(termView);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(std::string_view(str).substr(0, pos));
}


template <class S> inline
std::vector<S> split(const S& str, char delimiter, SplitOnEmpty soe)
{
    std::vector<S> output;
    const std::string_view strView = str;

    for (size_t blockStart = 0;;)
    {
        const size_t blockEnd = std::min(strView.find(delimiter, blockStart), strView.size());
        const std::string_view block = strView.substr(blockStart, blockEnd - blockStart);

        if (!block.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(block);

        if (blockEnd == strView.size())
            return output;
        blockStart = blockEnd + 1;
    }
}


inline
void trim(std::string& str, bool fromLeft, bool fromRight)
{
    assert(fromLeft || fromRight);
    if (fromRight)
        str.erase(std::find_if_not(str.rbegin(), str.rend(), isWhiteSpace).base(), str.end());
    if (fromLeft)
        str.erase(str.begin(), std::find_if_not(str.begin(), str.end(), isWhiteSpace));
}


template <class S> inline
S trimCpy(const S& str, bool fromLeft, bool fromRight)
{
    std::string_view output = str;
    if (fromLeft)
        while (!output.empty() && isWhiteSpace(output.front()))
            output.remove_prefix(1);
    if (fromRight)
        while (!output.empty() && isWhiteSpace(output.back()))
            output.remove_suffix(1);
    return S(output);
}


inline
void replace(std::string& str, std::string_view oldTerm, std::string_view newTerm)
{
    assert(!oldTerm.empty());
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


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_integral_v<Num>);
    char buffer[32] = {};
    const auto [ptr, ec] = std::to_chars(std::begin(buffer), std::end(buffer), number);
    assert(ec == std::errc());
    return S(buffer, ptr - buffer);
}


template <class Num> inline
Num stringTo(std::string_view str)
{
    static_assert(std::is_integral_v<Num>);
    str = trimCpy(str);
    if (startsWith(str, '+'))
        str.remove_prefix(1);

    Num number = 0;
    if (std::from_chars(str.data(), str.data() + str.size(), number).ec != std::errc())
        return 0;
    return number;
}


template <class Num> inline
std::string printNumber(const char* format, const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    std::string buf(128, '0');
    const int charsWritten = std::snprintf(buf.data(), buf.size(), format, number);

    if (charsWritten < 0 || static_cast<size_t>(charsWritten) > buf.size())
        return std::string();

    buf.resize(charsWritten);
    return buf;
}


inline
std::pair<char, char> hexify(unsigned char c, bool upperCase)
{
    auto hexifyDigit = [upperCase](int num) -> char //input [0, 15], output 0-9, A-F
    {
        assert(0 <= num && num <= 15);
        if (num <= 9)
            return static_cast<char>('0' + num);
        return static_cast<char>((upperCase ? 'A' : 'a') + (num - 10));
    };
    return {hexifyDigit(c / 16), hexifyDigit(c % 16)};
}


inline
char unhexify(char high, char low)
{
    auto unhexifyDigit = [](char hex) -> int //input 0-9, a-f, A-F; output range: [0, 15]
    {
        if ('0' <= hex && hex <= '9') return hex - '0';
        if ('A' <= hex && hex <= 'F') return hex - 'A' + 10;
        if ('a' <= hex && hex <= 'f') return hex - 'a' + 10;
        assert(false);
        return 0;
    };
    return static_cast<char>(16 * unhexifyDigit(high) + unhexifyDigit(low));
}
}

#endif //STRING_TOOLS_H_213458973046
