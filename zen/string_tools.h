// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_4720195638217409
#define STRING_TOOLS_H_4720195638217409

#include <algorithm>
#include <cassert>
#include <compare>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>


//string helpers working on std::string, std::wstring, their views, string literals and single chars
namespace zen
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isAsciiChar (Char c);
template <class Char> bool isDigit     (Char c); //not exactly the same as "std::isdigit" => we consider '0'-'9' only!
template <class Char> Char asciiToLower(Char c);

template <class S, class T> bool contains  (const S& str, const T& term);
template <class S, class T> bool startsWith(const S& str, const T& prefix);
template <class S, class T> bool endsWith  (const S& str, const T& postfix);

template <class S, class T> bool equalAsciiNoCase     (const S& lhs, const T& rhs);
template <class S, class T> bool startsWithAsciiNoCase(const S& str, const T& prefix);
template <class S, class T> std::weak_ordering compareAsciiNoCase(const S& lhs, const T& rhs);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

template <class S, class T, class U> void replace   (      S& str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U> S    replaceCpy(const S& str, const T& oldTerm, const U& newTerm);

enum class TrimSide
{
    both,
    left,
    right,
};
template <class S> void trim   (      S& str, TrimSide side = TrimSide::both);
template <class S> S    trimCpy(const S& str, TrimSide side = TrimSide::both);
template <class S, class Function> void trim(S& str, TrimSide side, Function trimThisChar);

//call "onItem" for each delimiter-separated token, including empty ones
template <class S, class Char, class Function> void split(const S& str, Char delimiter, Function onItem);

template <class S, class Num> S   numberTo(const Num& number);
template <class Num, class S> Num stringTo(const S& str); //0 on parse failure








//######################## implementation ########################
namespace impl
{
inline std::string_view makeView(const std::string& str) { return str; }
inline std::string_view makeView(std::string_view    str) { return str; }
inline std::string_view makeView(const char*         str) { return str; }
inline std::string_view makeView(const char&           c) { return {&c, 1}; }

inline std::wstring_view makeView(const std::wstring& str) { return str; }
inline std::wstring_view makeView(std::wstring_view    str) { return str; }
inline std::wstring_view makeView(const wchar_t*       str) { return str; }
inline std::wstring_view makeView(const wchar_t&         c) { return {&c, 1}; }

template <class S, class View> inline
S makeResult(const View& view) { return S(view.begin(), view.end()); }
}


template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    //caveat: std::isspace() depends on the current locale and is undefined for negative char values
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v' ||
           (std::is_same_v<Char, wchar_t> && static_cast<wchar_t>(c) == L'\u00A0'); //no-break space
}


template <class Char> inline bool isAsciiChar (Char c) { return static_cast<std::make_unsigned_t<Char>>(c) < 128; }
template <class Char> inline bool isDigit     (Char c) { return '0' <= c && c <= '9'; }

template <class Char> inline Char asciiToLower(Char c) { return 'A' <= c && c <= 'Z' ? static_cast<Char>(c - 'A' + 'a') : c; }


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    return impl::makeView(str).find(impl::makeView(term)) != std::string_view::npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    return impl::makeView(str).starts_with(impl::makeView(prefix));
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    return impl::makeView(str).ends_with(impl::makeView(postfix));
}


template <class S, class T> inline
bool equalAsciiNoCase(const S& lhs, const T& rhs)
{
    const auto lhsV = impl::makeView(lhs);
    const auto rhsV = impl::makeView(rhs);
    if (lhsV.size() != rhsV.size())
        return false;

    for (size_t i = 0; i < lhsV.size(); ++i)
        if (asciiToLower(lhsV[i]) != asciiToLower(rhsV[i]))
            return false;
    return true;
}


template <class S, class T> inline
std::weak_ordering compareAsciiNoCase(const S& lhs, const T& rhs)
{
    const auto lhsV = impl::makeView(lhs);
    const auto rhsV = impl::makeView(rhs);
    return std::lexicographical_compare_three_way(lhsV.begin(), lhsV.end(), rhsV.begin(), rhsV.end(),
                                                  [](auto cL, auto cR) -> std::weak_ordering { return asciiToLower(cL) <=> asciiToLower(cR); });
}


template <class S, class T> inline
bool startsWithAsciiNoCase(const S& str, const T& prefix)
{
    const auto strV    = impl::makeView(str);
    const auto prefixV = impl::makeView(prefix);
    return strV.size() >= prefixV.size() && equalAsciiNoCase(strV.substr(0, prefixV.size()), prefixV);
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strV  = impl::makeView(str);
    const auto termV = impl::makeView(term);
    assert(!termV.empty());

    const size_t pos = strV.rfind(termV);
    if (pos == strV.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return impl::makeResult<S>(strV.substr(pos + termV.size()));
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strV  = impl::makeView(str);
    const auto termV = impl::makeView(term);
    assert(!termV.empty());

    const size_t pos = strV.rfind(termV);
    if (pos == strV.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return impl::makeResult<S>(strV.substr(0, pos));
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strV  = impl::makeView(str);
    const auto termV = impl::makeView(term);
    assert(!termV.empty());

    const size_t pos = strV.find(termV);
    if (pos == strV.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return impl::makeResult<S>(strV.substr(pos + termV.size()));
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strV  = impl::makeView(str);
    const auto termV = impl::makeView(term);
    assert(!termV.empty());

    const size_t pos = strV.find(termV);
    if (pos == strV.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return impl::makeResult<S>(strV.substr(0, pos));
}


template <class S, class T, class U> inline
S replaceCpy(const S& str, const T& oldTerm, const U& newTerm)
{
    const auto strV = impl::makeView(str);
    const auto oldV = impl::makeView(oldTerm);
    const auto newV = impl::makeView(newTerm);
    assert(!oldV.empty());

    S output;
    for (size_t pos = 0;;)
    {
        const size_t posFound = strV.find(oldV, pos);
        if (posFound == strV.npos)
        {
            output += impl::makeResult<S>(strV.substr(pos));
            return output;
        }
        output += impl::makeResult<S>(strV.substr(pos, posFound - pos));
        output += impl::makeResult<S>(newV);
        pos = posFound + oldV.size();
    }
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    str = replaceCpy(str, oldTerm, newTerm);
}


template <class S, class Function> inline
void trim(S& str, TrimSide side, Function trimThisChar)
{
    auto itFirst = str.begin();
    auto itLast  = str.end();

    if (side == TrimSide::right || side == TrimSide::both)
        while (itLast != itFirst && trimThisChar(*(itLast - 1)))
            --itLast;

    if (side == TrimSide::left || side == TrimSide::both)
        while (itFirst != itLast && trimThisChar(*itFirst))
            ++itFirst;

    str = S(itFirst, itLast);
}


template <class S> inline
void trim(S& str, TrimSide side)
{
    using CharType = std::remove_cvref_t<decltype(str[0])>;
    trim(str, side, [](CharType c) { return isWhiteSpace(c); });
}


template <class S> inline
S trimCpy(const S& str, TrimSide side)
{
    S tmp = str;
    trim(tmp, side);
    return tmp;
}


template <class S, class Char, class Function> inline
void split(const S& str, Char delimiter, Function onItem)
{
    const auto strV = impl::makeView(str);
    for (size_t pos = 0;;)
    {
        const size_t posDelim = strV.find(delimiter, pos);
        if (posDelim == strV.npos)
            return onItem(strV.substr(pos));

        onItem(strV.substr(pos, posDelim - pos));
        pos = posDelim + 1;
    }
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    if constexpr (std::is_same_v<S, std::wstring>)
        return std::to_wstring(number);
    else
        return std::to_string(number);
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_integral_v<Num>);
    std::string buf;
    for (const auto c : impl::makeView(str))
        if (!isWhiteSpace(c))
            buf += static_cast<char>(c);

    Num number = 0;
    const std::from_chars_result rv = std::from_chars(buf.data(), buf.data() + buf.size(), number);
    if (rv.ec != std::errc() || rv.ptr != buf.data() + buf.size())
        return 0;
    return number;
}
}

#endif //STRING_TOOLS_H_4720195638217409
