// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef UTF_H_2093746510238476
#define UTF_H_2093746510238476

#include <cstdint>
#include <optional>
#include "string_tools.h"


namespace zen
{
//convert between UTF-8 (std::string) and UTF-32 (std::wstring on Linux); same-type conversion is a copy
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

bool isValidUtf(std::string_view str); //check for UTF-8 encoding errors

size_t unicodeLength(std::string_view str); //number of code points; broken sequences count as one each








//----------------------- implementation ----------------------------------
namespace impl
{
using CodePoint = uint32_t;

const CodePoint REPLACEMENT_CHAR = 0xfffd;
const CodePoint CODE_POINT_MAX   = 0x10ffff;


class Utf8Decoder
{
public:
    explicit Utf8Decoder(std::string_view str) : it_(str.begin()), last_(str.end()) {}

    //returns REPLACEMENT_CHAR for each broken sequence and sets "hadError"
    std::optional<CodePoint> getNext()
    {
        if (it_ == last_)
            return {};

        const auto lead = static_cast<unsigned char>(*it_++);
        if (lead < 0x80)
            return lead;

        size_t trailCount = 0;
        CodePoint cp = 0;
        CodePoint minValue = 0;
        if ((lead >> 5) == 0b110)
        {
            trailCount = 1;
            cp = lead & 0b1'1111;
            minValue = 0x80;
        }
        else if ((lead >> 4) == 0b1110)
        {
            trailCount = 2;
            cp = lead & 0b1111;
            minValue = 0x800;
        }
        else if ((lead >> 3) == 0b11110)
        {
            trailCount = 3;
            cp = lead & 0b111;
            minValue = 0x10000;
        }
        else
            return error();

        for (size_t i = 0; i < trailCount; ++i)
        {
            if (it_ == last_)
                return error();

            const auto trail = static_cast<unsigned char>(*it_);
            if ((trail >> 6) != 0b10)
                return error();

            cp = (cp << 6) | (trail & 0b11'1111);
            ++it_;
        }

        if (cp < minValue ||                  //overlong encoding
            (0xd800 <= cp && cp <= 0xdfff) || //surrogates are not valid code points
            cp > CODE_POINT_MAX)
            return error();

        return cp;
    }

    bool hadError() const { return hadError_; }

private:
    CodePoint error()
    {
        hadError_ = true;
        return REPLACEMENT_CHAR;
    }

    std::string_view::const_iterator it_;
    const std::string_view::const_iterator last_;
    bool hadError_ = false;
};


template <class Function> inline
void codePointToUtf8(CodePoint cp, Function writeOutput) //"writeOutput" takes a char
{
    if (cp > CODE_POINT_MAX || (0xd800 <= cp && cp <= 0xdfff))
        cp = REPLACEMENT_CHAR;

    if (cp < 0x80)
        writeOutput(static_cast<char>(cp));
    else if (cp < 0x800)
    {
        writeOutput(static_cast<char>(0b1100'0000 | (cp >> 6)));
        writeOutput(static_cast<char>(0b1000'0000 | (cp & 0b11'1111)));
    }
    else if (cp < 0x10000)
    {
        writeOutput(static_cast<char>(0b1110'0000 | (cp >> 12)));
        writeOutput(static_cast<char>(0b1000'0000 | ((cp >> 6) & 0b11'1111)));
        writeOutput(static_cast<char>(0b1000'0000 | (cp & 0b11'1111)));
    }
    else
    {
        writeOutput(static_cast<char>(0b1111'0000 | (cp >> 18)));
        writeOutput(static_cast<char>(0b1000'0000 | ((cp >> 12) & 0b11'1111)));
        writeOutput(static_cast<char>(0b1000'0000 | ((cp >> 6) & 0b11'1111)));
        writeOutput(static_cast<char>(0b1000'0000 | (cp & 0b11'1111)));
    }
}


inline
std::wstring utf8ToWide(std::string_view str)
{
    static_assert(sizeof(wchar_t) == 4); //UTF-32
    std::wstring output;
    output.reserve(str.size());

    Utf8Decoder decoder(str);
    while (const std::optional<CodePoint> cp = decoder.getNext())
        output += static_cast<wchar_t>(*cp);
    return output;
}


inline
std::string wideToUtf8(std::wstring_view str)
{
    std::string output;
    output.reserve(str.size());

    for (const wchar_t c : str)
        codePointToUtf8(static_cast<CodePoint>(c), [&](char ch) { output += ch; });
    return output;
}
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    const auto strV = impl::makeView(str);

    if constexpr (std::is_same_v<decltype(strV), const std::string_view>)
    {
        if constexpr (std::is_same_v<TargetString, std::wstring>)
            return impl::utf8ToWide(strV);
        else
            return TargetString(strV);
    }
    else
    {
        if constexpr (std::is_same_v<TargetString, std::string>)
            return impl::wideToUtf8(strV);
        else
            return TargetString(strV);
    }
}


inline
bool isValidUtf(std::string_view str)
{
    impl::Utf8Decoder decoder(str);
    while (decoder.getNext())
        ;
    return !decoder.hadError();
}


inline
size_t unicodeLength(std::string_view str)
{
    size_t len = 0;
    impl::Utf8Decoder decoder(str);
    while (decoder.getNext())
        ++len;
    return len;
}
}

#endif //UTF_H_2093746510238476
