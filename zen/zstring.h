// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ZSTRING_H_6610385927140258
#define ZSTRING_H_6610385927140258

#include <stdexcept> //not used by this header, but the "rest of the world" needs it!
#include <algorithm>
#include "utf.h"     //


    using Zchar = char;
    #define Zstr(x) x


//native path string: UTF-8 on Linux
using Zstring = std::basic_string<Zchar>;

using ZstringView = std::basic_string_view<Zchar>;

//log messages and other non-path text
using Zstringc = std::string;


enum class UnicodeNormalForm
{
    nfc, //precomposed
    nfd, //decomposed
    native = nfc,
};

/* Caveat: don't expect input/output string sizes to match:
    - different UTF-8 encoding length of lower-case chars
    - output is Unicode-normalized
    - broken UTF-8 is band-aided with REPLACEMENT_CHAR                     */
Zstring getLowerCase(const Zstring& str);

inline bool isAsciiString(ZstringView str) { return std::all_of(str.begin(), str.end(), [](Zchar c) { return zen::isAsciiChar(c); }); }

#endif //ZSTRING_H_6610385927140258
