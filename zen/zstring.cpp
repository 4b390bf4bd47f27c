// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "zstring.h"
    #include <glib.h>
    #include "sys_error.h"

using namespace zen;


namespace
{
Zstring getValidUtf(const Zstring& str)
{
    if (isValidUtf(str)) //avoid memory allocation in the standard case
        return str;

    Zstring validStr;
    impl::Utf8Decoder decoder(str);
    while (const std::optional<impl::CodePoint> cp = decoder.getNext())
        impl::codePointToUtf8(*cp, [&](Zchar ch) { validStr += ch; });
    return validStr;
}


Zstring getUnicodeNormalFormNonAscii(const Zstring& str, UnicodeNormalForm form)
{
    //Example: const char* decomposed  = "\x6f\xcc\x81"; //ó
    //         const char* precomposed = "\xc3\xb3"; //ó
    assert(!isAsciiString(str));

    const Zstring& strValidUtf = getValidUtf(str);
    try
    {
        gchar* strNorm = ::g_utf8_normalize(strValidUtf.c_str(), strValidUtf.size(), form == UnicodeNormalForm::nfc ? G_NORMALIZE_NFC : G_NORMALIZE_NFD);
        if (!strNorm)
            throw SysError(formatSystemError("g_utf8_normalize", L"", L"Conversion failed."));
        ZEN_ON_SCOPE_EXIT(::g_free(strNorm));

        return strNorm;
    }
    catch (const SysError& e)
    {
        throw std::runtime_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Error normalizing string:" + '\n' +
                                 strValidUtf + "\n\n" + utfTo<std::string>(e.toString()));
    }
}
}


Zstring getLowerCase(const Zstring& str)
{
    if (isAsciiString(str)) //fast path: identical to g_utf8_strdown() for ASCII
    {
        Zstring output = str;
        for (Zchar& c : output)
            c = asciiToLower(c);
        return output;
    }

    const Zstring strNorm = getUnicodeNormalFormNonAscii(str, UnicodeNormalForm::native);

    gchar* strLower = ::g_utf8_strdown(strNorm.c_str(), strNorm.size()); //don't use std::towlower: *incomplete* and locale-dependent!
    if (!strLower)
        throw std::runtime_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Error converting string to lower case:\n" + strNorm);
    ZEN_ON_SCOPE_EXIT(::g_free(strLower));

    return strLower;
}

