// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <algorithm>
#include <gtest/gtest.h>
#include <zen/file_error.h>
#include <zen/extra_log.h>
#include <TransitFS/Source/afs/abstract.h>

using namespace zen;
using namespace tfs;


namespace
{
template <class E>
FileErrorKind kindAfterCatchByBase()
{
    try
    {
        throw E(L"message", L"details", Zstr("/some/path"));
    }
    catch (const FileError& e)
    {
        return e.getKind();
    }
}
}


TEST(FileError, KindSurvivesCatchByBase)
{
    EXPECT_EQ(kindAfterCatchByBase<ErrorTargetExisting      >(), FileErrorKind::targetExisting);
    EXPECT_EQ(kindAfterCatchByBase<ErrorTargetNotExisting   >(), FileErrorKind::targetNotExisting);
    EXPECT_EQ(kindAfterCatchByBase<ErrorOperationUnsupported>(), FileErrorKind::operationUnsupported);
    EXPECT_EQ(kindAfterCatchByBase<ErrorMoveUnsupported     >(), FileErrorKind::operationUnsupported);
    EXPECT_EQ(kindAfterCatchByBase<RecycleBinUnavailable    >(), FileErrorKind::operationUnsupported);
    EXPECT_EQ(kindAfterCatchByBase<ErrorTrashFailure        >(), FileErrorKind::trashFailure);
    EXPECT_EQ(kindAfterCatchByBase<ErrorProtocolFailure     >(), FileErrorKind::protocolFailure);
    EXPECT_EQ(kindAfterCatchByBase<ErrorNoFileName          >(), FileErrorKind::noFileName);
    EXPECT_EQ(kindAfterCatchByBase<ErrorNotUtf8Path         >(), FileErrorKind::notUtf8Path);
    EXPECT_EQ(kindAfterCatchByBase<ErrorFileTypeUnsupported >(), FileErrorKind::fileTypeUnsupported);
}

TEST(FileError, PlainFileErrorIsIoFailure)
{
    const FileError e(L"Cannot read file.", L"EIO: Input/output error");

    EXPECT_EQ(e.getKind(), FileErrorKind::ioFailure);
    EXPECT_TRUE(e.getItemPath().empty());
    EXPECT_EQ(e.toString(), L"Cannot read file.\n\nEIO: Input/output error");
}

TEST(FileError, TargetExistingPredicate)
{
    EXPECT_TRUE (isTargetExisting(ErrorTargetExisting(L"exists", L"", Zstr("/dst/existing.txt"))));
    EXPECT_FALSE(isTargetExisting(ErrorTargetNotExisting(L"missing")));
    EXPECT_FALSE(isTargetExisting(FileError(L"other")));
}

TEST(FileError, CarriesItemPath)
{
    const ErrorTargetExisting e(L"The item is already existing.", L"", Zstr("/dst/existing.txt"));

    EXPECT_EQ(e.getItemPath(), Zstr("/dst/existing.txt"));
    EXPECT_EQ(e.toString(), L"The item is already existing."); //no details => no separator
}

TEST(FileError, CopyKeepsKind)
{
    const FileError original = ErrorProtocolFailure(L"FTP failure", L"550", Zstr("/x"));
    const FileError copy = original; //e.g. stored inside TransitState

    EXPECT_EQ(copy.getKind(), FileErrorKind::protocolFailure);
    EXPECT_EQ(copy.getItemPath(), Zstr("/x"));
}

TEST(SysError, FormatSystemError)
{
    const std::wstring msg = formatSystemError("open", ENOENT);

    EXPECT_TRUE(startsWith(msg, L"ENOENT: ")) << utfTo<std::string>(msg);
    EXPECT_TRUE(endsWith(msg, L" [open]")) << utfTo<std::string>(msg);
}

TEST(SysError, FormatSystemErrorWithoutCode)
{
    EXPECT_EQ(formatSystemError("curl_easy_perform", L"", L"Timeout"), L"Timeout [curl_easy_perform]");
    EXPECT_EQ(formatSystemError("", L"CURLE_OK", L""), L"CURLE_OK");
}

TEST(ErrorLog, StatsAndFormatting)
{
    ErrorLog log;
    logMsg(log, L"first", MSG_TYPE_INFO);
    logMsg(log, L"second\nline two", MSG_TYPE_WARNING);
    logMsg(log, L"third", MSG_TYPE_ERROR);

    const ErrorLogStats stats = getStats(log);
    EXPECT_EQ(stats.info,    1);
    EXPECT_EQ(stats.warning, 1);
    EXPECT_EQ(stats.error,   1);

    const std::string formatted = formatMessage(log[1]);
    EXPECT_NE(formatted.find("Warning:  second\n"), std::string::npos) << formatted;
    EXPECT_TRUE(endsWith(formatted, "line two\n")) << formatted;

    //continuation line is indented below the message start
    const size_t prefixLen = formatted.find("second");
    EXPECT_EQ(formatted.substr(formatted.find('\n') + 1, prefixLen), std::string(prefixLen, ' '));
}

TEST(ErrorLog, FilterBySeverity)
{
    ErrorLog log;
    EXPECT_EQ(getMaxSeverity(log), 0);

    logMsg(log, L"Skipped \"a\".", MSG_TYPE_INFO);
    logMsg(log, L"Overwrote \"b\".", MSG_TYPE_INFO);
    EXPECT_EQ(getMaxSeverity(log), MSG_TYPE_INFO);

    logMsg(log, L"Operation aborted", MSG_TYPE_WARNING);
    EXPECT_EQ(getMaxSeverity(log), MSG_TYPE_WARNING);

    const ErrorLog warnings = filterLog(log, MSG_TYPE_WARNING | MSG_TYPE_ERROR);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].message, "Operation aborted");

    const std::string quiet = formatLog(log, MSG_TYPE_WARNING | MSG_TYPE_ERROR);
    EXPECT_EQ(quiet.find("Skipped"), std::string::npos) << quiet;
    EXPECT_NE(quiet.find("Operation aborted"), std::string::npos) << quiet;

    const std::string full = formatLog(log);
    EXPECT_LT(full.find("Skipped"), full.find("Overwrote")) << full;
    EXPECT_EQ(std::count(full.begin(), full.end(), '\n'), 3);
}

TEST(ExtraLog, FetchEmptiesTheLog)
{
    fetchExtraLog(); //discard entries of previous tests

    logExtraInfo(L"info entry");
    logExtraWarning(L"warning entry");

    const ErrorLog log = fetchExtraLog();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].type, MSG_TYPE_INFO);
    EXPECT_EQ(log[0].message, "info entry");
    EXPECT_EQ(log[1].type, MSG_TYPE_WARNING);

    EXPECT_TRUE(fetchExtraLog().empty());
}

namespace
{
struct BracketTranslation : public TranslationHandler
{
    std::wstring translate(const std::wstring& text) const override { return L"[" + text + L"]"; }

    std::wstring translate(const std::wstring& singular, const std::wstring& plural, int64_t n) const override
    {
        return replaceCpy(n == 1 ? singular : plural, L"%x", numberTo<std::wstring>(n)) + L"!";
    }
};
}

TEST(Translation, HandlerAppliesToMessages)
{
    EXPECT_EQ(_("Cannot delete file %x."), L"Cannot delete file %x.");
    EXPECT_EQ(_P("1 sec", "%x sec", 5), L"5 sec");

    setTranslator(std::make_unique<BracketTranslation>());
    ZEN_ON_SCOPE_EXIT(setTranslator(nullptr));

    EXPECT_EQ(_("Cannot delete file %x."), L"[Cannot delete file %x.]");
    EXPECT_EQ(_P("1 sec", "%x sec", 1), L"1 sec!");
    EXPECT_EQ(_P("1 sec", "%x sec", 5), L"5 sec!");

    const ErrorTargetExisting e(replaceCpy(_("The item %x is already existing."), L"%x", fmtPath(Zstr("/dst/a.txt"))), L"", Zstr("/dst/a.txt"));
    EXPECT_EQ(e.toString(), L"[The item \"/dst/a.txt\" is already existing.]");
}
