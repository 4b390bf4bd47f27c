// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "recycler.h"

    #include <gio/gio.h>
    #include "scope_guard.h"

using namespace zen;


void zen::moveToRecycleBin(const Zstring& itemPath) //throw FileError, RecycleBinUnavailable, ErrorTrashFailure
{
    GFile* file = ::g_file_new_for_path(itemPath.c_str()); //never fails according to docu
    ZEN_ON_SCOPE_EXIT(g_object_unref(file);)

    GError* error = nullptr;
    ZEN_ON_SCOPE_EXIT(if (error) ::g_error_free(error));

    if (!::g_file_trash(file, nullptr, &error))
    {
        if (error && error->domain == G_IO_ERROR && error->code == G_IO_ERROR_NOT_FOUND)
            throw ErrorTargetNotExisting(replaceCpy(_("Unable to move %x to the recycle bin."), L"%x", fmtPath(itemPath)),
                                         formatGlibError("g_file_trash", error), itemPath);

        /*  g_file_trash() fails with different error codes/messages when trash is unavailable:
                GLib 2.42: G_IO_ERROR_NOT_SUPPORTED: Unable to find or create trash directory
                GLib 2.56: G_IO_ERROR_FAILED:        Unable to find or create trash directory for file.txt => localized!
                GLib 2.64: G_IO_ERROR_NOT_SUPPORTED: Trashing on system internal mounts is not supported
            => only the untranslated English message is recognized for G_IO_ERROR_FAILED      */
        const bool trashUnavailable = error && error->domain == G_IO_ERROR &&
                                      (error->code == G_IO_ERROR_NOT_SUPPORTED ||
                                       (error->code == G_IO_ERROR_FAILED && contains(error->message, "Unable to find or create trash directory")));
        if (trashUnavailable)
            throw RecycleBinUnavailable(replaceCpy(_("The recycle bin is not available for %x."), L"%x", fmtPath(itemPath)),
                                        formatGlibError("g_file_trash", error), itemPath);

        throw ErrorTrashFailure(replaceCpy(_("Unable to move %x to the recycle bin."), L"%x", fmtPath(itemPath)),
                                formatGlibError("g_file_trash", error), itemPath);
    }
}
