// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_IO_H_5502817364092851
#define FILE_IO_H_5502817364092851

#include "file_access.h"


namespace zen
{
/*  OS-buffered file I/O:
    - sequential read/write accesses
    - better error reporting
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const Zstring& getFilePath() const { return filePath_; }

    static constexpr size_t blockSize = 256 * 1024;

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

    const struct stat& getStatBuffered(); //throw FileError

protected:
    FileBase(FileHandle handle, const Zstring& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const Zstring filePath_;
    std::optional<struct stat> statBuf_;
};

//-----------------------------------------------------------------------------------------------

class FileInputPlain : public FileBase
{
public:
    explicit FileInputPlain(const Zstring& filePath); //throw FileError

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError
};


class FileOutputPlain : public FileBase
{
public:
    //mode: permission bits of a newly created file, umask applies
    FileOutputPlain(const Zstring& filePath, mode_t mode = 0666); //throw FileError, ErrorTargetExisting
    ~FileOutputPlain();

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError

    void write(std::string_view bytes); //throw FileError

    //close() when done, or else file is considered incomplete and will be deleted!
};

//--------------------------------------------------------------------

std::string getFileContent(const Zstring& filePath); //throw FileError

//create a new file: fails if the path is occupied
void createFileWithContent(const Zstring& filePath, std::string_view bytes); //throw FileError, ErrorTargetExisting

//overwrite transactionally: write temporary file first, then rename
void setFileContent(const Zstring& filePath, std::string_view bytes); //throw FileError

//unique path next to "itemPath" for transactional writes
Zstring getPathWithTempName(const Zstring& itemPath);
}

#endif //FILE_IO_H_5502817364092851
