// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef FILE_IO_H_7465019283746501
#define FILE_IO_H_7465019283746501

#include <optional>
#include "file_access.h"
#include "crc.h"
#include "guid.h"


namespace rz
{
/*  OS-buffered file I/O:
    - better error reporting
    - advisory lock (flock) held for the lifetime of the handle
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static constexpr int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const Zstring& getFilePath() const { return filePath_; }

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

    const struct stat& getStatBuffered(); //throw FileError

protected:
    FileBase(FileHandle handle, const Zstring& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

    void setStatBuffered(const struct stat& fileInfo) { statBuf_ = fileInfo; }

    void seekImpl(uint64_t offset, const std::string& errorMsg); //throw FileError

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
    //takes a shared lock: fails with ErrorFileLocked if another process holds an exclusive lock
    explicit FileInputPlain(const Zstring& filePath); //throw FileError, ErrorFileLocked

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError

    void seek(uint64_t offset); //throw FileError

private:
    FileInputPlain(const std::pair<FileBase::FileHandle, struct stat>& fileDetails, const Zstring& filePath);
};


class FileOutputPlain : public FileBase
{
public:
    enum class OpenMode
    {
        createNew,      //fail with ErrorTargetExisting if existing
        createOrAppend, //keep existing content (resume)
    };
    //takes an exclusive lock: fails with ErrorFileLocked if another process holds a lock
    FileOutputPlain(const Zstring& filePath, OpenMode mode, mode_t permissions = 0666); //throw FileError, ErrorTargetExisting, ErrorFileLocked

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError

    void seek(uint64_t offset); //throw FileError
    void truncate(uint64_t newSize); //throw FileError

    //unlike regular stream output, an incomplete file is NOT deleted on destruction: it may be resumed
};

//-----------------------------------------------------------------------------------------------

//write all bytes, retrying short writes
void writeAll(FileOutputPlain& fileOut, const void* buffer, size_t bytesToWrite); //throw FileError

//read until "bytesToRead" or EOF; returns bytes read
size_t readAll(FileInputPlain& fileIn, void* buffer, size_t bytesToRead); //throw FileError

//stream I/O convenience functions:

inline
Zstring getPathWithTempName(const Zstring& filePath) //generate (hopefully) unique file name
{
    const Zstring shortGuid = printNumber<Zstring>("%04x", static_cast<unsigned int>(getCrc16(generateGUID())));
    return filePath + '.' + shortGuid + ".tmp";
}

[[nodiscard]] std::string getFileContent(const Zstring& filePath); //throw FileError

//overwrites if existing + transactional! :)
void setFileContent(const Zstring& filePath, std::string_view bytes); //throw FileError
}

#endif //FILE_IO_H_7465019283746501
