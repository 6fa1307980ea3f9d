// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include "file_io.h"
#include <sys/stat.h>
#include <sys/file.h> //flock
#include <fcntl.h>    //open
#include <unistd.h>   //close, read, write, lseek, ftruncate

using namespace rz;


const struct stat& FileBase::getStatBuffered() //throw FileError
{
    if (!statBuf_)
        try
        {
            if (hFile_ == invalidFileHandle)
                throw SysError("Contract error: getStatBuffered() called after close().");

            struct stat fileInfo = {};
            if (::fstat(hFile_, &fileInfo) != 0)
                THROW_LAST_SYS_ERROR("fstat");
            statBuf_ = std::move(fileInfo);
        }
        catch (const SysError& e) { throwFileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(filePath_)), e); }

    return *statBuf_;
}


FileBase::~FileBase()
{
    if (hFile_ != invalidFileHandle)
        try
        {
            close(); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


void FileBase::close() //throw FileError
{
    try
    {
        if (hFile_ == invalidFileHandle)
            throw SysError("Contract error: close() called more than once.");
        const FileHandle fd = std::exchange(hFile_, invalidFileHandle); //even on error: "close() should not be retried after an error"
        if (::close(fd) != 0)
            THROW_LAST_SYS_ERROR("close");
    }
    catch (const SysError& e) { throwFileError(replaceCpy("Cannot write file %x.", "%x", fmtPath(getFilePath())), e); }
}


void FileBase::seekImpl(uint64_t offset, const std::string& errorMsg) //throw FileError
{
    if (::lseek(hFile_, static_cast<off_t>(offset), SEEK_SET) == -1)
        THROW_LAST_FILE_ERROR(errorMsg, "lseek");
}

//----------------------------------------------------------------------------------------------------

namespace
{
//an advisory lock held by another open file description => transient "file in use" condition
void lockFile(FileBase::FileHandle fd, int operation) //throw SysError
{
    int rv = 0;
    do
    {
        rv = ::flock(fd, operation | LOCK_NB);
    }
    while (rv != 0 && errno == EINTR);

    if (rv != 0)
        THROW_LAST_SYS_ERROR(operation == LOCK_SH ? "flock(LOCK_SH)" : "flock(LOCK_EX)"); //EWOULDBLOCK => ErrorFileLocked
}


std::pair<FileBase::FileHandle, struct stat>
openHandleForRead(const Zstring& filePath) //throw FileError, ErrorFileLocked
{
    try
    {
        //caveat: check for file types that block during open(): character device, block device, named pipe
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0) //follows symlinks
            THROW_LAST_SYS_ERROR("stat");

        if (!S_ISREG(fileInfo.st_mode) &&
            !S_ISDIR(fileInfo.st_mode)) //open() will fail with "EISDIR: Is a directory" => nice
        {
            const std::string typeName = [m = fileInfo.st_mode]
            {
                std::string name =
                S_ISCHR (m) ? "character device" : //e.g. /dev/null
                S_ISBLK (m) ? "block device" :     //e.g. /dev/sda1
                S_ISFIFO(m) ? "FIFO, named pipe" :
                S_ISSOCK(m) ? "socket" : "";
                if (!name.empty())
                    name += ", ";
                return name + printNumber<std::string>("0%06o", m & S_IFMT);
            }();
            throw SysError("Unsupported item type. [" + typeName + ']');
        }

        const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
        if (fdFile == -1) //don't check "< 0" -> docu seems to allow "-2" to be a valid file handle
            THROW_LAST_SYS_ERROR("open");
        RZ_ON_SCOPE_FAIL(::close(fdFile));

        lockFile(fdFile, LOCK_SH); //throw SysError

        return {fdFile /*pass ownership*/, fileInfo};
    }
    catch (const SysError& e) { throwFileError(replaceCpy("Cannot open file %x.", "%x", fmtPath(filePath)), e); }
}
}


FileInputPlain::FileInputPlain(const Zstring& filePath) :
    FileInputPlain(openHandleForRead(filePath), filePath) {} //throw FileError, ErrorFileLocked


FileInputPlain::FileInputPlain(const std::pair<FileBase::FileHandle, struct stat>& fileDetails, const Zstring& filePath) :
    FileBase(fileDetails.first, filePath)
{
    setStatBuffered(fileDetails.second);

    //optimize read-ahead on input file:
    //returns the error code instead of setting errno
    if (const int ec = ::posix_fadvise(getHandle(), 0 /*offset*/, 0 /*len*/, POSIX_FADV_SEQUENTIAL); ec != 0) //"len == 0" means "end of the file"
        throwFileError(replaceCpy("Cannot read file %x.", "%x", fmtPath(filePath)), SysError(formatSystemError("posix_fadvise(POSIX_FADV_SEQUENTIAL)", ec), ec));
}


//may return short, only 0 means EOF! =>  CONTRACT: bytesToRead > 0!
size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw FileError
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(getHandle(), buffer, bytesToRead);
        }
        while (bytesRead < 0 && errno == EINTR); //if ::read is interrupted (EINTR) right in the middle, it will return successfully with "bytesRead < bytesToRead"

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("read");

        ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= bytesToRead); //better safe than sorry
        return bytesRead; //"zero indicates end of file"
    }
    catch (const SysError& e) { throwFileError(replaceCpy("Cannot read file %x.", "%x", fmtPath(getFilePath())), e); }
}


void FileInputPlain::seek(uint64_t offset) //throw FileError
{
    seekImpl(offset, replaceCpy("Cannot read file %x.", "%x", fmtPath(getFilePath())));
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForWrite(const Zstring& filePath, FileOutputPlain::OpenMode mode, mode_t permissions) //throw FileError, ErrorTargetExisting, ErrorFileLocked
{
    try
    {
        const int flags = O_CREAT | O_WRONLY | O_CLOEXEC | (mode == FileOutputPlain::OpenMode::createNew ? O_EXCL : 0);

        const int fdFile = ::open(filePath.c_str(), flags, permissions); //umask will be applied implicitly!
        if (fdFile == -1)
        {
            const int ec = errno; //copy before making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy("Cannot write file %x.", "%x", fmtPath(filePath)), formatSystemError("open", ec));

            THROW_LAST_SYS_ERROR("open");
        }
        RZ_ON_SCOPE_FAIL(::close(fdFile));

        lockFile(fdFile, LOCK_EX); //throw SysError

        return fdFile; //pass ownership
    }
    catch (const SysError& e) { throwFileError(replaceCpy("Cannot write file %x.", "%x", fmtPath(filePath)), e); }
}
}


FileOutputPlain::FileOutputPlain(const Zstring& filePath, OpenMode mode, mode_t permissions) :
    FileBase(openHandleForWrite(filePath, mode, permissions), filePath) {} //throw FileError, ErrorTargetExisting, ErrorFileLocked


//may return short! CONTRACT: bytesToWrite > 0
size_t FileOutputPlain::tryWrite(const void* buffer, size_t bytesToWrite) //throw FileError
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesWritten = 0;
        do
        {
            bytesWritten = ::write(getHandle(), buffer, bytesToWrite);
        }
        while (bytesWritten < 0 && errno == EINTR);

        if (bytesWritten <= 0)
        {
            if (bytesWritten == 0) //comment in safe-read.c suggests to treat this as an error due to buggy drivers
                errno = ENOSPC;

            THROW_LAST_SYS_ERROR("write");
        }

        ASSERT_SYSERROR(static_cast<size_t>(bytesWritten) <= bytesToWrite); //better safe than sorry
        return bytesWritten;
    }
    catch (const SysError& e) { throwFileError(replaceCpy("Cannot write file %x.", "%x", fmtPath(getFilePath())), e); }
}


void FileOutputPlain::seek(uint64_t offset) //throw FileError
{
    seekImpl(offset, replaceCpy("Cannot write file %x.", "%x", fmtPath(getFilePath())));
}


void FileOutputPlain::truncate(uint64_t newSize) //throw FileError
{
    if (::ftruncate(getHandle(), static_cast<off_t>(newSize)) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot write file %x.", "%x", fmtPath(getFilePath())), "ftruncate");
}

//----------------------------------------------------------------------------------------------------

void rz::writeAll(FileOutputPlain& fileOut, const void* buffer, size_t bytesToWrite) //throw FileError
{
    for (size_t bytesWritten = 0; bytesWritten < bytesToWrite; )
        bytesWritten += fileOut.tryWrite(static_cast<const char*>(buffer) + bytesWritten, bytesToWrite - bytesWritten); //throw FileError
}


size_t rz::readAll(FileInputPlain& fileIn, void* buffer, size_t bytesToRead) //throw FileError
{
    size_t bytesRead = 0;
    while (bytesRead < bytesToRead)
    {
        const size_t bytesReadNow = fileIn.tryRead(static_cast<char*>(buffer) + bytesRead, bytesToRead - bytesRead); //throw FileError
        if (bytesReadNow == 0) //EOF
            break;
        bytesRead += bytesReadNow;
    }
    return bytesRead;
}


std::string rz::getFileContent(const Zstring& filePath) //throw FileError
{
    FileInputPlain fileIn(filePath); //throw FileError, ErrorFileLocked

    std::string output;
    const size_t blockSize = 64 * 1024;
    for (;;)
    {
        const size_t oldSize = output.size();
        output.resize(oldSize + blockSize);

        const size_t bytesRead = readAll(fileIn, output.data() + oldSize, blockSize); //throw FileError
        output.resize(oldSize + bytesRead);

        if (bytesRead < blockSize) //EOF
            return output;
    }
}


void rz::setFileContent(const Zstring& filePath, std::string_view byteStream) //throw FileError
{
    const Zstring tmpFilePath = getPathWithTempName(filePath);
    {
        FileOutputPlain tmpFile(tmpFilePath, FileOutputPlain::OpenMode::createNew); //throw FileError, (ErrorTargetExisting)
        //take over ownership:
        RZ_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); }
        catch (const FileError& e) { logExtraError(e.toString()); });

        if (!byteStream.empty())
            writeAll(tmpFile, byteStream.data(), byteStream.size()); //throw FileError

        tmpFile.close(); //throw FileError
    }

    RZ_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    //operation finished: move temp file transactionally
    moveAndRenameItem(tmpFilePath, filePath, true /*replaceExisting*/); //throw FileError
}
