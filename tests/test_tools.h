// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef TEST_TOOLS_H_5029384756102938
#define TEST_TOOLS_H_5029384756102938

#include <mutex>
#include <vector>
#include <rz/file_access.h>
#include "base/process_callback.h"


namespace rpl
{
namespace test
{
//unique folder below $TMPDIR, deleted recursively on destruction
class TempFolder
{
public:
    TempFolder();
    ~TempFolder();

    const Zstring& path() const { return path_; }
    Zstring operator/(const Zstring& relPath) const { return rz::appendPath(path_, relPath); }

private:
    TempFolder           (const TempFolder&) = delete;
    TempFolder& operator=(const TempFolder&) = delete;

    Zstring path_;
};

void removeFolderRecursively(const Zstring& folderPath); //throw FileError

//creates missing parent folders
void writeFile(const Zstring& filePath, const std::string& content); //throw FileError
std::string readFile(const Zstring& filePath); //throw FileError

void createSymlink(const Zstring& linkPath, const Zstring& targetPath); //throw FileError

//deterministic, non-repeating within 4 MiB chunks
std::string makeTestContent(size_t size);


//collects all messages; thread-safe
class TestLog : public LogCallback
{
public:
    struct Entry
    {
        std::string msg;
        MsgType type = MsgType::info;
        std::string correlationId;
    };

    void logMessage(const std::string& msg, MsgType type, const std::string& correlationId) override
    {
        std::lock_guard dummy(lock_);
        entries_.push_back({msg, type, correlationId});
    }

    std::vector<Entry> getEntries()
    {
        std::lock_guard dummy(lock_);
        return entries_;
    }

    size_t count(MsgType type)
    {
        std::lock_guard dummy(lock_);
        size_t n = 0;
        for (const Entry& e : entries_)
            if (e.type == type)
                ++n;
        return n;
    }

private:
    std::mutex lock_;
    std::vector<Entry> entries_;
};


//holds an exclusive advisory lock on a file through a separate open file description
class FileLockHolder
{
public:
    explicit FileLockHolder(const Zstring& filePath); //throw FileError
    ~FileLockHolder();

    void release();

private:
    FileLockHolder           (const FileLockHolder&) = delete;
    FileLockHolder& operator=(const FileLockHolder&) = delete;

    int fd_ = -1;
};
}
}

#endif //TEST_TOOLS_H_5029384756102938
