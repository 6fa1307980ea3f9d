// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef FILE_ERROR_H_7381920465738291
#define FILE_ERROR_H_7381920465738291

#include "sys_error.h" //we'll need this later anyway!


namespace rz
{
class FileError //A high-level exception class giving detailed context information for end users
{
public:
    explicit FileError(const std::string& msg) : msg_(msg) {}
    FileError(const std::string& msg, const std::string& details) : msg_(msg + "\n\n" + details) {}
    virtual ~FileError() {}

    const std::string& toString() const { return msg_; }

private:
    std::string msg_;
};

#define DEFINE_NEW_FILE_ERROR(X) struct X : public rz::FileError { X(const std::string& msg) : FileError(msg) {} X(const std::string& msg, const std::string& descr) : FileError(msg, descr) {} };

DEFINE_NEW_FILE_ERROR(ErrorTargetExisting)
DEFINE_NEW_FILE_ERROR(ErrorFileLocked)     //transient: another process holds a conflicting lock
DEFINE_NEW_FILE_ERROR(ErrorAccessDenied)   //EACCES, EPERM
DEFINE_NEW_FILE_ERROR(ErrorSourceNotFound)
DEFINE_NEW_FILE_ERROR(ErrorCyclicLink)
DEFINE_NEW_FILE_ERROR(ErrorLinkCreation)


//map errno to the matching FileError type
[[noreturn]] inline void throwFileError(const std::string& msg, const SysError& e)
{
    switch (e.getErrorCode())
    {
        case EACCES:
        case EPERM:
            throw ErrorAccessDenied(msg, e.toString());
        case EBUSY:
        case ETXTBSY:
        case EAGAIN: //== EWOULDBLOCK
            throw ErrorFileLocked(msg, e.toString());
        default:
            throw FileError(msg, e.toString());
    }
}


//CAVEAT: errno is easily overwritten => evaluate *before* making any (indirect) system calls!
#define THROW_LAST_FILE_ERROR(msg, functionName)                           \
    do { const rz::ErrorCode ecInternal = rz::getLastError(); rz::throwFileError(msg, rz::SysError(rz::formatSystemError(functionName, ecInternal), ecInternal)); } while (false)

//----------- facilitate usage of std::string for error messages --------------------

inline std::string fmtPath(const Zstring& displayPath) { return '"' + displayPath + '"'; }
inline std::string fmtPath(const char* displayPath) { return fmtPath(Zstring(displayPath)); } //resolve overload ambiguity
}

#endif //FILE_ERROR_H_7381920465738291
