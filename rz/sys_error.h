// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef SYS_ERROR_H_5092837465102938
#define SYS_ERROR_H_5092837465102938

#include "scope_guard.h" //
#include "zstring.h"     //not used by this header, but the "rest of the world" needs it!
#include "extra_log.h"   //

#include <cerrno>


namespace rz
{
//evaluate errno and assemble specific error message
using ErrorCode = int;

ErrorCode getLastError();

std::string formatSystemError(const std::string& functionName, const std::string& errorCode, const std::string& errorMsg);
std::string formatSystemError(const std::string& functionName, ErrorCode ec);


//A low-level exception class giving (non-translated) detail information only - same conceptional level like "errno"!
class SysError
{
public:
    explicit SysError(const std::string& msg, ErrorCode ec = 0) : msg_(msg), errorCode_(ec) {}
    const std::string& toString() const { return msg_; }
    ErrorCode getErrorCode() const { return errorCode_; } //0 if not originating from a system call

private:
    std::string msg_;
    ErrorCode errorCode_ = 0;
};


//better leave it as a macro (see comment in file_error.h)
#define THROW_LAST_SYS_ERROR(functionName)                           \
    do { const rz::ErrorCode ecInternal = rz::getLastError(); throw rz::SysError(rz::formatSystemError(functionName, ecInternal), ecInternal); } while (false)


/* Example: ASSERT_SYSERROR(expr);

    Equivalent to:
        if (!expr)
            throw rz::SysError("Assertion failed: \"expr\"");            */
#define ASSERT_SYSERROR(expr) ASSERT_SYSERROR_IMPL(expr, #expr) //throw SysError



//######################## implementation ########################
inline
ErrorCode getLastError()
{
    return errno; //don't use "::" prefix, errno is a macro!
}


std::string getSystemErrorDescription(ErrorCode ec); //return empty string on error


namespace impl
{
inline bool validateBool(bool  b) { return b; }
inline bool validateBool(void* b) { return b; }
bool validateBool(int) = delete; //catch unintended bool conversions
}
#define ASSERT_SYSERROR_IMPL(expr, exprStr) \
    { if (!rz::impl::validateBool(expr))        \
            throw rz::SysError("Assertion failed: \"" exprStr "\""); }
}

#endif //SYS_ERROR_H_5092837465102938
