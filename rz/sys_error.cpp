// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#include "sys_error.h"
#include <cstring> //strerror_r

using namespace rz;


namespace
{
std::string formatSystemErrorCode(ErrorCode ec)
{
    switch (ec) //the codes a file copy can realistically run into
    {
            RZ_CHECK_CASE_FOR_CONSTANT(EPERM);
            RZ_CHECK_CASE_FOR_CONSTANT(ENOENT);
            RZ_CHECK_CASE_FOR_CONSTANT(EINTR);
            RZ_CHECK_CASE_FOR_CONSTANT(EIO);
            RZ_CHECK_CASE_FOR_CONSTANT(ENXIO);
            RZ_CHECK_CASE_FOR_CONSTANT(EBADF);
            RZ_CHECK_CASE_FOR_CONSTANT(EAGAIN);
            RZ_CHECK_CASE_FOR_CONSTANT(ENOMEM);
            RZ_CHECK_CASE_FOR_CONSTANT(EACCES);
            RZ_CHECK_CASE_FOR_CONSTANT(EFAULT);
            RZ_CHECK_CASE_FOR_CONSTANT(EBUSY);
            RZ_CHECK_CASE_FOR_CONSTANT(EEXIST);
            RZ_CHECK_CASE_FOR_CONSTANT(EXDEV);
            RZ_CHECK_CASE_FOR_CONSTANT(ENODEV);
            RZ_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
            RZ_CHECK_CASE_FOR_CONSTANT(EISDIR);
            RZ_CHECK_CASE_FOR_CONSTANT(EINVAL);
            RZ_CHECK_CASE_FOR_CONSTANT(ENFILE);
            RZ_CHECK_CASE_FOR_CONSTANT(EMFILE);
            RZ_CHECK_CASE_FOR_CONSTANT(ETXTBSY);
            RZ_CHECK_CASE_FOR_CONSTANT(EFBIG);
            RZ_CHECK_CASE_FOR_CONSTANT(ENOSPC);
            RZ_CHECK_CASE_FOR_CONSTANT(ESPIPE);
            RZ_CHECK_CASE_FOR_CONSTANT(EROFS);
            RZ_CHECK_CASE_FOR_CONSTANT(EMLINK);
            RZ_CHECK_CASE_FOR_CONSTANT(EPIPE);
            RZ_CHECK_CASE_FOR_CONSTANT(ERANGE);
            RZ_CHECK_CASE_FOR_CONSTANT(EDEADLK);
            RZ_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
            RZ_CHECK_CASE_FOR_CONSTANT(ENOLCK);
            RZ_CHECK_CASE_FOR_CONSTANT(ENOSYS);
            RZ_CHECK_CASE_FOR_CONSTANT(ENOTEMPTY);
            RZ_CHECK_CASE_FOR_CONSTANT(ELOOP);
            RZ_CHECK_CASE_FOR_CONSTANT(ENODATA);
            RZ_CHECK_CASE_FOR_CONSTANT(EOVERFLOW);
            RZ_CHECK_CASE_FOR_CONSTANT(EILSEQ);
            RZ_CHECK_CASE_FOR_CONSTANT(ENOTSUP);
            RZ_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
            RZ_CHECK_CASE_FOR_CONSTANT(ESTALE);
            RZ_CHECK_CASE_FOR_CONSTANT(EDQUOT);
            RZ_CHECK_CASE_FOR_CONSTANT(ECANCELED);
            RZ_CHECK_CASE_FOR_CONSTANT(EREMOTEIO);
            RZ_CHECK_CASE_FOR_CONSTANT(ENOMEDIUM);
        default:
            return replaceCpy("Error code %x", "%x", numberTo<std::string>(ec));
    }
}
}


std::string rz::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode ecCurrent = getLastError(); //not necessarily == ec
    RZ_ON_SCOPE_EXIT(errno = ecCurrent);

    char buffer[256] = {};
    const char* errorMsg = ::strerror_r(ec, buffer, sizeof(buffer)); //GNU variant: may or may not use "buffer"
    if (!errorMsg)
        return std::string();

    return trimCpy(errorMsg);
}


std::string rz::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::string rz::formatSystemError(const std::string& functionName, const std::string& errorCode, const std::string& errorMsg)
{
    std::string output = trimCpy(errorCode);

    const std::string errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += ": ";

    output += errorMsgFmt;

    if (!functionName.empty())
        output += " [" + functionName + ']';

    return trimCpy(output);
}
