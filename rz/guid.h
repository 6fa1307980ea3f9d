// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef GUID_H_3847561029384756
#define GUID_H_3847561029384756

#include <unistd.h> //getentropy
#include <stdexcept>
#include "sys_error.h"


namespace rz
{
inline
std::string generateGUID() //creates a 16-byte GUID
{
    std::string guid(16, '\0');

    if (::getentropy(guid.data(), guid.size()) != 0) //"The maximum permitted value for the length argument is 256"
        throw std::runtime_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Failed to generate GUID." + "\n\n" +
                                 formatSystemError("getentropy", errno));
    return guid;
}
}

#endif //GUID_H_3847561029384756
