// *****************************************************************************
// * This file is part of the Replica project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The Replica authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef ZSTRING_H_61093847561029384
#define ZSTRING_H_61093847561029384

#include "string_tools.h"

//native file path string: UTF-8 on Linux
using Zstring = std::string;
using Zchar   = char;
using ZstringView = std::string_view;

#define Zstr(x) x

#endif //ZSTRING_H_61093847561029384
