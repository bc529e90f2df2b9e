/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Common macros for the vigil library

**************************************************/

#ifndef VIGIL_MACRO_HPP
#define VIGIL_MACRO_HPP

#define VIGIL_FILE_NAME __FILE__
#define VIGIL_FILE_LINE __LINE__
#define VIGIL_FUNC_NAME __func__

#endif  // VIGIL_MACRO_HPP
