// SPDX-License-Identifier: GPL-2.0-only
/*
 * Kamailio BinRPC Client - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2009,2014,2015 Jonathan Naylor, G4KLX
 *  Copyright (C) 2018-2024 Bryan Biedenkapp, N2PLL
 *  Copyright (C) 2026 binrpc Authors
 *
 */
/**
 * @defgroup utils Utility Routines
 * @brief Defines and implements utility routines.
 * @ingroup common
 * 
 * @file Utils.h
 * @ingroup utils
 * @file Utils.cpp
 * @ingroup utils
 */
#if !defined(__UTILS_H__)
#define __UTILS_H__

#include "common/Defines.h"

#include <cstring>
#include <string>

// ---------------------------------------------------------------------------
//  Class Declaration
// ---------------------------------------------------------------------------

/**
 * @brief Various helper utilities.
 * @ingroup utils
 */
class BINRPC_API Utils {
public:
    /**
     * @brief Helper to dump the input buffer and display the hexadecimal output in the log.
     * @param title Name of buffer.
     * @param data Buffer to dump.
     * @param length Length of buffer.
     */
    static void dump(const std::string& title, const uint8_t* data, uint32_t length);
    /**
     * @brief Helper to dump the input buffer and display the hexadecimal output in the log.
     * @param level Log level.
     * @param title Name of buffer.
     * @param data Buffer to dump.
     * @param length Length of buffer.
     */
    static void dump(int level, const std::string& title, const uint8_t* data, uint32_t length);

    /**
     * @brief Helper to convert the input buffer into a contiguous hexadecimal string.
     * @param data Buffer to convert.
     * @param length Length of buffer.
     * @returns std::string Lowercase hexadecimal representation of the buffer.
     */
    static std::string hex(const uint8_t* data, uint32_t length);
};

#endif // __UTILS_H__
