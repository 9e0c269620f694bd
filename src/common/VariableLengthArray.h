// SPDX-License-Identifier: GPL-2.0-only
/*
 * Kamailio BinRPC Client - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2025 Bryan Biedenkapp, N2PLL
 *  Copyright (C) 2026 binrpc Authors
 *
 */
/**
 * @file VariableLengthArray.h
 * @ingroup common
 */
#pragma once
#if !defined(__VARIABLE_LENGTH_ARRAY_H__)
#define __VARIABLE_LENGTH_ARRAY_H__

#if !defined(__COMMON_DEFINES_H__)
#warning "VariableLengthArray.h included before Defines.h, please check include order"
#include "common/Defines.h"
#endif

// ---------------------------------------------------------------------------
//  Types
// ---------------------------------------------------------------------------

/**
 * @addtogroup common
 * @{
 */

/**
 * @brief Unique uint8_t array.
 * @ingroup common
 */
typedef std::unique_ptr<uint8_t[]> UInt8Array;

/** @} */

#endif // __VARIABLE_LENGTH_ARRAY_H__
