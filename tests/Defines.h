// SPDX-License-Identifier: GPL-2.0-only
/*
 * Kamailio BinRPC Client - Test Suite
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 binrpc Authors
 *
 */
#if !defined(__DEFINES_H__)
#define __DEFINES_H__

#include "common/Defines.h"

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

#undef __PROG_NAME__
#define __PROG_NAME__ "Kamailio BinRPC Tests"
#undef __EXE_NAME__ 
#define __EXE_NAME__ "binrpc_tests"

/** @brief Loopback port used by tests that capture datagrams */
#define TEST_CAPTURE_PORT 32049U

#endif // __DEFINES_H__
