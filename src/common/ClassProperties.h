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
 * @file ClassProperties.h
 * @ingroup common
 */
#pragma once
#if !defined(__CLASS_PROPERTIES_H__)
#define __CLASS_PROPERTIES_H__

#if !defined(__COMMON_DEFINES_H__)
#warning "ClassProperties.h included before Defines.h, please check include order"
#include "common/Defines.h"
#endif

// ---------------------------------------------------------------------------
//  Macros
// ---------------------------------------------------------------------------

/**
 * @addtogroup common
 * @{
 */

/**
 * Property Declaration
 *  These macros should always be used LAST in a "public" section of a class definition.
 */

/**
 * @brief Declare a read-only get property.
 *  This creates a "property" that is read-only and can only be set internally to the class. Properties created
 *  with this macro generate an internal variable with the name "m_<variableName>", and a getter method
 *  with the name "get<propertyName>()".
 * @ingroup common
 * @param type Atomic type for property.
 * @param variableName Variable name for property.
 * @param propName Property name.
 */
#define DECLARE_RO_PROPERTY(type, variableName, propName)                                       \
        private: type m_##variableName;                                                         \
        public: __forceinline type get##propName(void) const { return m_##variableName; }

/**
 * @brief Declare a get and set private property.
 *  This creates a "property" that is read/write. Properties created with this macro generate an internal variable
 *  with the name "m_<variableName>", a getter method with the name "get<propertyName>()", and a setter method
 *  with the name "set<propertyName>(value)".
 * @ingroup common
 * @param type Atomic type for property.
 * @param variableName Variable name for property.
 * @param propName Property name.
 */
#define DECLARE_PROPERTY(type, variableName, propName)                                          \
        private: type m_##variableName;                                                         \
        public: __forceinline type get##propName(void) const { return m_##variableName; }       \
                __forceinline void set##propName(type val) { m_##variableName = val; }

/** @} */

#endif // __CLASS_PROPERTIES_H__
