// SPDX-License-Identifier: GPL-2.0-only
/*
 * Kamailio BinRPC Client - Common Library
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2015,2016 Jonathan Naylor, G4KLX
 *  Copyright (C) 2018-2024 Bryan Biedenkapp, N2PLL
 *  Copyright (C) 2026 binrpc Authors
 *
 */
#include "common/Log.h"

#include <sys/time.h>
#include <syslog.h>

#if defined(CATCH2_TEST_COMPILATION)
#include <catch2/catch_test_macros.hpp>
#endif

#include <cstdio>
#include <cstdlib>
#include <cstdarg>
#include <ctime>
#include <cassert>
#include <cstring>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

#define EOL    "\r\n"

const uint32_t LOG_BUFFER_LEN = 4096U;

// ---------------------------------------------------------------------------
//  Global Variables
// ---------------------------------------------------------------------------

static uint32_t m_fileLevel = 0U;
static std::string m_filePath;
static std::string m_fileRoot;

static FILE* m_fpLog = nullptr;

uint32_t g_logDisplayLevel = 2U;
bool g_disableTimeDisplay = false;

bool g_useSyslog = false;

static struct tm m_tm;

static char LEVELS[] = " DMIWEF";

// ---------------------------------------------------------------------------
//  Global Functions
// ---------------------------------------------------------------------------

/* Helper to get the current log file level. */

uint32_t CurrentLogFileLevel() { return m_fileLevel; }

/* Helper to open the detailed log file, file handle. */

static bool LogOpen()
{
#if defined(CATCH2_TEST_COMPILATION)
    return true;
#endif
    if (m_fileLevel == 0U)
        return true;

    if (!g_useSyslog) {
        time_t now;
        ::time(&now);

        struct tm* tm = ::localtime(&now);

        if (tm->tm_mday == m_tm.tm_mday && tm->tm_mon == m_tm.tm_mon && tm->tm_year == m_tm.tm_year) {
            if (m_fpLog != nullptr)
                return true;
        }
        else {
            if (m_fpLog != nullptr)
                ::fclose(m_fpLog);
        }

        char filename[200U];
        ::snprintf(filename, sizeof(filename), "%s/%s-%04d-%02d-%02d.log", m_filePath.c_str(), m_fileRoot.c_str(), tm->tm_year + 1900, tm->tm_mon + 1, tm->tm_mday);

        m_fpLog = ::fopen(filename, "a+t");
        m_tm = *tm;

        return m_fpLog != nullptr;
    }
    else {
        switch (m_fileLevel) {
        case 1U:
            setlogmask(LOG_UPTO(LOG_DEBUG));
            break;
        case 2U:
            setlogmask(LOG_UPTO(LOG_INFO));
            break;
        case 3U:
            setlogmask(LOG_UPTO(LOG_NOTICE));
            break;
        case 4U:
            setlogmask(LOG_UPTO(LOG_WARNING));
            break;
        case 5U:
        default:
            setlogmask(LOG_UPTO(LOG_ERR));
            break;
        }

        openlog(m_fileRoot.c_str(), LOG_CONS | LOG_PID | LOG_NDELAY, LOG_DAEMON);
        return true;
    }
}

/* Initializes the diagnostics log. */

bool LogInitialise(const std::string& filePath, const std::string& fileRoot, uint32_t fileLevel, uint32_t displayLevel, bool disableTimeDisplay, bool useSyslog)
{
    m_filePath = filePath;
    m_fileRoot = fileRoot;
    m_fileLevel = fileLevel;
    g_logDisplayLevel = displayLevel;
    g_disableTimeDisplay = disableTimeDisplay;
    if (!g_useSyslog)
        g_useSyslog = useSyslog;
    return ::LogOpen();
}

/* Finalizes the diagnostics log. */

void LogFinalise()
{
#if defined(CATCH2_TEST_COMPILATION)
    return;
#endif
    if (m_fpLog != nullptr) {
        ::fclose(m_fpLog);
        m_fpLog = nullptr;
    }

    if (g_useSyslog)
        closelog();
}

/* Writes a new entry to the diagnostics log. */

void Log(uint32_t level, const char* module, const char* file, const int lineNo, const char* func, const char* fmt, ...)
{
    assert(fmt != nullptr);
#if defined(CATCH2_TEST_COMPILATION)
    g_disableTimeDisplay = true;
#endif
    char buffer[LOG_BUFFER_LEN];
    if (!g_disableTimeDisplay && !g_useSyslog) {
        time_t now;
        ::time(&now);
        struct tm* tm = ::localtime(&now);

        struct timeval nowMillis;
        ::gettimeofday(&nowMillis, NULL);

        if (module != nullptr) {
            ::snprintf(buffer, LOG_BUFFER_LEN, "%c: %04d-%02d-%02d %02d:%02d:%02d.%03lu (%s) ", LEVELS[level], tm->tm_year + 1900, tm->tm_mon + 1, tm->tm_mday, tm->tm_hour, tm->tm_min, tm->tm_sec, 
                (unsigned long)(nowMillis.tv_usec / 1000U), module);
        }
        else {
            ::snprintf(buffer, LOG_BUFFER_LEN, "%c: %04d-%02d-%02d %02d:%02d:%02d.%03lu ", LEVELS[level], tm->tm_year + 1900, tm->tm_mon + 1, tm->tm_mday, tm->tm_hour, tm->tm_min, tm->tm_sec, 
                (unsigned long)(nowMillis.tv_usec / 1000U));
        }
    }
    else {
        if (module != nullptr) {
            ::snprintf(buffer, LOG_BUFFER_LEN, "%c: (%s) ", LEVELS[level], module);
        }
        else {
            ::snprintf(buffer, LOG_BUFFER_LEN, "%c: ", LEVELS[level]);
        }
    }

    // debug entries carry their origin
    if (level == 1U && file != nullptr) {
        size_t prefixLen = ::strlen(buffer);
        if (func != nullptr) {
            ::snprintf(buffer + prefixLen, LOG_BUFFER_LEN - prefixLen, "[%s:%d][%s] ", file, lineNo, func);
        }
        else {
            ::snprintf(buffer + prefixLen, LOG_BUFFER_LEN - prefixLen, "[%s:%d] ", file, lineNo);
        }
    }

    va_list vl;
    va_start(vl, fmt);

    size_t prefixLen = ::strlen(buffer);
    ::vsnprintf(buffer + prefixLen, LOG_BUFFER_LEN - prefixLen, fmt, vl);

    va_end(vl);

#if defined(CATCH2_TEST_COMPILATION)
    UNSCOPED_INFO(buffer);
    return;
#endif

    if (level >= m_fileLevel && m_fileLevel != 0U) {
        if (!g_useSyslog) {
            bool ret = ::LogOpen();
            if (!ret)
                return;

            ::fprintf(m_fpLog, "%s\n", buffer);
            ::fflush(m_fpLog);
        } else {
            // convert our log level into syslog level
            int syslogLevel = LOG_INFO;
            switch (level) {
            case 1U:
                syslogLevel = LOG_DEBUG;
                break;
            case 2U:
                syslogLevel = LOG_NOTICE;
                break;
            case 3U:
                syslogLevel = LOG_INFO;
                break;
            case 4U:
                syslogLevel = LOG_WARNING;
                break;
            case 5U:
                syslogLevel = LOG_ERR;
                break;
            default:
                syslogLevel = LOG_EMERG;
                break;
            }

            syslog(syslogLevel, "%s", buffer);
        }
    }

    if (!g_useSyslog && level >= g_logDisplayLevel && g_logDisplayLevel != 0U) {
        ::fprintf(stdout, "%s" EOL, buffer);
        ::fflush(stdout);
    }

    // fatal error
    if (level >= 6U) {
        if (m_fpLog != nullptr)
            ::fclose(m_fpLog);
        if (g_useSyslog)
            ::closelog();
        exit(1);
    }
}
