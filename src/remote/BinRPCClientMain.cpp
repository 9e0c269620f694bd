// SPDX-License-Identifier: GPL-2.0-only
/*
 * Kamailio BinRPC Client - Remote Command Client
 * GPLv2 Open Source. Use is subject to license terms.
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS FILE HEADER.
 *
 *  Copyright (C) 2026 binrpc Authors
 *
 */
#include "common/Defines.h"
#include "common/Log.h"
#include "binrpc/BinRPCDefines.h"
#include "remote/BinRPCClient.h"

using namespace binrpc::defines;

#include <cstdio>
#include <cstdlib>
#include <cstring>

// ---------------------------------------------------------------------------
//  Constants
// ---------------------------------------------------------------------------

#undef __PROG_NAME__
#define __PROG_NAME__ "Kamailio BinRPC Command Tool"
#undef __EXE_NAME__
#define __EXE_NAME__ "binrpccmd"

#define ERRNO_REMOTE_CMD 99
#define ERRNO_SOCK_OPEN 98
#define ERRNO_ADDR_LOOKUP 97
#define ERRNO_FAILED_TO_SEND 96
#define ERRNO_ENCODING 95

// ---------------------------------------------------------------------------
//	Macros
// ---------------------------------------------------------------------------

#define IS(s) (::strcmp(argv[i], s) == 0)

// ---------------------------------------------------------------------------
//  Global Variables
// ---------------------------------------------------------------------------

static std::string g_progExe = std::string(__EXE_NAME__);
static std::string g_remoteAddress = std::string("127.0.0.1");
static uint32_t g_remotePort = BINRPC_DEFAULT_PORT;
static uint32_t g_logLevel = 1U;
static bool g_debug = false;

// ---------------------------------------------------------------------------
//	Global Functions
// ---------------------------------------------------------------------------

/* Helper to pring usage the command line arguments. (And optionally an error.) */

void usage(const char* message, const char* arg)
{
    ::fprintf(stdout, __PROG_NAME__ " %s (built %s)\r\n", __VER__, __BUILD__);
    if (message != nullptr) {
        ::fprintf(stderr, "%s: ", g_progExe.c_str());
        ::fprintf(stderr, message, arg);
        ::fprintf(stderr, "\n\n");
    }

    ::fprintf(stdout, 
        "usage: %s [-dvh]"
        "[-a <address>]"
        "[-p <port>]"
        "[-l <level>]"
        " <method>"
        "\n\n"
        "  -d                          enable debug\n"
        "  -v                          show version information\n"
        "  -h                          show this screen\n"
        "\n"
        "  -a                          remote Kamailio ctl address (default 127.0.0.1)\n"
        "  -p                          remote Kamailio ctl port (default %u)\n"
        "  -l                          display log level\n"
        "\n"
        "  --                          stop handling options\n"
        "\n"
        "example:\n"
        "  %s -a 127.0.0.1 -p %u dispatcher.reload\n",
        g_progExe.c_str(), BINRPC_DEFAULT_PORT, g_progExe.c_str(), BINRPC_DEFAULT_PORT);

    exit(EXIT_FAILURE);
}

/* Helper to validate the command line arguments. */

int checkArgs(int argc, char* argv[])
{
    int i, p = 0;

    // iterate through arguments
    for (i = 1; i <= argc; i++)
    {
        if (argv[i] == nullptr) {
            break;
        }

        if (*argv[i] != '-') {
            continue;
        }
        else if (IS("--")) {
            ++p;
            break;
        }
        else if (IS("-a")) {
            if (i + 1 >= argc)
                usage("error: %s", "must specify the address to connect to");
            g_remoteAddress = std::string(argv[++i]);

            if (g_remoteAddress.empty())
                usage("error: %s", "remote address cannot be blank!");

            p += 2;
        }
        else if (IS("-p")) {
            if (i + 1 >= argc)
                usage("error: %s", "must specify the port to connect to");
            g_remotePort = (uint32_t)::atoi(argv[++i]);

            if (g_remotePort == 0 || g_remotePort > UINT16_MAX)
                usage("error: %s", "remote port number must be between 1 and 65535!");

            p += 2;
        }
        else if (IS("-l")) {
            if (i + 1 >= argc)
                usage("error: %s", "must specify the display log level");
            g_logLevel = (uint32_t)::atoi(argv[++i]);

            if (g_logLevel > 6U)
                usage("error: %s", "display log level must be between 0 and 6!");

            p += 2;
        }
        else if (IS("-d")) {
            ++p;
            g_debug = true;
        }
        else if (IS("-v")) {
            ::fprintf(stdout, __PROG_NAME__ " %s (built %s)\r\n", __VER__, __BUILD__);
            if (argc == 2)
                exit(EXIT_SUCCESS);
        }
        else if (IS("-h")) {
            usage(nullptr, nullptr);
            if (argc == 2)
                exit(EXIT_SUCCESS);
        }
        else {
            usage("unrecognized option `%s'", argv[i]);
        }
    }

    if (p < 0 || p > argc) {
        p = 0;
    }

    return ++p;
}

// ---------------------------------------------------------------------------
//  Program Entry Point
// ---------------------------------------------------------------------------

int main(int argc, char** argv)
{
    if (argv[0] != nullptr && *argv[0] != 0)
        g_progExe = std::string(argv[0]);

    if (argc < 2) {
        usage("error: %s", "must specify the remote method!");
        return ERRNO_REMOTE_CMD;
    }

    if (argc > 1) {
        // check arguments
        int i = checkArgs(argc, argv);
        if (i < argc) {
            argc -= i;
            argv += i;
        }
        else {
            argc--;
            argv++;
        }
    }

    if (argc < 1 || argv[0] == nullptr || *argv[0] == 0 || *argv[0] == '-') {
        usage("error: %s", "must specify the remote method!");
        return ERRNO_REMOTE_CMD;
    }

    std::string method = std::string(argv[0]);

    // initialize system logging
    bool ret = ::LogInitialise("", "", 0U, g_debug ? 1U : g_logLevel, true);
    if (!ret) {
        ::fprintf(stderr, "unable to open the log file\n");
        return 1;
    }

    BinRPCClient client(g_remoteAddress, (uint16_t)g_remotePort, g_debug);

    int retCode = EXIT_SUCCESS;
    BRPC_STATUS status = client.invoke(method);
    switch (client.getFailedStage()) {
    case ClientStage::NONE:
        retCode = (status == BRPC_OK) ? EXIT_SUCCESS : ERRNO_REMOTE_CMD;
        break;
    case ClientStage::LOOKUP:
        retCode = ERRNO_ADDR_LOOKUP;
        break;
    case ClientStage::SOCKET:
        retCode = ERRNO_SOCK_OPEN;
        break;
    case ClientStage::ENCODE:
        retCode = ERRNO_ENCODING;
        break;
    case ClientStage::SEND:
        retCode = ERRNO_FAILED_TO_SEND;
        break;
    default:
        retCode = ERRNO_REMOTE_CMD;
        break;
    }

    if (status != BRPC_OK) {
        ::fprintf(stderr, "%s: failed to invoke %s on %s:%u, %s\n", g_progExe.c_str(), method.c_str(), 
            g_remoteAddress.c_str(), g_remotePort, statusToString(status));
    }

    ::LogFinalise();
    return retCode;
}
