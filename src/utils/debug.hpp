/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_DEBUG_HPP_INCLUDED__
#define __TAPEWIRE_DEBUG_HPP_INCLUDED__

#include <cstdio>

//  Unified debug macros for engine and transport components
//  Enable with -DTAPEWIRE_DEBUG=1 during compilation
//
//  Usage:
//    TW_DBG_ENGINE("read completed: %zu bytes", bytes);
//    TW_DBG_CONN("connecting to %s", endpoint);

#ifdef TAPEWIRE_DEBUG

#define TW_DBG(category, fmt, ...)                                             \
    do {                                                                       \
        fprintf (stderr, "[TAPEWIRE:" category "] " fmt "\n", ##__VA_ARGS__);  \
    } while (0)

#define TW_DBG_THIS(category, fmt, ...)                                        \
    do {                                                                       \
        fprintf (stderr, "[TAPEWIRE:" category ":%p] " fmt "\n",               \
                 static_cast<const void *> (this), ##__VA_ARGS__);             \
    } while (0)

#else

#define TW_DBG(category, fmt, ...) ((void) 0)
#define TW_DBG_THIS(category, fmt, ...) ((void) 0)

#endif

//  Component-specific macros
#define TW_DBG_ENGINE(fmt, ...) TW_DBG_THIS ("ENGINE", fmt, ##__VA_ARGS__)
#define TW_DBG_CONN(fmt, ...) TW_DBG_THIS ("CONN", fmt, ##__VA_ARGS__)
#define TW_DBG_LISTENER(fmt, ...) TW_DBG_THIS ("LISTENER", fmt, ##__VA_ARGS__)

//  Severity-based macros (with this pointer)
#define TW_LOG_ERROR(fmt, ...) TW_DBG_THIS ("ERROR", fmt, ##__VA_ARGS__)
#define TW_LOG_WARN(fmt, ...) TW_DBG_THIS ("WARN", fmt, ##__VA_ARGS__)

//  Global severity macros (without this pointer)
#define TW_GLOBAL_WARN(fmt, ...) TW_DBG ("WARN", fmt, ##__VA_ARGS__)

#endif
