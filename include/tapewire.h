/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_H_INCLUDED__
#define __TAPEWIRE_H_INCLUDED__

/*  Version macros for compile-time API version detection                     */
#define TAPEWIRE_VERSION_MAJOR 0
#define TAPEWIRE_VERSION_MINOR 3
#define TAPEWIRE_VERSION_PATCH 0

#define TAPEWIRE_MAKE_VERSION(major, minor, patch)                             \
    ((major) *10000 + (minor) *100 + (patch))
#define TAPEWIRE_VERSION                                                       \
    TAPEWIRE_MAKE_VERSION (TAPEWIRE_VERSION_MAJOR, TAPEWIRE_VERSION_MINOR,     \
                           TAPEWIRE_VERSION_PATCH)

#ifdef __cplusplus
extern "C" {
#endif

#include <errno.h>
#include <stddef.h>
#include <stdint.h>

/*  Handle DSO symbol visibility                                             */
#if defined TAPEWIRE_NO_EXPORT
#define TAPEWIRE_EXPORT
#else
#if defined _WIN32
#if defined TAPEWIRE_STATIC
#define TAPEWIRE_EXPORT
#elif defined DLL_EXPORT
#define TAPEWIRE_EXPORT __declspec(dllexport)
#else
#define TAPEWIRE_EXPORT __declspec(dllimport)
#endif
#else
#if (defined __GNUC__ && __GNUC__ >= 4) || defined __INTEL_COMPILER
#define TAPEWIRE_EXPORT __attribute__ ((visibility ("default")))
#else
#define TAPEWIRE_EXPORT
#endif
#endif
#endif

/******************************************************************************/
/*  Errors.                                                                   */
/******************************************************************************/
#define TAPEWIRE_HAUSNUMERO 156384712

#ifndef EPROTO
#define EPROTO (TAPEWIRE_HAUSNUMERO + 1)
#endif
#ifndef EMSGSIZE
#define EMSGSIZE (TAPEWIRE_HAUSNUMERO + 10)
#endif
#ifndef ECONNRESET
#define ECONNRESET (TAPEWIRE_HAUSNUMERO + 14)
#endif
#ifndef ENOTCONN
#define ENOTCONN (TAPEWIRE_HAUSNUMERO + 15)
#endif
#ifndef ETIMEDOUT
#define ETIMEDOUT (TAPEWIRE_HAUSNUMERO + 16)
#endif

/*  The peer closed the stream before the current frame was complete.        */
#define EINCOMPLETE (TAPEWIRE_HAUSNUMERO + 60)

/**
 * @brief Return the errno for the current thread.
 * @return errno value (POSIX errno or TAPEWIRE_HAUSNUMERO-based code).
 */
TAPEWIRE_EXPORT int tapewire_errno (void);

/**
 * @brief Return a human-readable string for the given error number.
 * @param errnum_  Error number (e.g. return value of tapewire_errno()).
 * @return Static string pointer. Must not be modified or freed.
 */
TAPEWIRE_EXPORT const char *tapewire_strerror (int errnum_);

/**
 * @brief Return the runtime library version.
 * @param[out] major_  Major version.
 * @param[out] minor_  Minor version.
 * @param[out] patch_  Patch version.
 */
TAPEWIRE_EXPORT void tapewire_version (int *major_, int *minor_, int *patch_);

/******************************************************************************/
/*  Event tags as they appear on the wire.                                    */
/******************************************************************************/
#define TAPEWIRE_EVENT_LOG 1
#define TAPEWIRE_EVENT_MATCH 2
#define TAPEWIRE_EVENT_PRICE_UPDATE 3

/*  Longest text field a frame can carry (u16 length prefix).                */
#define TAPEWIRE_MAX_TEXT_SIZE 65535

/******************************************************************************/
/*  Connection options.                                                       */
/******************************************************************************/
#define TAPEWIRE_IN_BATCH_SIZE 1
#define TAPEWIRE_OUT_BATCH_SIZE 2
#define TAPEWIRE_SNDHWM 3
#define TAPEWIRE_RCVTIMEO 4
#define TAPEWIRE_RECONNECT_IVL 5
#define TAPEWIRE_TCP_NODELAY 6

#define TAPEWIRE_DEFAULT_ENDPOINT "tcp://127.0.0.1:12345"

#ifdef __cplusplus
}
#endif

#endif
