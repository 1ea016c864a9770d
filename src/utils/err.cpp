/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/err.hpp"
#include "utils/macros.hpp"

const char *tapewire::errno_to_string (int errno_)
{
    switch (errno_) {
        case EINCOMPLETE:
            return "Stream ended mid-frame";
#if EPROTO == TAPEWIRE_HAUSNUMERO + 1
        case EPROTO:
            return "Protocol error";
#endif
#if EMSGSIZE == TAPEWIRE_HAUSNUMERO + 10
        case EMSGSIZE:
            return "Message too long";
#endif
#if ECONNRESET == TAPEWIRE_HAUSNUMERO + 14
        case ECONNRESET:
            return "Connection reset by peer";
#endif
#if ENOTCONN == TAPEWIRE_HAUSNUMERO + 15
        case ENOTCONN:
            return "The socket is not connected";
#endif
#if ETIMEDOUT == TAPEWIRE_HAUSNUMERO + 16
        case ETIMEDOUT:
            return "Connection timed out";
#endif
        default:
            return strerror (errno_);
    }
}

void tapewire::tapewire_abort (const char *errmsg_)
{
    LIBTAPEWIRE_UNUSED (errmsg_);
    abort ();
}
