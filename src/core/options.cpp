/* SPDX-License-Identifier: MPL-2.0 */

#include <limits.h>
#include <stdlib.h>
#include <string.h>

#include "core/options.hpp"
#include "utils/err.hpp"

namespace
{
enum
{
    default_batch_size = 8192,
    default_hwm = 1000,
    default_reconnect_ivl = 100
};

int option_invalid ()
{
    errno = EINVAL;
    return -1;
}

struct env_option_t
{
    const char *name;
    int option;
};

const env_option_t env_options[] = {
  {"TAPEWIRE_IN_BATCH_SIZE", TAPEWIRE_IN_BATCH_SIZE},
  {"TAPEWIRE_OUT_BATCH_SIZE", TAPEWIRE_OUT_BATCH_SIZE},
  {"TAPEWIRE_SNDHWM", TAPEWIRE_SNDHWM},
  {"TAPEWIRE_RCVTIMEO", TAPEWIRE_RCVTIMEO},
  {"TAPEWIRE_RECONNECT_IVL", TAPEWIRE_RECONNECT_IVL},
  {"TAPEWIRE_TCP_NODELAY", TAPEWIRE_TCP_NODELAY}};
}

tapewire::options_t::options_t () :
    in_batch_size (default_batch_size),
    out_batch_size (default_batch_size),
    sndhwm (default_hwm),
    rcvtimeo (-1),
    reconnect_ivl (default_reconnect_ivl),
    tcp_nodelay (true)
{
}

int tapewire::options_t::setoption (int option_,
                                    const void *optval_,
                                    size_t optvallen_)
{
    const bool is_int = (optvallen_ == sizeof (int));
    int value = 0;
    if (is_int)
        memcpy (&value, optval_, sizeof (int));

    switch (option_) {
        case TAPEWIRE_IN_BATCH_SIZE:
            if (is_int && value > 0) {
                in_batch_size = value;
                return 0;
            }
            break;

        case TAPEWIRE_OUT_BATCH_SIZE:
            if (is_int && value > 0) {
                out_batch_size = value;
                return 0;
            }
            break;

        case TAPEWIRE_SNDHWM:
            if (is_int && value >= 0) {
                sndhwm = value;
                return 0;
            }
            break;

        case TAPEWIRE_RCVTIMEO:
            if (is_int && value >= -1) {
                rcvtimeo = value;
                return 0;
            }
            break;

        case TAPEWIRE_RECONNECT_IVL:
            if (is_int && value >= -1) {
                reconnect_ivl = value;
                return 0;
            }
            break;

        case TAPEWIRE_TCP_NODELAY:
            if (is_int && (value == 0 || value == 1)) {
                tcp_nodelay = (value != 0);
                return 0;
            }
            break;

        default:
            break;
    }

    return option_invalid ();
}

int tapewire::options_t::getoption (int option_,
                                    void *optval_,
                                    size_t *optvallen_) const
{
    if (*optvallen_ != sizeof (int))
        return option_invalid ();

    int *value = static_cast<int *> (optval_);

    switch (option_) {
        case TAPEWIRE_IN_BATCH_SIZE:
            *value = in_batch_size;
            return 0;

        case TAPEWIRE_OUT_BATCH_SIZE:
            *value = out_batch_size;
            return 0;

        case TAPEWIRE_SNDHWM:
            *value = sndhwm;
            return 0;

        case TAPEWIRE_RCVTIMEO:
            *value = rcvtimeo;
            return 0;

        case TAPEWIRE_RECONNECT_IVL:
            *value = reconnect_ivl;
            return 0;

        case TAPEWIRE_TCP_NODELAY:
            *value = tcp_nodelay ? 1 : 0;
            return 0;

        default:
            break;
    }

    return option_invalid ();
}

int tapewire::options_t::load_env ()
{
    for (size_t i = 0; i != sizeof env_options / sizeof env_options[0]; ++i) {
        const char *str = getenv (env_options[i].name);
        if (str == NULL || *str == '\0')
            continue;

        char *end = NULL;
        errno = 0;
        const long value = strtol (str, &end, 10);
        if (errno != 0 || *end != '\0' || value < INT_MIN || value > INT_MAX)
            return option_invalid ();

        const int ivalue = static_cast<int> (value);
        if (setoption (env_options[i].option, &ivalue, sizeof (ivalue)) != 0)
            return -1;
    }
    return 0;
}
