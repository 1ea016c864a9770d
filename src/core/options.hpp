/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_OPTIONS_HPP_INCLUDED__
#define __TAPEWIRE_OPTIONS_HPP_INCLUDED__

#include <stddef.h>

namespace tapewire
{
struct options_t
{
    options_t ();

    int setoption (int option_, const void *optval_, size_t optvallen_);
    int getoption (int option_, void *optval_, size_t *optvallen_) const;

    //  Applies every option named in the environment, as
    //  TAPEWIRE_<OPTION>=<integer> (for example TAPEWIRE_RCVTIMEO=5000).
    //  Returns -1 with errno set to EINVAL at the first variable that is
    //  not an integer or is rejected by setoption; options applied before
    //  it keep their new value.
    int load_env ();

    //  Size of the buffer a connection reads into.
    int in_batch_size;

    //  Largest number of encoded bytes handed to one write.
    int out_batch_size;

    //  Maximum number of events queued for sending, 0 for no limit.
    int sndhwm;

    //  Read deadline in milliseconds. -1 means no deadline.
    int rcvtimeo;

    //  Delay before a failed connect is retried, -1 to never retry.
    int reconnect_ivl;

    bool tcp_nodelay;
};
}

#endif
