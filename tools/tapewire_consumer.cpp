/* SPDX-License-Identifier: MPL-2.0 */

//  Listens for producers and prints every event they send.
//
//  usage: tapewire_consumer [endpoint]
//
//  The endpoint defaults to TAPEWIRE_ENDPOINT, then to
//  tcp://127.0.0.1:12345. Connection options are read from
//  TAPEWIRE_RCVTIMEO, TAPEWIRE_IN_BATCH_SIZE and TAPEWIRE_TCP_NODELAY.

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>

#include "../include/tapewire.h"
#include "core/log_sink.hpp"
#include "core/options.hpp"
#include "transports/tcp/tcp_listener.hpp"

int main (int argc, char *argv[])
{
    if (argc > 2) {
        printf ("usage: tapewire_consumer [endpoint]\n");
        return 1;
    }

    std::string endpoint = TAPEWIRE_DEFAULT_ENDPOINT;
    const char *env = getenv ("TAPEWIRE_ENDPOINT");
    if (env && *env)
        endpoint = env;
    if (argc > 1)
        endpoint = argv[1];

    tapewire::options_t options;
    if (options.load_env () != 0) {
        fprintf (stderr, "invalid option in environment: %s\n",
                 tapewire_strerror (tapewire_errno ()));
        return 1;
    }
    boost::asio::io_context io_context;
    tapewire::log_sink_t sink (stdout);
    tapewire::tcp_listener_t listener (io_context, options, &sink);

    if (listener.bind (endpoint) != 0) {
        fprintf (stderr, "error in bind %s: %s\n", endpoint.c_str (),
                 tapewire_strerror (tapewire_errno ()));
        return 1;
    }
    fprintf (stderr, "listening on %s\n", listener.last_endpoint ().c_str ());

    boost::asio::signal_set signals (io_context, SIGINT, SIGTERM);
    signals.async_wait ([&] (const boost::system::error_code &ec, int) {
        if (!ec)
            listener.close ();
    });

    io_context.run ();

    fprintf (stderr, "%zu events received\n", sink.events ());
    return 0;
}
