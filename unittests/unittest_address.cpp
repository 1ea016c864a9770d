/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/address.hpp"

#include <unity.h>
#include <string>

void setUp ()
{
}

void tearDown ()
{
}

static void check_address (const char *endpoint_,
                           const char *host_,
                           uint16_t port_)
{
    tapewire::address_t addr;
    TEST_ASSERT_SUCCESS_ERRNO (addr.parse (endpoint_));
    TEST_ASSERT_EQUAL_STRING (host_, addr.host.c_str ());
    TEST_ASSERT_EQUAL_UINT16 (port_, addr.port);
}

void test_parse_endpoints ()
{
    check_address ("tcp://127.0.0.1:12345", "127.0.0.1", 12345);
    check_address ("localhost:9001", "localhost", 9001);
    check_address ("tcp://*:*", "*", 0);
    check_address ("tcp://*:0", "*", 0);
    check_address ("tcp://[::1]:5555", "::1", 5555);
    check_address (TAPEWIRE_DEFAULT_ENDPOINT, "127.0.0.1", 12345);
}

void test_parse_invalid_endpoints ()
{
    tapewire::address_t addr;
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, addr.parse (""));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, addr.parse ("tcp://127.0.0.1"));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, addr.parse ("tcp://127.0.0.1:"));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, addr.parse ("tcp://:5555"));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, addr.parse ("tcp://host:65536"));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, addr.parse ("tcp://host:12a"));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, addr.parse ("tcp://[::1:5555"));
    TEST_ASSERT_FAILURE_ERRNO (EPROTONOSUPPORT,
                               addr.parse ("udp://127.0.0.1:5555"));
}

void test_address_to_string ()
{
    tapewire::address_t addr;
    std::string s;
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, addr.to_string (s));

    TEST_ASSERT_SUCCESS_ERRNO (addr.parse ("127.0.0.1:80"));
    TEST_ASSERT_SUCCESS_ERRNO (addr.to_string (s));
    TEST_ASSERT_EQUAL_STRING ("tcp://127.0.0.1:80", s.c_str ());

    TEST_ASSERT_SUCCESS_ERRNO (addr.parse ("tcp://[::1]:5555"));
    TEST_ASSERT_SUCCESS_ERRNO (addr.to_string (s));
    TEST_ASSERT_EQUAL_STRING ("tcp://[::1]:5555", s.c_str ());
}

int main (void)
{
    UNITY_BEGIN ();

    RUN_TEST (test_parse_endpoints);
    RUN_TEST (test_parse_invalid_endpoints);
    RUN_TEST (test_address_to_string);

    return UNITY_END ();
}
