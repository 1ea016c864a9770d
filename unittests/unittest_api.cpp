/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include <unity.h>
#include <string.h>

void setUp ()
{
}

void tearDown ()
{
}

void test_strerror ()
{
    TEST_ASSERT_EQUAL_STRING ("Stream ended mid-frame",
                              tapewire_strerror (EINCOMPLETE));
    TEST_ASSERT_EQUAL_STRING (strerror (EINVAL), tapewire_strerror (EINVAL));
    TEST_ASSERT_NOT_NULL (tapewire_strerror (EPROTO));
}

void test_version ()
{
    int major = -1, minor = -1, patch = -1;
    tapewire_version (&major, &minor, &patch);
    TEST_ASSERT_EQUAL_INT (TAPEWIRE_VERSION_MAJOR, major);
    TEST_ASSERT_EQUAL_INT (TAPEWIRE_VERSION_MINOR, minor);
    TEST_ASSERT_EQUAL_INT (TAPEWIRE_VERSION_PATCH, patch);
}

int main (void)
{
    UNITY_BEGIN ();

    RUN_TEST (test_strerror);
    RUN_TEST (test_version);

    return UNITY_END ();
}
