/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/options.hpp"

#include <unity.h>
#include <stdlib.h>

void setUp ()
{
}

void tearDown ()
{
}

static int get_int (const tapewire::options_t &options_, int option_)
{
    int value = 0;
    size_t size = sizeof (value);
    TEST_ASSERT_SUCCESS_ERRNO (options_.getoption (option_, &value, &size));
    return value;
}

void test_defaults ()
{
    const tapewire::options_t options;
    TEST_ASSERT_EQUAL_INT (8192, get_int (options, TAPEWIRE_IN_BATCH_SIZE));
    TEST_ASSERT_EQUAL_INT (8192, get_int (options, TAPEWIRE_OUT_BATCH_SIZE));
    TEST_ASSERT_EQUAL_INT (1000, get_int (options, TAPEWIRE_SNDHWM));
    TEST_ASSERT_EQUAL_INT (-1, get_int (options, TAPEWIRE_RCVTIMEO));
    TEST_ASSERT_EQUAL_INT (100, get_int (options, TAPEWIRE_RECONNECT_IVL));
    TEST_ASSERT_EQUAL_INT (1, get_int (options, TAPEWIRE_TCP_NODELAY));
}

void test_set_and_get ()
{
    tapewire::options_t options;

    int value = 512;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setoption (TAPEWIRE_IN_BATCH_SIZE, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT (512, get_int (options, TAPEWIRE_IN_BATCH_SIZE));
    TEST_ASSERT_EQUAL_INT (512, options.in_batch_size);

    value = 0;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setoption (TAPEWIRE_SNDHWM, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT (0, options.sndhwm);

    value = 250;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setoption (TAPEWIRE_RCVTIMEO, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT (250, get_int (options, TAPEWIRE_RCVTIMEO));

    value = -1;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setoption (TAPEWIRE_RECONNECT_IVL, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT (-1, options.reconnect_ivl);

    value = 0;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setoption (TAPEWIRE_TCP_NODELAY, &value, sizeof (value)));
    TEST_ASSERT_FALSE (options.tcp_nodelay);
}

void test_invalid_values ()
{
    tapewire::options_t options;

    int value = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.setoption (TAPEWIRE_IN_BATCH_SIZE, &value, sizeof (value)));
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL,
      options.setoption (TAPEWIRE_OUT_BATCH_SIZE, &value, sizeof (value)));

    value = -2;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.setoption (TAPEWIRE_RCVTIMEO, &value, sizeof (value)));
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.setoption (TAPEWIRE_SNDHWM, &value, sizeof (value)));

    value = 2;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.setoption (TAPEWIRE_TCP_NODELAY, &value, sizeof (value)));

    //  Rejected values leave the option unchanged.
    TEST_ASSERT_EQUAL_INT (8192, options.in_batch_size);
    TEST_ASSERT_TRUE (options.tcp_nodelay);
}

void test_invalid_option_and_size ()
{
    tapewire::options_t options;

    int value = 1;
    TEST_ASSERT_FAILURE_ERRNO (EINVAL,
                               options.setoption (999, &value, sizeof (value)));

    const short small = 1;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.setoption (TAPEWIRE_SNDHWM, &small, sizeof (small)));

    size_t size = sizeof (value);
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, options.getoption (999, &value, &size));

    size = 1;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.getoption (TAPEWIRE_SNDHWM, &value, &size));
}

static const char *const env_names[] = {
  "TAPEWIRE_IN_BATCH_SIZE", "TAPEWIRE_OUT_BATCH_SIZE", "TAPEWIRE_SNDHWM",
  "TAPEWIRE_RCVTIMEO",      "TAPEWIRE_RECONNECT_IVL",  "TAPEWIRE_TCP_NODELAY"};

static void clear_env ()
{
    for (size_t i = 0; i != sizeof env_names / sizeof env_names[0]; ++i)
        unsetenv (env_names[i]);
}

void test_load_env_without_variables ()
{
    clear_env ();

    tapewire::options_t options;
    TEST_ASSERT_SUCCESS_ERRNO (options.load_env ());
    TEST_ASSERT_EQUAL_INT (1000, options.sndhwm);
    TEST_ASSERT_EQUAL_INT (-1, options.rcvtimeo);
    TEST_ASSERT_EQUAL_INT (100, options.reconnect_ivl);
}

void test_load_env_applies_variables ()
{
    clear_env ();
    setenv ("TAPEWIRE_RCVTIMEO", "5000", 1);
    setenv ("TAPEWIRE_RECONNECT_IVL", "-1", 1);
    setenv ("TAPEWIRE_SNDHWM", "0", 1);
    setenv ("TAPEWIRE_TCP_NODELAY", "0", 1);
    setenv ("TAPEWIRE_OUT_BATCH_SIZE", "", 1);

    tapewire::options_t options;
    TEST_ASSERT_SUCCESS_ERRNO (options.load_env ());
    TEST_ASSERT_EQUAL_INT (5000, get_int (options, TAPEWIRE_RCVTIMEO));
    TEST_ASSERT_EQUAL_INT (-1, get_int (options, TAPEWIRE_RECONNECT_IVL));
    TEST_ASSERT_EQUAL_INT (0, get_int (options, TAPEWIRE_SNDHWM));
    TEST_ASSERT_FALSE (options.tcp_nodelay);

    //  Empty variables are ignored.
    TEST_ASSERT_EQUAL_INT (8192, options.out_batch_size);

    clear_env ();
}

void test_load_env_rejects_bad_values ()
{
    clear_env ();
    setenv ("TAPEWIRE_RCVTIMEO", "soon", 1);
    tapewire::options_t options;
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, options.load_env ());
    TEST_ASSERT_EQUAL_INT (-1, options.rcvtimeo);

    setenv ("TAPEWIRE_RCVTIMEO", "250ms", 1);
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, options.load_env ());

    setenv ("TAPEWIRE_RCVTIMEO", "99999999999", 1);
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, options.load_env ());

    clear_env ();
    setenv ("TAPEWIRE_IN_BATCH_SIZE", "0", 1);
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, options.load_env ());
    TEST_ASSERT_EQUAL_INT (8192, options.in_batch_size);

    clear_env ();
}

int main (void)
{
    UNITY_BEGIN ();

    RUN_TEST (test_defaults);
    RUN_TEST (test_set_and_get);
    RUN_TEST (test_invalid_values);
    RUN_TEST (test_invalid_option_and_size);
    RUN_TEST (test_load_env_without_variables);
    RUN_TEST (test_load_env_applies_variables);
    RUN_TEST (test_load_env_rejects_bad_values);

    return UNITY_END ();
}
