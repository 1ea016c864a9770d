/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/schema.hpp"

#include <unity.h>

void setUp ()
{
}

void tearDown ()
{
}

//  Header size implied by the field kinds.
static size_t computed_header_size (const tapewire::event_schema_t *schema_)
{
    size_t size = 0;
    for (size_t i = 0; i < schema_->field_count; ++i)
        size += schema_->fields[i].kind == tapewire::field_text
                  ? tapewire::text_length_size
                  : tapewire::numeric_size;
    return size;
}

void test_log_layout ()
{
    const tapewire::event_schema_t *schema =
      tapewire::find_schema (TAPEWIRE_EVENT_LOG);
    TEST_ASSERT_NOT_NULL (schema);
    TEST_ASSERT_EQUAL_UINT8 (TAPEWIRE_EVENT_LOG, schema->tag);
    TEST_ASSERT_EQUAL_UINT (2, schema->field_count);
    TEST_ASSERT_EQUAL_UINT (2, schema->text_count);
    TEST_ASSERT_EQUAL_UINT (4, schema->header_size);
    TEST_ASSERT_EQUAL_STRING ("level", schema->fields[0].name);
    TEST_ASSERT_EQUAL_STRING ("message", schema->fields[1].name);
}

void test_match_layout ()
{
    const tapewire::event_schema_t *schema =
      tapewire::find_schema (TAPEWIRE_EVENT_MATCH);
    TEST_ASSERT_NOT_NULL (schema);
    TEST_ASSERT_EQUAL_UINT (4, schema->field_count);
    TEST_ASSERT_EQUAL_UINT (2, schema->text_count);
    TEST_ASSERT_EQUAL_UINT (12, schema->header_size);

    //  Declaration order decides the order of lengths and of numerics.
    TEST_ASSERT_EQUAL_STRING ("side", schema->fields[0].name);
    TEST_ASSERT_EQUAL_STRING ("symbol", schema->fields[1].name);
    TEST_ASSERT_EQUAL_STRING ("quantity", schema->fields[2].name);
    TEST_ASSERT_EQUAL_INT (tapewire::field_uint32, schema->fields[2].kind);
    TEST_ASSERT_EQUAL_STRING ("price", schema->fields[3].name);
    TEST_ASSERT_EQUAL_INT (tapewire::field_float, schema->fields[3].kind);
}

void test_price_update_layout ()
{
    const tapewire::event_schema_t *schema =
      tapewire::find_schema (TAPEWIRE_EVENT_PRICE_UPDATE);
    TEST_ASSERT_NOT_NULL (schema);
    TEST_ASSERT_EQUAL_UINT (3, schema->field_count);
    TEST_ASSERT_EQUAL_UINT (1, schema->text_count);
    TEST_ASSERT_EQUAL_UINT (10, schema->header_size);
    TEST_ASSERT_EQUAL_STRING ("old_price", schema->fields[1].name);
    TEST_ASSERT_EQUAL_STRING ("new_price", schema->fields[2].name);
}

void test_header_sizes_match_fields ()
{
    const uint8_t tags[] = {TAPEWIRE_EVENT_LOG, TAPEWIRE_EVENT_MATCH,
                            TAPEWIRE_EVENT_PRICE_UPDATE};
    for (size_t i = 0; i < sizeof (tags); ++i) {
        const tapewire::event_schema_t *schema = tapewire::find_schema (tags[i]);
        TEST_ASSERT_NOT_NULL (schema);
        TEST_ASSERT_EQUAL_UINT (computed_header_size (schema),
                                schema->header_size);
        TEST_ASSERT_TRUE (schema->header_size <= tapewire::max_header_size);
        TEST_ASSERT_TRUE (schema->field_count <= tapewire::max_fields);
    }
}

void test_unknown_tags ()
{
    TEST_ASSERT_NULL (tapewire::find_schema (0));
    TEST_ASSERT_NULL (tapewire::find_schema (4));
    TEST_ASSERT_NULL (tapewire::find_schema (9));
    TEST_ASSERT_NULL (tapewire::find_schema (255));
}

int main (void)
{
    UNITY_BEGIN ();

    RUN_TEST (test_log_layout);
    RUN_TEST (test_match_layout);
    RUN_TEST (test_price_update_layout);
    RUN_TEST (test_header_sizes_match_fields);
    RUN_TEST (test_unknown_tags);

    return UNITY_END ();
}
