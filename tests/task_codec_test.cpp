#include <gtest/gtest.h>
#include "grocery/errors.hpp"
#include "grocery/task_codec.hpp"

using namespace grocery;

// =============================================================================
// Topic Tests
// =============================================================================

TEST(TaskCodecTest, TopicFor_ShouldMapTaskTypes) {
    EXPECT_EQ(topic_for(FETCH), "FETCH");
    EXPECT_EQ(topic_for(RESTOCK), "RESTOCK");
    EXPECT_EQ(task_type_for_topic("FETCH"), FETCH);
    EXPECT_EQ(task_type_for_topic("RESTOCK"), RESTOCK);
    EXPECT_FALSE(task_type_for_topic(ANALYTICS_TOPIC).has_value());
}

// =============================================================================
// Task Id Tests
// =============================================================================

TEST(TaskCodecTest, FormatTaskId_ShouldPrefixWithTaskType) {
    EXPECT_EQ(format_task_id(FETCH, 12), "fetch_12");
    EXPECT_EQ(format_task_id(RESTOCK, 3), "restock_3");
}

TEST(TaskCodecTest, ParseTaskId_WellFormed_ShouldReturnNumericId) {
    auto fetch = parse_task_id("fetch_12");
    ASSERT_TRUE(fetch.has_value());
    EXPECT_EQ(fetch->task_type, FETCH);
    EXPECT_EQ(fetch->id, TaskId{12});

    auto restock = parse_task_id("restock_18446744073709551615");
    ASSERT_TRUE(restock.has_value());
    EXPECT_EQ(restock->task_type, RESTOCK);
    EXPECT_EQ(restock->id, TaskId{18446744073709551615ULL});
}

TEST(TaskCodecTest, ParseTaskId_Malformed_ShouldReturnNullopt) {
    EXPECT_FALSE(parse_task_id("").has_value());
    EXPECT_FALSE(parse_task_id("fetch_").has_value());
    EXPECT_FALSE(parse_task_id("fetch_-1").has_value());
    EXPECT_FALSE(parse_task_id("fetch_12abc").has_value());
    EXPECT_FALSE(parse_task_id("order_12").has_value());
    EXPECT_FALSE(parse_task_id("fetch_123456789012345678901").has_value());
}

TEST(TaskCodecTest, ParseTaskId_BeyondUint64_ShouldReturnNullopt) {
    EXPECT_FALSE(parse_task_id("restock_18446744073709551616").has_value());
    EXPECT_FALSE(parse_task_id("fetch_99999999999999999999").has_value());
}

TEST(TaskCodecTest, ParseTaskId_PaddedOrZero_ShouldReturnNullopt) {
    // Only the spelling format_task_id() produces names a task
    EXPECT_FALSE(parse_task_id("fetch_01").has_value());
    EXPECT_FALSE(parse_task_id("fetch_0001").has_value());
    EXPECT_FALSE(parse_task_id("restock_0").has_value());
}

TEST(TaskCodecTest, ParseTaskId_ShouldInvertFormatTaskId) {
    for (TaskType type : {FETCH, RESTOCK}) {
        auto ref = parse_task_id(format_task_id(type, 40));
        ASSERT_TRUE(ref.has_value());
        EXPECT_EQ(ref->task_type, type);
        EXPECT_EQ(ref->id, TaskId{40});
    }
}

// =============================================================================
// Descriptor Tests
// =============================================================================

TEST(TaskCodecTest, DecodeTask_ShouldRecoverEncodedDescriptor) {
    auto descriptor = make_task_descriptor("fetch_7", FETCH, {{"bagels", 2}, {"apples", 1.5}}, 1700000000000);

    auto decoded = decode_task(encode_task(descriptor));

    EXPECT_EQ(decoded.task_id(), "fetch_7");
    EXPECT_EQ(decoded.task_type(), FETCH);
    EXPECT_EQ(decoded.timestamp_ms(), 1700000000000);
    ASSERT_EQ(decoded.items_size(), 2);
    EXPECT_EQ(decoded.items(1).item(), "apples");
    EXPECT_DOUBLE_EQ(decoded.items(1).qty(), 1.5);
}

TEST(TaskCodecTest, DecodeTask_Garbage_ShouldThrowDecodeError) {
    EXPECT_THROW(decode_task(std::string("\xff\xff\xff\xff", 4)), DecodeError);
}

TEST(TaskCodecTest, DecodeTask_MissingTaskIdOrType_ShouldThrowDecodeError) {
    EXPECT_THROW(decode_task(encode_task(make_task_descriptor("", FETCH, {}, 0))), DecodeError);
    EXPECT_THROW(decode_task(encode_task(make_task_descriptor("fetch_1", TASK_TYPE_UNSPECIFIED, {}, 0))),
                 DecodeError);
}

TEST(TaskCodecTest, DecodeError_ShouldReportAsInvalidArgument) {
    try {
        decode_task(std::string());
        FAIL() << "expected DecodeError";
    } catch (const GroceryError& e) {
        EXPECT_TRUE(e.is_invalid_argument());
        EXPECT_FALSE(e.is_connection_error());
    }
}
