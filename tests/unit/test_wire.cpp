#include <gtest/gtest.h>
#include "postrelay/network/wire.hpp"
#include "postrelay/network/http_types.hpp"
#include "postrelay/core/utils.hpp"

using namespace postrelay::network;
using postrelay::core::utils::TimeUtils;

class WireTest : public ::testing::Test {};

TEST_F(WireTest, DecodesTimeline) {
    auto root = wire::parse_json(R"({"tweets":[
        {"id":"a1","text":"first","level":"level1","createdAt":"2024-05-01T12:30:00.512Z"},
        {"id":"b2","text":"second","level":"level4","createdAt":"2024-05-01T12:31:00Z"}
    ]})");

    auto items = wire::decode_timeline(root);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].id, "a1");
    EXPECT_EQ(items[0].text, "first");
    EXPECT_EQ(items[0].level, "level1");
    EXPECT_EQ(TimeUtils::to_unix_millis(items[0].created_at), 1714566600000LL);
    EXPECT_EQ(items[1].level, "level4");
}

TEST_F(WireTest, TimelineRequiresTweetsArray) {
    EXPECT_THROW(wire::decode_timeline(wire::parse_json(R"({"posts":[]})")), WireFormatError);
    EXPECT_THROW(wire::decode_timeline(wire::parse_json(R"({"tweets":{}})")), WireFormatError);
}

TEST_F(WireTest, ContentItemRejectsBadDate) {
    auto root = wire::parse_json(R"({"id":"x","text":"t","level":"level1","createdAt":"soon"})");
    EXPECT_THROW(wire::decode_content_item(root), WireFormatError);
}

TEST_F(WireTest, MalformedJsonThrows) {
    EXPECT_THROW(wire::parse_json("{not json"), WireFormatError);
}

TEST_F(WireTest, EncodesRequestBodies) {
    EXPECT_EQ(wire::to_json_string(wire::encode_text_body("hello")), R"({"text":"hello"})");

    StartSessionRequest request{"caption", "clip.mp4", 1048576};
    auto body = wire::encode_start_session(request);
    EXPECT_EQ(body["text"].asString(), "caption");
    EXPECT_EQ(body["filename"].asString(), "clip.mp4");
    EXPECT_EQ(body["totalBytes"].asUInt64(), 1048576u);
}

TEST_F(WireTest, DecodesSessionMessages) {
    auto start = wire::decode_start_session(wire::parse_json(R"({"sessionId":"s-1","nextOffset":524288})"));
    EXPECT_EQ(start.session_id, "s-1");
    EXPECT_EQ(start.next_offset, 524288u);

    auto status = wire::decode_session_status(wire::parse_json(
        R"({"sessionId":"s-1","offset":1000.0,"totalBytes":2000,"complete":false})"));
    EXPECT_EQ(status.offset, 1000u);
    EXPECT_EQ(status.total_bytes, 2000u);
    EXPECT_FALSE(status.complete);

    EXPECT_THROW(wire::decode_start_session(wire::parse_json(R"({"sessionId":"s-1","nextOffset":-4})")),
                 WireFormatError);
}

TEST_F(WireTest, OffsetsMustBeWholeNumbersInRange) {
    EXPECT_THROW(wire::decode_start_session(wire::parse_json(R"({"sessionId":"s-1","nextOffset":1.5})")),
                 WireFormatError);
    EXPECT_THROW(wire::decode_start_session(wire::parse_json(R"({"sessionId":"s-1","nextOffset":1e20})")),
                 WireFormatError);
    EXPECT_THROW(wire::decode_session_status(wire::parse_json(
                     R"({"sessionId":"s-1","offset":2.5e300,"totalBytes":2000,"complete":false})")),
                 WireFormatError);

    auto start = wire::decode_start_session(wire::parse_json(R"({"sessionId":"s-1","nextOffset":4096.0})"));
    EXPECT_EQ(start.next_offset, 4096u);
}

TEST_F(WireTest, ErrorMessageFromBody) {
    EXPECT_EQ(wire::error_message_from_body(R"({"message":"Upload-Offset mismatch"})"), "Upload-Offset mismatch");
    EXPECT_EQ(wire::error_message_from_body("  plain text  "), "plain text");
    EXPECT_EQ(wire::error_message_from_body("{broken"), "{broken");
    EXPECT_EQ(wire::error_message_from_body(""), "");
}

TEST_F(WireTest, HttpStatusErrorMessage) {
    EXPECT_STREQ(HttpStatusError(503, "").what(), "Request failed with HTTP 503.");
    EXPECT_STREQ(HttpStatusError(409, " conflict\n").what(), "Request failed with HTTP 409: conflict");
}
