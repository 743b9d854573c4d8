#include "parley/server/frame.hpp"
#include "parley/server/frame_error.hpp"
#include "parley/server/test_connection.hpp"
#include "parley/core/protobuf/frames.pb.h"
#include <gtest/gtest.h>

namespace parley {
namespace server {

namespace spb = parley::core::protobuf;

namespace {

unsigned decode_error_code(const std::string & json)
{
    try
    {
        decode_frame(json);
    }
    catch(const frame_error & e)
    {
        return e.get_code();
    }
    return 0;
}

}

TEST(frame, decodes_post_message)
{
    inbound_frame frame = decode_frame(
        R"({"type": "message", "content": "hello"})");

    const post_message_frame * post = boost::get<post_message_frame>(&frame);
    ASSERT_NE(nullptr, post);
    EXPECT_EQ("hello", post->content);
}

TEST(frame, decodes_sync_message)
{
    inbound_frame frame = decode_frame(R"({
        "type": "sync_message",
        "message": {
            "id": 7,
            "vector_clock": {"1": 2, "3": 1},
            "content": "A",
            "user_id": 1,
            "created_at": "2024-05-01T10:00:00.250000Z"
        }})");

    const sync_message_frame * sync = boost::get<sync_message_frame>(&frame);
    ASSERT_NE(nullptr, sync);

    EXPECT_EQ(datamodel::message_version(7, {{1, 2}, {3, 1}}, "A", 1,
        1714557600250000ULL), sync->version);
}

TEST(frame, decodes_signals)
{
    inbound_frame typing = decode_frame(R"({"type": "typing"})");
    EXPECT_NE(nullptr, boost::get<typing_frame>(&typing));

    inbound_frame ping = decode_frame(R"({"type": "presence_ping"})");
    EXPECT_NE(nullptr, boost::get<presence_ping_frame>(&ping));
}

TEST(frame, decodes_message_id_frames)
{
    inbound_frame read = decode_frame(
        R"({"type": "mark_read", "message_id": 5})");
    ASSERT_NE(nullptr, boost::get<mark_read_frame>(&read));
    EXPECT_EQ(5u, boost::get<mark_read_frame>(read).message_id);

    inbound_frame del = decode_frame(
        R"({"type": "delete_message", "message_id": 6})");
    ASSERT_NE(nullptr, boost::get<delete_message_frame>(&del));
    EXPECT_EQ(6u, boost::get<delete_message_frame>(del).message_id);
}

TEST(frame, ignores_unknown_fields)
{
    inbound_frame frame = decode_frame(
        R"({"type": "typing", "client_seq": 12, "extra": {"a": 1}})");
    EXPECT_NE(nullptr, boost::get<typing_frame>(&frame));
}

TEST(frame, rejects_unknown_or_missing_type)
{
    EXPECT_EQ(FRAME_UNKNOWN_TYPE, decode_error_code(R"({"type": "shout"})"));
    EXPECT_EQ(FRAME_UNKNOWN_TYPE, decode_error_code(R"({"content": "x"})"));
}

TEST(frame, rejects_malformed_frames)
{
    EXPECT_EQ(FRAME_MALFORMED, decode_error_code("not json"));
    EXPECT_EQ(FRAME_MALFORMED, decode_error_code(R"(["message"])"));
    EXPECT_EQ(FRAME_MALFORMED, decode_error_code(R"({"type": 12})"));

    EXPECT_EQ(FRAME_MALFORMED, decode_error_code(
        R"({"type": "sync_message"})"));
    EXPECT_EQ(FRAME_MALFORMED, decode_error_code(
        R"({"type": "sync_message", "message": {"user_id": 1,)"
        R"( "created_at": "2024-05-01T10:00:00Z"}})"));
    EXPECT_EQ(FRAME_MALFORMED, decode_error_code(
        R"({"type": "sync_message", "message": {"id": 1, "user_id": 1,)"
        R"( "created_at": "last tuesday"}})"));

    EXPECT_EQ(FRAME_MALFORMED, decode_error_code(R"({"type": "mark_read"})"));
    EXPECT_EQ(FRAME_MALFORMED, decode_error_code(
        R"({"type": "delete_message", "message_id": 0})"));
}

TEST(frame, rejects_out_of_range_clock_counters)
{
    EXPECT_EQ(FRAME_REJECTED, decode_error_code(
        R"({"type": "sync_message", "message": {"id": 1, "user_id": 2,)"
        R"( "vector_clock": {"1": 3, "2": 4294967295},)"
        R"( "created_at": "2024-05-01T10:00:00Z"}})"));

    inbound_frame frame = decode_frame(
        R"({"type": "sync_message", "message": {"id": 1, "user_id": 2,)"
        R"( "vector_clock": {"2": 2147483647},)"
        R"( "created_at": "2024-05-01T10:00:00Z"}})");

    sync_message_frame * sync = boost::get<sync_message_frame>(&frame);
    ASSERT_NE(nullptr, sync);
    EXPECT_EQ(2147483647u, sync->version.get_version());
}

TEST(frame, encodes_with_field_names_and_defaults)
{
    spb::UserLeftFrame left;
    left.set_type("user_left");

    google::protobuf::Struct json = parse_json(encode_frame(left));

    EXPECT_EQ("user_left", json.fields().at("type").string_value());
    ASSERT_EQ(1u, json.fields().count("user_id"));
    EXPECT_EQ(0, json.fields().at("user_id").number_value());
}

TEST(frame, encodes_nested_messages)
{
    spb::NewMessageFrame out;
    out.set_type("new_message");

    spb::WireMessage & message = *out.mutable_message();
    message.set_id(3);
    message.set_content("hi");
    message.set_version(2);
    (*message.mutable_vector_clock())[1] = 2;
    message.mutable_user()->set_photo_url("https://example.com/a.png");

    google::protobuf::Struct json = parse_json(encode_frame(out));
    const google::protobuf::Struct & wire =
        json.fields().at("message").struct_value();

    EXPECT_EQ(3, wire.fields().at("id").number_value());
    EXPECT_EQ("hi", wire.fields().at("content").string_value());
    EXPECT_FALSE(wire.fields().at("is_deleted").bool_value());
    EXPECT_EQ(2, wire.fields().at("vector_clock").struct_value()
        .fields().at("1").number_value());
    EXPECT_EQ("https://example.com/a.png", wire.fields().at("user")
        .struct_value().fields().at("photo_url").string_value());
}

}
}
