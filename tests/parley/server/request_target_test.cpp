#include "parley/server/request_target.hpp"
#include <gtest/gtest.h>

namespace parley {
namespace server {

TEST(request_target, parses_conversation_and_token)
{
    boost::optional<request_target> target =
        parse_request_target("/events/42/ws?token=abc.def");

    ASSERT_TRUE(target);
    EXPECT_EQ(42u, target->conversation_id);
    EXPECT_EQ("abc.def", target->token);
}

TEST(request_target, decodes_token)
{
    boost::optional<request_target> target =
        parse_request_target("/events/1/ws?x=1&token=a%2Bb%3D+c&token=zzz");

    ASSERT_TRUE(target);
    EXPECT_EQ("a+b= c", target->token);
}

TEST(request_target, token_is_optional)
{
    boost::optional<request_target> target =
        parse_request_target("/events/1/ws");

    ASSERT_TRUE(target);
    EXPECT_EQ("", target->token);

    target = parse_request_target("/events/1/ws?token=%zz");
    ASSERT_TRUE(target);
    EXPECT_EQ("", target->token);
}

TEST(request_target, rejects_other_paths)
{
    EXPECT_FALSE(parse_request_target("/"));
    EXPECT_FALSE(parse_request_target("/events//ws"));
    EXPECT_FALSE(parse_request_target("/events/abc/ws"));
    EXPECT_FALSE(parse_request_target("/events/-1/ws"));
    EXPECT_FALSE(parse_request_target("/events/1/chat"));
    EXPECT_FALSE(parse_request_target("/groups/1/ws?token=abc"));
    EXPECT_FALSE(parse_request_target("/events/99999999999/ws"));
}

TEST(request_target, percent_decode)
{
    EXPECT_EQ(std::string("a b/c"), *percent_decode("a+b%2fc"));
    EXPECT_FALSE(percent_decode("%"));
    EXPECT_FALSE(percent_decode("%4"));
    EXPECT_FALSE(percent_decode("%g0"));
}

}
}
