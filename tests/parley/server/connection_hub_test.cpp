#include "parley/server/connection_hub.hpp"
#include "parley/server/test_connection.hpp"
#include "parley/core/timestamp.hpp"
#include <gtest/gtest.h>

namespace parley {
namespace server {

namespace {

const core::timestamp_t t0 = 1714557600000000ULL;

class connection_hub_test : public ::testing::Test
{
protected:

    connection_hub_test()
     :  hub(300, 3),
        conn1(std::make_shared<test_connection>()),
        conn2(std::make_shared<test_connection>()),
        conn3(std::make_shared<test_connection>())
    {
        hub.register_connection(10, 1, conn1);
        hub.register_connection(10, 2, conn2);
        hub.register_connection(10, 3, conn3);
    }

    connection_hub hub;

    test_connection::ptr_t conn1;
    test_connection::ptr_t conn2;
    test_connection::ptr_t conn3;
};

}

TEST_F(connection_hub_test, broadcast_skips_excluded_participant)
{
    EXPECT_EQ(2u, hub.broadcast(10, 2u, "payload"));

    EXPECT_EQ(std::vector<std::string>{"payload"}, conn1->sent);
    EXPECT_TRUE(conn2->sent.empty());
    EXPECT_EQ(std::vector<std::string>{"payload"}, conn3->sent);
}

TEST_F(connection_hub_test, broadcast_without_exclusion_reaches_all)
{
    EXPECT_EQ(3u, hub.broadcast(10, boost::none, "payload"));

    EXPECT_EQ(1u, conn1->sent.size());
    EXPECT_EQ(1u, conn2->sent.size());
    EXPECT_EQ(1u, conn3->sent.size());
}

TEST_F(connection_hub_test, broadcast_is_scoped_to_conversation)
{
    test_connection::ptr_t other = std::make_shared<test_connection>();
    hub.register_connection(20, 1, other);

    EXPECT_EQ(1u, hub.broadcast(20, boost::none, "payload"));
    EXPECT_EQ(0u, hub.broadcast(30, boost::none, "payload"));

    EXPECT_TRUE(conn1->sent.empty());
    EXPECT_EQ(1u, other->sent.size());
}

TEST_F(connection_hub_test, failed_sends_are_removed_after_fan_out)
{
    conn1->fail_sends = true;
    conn2->fail_sends = true;

    EXPECT_EQ(1u, hub.broadcast(10, boost::none, "payload"));

    // remaining recipients are still reached
    EXPECT_EQ(1u, conn3->sent.size());
    EXPECT_EQ(std::vector<user_id_t>{3}, hub.list_connected(10));
}

TEST_F(connection_hub_test, register_replaces_existing_connection)
{
    test_connection::ptr_t replacement = std::make_shared<test_connection>();
    hub.register_connection(10, 2, replacement);

    EXPECT_EQ(replacement, hub.get_connection(10, 2));
    EXPECT_EQ(3u, hub.list_connected(10).size());

    hub.broadcast(10, boost::none, "payload");
    EXPECT_TRUE(conn2->sent.empty());
    EXPECT_EQ(1u, replacement->sent.size());
}

TEST_F(connection_hub_test, unregister_is_idempotent)
{
    hub.unregister_connection(10, 2);
    hub.unregister_connection(10, 2);
    hub.unregister_connection(99, 2);

    EXPECT_EQ(nullptr, hub.get_connection(10, 2));
    EXPECT_EQ((std::vector<user_id_t>{1, 3}), hub.list_connected(10));
}

TEST_F(connection_hub_test, unregister_with_stale_handle_keeps_successor)
{
    test_connection::ptr_t replacement = std::make_shared<test_connection>();
    hub.register_connection(10, 2, replacement);

    EXPECT_FALSE(hub.unregister_connection(10, 2, conn2));
    EXPECT_EQ(replacement, hub.get_connection(10, 2));

    EXPECT_TRUE(hub.unregister_connection(10, 2, replacement));
    EXPECT_EQ(nullptr, hub.get_connection(10, 2));
}

TEST_F(connection_hub_test, presence_expires_after_timeout)
{
    hub.touch_presence(1, t0);

    EXPECT_TRUE(hub.is_online(1, t0));
    EXPECT_TRUE(hub.is_online(1, t0 + core::seconds(299)));
    EXPECT_FALSE(hub.is_online(1, t0 + core::seconds(300)));
    EXPECT_FALSE(hub.is_online(2, t0));

    // touching again refreshes
    hub.touch_presence(1, t0 + core::seconds(200));
    EXPECT_TRUE(hub.is_online(1, t0 + core::seconds(400)));
}

TEST_F(connection_hub_test, presence_is_global)
{
    hub.touch_presence(1, t0);
    hub.touch_presence(3, t0 - core::seconds(400));

    EXPECT_EQ(std::vector<user_id_t>{1},
        hub.online_participants({1, 2, 3}, t0));
}

TEST_F(connection_hub_test, typing_expires_and_excludes_caller)
{
    hub.set_typing(10, 1, t0);
    hub.set_typing(10, 2, t0 + core::seconds(2));

    EXPECT_EQ((std::vector<user_id_t>{1, 2}),
        hub.list_typing(10, t0 + core::seconds(3), boost::none));

    EXPECT_EQ(std::vector<user_id_t>{2},
        hub.list_typing(10, t0 + core::seconds(3), 1u));

    EXPECT_EQ(std::vector<user_id_t>{2},
        hub.list_typing(10, t0 + core::seconds(4), boost::none));

    // typing is per conversation
    EXPECT_TRUE(hub.list_typing(20, t0, boost::none).empty());
}

TEST_F(connection_hub_test, prune_drops_expired_state)
{
    hub.touch_presence(1, t0);
    hub.touch_presence(2, t0 + core::seconds(250));
    hub.set_typing(10, 1, t0);

    hub.prune(t0 + core::seconds(300));

    EXPECT_FALSE(hub.is_online(1, t0));
    EXPECT_TRUE(hub.is_online(2, t0 + core::seconds(300)));
    EXPECT_TRUE(hub.list_typing(10, t0, boost::none).empty());
}

}
}
