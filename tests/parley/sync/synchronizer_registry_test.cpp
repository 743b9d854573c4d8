#include "parley/sync/synchronizer_registry.hpp"
#include "parley/sync/message_synchronizer.hpp"
#include <gtest/gtest.h>

namespace parley {
namespace sync {

TEST(synchronizer_registry, returns_same_instance_per_conversation)
{
    synchronizer_registry registry;

    message_synchronizer_ptr_t first = registry.get_synchronizer("1", "event");
    message_synchronizer_ptr_t second = registry.get_synchronizer("1", "event");

    ASSERT_TRUE(first);
    EXPECT_EQ(first, second);
    EXPECT_EQ("1", first->get_conversation_id());
    EXPECT_EQ(1u, registry.size());
}

TEST(synchronizer_registry, separates_conversations_and_kinds)
{
    synchronizer_registry registry;

    message_synchronizer_ptr_t group = registry.get_synchronizer("1");
    message_synchronizer_ptr_t event = registry.get_synchronizer("1", "event");
    message_synchronizer_ptr_t other = registry.get_synchronizer("2", "event");

    EXPECT_NE(group, event);
    EXPECT_NE(event, other);
    EXPECT_EQ(3u, registry.size());

    EXPECT_EQ(group, registry.get_synchronizer("1", "group"));
}

}
}
