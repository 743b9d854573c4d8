#include "parley/datamodel/vector_clock.hpp"
#include "parley/error.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace parley {
namespace datamodel {

TEST(vector_clock, starts_with_owner_at_zero)
{
    vector_clock clock(3);

    EXPECT_EQ(3u, clock.get_owner());
    EXPECT_EQ(0u, clock.get(3));
    EXPECT_EQ(0u, clock.get(9));
    EXPECT_EQ((clock_state_t{{3, 0}}), clock.snapshot());
}

TEST(vector_clock, tick_increments_owner)
{
    vector_clock clock(1);

    EXPECT_EQ(1u, clock.tick());
    EXPECT_EQ(2u, clock.tick());
    EXPECT_EQ((clock_state_t{{1, 2}}), clock.snapshot());
}

TEST(vector_clock, update_takes_max_then_ticks_owner)
{
    vector_clock clock(1, clock_state_t{{1, 2}, {2, 5}});

    clock.update(clock_state_t{{1, 7}, {2, 3}, {4, 1}});

    // owner counter is max(2, 7) + 1
    EXPECT_EQ((clock_state_t{{1, 8}, {2, 5}, {4, 1}}), clock.snapshot());
}

TEST(vector_clock, update_is_not_idempotent_for_owner)
{
    vector_clock clock(1);
    clock_state_t remote{{2, 1}};

    clock.update(remote);
    clock.update(remote);

    EXPECT_EQ(2u, clock.get(1));
    EXPECT_EQ(1u, clock.get(2));
}

TEST(vector_clock, initial_state_gains_owner)
{
    vector_clock clock(5, clock_state_t{{2, 4}});
    EXPECT_EQ((clock_state_t{{2, 4}, {5, 0}}), clock.snapshot());
}

TEST(vector_clock, compare)
{
    typedef vector_clock vc;

    EXPECT_EQ(vc::CLOCKS_EQUAL, vc::compare({}, {}));
    EXPECT_EQ(vc::CLOCKS_EQUAL, vc::compare({{1, 1}}, {{1, 1}}));

    // absent authors compare as zero
    EXPECT_EQ(vc::CLOCKS_EQUAL, vc::compare({{1, 1}, {2, 0}}, {{1, 1}}));

    EXPECT_EQ(vc::LOCAL_MORE_RECENT, vc::compare({{1, 2}}, {{1, 1}}));
    EXPECT_EQ(vc::LOCAL_MORE_RECENT,
        vc::compare({{1, 1}, {2, 1}}, {{1, 1}}));

    EXPECT_EQ(vc::REMOTE_MORE_RECENT, vc::compare({{1, 1}}, {{1, 2}}));
    EXPECT_EQ(vc::REMOTE_MORE_RECENT,
        vc::compare({{2, 1}}, {{1, 1}, {2, 1}}));

    EXPECT_EQ(vc::CLOCKS_DIVERGE, vc::compare({{1, 1}}, {{2, 1}}));
    EXPECT_EQ(vc::CLOCKS_DIVERGE,
        vc::compare({{1, 2}, {2, 1}}, {{1, 1}, {2, 2}}));
}

TEST(vector_clock, happens_before_and_concurrent_with)
{
    vector_clock clock(1, clock_state_t{{1, 1}});

    EXPECT_TRUE(clock.happens_before({{1, 1}, {2, 1}}));
    EXPECT_FALSE(clock.happens_before({{1, 1}}));
    EXPECT_FALSE(clock.concurrent_with({{1, 1}}));

    EXPECT_TRUE(clock.concurrent_with({{2, 1}}));
    EXPECT_FALSE(clock.happens_before({{2, 1}}));
}

TEST(vector_clock, max_tick)
{
    EXPECT_EQ(0u, vector_clock::max_tick({}));
    EXPECT_EQ(7u, vector_clock::max_tick({{1, 3}, {2, 7}, {3, 1}}));
}

TEST(vector_clock, exhausted_owner_counter_throws)
{
    const lamport_t max = std::numeric_limits<lamport_t>::max();

    vector_clock clock(1, clock_state_t{{1, max}});

    EXPECT_THROW(clock.tick(), error::parley_exception);
    EXPECT_EQ(max, clock.get(1));

    vector_clock other(2, clock_state_t{{2, 5}});

    EXPECT_THROW(other.update({{1, 4}, {2, max}}), error::parley_exception);
    EXPECT_EQ((clock_state_t{{2, 5}}), other.snapshot());

    // another author's counter may sit at the limit
    other.update({{1, max}});

    EXPECT_EQ(max, other.get(1));
    EXPECT_EQ(6u, other.get(2));
}

}
}
