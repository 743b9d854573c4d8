#include "parley/server/broadcast_channel.hpp"
#include "parley/server/connection_hub.hpp"
#include "parley/server/test_connection.hpp"
#include <boost/asio.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/thread/thread.hpp>
#include <gtest/gtest.h>

namespace parley {
namespace server {

TEST(broadcast_channel, delivers_on_serial_service_in_order)
{
    core::io_service_ptr_t io_srv = std::make_shared<boost::asio::io_service>();
    connection_hub::ptr_t hub = std::make_shared<connection_hub>(300, 3);

    test_connection::ptr_t conn1 = std::make_shared<test_connection>();
    test_connection::ptr_t conn2 = std::make_shared<test_connection>();
    hub->register_connection(10, 1, conn1);
    hub->register_connection(10, 2, conn2);

    broadcast_channel::ptr_t channel =
        std::make_shared<broadcast_channel>(io_srv, hub);

    const unsigned count = 100;

    boost::thread worker([channel, count]()
        {
            for(unsigned i = 0; i != count; ++i)
            {
                channel->submit(10, boost::none,
                    boost::lexical_cast<std::string>(i));
            }
        });
    worker.join();

    // nothing is delivered off the serial service
    EXPECT_TRUE(conn1->sent.empty());
    EXPECT_EQ(count, channel->get_pending_count());

    io_srv->run();

    EXPECT_EQ(0u, channel->get_pending_count());

    ASSERT_EQ(count, conn1->sent.size());
    ASSERT_EQ(count, conn2->sent.size());

    for(unsigned i = 0; i != count; ++i)
    {
        EXPECT_EQ(boost::lexical_cast<std::string>(i), conn1->sent[i]);
    }
}

TEST(broadcast_channel, honours_exclusion)
{
    core::io_service_ptr_t io_srv = std::make_shared<boost::asio::io_service>();
    connection_hub::ptr_t hub = std::make_shared<connection_hub>(300, 3);

    test_connection::ptr_t conn1 = std::make_shared<test_connection>();
    test_connection::ptr_t conn2 = std::make_shared<test_connection>();
    hub->register_connection(10, 1, conn1);
    hub->register_connection(10, 2, conn2);

    broadcast_channel::ptr_t channel =
        std::make_shared<broadcast_channel>(io_srv, hub);

    channel->submit(10, 1u, "payload");
    io_srv->run();

    EXPECT_TRUE(conn1->sent.empty());
    EXPECT_EQ(1u, conn2->sent.size());
}

}
}
