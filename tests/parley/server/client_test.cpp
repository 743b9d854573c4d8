#include "parley/server/client.hpp"
#include "parley/server/context.hpp"
#include "parley/server/session.hpp"
#include "parley/store/authenticator.hpp"
#include "parley/store/memory_store.hpp"
#include "parley/core/protobuf/parley.pb.h"
#include <gtest/gtest.h>

namespace parley {
namespace server {

namespace {

// exposes transport completions, so their interleaving can be driven
class scripted_client : public client
{
public:

    using client::client;

    void complete_write(boost::system::error_code ec)
    { on_write(ec); }

    void complete_disconnect(boost::system::error_code ec)
    { on_disconnect(ec); }
};

context::ptr_t make_context()
{
    return std::make_shared<context>(spb::ServerConfig(),
        std::make_shared<store::memory_store>(),
        std::make_shared<store::token_authenticator>(
            store::token_authenticator::tokens_t()));
}

}

TEST(client, write_completing_after_disconnect_is_ignored)
{
    context::ptr_t ctx = make_context();
    core::io_service_ptr_t io_srv = ctx->get_serial_io_service();

    std::shared_ptr<scripted_client> conn = std::make_shared<scripted_client>(
        ctx, boost::asio::ip::tcp::socket(*io_srv));
    conn->initialize();

    // a failed read is handled ahead of a successful write
    conn->complete_disconnect(boost::asio::error::connection_reset);
    conn->complete_write(boost::system::error_code());

    EXPECT_FALSE(conn->is_open());
    EXPECT_FALSE(conn->send("late frame"));

    // the request read then fails on the closed socket, and is ignored
    io_srv->run();
    io_srv->reset();

    EXPECT_FALSE(conn->is_open());
}

TEST(client, unopened_connection_refuses_sends)
{
    context::ptr_t ctx = make_context();
    core::io_service_ptr_t io_srv = ctx->get_serial_io_service();

    std::shared_ptr<scripted_client> conn = std::make_shared<scripted_client>(
        ctx, boost::asio::ip::tcp::socket(*io_srv));
    conn->initialize();

    EXPECT_FALSE(conn->is_open());
    EXPECT_FALSE(conn->send("early frame"));

    // closing before the upgrade completes is a no-op
    conn->close(CLOSE_POLICY_VIOLATION, "Access denied");

    io_srv->run();
    io_srv->reset();
}

}
}
