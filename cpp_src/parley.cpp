#include "parley/server/context.hpp"
#include "parley/server/listener.hpp"
#include "parley/store/authenticator.hpp"
#include "parley/store/memory_store.hpp"
#include "parley/core/config.hpp"
#include "parley/core/proactor.hpp"
#include "parley/error.hpp"
#include "parley/log.hpp"
#include <boost/asio.hpp>
#include <iostream>

using namespace parley;

namespace {

// grace period for close frames to flush before stopping
const unsigned shutdown_delay_ms = 250;

store::authenticator_ptr_t make_authenticator(
    const core::protobuf::ServerConfig & config)
{
    store::token_authenticator::tokens_t tokens;

    for(const core::protobuf::ServerConfig::Credential & credential :
        config.credential())
    {
        tokens[credential.token()] = credential.user_id();
    }
    return std::make_shared<store::token_authenticator>(std::move(tokens));
}

}

int main(int argc, const char ** argv)
{
    if(argc != 2)
    {
        std::cerr << "usage: " << argv[0] << " <config-file>" << std::endl;
        return 1;
    }

    try
    {
        core::protobuf::ServerConfig config = core::load_config(argv[1]);

        core::proactor::ptr_t proactor = core::proactor::get_proactor();

        store::memory_store::ptr_t store =
            std::make_shared<store::memory_store>();
        store->seed(config);

        server::context::ptr_t context = std::make_shared<server::context>(
            config, store, make_authenticator(config));
        context->initialize();

        server::listener::ptr_t listener =
            std::make_shared<server::listener>(context);
        listener->initialize();

        boost::asio::signal_set signals(*proactor->serial_io_service(),
            SIGINT, SIGTERM);

        signals.async_wait(
            [context, proactor](const boost::system::error_code & ec, int sig)
            {
                if(ec)
                    return;

                LOG_INFO("caught signal " << sig << "; shutting down");
                context->shutdown();

                proactor->run_later([proactor]() { proactor->shutdown(); },
                    shutdown_delay_ms);
            });

        listener.reset();

        proactor->run(config.worker_threads());
    }
    catch(const error::parley_exception & e)
    {
        LOG_ERR(e.what());
        return 1;
    }
    catch(const std::exception & e)
    {
        LOG_ERR(e.what());
        return 1;
    }

    LOG_INFO("run returned");
    return 0;
}
