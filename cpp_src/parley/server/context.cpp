
#include "parley/server/context.hpp"
#include "parley/server/broadcast_channel.hpp"
#include "parley/server/connection_hub.hpp"
#include "parley/server/client.hpp"
#include "parley/server/cron.hpp"
#include "parley/server/listener.hpp"
#include "parley/sync/synchronizer_registry.hpp"
#include "parley/store/authenticator.hpp"
#include "parley/store/store.hpp"
#include "parley/core/config.hpp"
#include "parley/core/proactor.hpp"
#include "parley/error.hpp"
#include "parley/log.hpp"
#include <vector>

namespace parley {
namespace server {

namespace {

const spb::ServerConfig & checked(const spb::ServerConfig & config)
{
    core::validate_config(config);
    return config;
}

}

context::context(const spb::ServerConfig & config,
    const store::store_ptr_t & store,
    const store::authenticator_ptr_t & authenticator)
 :  _config(checked(config)),
    _proactor(core::proactor::get_proactor()),
    _serial_io_srv(_proactor->serial_io_service()),
    _concurrent_io_srv(_proactor->concurrent_io_service()),
    _store(store),
    _authenticator(authenticator),
    _hub(std::make_shared<connection_hub>(
        config.presence_timeout_seconds(), config.typing_timeout_seconds())),
    _registry(std::make_shared<sync::synchronizer_registry>()),
    _channel(std::make_shared<broadcast_channel>(_serial_io_srv, _hub)),
    _cron(std::make_shared<cron>(_serial_io_srv, _hub))
{
    PARLEY_ASSERT(_store && _authenticator);
    LOG_DBG("context created");
}

context::~context()
{
    LOG_DBG("context destroyed");
}

void context::initialize()
{
    _cron->initialize();
}

void context::shutdown()
{
    std::vector<listener::ptr_t> listeners;
    {
        spinlock::guard guard(_listener_lock);

        for(const listeners_t::value_type & entry : _listeners)
        {
            listener::ptr_t listener(entry.second.lock());

            if(listener)
                listeners.push_back(listener);
        }
    }
    for(const listener::ptr_t & listener : listeners)
    {
        listener->shutdown();
    }

    std::vector<client::ptr_t> clients;
    {
        spinlock::guard guard(_client_lock);

        for(const clients_t::value_type & entry : _clients)
        {
            client::ptr_t client(entry.second.lock());

            if(client)
                clients.push_back(client);
        }
    }
    for(const client::ptr_t & client : clients)
    {
        client->shutdown();
    }

    _cron->shutdown();
}

void context::add_client(size_t client_id, const client::ptr_t & client)
{
    spinlock::guard guard(_client_lock);

    PARLEY_ASSERT(_clients.insert(
        std::make_pair(client_id, client)).second);
}

void context::drop_client(size_t client_id)
{
    spinlock::guard guard(_client_lock);

    clients_t::iterator it = _clients.find(client_id);
    PARLEY_ASSERT(it != _clients.end());
    _clients.erase(it);
}

void context::add_listener(size_t listener_id,
    const listener::ptr_t & listener)
{
    spinlock::guard guard(_listener_lock);

    PARLEY_ASSERT(_listeners.insert(
        std::make_pair(listener_id, listener)).second);
}

void context::drop_listener(size_t listener_id)
{
    spinlock::guard guard(_listener_lock);

    listeners_t::iterator it = _listeners.find(listener_id);
    PARLEY_ASSERT(it != _listeners.end());
    _listeners.erase(it);
}

}
}

