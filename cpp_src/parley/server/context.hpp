#ifndef PARLEY_SERVER_CONTEXT_HPP
#define PARLEY_SERVER_CONTEXT_HPP

#include "parley/server/fwd.hpp"
#include "parley/store/fwd.hpp"
#include "parley/sync/fwd.hpp"
#include "parley/core/fwd.hpp"
#include "parley/core/protobuf/parley.pb.h"
#include "parley/spinlock.hpp"
#include <memory>
#include <string>
#include <unordered_map>

namespace parley {
namespace server {

namespace spb = parley::core::protobuf;

/*!
 * Process-scoped server state, shared by every session: configuration,
 *  store collaborators, the connection_hub, the synchronizer_registry,
 *  and the io_services they run on.
 */
class context :
    public std::enable_shared_from_this<context>
{
public:

    typedef context_ptr_t ptr_t;
    typedef context_weak_ptr_t weak_ptr_t;

    /*!
     * Throws error::parley_exception if the configuration is invalid.
     */
    context(const spb::ServerConfig &,
        const store::store_ptr_t &,
        const store::authenticator_ptr_t &);

    ~context();

    const spb::ServerConfig & get_config() const
    { return _config; }

    const std::string & get_server_hostname() const
    { return _config.hostname(); }

    unsigned short get_server_port() const
    { return _config.port(); }

    const store::store_ptr_t & get_store() const
    { return _store; }

    const store::authenticator_ptr_t & get_authenticator() const
    { return _authenticator; }

    const connection_hub_ptr_t & get_connection_hub() const
    { return _hub; }

    const sync::synchronizer_registry_ptr_t & get_synchronizer_registry() const
    { return _registry; }

    const broadcast_channel_ptr_t & get_broadcast_channel() const
    { return _channel; }

    const core::io_service_ptr_t & get_serial_io_service() const
    { return _serial_io_srv; }

    const core::io_service_ptr_t & get_concurrent_io_service() const
    { return _concurrent_io_srv; }

    /// Starts periodic upkeep
    void initialize();

    /// Stops listeners, closes clients, and stops upkeep
    void shutdown();

    void add_listener(size_t listener_id, const listener_ptr_t &);

    void drop_listener(size_t listener_id);

    void add_client(size_t client_id, const client_ptr_t &);

    void drop_client(size_t client_id);

private:

    const spb::ServerConfig _config;

    // lifetime management
    const core::proactor_ptr_t _proactor;
    const core::io_service_ptr_t _serial_io_srv;
    const core::io_service_ptr_t _concurrent_io_srv;

    const store::store_ptr_t _store;
    const store::authenticator_ptr_t _authenticator;

    const connection_hub_ptr_t _hub;
    const sync::synchronizer_registry_ptr_t _registry;
    const broadcast_channel_ptr_t _channel;
    const cron_ptr_t _cron;

    spinlock _listener_lock;
    typedef std::unordered_map<size_t, std::weak_ptr<listener>> listeners_t;
    listeners_t _listeners;

    spinlock _client_lock;
    typedef std::unordered_map<size_t, client_weak_ptr_t> clients_t;
    clients_t _clients;
};

}
}

#endif
