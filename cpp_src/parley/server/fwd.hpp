#ifndef PARLEY_SERVER_FWD_HPP
#define PARLEY_SERVER_FWD_HPP

#include <memory>

namespace parley {
namespace server {

class context;
typedef std::shared_ptr<context> context_ptr_t;
typedef std::weak_ptr<context> context_weak_ptr_t;

class listener;
typedef std::shared_ptr<listener> listener_ptr_t;

class connection;
typedef std::shared_ptr<connection> connection_ptr_t;

class client;
typedef std::shared_ptr<client> client_ptr_t;
typedef std::weak_ptr<client> client_weak_ptr_t;

class session;
typedef std::shared_ptr<session> session_ptr_t;

class connection_hub;
typedef std::shared_ptr<connection_hub> connection_hub_ptr_t;

class broadcast_channel;
typedef std::shared_ptr<broadcast_channel> broadcast_channel_ptr_t;

class cron;
typedef std::shared_ptr<cron> cron_ptr_t;

}
}

#endif
