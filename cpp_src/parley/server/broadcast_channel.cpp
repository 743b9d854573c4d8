
#include "parley/server/broadcast_channel.hpp"
#include "parley/server/connection_hub.hpp"
#include "parley/log.hpp"
#include <functional>

namespace parley {
namespace server {

broadcast_channel::broadcast_channel(
    const core::io_service_ptr_t & serial_io_service,
    const connection_hub_ptr_t & hub)
 :  _io_service(serial_io_service),
    _hub(hub),
    _drain_posted(false)
{ }

void broadcast_channel::submit(conversation_id_t conversation_id,
    const boost::optional<user_id_t> & exclude,
    std::string payload)
{
    spinlock::guard guard(_lock);

    pending_broadcast entry;
    entry.conversation_id = conversation_id;
    entry.exclude = exclude;
    entry.payload = std::move(payload);

    _pending.push_back(std::move(entry));

    if(!_drain_posted)
    {
        _drain_posted = true;
        _io_service->post(std::bind(&broadcast_channel::on_drain,
            shared_from_this()));
    }
}

size_t broadcast_channel::get_pending_count() const
{
    spinlock::guard guard(_lock);
    return _pending.size();
}

void broadcast_channel::on_drain()
{
    std::vector<pending_broadcast> pending;
    {
        spinlock::guard guard(_lock);
        pending.swap(_pending);
        _drain_posted = false;
    }

    for(const pending_broadcast & entry : pending)
    {
        size_t delivered = _hub->broadcast(entry.conversation_id,
            entry.exclude, entry.payload);

        LOG_DBG("delivered submitted broadcast to " << delivered
            << " connections of conversation " << entry.conversation_id);
    }
}

}
}

