#ifndef PARLEY_SERVER_BROADCAST_CHANNEL_HPP
#define PARLEY_SERVER_BROADCAST_CHANNEL_HPP

#include "parley/server/fwd.hpp"
#include "parley/core/fwd.hpp"
#include "parley/spinlock.hpp"
#include "parley/fwd.hpp"
#include <boost/optional.hpp>
#include <string>
#include <vector>

namespace parley {
namespace server {

/*!
 * Hand-off of broadcasts from worker threads to the serial io_service.
 *
 * submit() may be called from any thread. Submitted broadcasts are queued,
 *  and drained in submission order by a handler posted to the serial
 *  io_service, which performs the actual connection_hub fan-out.
 */
class broadcast_channel :
    public std::enable_shared_from_this<broadcast_channel>
{
public:

    typedef broadcast_channel_ptr_t ptr_t;

    broadcast_channel(const core::io_service_ptr_t & serial_io_service,
        const connection_hub_ptr_t &);

    void submit(conversation_id_t,
        const boost::optional<user_id_t> & exclude,
        std::string payload);

    /// Number of submitted broadcasts not yet drained
    size_t get_pending_count() const;

private:

    struct pending_broadcast
    {
        conversation_id_t conversation_id;
        boost::optional<user_id_t> exclude;
        std::string payload;
    };

    void on_drain();

    const core::io_service_ptr_t _io_service;
    const connection_hub_ptr_t _hub;

    mutable spinlock _lock;
    std::vector<pending_broadcast> _pending;
    bool _drain_posted;
};

}
}

#endif
