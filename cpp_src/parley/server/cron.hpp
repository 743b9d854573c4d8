#ifndef PARLEY_SERVER_CRON_HPP
#define PARLEY_SERVER_CRON_HPP

#include "parley/server/fwd.hpp"
#include "parley/core/fwd.hpp"
#include <boost/asio.hpp>
#include <memory>

namespace parley {
namespace server {

/*!
 * Once-a-second upkeep on the serial io_service: samples the server clock
 *  and prunes expired presence & typing state from the connection_hub.
 */
class cron :
    public std::enable_shared_from_this<cron>
{
public:

    typedef cron_ptr_t ptr_t;

    cron(const core::io_service_ptr_t & serial_io_service,
        const connection_hub_ptr_t &);

    void initialize();
    void shutdown();

private:

    void schedule();

    void on_cron(boost::system::error_code);

    const core::io_service_ptr_t _io_service;
    const connection_hub_ptr_t _hub;

    boost::asio::deadline_timer _timer;
    bool _shutdown;
};

}
}

#endif
