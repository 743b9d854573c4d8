#include "parley/server/cron.hpp"
#include "parley/server/connection_hub.hpp"
#include "parley/core/server_time.hpp"
#include "parley/error.hpp"
#include "parley/log.hpp"
#include <functional>

namespace parley {
namespace server {

cron::cron(const core::io_service_ptr_t & serial_io_service,
    const connection_hub_ptr_t & hub)
 :  _io_service(serial_io_service),
    _hub(hub),
    _timer(*serial_io_service),
    _shutdown(false)
{ }

void cron::initialize()
{
    core::server_time::update();
    schedule();
}

void cron::shutdown()
{
    _shutdown = true;
    _timer.cancel();
}

void cron::schedule()
{
    _timer.expires_from_now(boost::posix_time::seconds(1));
    _timer.async_wait(std::bind(&cron::on_cron, shared_from_this(),
        std::placeholders::_1));
}

void cron::on_cron(boost::system::error_code ec)
{
    if(ec == boost::asio::error::operation_aborted)
        return;

    PARLEY_ASSERT(!ec);

    if(_shutdown)
        return;

    // update server clock
    core::server_time::update();

    _hub->prune(core::server_time::get_time());

    schedule();
}

}
}

