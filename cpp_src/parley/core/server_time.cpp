
#include "parley/core/server_time.hpp"
#include <boost/date_time/posix_time/posix_time.hpp>

namespace parley {
namespace core {

std::atomic<timestamp_t> server_time::_time(server_time::system_time());

void server_time::set_time(timestamp_t new_time)
{
    _time.store(new_time, std::memory_order_relaxed);
}

void server_time::update()
{
    set_time(system_time());
}

timestamp_t server_time::system_time()
{
    static const boost::posix_time::ptime epoch(
        boost::gregorian::date(1970, 1, 1));

    return (boost::posix_time::microsec_clock::universal_time() - epoch
        ).total_microseconds();
}

}
}

