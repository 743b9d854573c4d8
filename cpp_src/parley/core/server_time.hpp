#ifndef PARLEY_CORE_SERVER_TIME_HPP
#define PARLEY_CORE_SERVER_TIME_HPP

#include "parley/core/fwd.hpp"
#include <atomic>

namespace parley {
namespace core {

/*!
 * Process-wide view of the current time, in microseconds since the epoch.
 *
 * The value is sampled from the system clock by server::cron once a second,
 * so that presence & typing expiry within one scheduler turn see a single
 * consistent "now". Tests pin it with set_time().
 */
class server_time
{
public:

    static timestamp_t get_time()
    { return _time.load(std::memory_order_relaxed); }

    static void set_time(timestamp_t);

    /// Re-samples the system clock into get_time()
    static void update();

    /// Reads the system clock directly
    static timestamp_t system_time();

private:

    static std::atomic<timestamp_t> _time;
};

}
}

#endif
