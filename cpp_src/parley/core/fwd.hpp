#ifndef PARLEY_CORE_FWD_HPP
#define PARLEY_CORE_FWD_HPP

#include <boost/asio.hpp>
#include <cstdint>
#include <memory>

namespace parley {
namespace core {

class proactor;
typedef std::shared_ptr<proactor> proactor_ptr_t;
typedef std::shared_ptr<boost::asio::io_service> io_service_ptr_t;

typedef std::shared_ptr<boost::asio::deadline_timer> timer_ptr_t;

// microseconds since the unix epoch (UTC)
typedef uint64_t timestamp_t;

namespace protobuf {
    class ServerConfig;
}

}
}

#endif
