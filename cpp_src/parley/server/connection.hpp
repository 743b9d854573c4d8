#ifndef PARLEY_SERVER_CONNECTION_HPP
#define PARLEY_SERVER_CONNECTION_HPP

#include "parley/server/fwd.hpp"
#include <boost/noncopyable.hpp>
#include <string>

namespace parley {
namespace server {

/*!
 * A live, bidirectional connection of one participant, as seen by the
 *  connection_hub and a session. Only used from the serial io_service.
 */
class connection : private boost::noncopyable
{
public:

    typedef connection_ptr_t ptr_t;

    virtual ~connection()
    { }

    /*!
     * Queues a text frame for delivery.
     *
     * Returns false if the frame cannot be delivered because the
     *  connection is no longer open.
     */
    virtual bool send(const std::string & payload) = 0;

    virtual bool is_open() const = 0;

    /// Begins closing the connection with a close code & reason
    virtual void close(unsigned short code, const std::string & reason) = 0;
};

}
}

#endif
