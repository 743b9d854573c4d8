#ifndef PARLEY_SERVER_REQUEST_TARGET_HPP
#define PARLEY_SERVER_REQUEST_TARGET_HPP

#include "parley/fwd.hpp"
#include <boost/optional.hpp>
#include <string>

namespace parley {
namespace server {

/// Connection parameters carried by a websocket upgrade request
struct request_target
{
    conversation_id_t conversation_id;

    // empty if no token parameter was supplied
    std::string token;
};

/*!
 * Parses a request target of form "/events/{conversation-id}/ws?token=..."
 *
 * Query parameters are percent-decoded. Returns none if the path doesn't
 *  name a conversation channel.
 */
boost::optional<request_target> parse_request_target(const std::string &);

/// Decodes %XX escapes, and '+' as space. Returns none on a bad escape
boost::optional<std::string> percent_decode(const std::string &);

}
}

#endif
