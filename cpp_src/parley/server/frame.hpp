#ifndef PARLEY_SERVER_FRAME_HPP
#define PARLEY_SERVER_FRAME_HPP

#include "parley/datamodel/message_version.hpp"
#include "parley/fwd.hpp"
#include <boost/variant.hpp>
#include <string>

namespace google {
namespace protobuf {
    class Message;
}
}

namespace parley {
namespace server {

// frame error codes
static const unsigned FRAME_MALFORMED = 1;
static const unsigned FRAME_UNKNOWN_TYPE = 2;

// well-formed, but carries values the server refuses
static const unsigned FRAME_REJECTED = 3;

/// type: message
struct post_message_frame
{
    std::string content;
};

/// type: sync_message
struct sync_message_frame
{
    explicit sync_message_frame(datamodel::message_version version)
     : version(std::move(version))
    { }

    datamodel::message_version version;
};

/// type: typing
struct typing_frame
{ };

/// type: presence_ping
struct presence_ping_frame
{ };

/// type: mark_read
struct mark_read_frame
{
    message_id_t message_id;
};

/// type: delete_message
struct delete_message_frame
{
    message_id_t message_id;
};

typedef boost::variant<
    post_message_frame,
    sync_message_frame,
    typing_frame,
    presence_ping_frame,
    mark_read_frame,
    delete_message_frame
> inbound_frame;

/*!
 * Decodes one inbound JSON text frame.
 *
 * Throws frame_error if the text is not a JSON object, if its type is
 *  absent or unknown, or if fields required by the type are missing.
 *  A sync_message clock counter above vector_clock::max_remote_tick is
 *  rejected with FRAME_REJECTED.
 */
inbound_frame decode_frame(const std::string & json);

/// Encodes an outbound frame message as JSON text
std::string encode_frame(const google::protobuf::Message &);

}
}

#endif
