
#include "parley/server/frame.hpp"
#include "parley/server/frame_error.hpp"
#include "parley/core/protobuf/frames.pb.h"
#include "parley/core/timestamp.hpp"
#include "parley/datamodel/vector_clock.hpp"
#include "parley/error.hpp"
#include <google/protobuf/util/json_util.h>

namespace parley {
namespace server {

namespace spb = parley::core::protobuf;

namespace {

typedef google::protobuf::Map<uint32_t, uint32_t> wire_clock_t;

datamodel::message_version decode_version(const spb::WireVersion & wire)
{
    if(!wire.id())
    {
        throw frame_error(FRAME_MALFORMED, "sync_message without message.id");
    }
    if(!wire.user_id())
    {
        throw frame_error(FRAME_MALFORMED,
            "sync_message without message.user_id");
    }

    core::timestamp_t created_at = 0;
    if(!core::try_parse_timestamp(wire.created_at(), created_at))
    {
        throw frame_error(FRAME_MALFORMED,
            "sync_message with bad created_at: " + wire.created_at());
    }

    datamodel::clock_state_t clock;
    for(const wire_clock_t::value_type & entry : wire.vector_clock())
    {
        if(entry.second > datamodel::vector_clock::max_remote_tick)
        {
            throw frame_error(FRAME_REJECTED,
                "sync_message with out-of-range clock counter");
        }
        clock[entry.first] = entry.second;
    }

    return datamodel::message_version(wire.id(), std::move(clock),
        wire.content(), wire.user_id(), created_at);
}

}

inbound_frame decode_frame(const std::string & json)
{
    spb::ClientFrame frame;

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    google::protobuf::util::Status status =
        google::protobuf::util::JsonStringToMessage(json, &frame, options);

    if(!status.ok())
    {
        throw frame_error(FRAME_MALFORMED,
            "malformed frame: " + status.ToString());
    }

    const std::string & type = frame.type();

    if(type == "message")
    {
        post_message_frame result;
        result.content = frame.content();
        return result;
    }
    if(type == "sync_message")
    {
        if(!frame.has_message())
        {
            throw frame_error(FRAME_MALFORMED, "sync_message without message");
        }
        return sync_message_frame(decode_version(frame.message()));
    }
    if(type == "typing")
    {
        return typing_frame();
    }
    if(type == "presence_ping")
    {
        return presence_ping_frame();
    }
    if(type == "mark_read" || type == "delete_message")
    {
        if(!frame.message_id())
        {
            throw frame_error(FRAME_MALFORMED, type + " without message_id");
        }
        if(type == "mark_read")
        {
            mark_read_frame result;
            result.message_id = frame.message_id();
            return result;
        }
        delete_message_frame result;
        result.message_id = frame.message_id();
        return result;
    }

    if(type.empty())
        throw frame_error(FRAME_UNKNOWN_TYPE, "frame without type");

    throw frame_error(FRAME_UNKNOWN_TYPE, "unknown frame type: " + type);
}

std::string encode_frame(const google::protobuf::Message & message)
{
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;
    options.always_print_primitive_fields = true;

    std::string output;
    google::protobuf::util::Status status =
        google::protobuf::util::MessageToJsonString(message, &output, options);

    // serialization of a well-formed message cannot fail
    PARLEY_ASSERT(status.ok());
    return output;
}

}
}

