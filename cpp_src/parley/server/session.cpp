
#include "parley/server/session.hpp"
#include "parley/server/broadcast_channel.hpp"
#include "parley/server/connection.hpp"
#include "parley/server/connection_hub.hpp"
#include "parley/server/context.hpp"
#include "parley/server/frame_error.hpp"
#include "parley/sync/message_synchronizer.hpp"
#include "parley/sync/synchronizer_registry.hpp"
#include "parley/store/authenticator.hpp"
#include "parley/store/store.hpp"
#include "parley/core/protobuf/frames.pb.h"
#include "parley/core/server_time.hpp"
#include "parley/core/timestamp.hpp"
#include "parley/error.hpp"
#include "parley/log.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <functional>

namespace parley {
namespace server {

namespace {

const char * messaging_closed_error = "This event has ended. "
    "Chat is now read-only. You can still view message history.";

std::string display_name(const spb::User & user)
{
    return user.name().empty() ? user.email() : user.name();
}

void set_wire_user(spb::WireUser & wire, user_id_t user_id,
    const boost::optional<spb::User> & user)
{
    wire.set_id(user_id);

    if(!user)
    {
        wire.set_name("Unknown");
        return;
    }
    wire.set_name(user->name());
    wire.set_email(user->email());
    wire.set_photo_url(user->photo_url());
    wire.set_is_verified(user->is_verified());
}

void set_wire_version(spb::WireMessage & wire,
    const datamodel::message_version & version)
{
    wire.set_id(version.get_message_id());
    wire.set_version(version.get_version());

    for(const datamodel::clock_state_t::value_type & entry :
        version.get_vector_clock())
    {
        (*wire.mutable_vector_clock())[entry.first] = entry.second;
    }
}

}

class session::frame_dispatch :
    public boost::static_visitor<void>
{
public:

    explicit frame_dispatch(session & s)
     : _session(s)
    { }

    void operator()(const post_message_frame & frame) const
    { _session.on_post_message(frame); }

    void operator()(const sync_message_frame & frame) const
    { _session.on_sync_message(frame); }

    void operator()(const typing_frame & frame) const
    { _session.on_typing(frame); }

    void operator()(const presence_ping_frame & frame) const
    { _session.on_presence_ping(frame); }

    void operator()(const mark_read_frame & frame) const
    { _session.on_mark_read(frame); }

    void operator()(const delete_message_frame & frame) const
    { _session.on_delete_message(frame); }

private:

    session & _session;
};

session::session(const context_ptr_t & context,
    const connection_ptr_t & connection)
 :  _context(context),
    _connection(connection),
    _state(CONNECTING),
    _registered(false),
    _user_id(0),
    _conversation_id(0)
{
    PARLEY_ASSERT(_context && _connection);
}

session::~session()
{
    close();
}

bool session::open(const std::string & token,
    conversation_id_t conversation_id)
{
    PARLEY_ASSERT(_state == CONNECTING);

    _conversation_id = conversation_id;

    try
    {
        _store_session = _context->get_store()->open_session();

        _state = AUTHENTICATING;
        if(!authenticate(token))
            return false;

        _state = AUTHORIZING;
        if(!authorize())
            return false;

        _state = REPLAYING;
        replay();
    }
    catch(const store::store_error & e)
    {
        LOG_WARN("store failure opening conversation " << conversation_id
            << " in state " << _state << ": " << e.what());

        reject(CLOSE_INTERNAL_ERROR, "Internal error");
        return false;
    }
    return _state == OPEN;
}

void session::reject(unsigned short code, const std::string & reason)
{
    LOG_INFO("rejecting connection to conversation " << _conversation_id
        << " in state " << _state << ": " << reason);

    _connection->close(code, reason);
    close();
}

bool session::authenticate(const std::string & token)
{
    if(token.empty())
    {
        reject(CLOSE_POLICY_VIOLATION, "Authentication required");
        return false;
    }

    try
    {
        _user_id = _context->get_authenticator()->verify_credential(token);
    }
    catch(const store::store_error & e)
    {
        LOG_INFO("credential verification failed: " << e.what());
        reject(CLOSE_POLICY_VIOLATION, "Invalid authentication");
        return false;
    }

    boost::optional<spb::User> user = _store_session->get_user(_user_id);
    if(user)
        _user = *user;
    else
        _user.set_id(_user_id);

    return true;
}

bool session::authorize()
{
    boost::optional<spb::Conversation> conversation =
        _store_session->get_conversation(_conversation_id);

    if(!conversation)
    {
        reject(CLOSE_POLICY_VIOLATION, "Event not found");
        return false;
    }
    _conversation = *conversation;

    bool is_participant = std::find(
        _conversation.participant_id().begin(),
        _conversation.participant_id().end(),
        _user_id) != _conversation.participant_id().end();

    if(!is_participant && _conversation.owner_id() != _user_id)
    {
        reject(CLOSE_POLICY_VIOLATION, "Access denied");
        return false;
    }
    return true;
}

void session::replay()
{
    const unsigned limit = _context->get_config().replay_limit();

    _synchronizer = _context->get_synchronizer_registry()->get_synchronizer(
        std::to_string(_conversation_id), "event");

    // oldest first
    std::vector<spb::PersistedMessage> history =
        _store_session->load_recent_messages(_conversation_id, limit);

    for(const spb::PersistedMessage & message : history)
    {
        _synchronizer->initialize_version(message.id(), message.user_id(),
            message.is_deleted() ? std::string() : message.content(),
            message.created_at());
    }

    spb::InitialMessagesFrame snapshot;
    snapshot.set_type("initial_messages");

    for(const datamodel::message_version & version :
        _synchronizer->get_ordered_messages(limit))
    {
        boost::optional<spb::PersistedMessage> message =
            _store_session->get_message(version.get_message_id());

        // versions without a persisted message of this conversation
        //  are not part of the snapshot
        if(!message || message->conversation_id() != _conversation_id)
            continue;

        spb::WireMessage & wire = *snapshot.add_messages();
        set_wire_version(wire, version);

        wire.set_content(message->is_deleted() ?
            std::string() : message->content());
        wire.set_is_deleted(message->is_deleted());
        wire.set_created_at(core::format_timestamp(message->created_at()));
        wire.set_is_read_by_me(_store_session->has_read_receipt(
            message->id(), _user_id));

        set_wire_user(*wire.mutable_user(), message->user_id(),
            _store_session->get_user(message->user_id()));
    }

    if(!_connection->send(encode_frame(snapshot)))
    {
        LOG_INFO("participant " << _user_id << " disconnected during replay");
        close();
        return;
    }

    connection_hub & hub = *_context->get_connection_hub();
    core::timestamp_t now = core::server_time::get_time();

    hub.register_connection(_conversation_id, _user_id, _connection);
    _registered = true;

    hub.touch_presence(_user_id, now);

    _state = OPEN;

    LOG_INFO("participant " << _user_id << " joined conversation "
        << _conversation_id << " (" << snapshot.messages_size()
        << " messages replayed)");

    spb::UserJoinedFrame joined;
    joined.set_type("user_joined");
    joined.set_user_id(_user_id);
    joined.set_user_name(display_name(_user));
    joined.set_user_photo_url(_user.photo_url());

    hub.broadcast(_conversation_id, _user_id, encode_frame(joined));
}

void session::on_frame(const std::string & text)
{
    if(_state != OPEN)
    {
        LOG_WARN("dropping frame received in state " << _state);
        return;
    }

    try
    {
        inbound_frame frame = decode_frame(text);
        boost::apply_visitor(frame_dispatch(*this), frame);
    }
    catch(const frame_error & e)
    {
        LOG_WARN("dropping frame of participant " << _user_id
            << " (code " << e.get_code() << "): " << e.what());
    }
    catch(const store::store_error & e)
    {
        LOG_WARN("store failure handling frame of participant "
            << _user_id << ": " << e.what());
    }

    if(!_connection->is_open())
    {
        close();
    }
}

void session::on_post_message(const post_message_frame & frame)
{
    core::timestamp_t now = core::server_time::get_time();

    if(_conversation.has_messaging_ends_at() &&
        now >= _conversation.messaging_ends_at())
    {
        send_error(messaging_closed_error);
        return;
    }

    std::string content = boost::algorithm::trim_copy(frame.content);

    if(content.empty() ||
        content.size() > _context->get_config().max_content_length())
    {
        LOG_DBG("dropping message of participant " << _user_id
            << " with content length " << content.size());
        return;
    }

    spb::PersistedMessage persisted = _store_session->persist_message(
        _conversation_id, _user_id, content);

    datamodel::message_version version = _synchronizer->create_version(
        persisted.id(), _user_id, content, persisted.created_at());

    connection_hub & hub = *_context->get_connection_hub();
    hub.touch_presence(_user_id, now);

    spb::NewMessageFrame out;
    out.set_type("new_message");

    spb::WireMessage & wire = *out.mutable_message();
    set_wire_version(wire, version);
    wire.set_content(content);
    wire.set_created_at(core::format_timestamp(persisted.created_at()));
    set_wire_user(*wire.mutable_user(), _user_id, _user);

    hub.broadcast(_conversation_id, boost::none, encode_frame(out));
}

void session::on_sync_message(const sync_message_frame & frame)
{
    datamodel::merge_result result = _synchronizer->merge(frame.version);

    if(!result.is_new)
    {
        LOG_DBG("ignoring sync of " << frame.version);
        return;
    }

    const datamodel::message_version & winner = result.winner;

    spb::NewMessageFrame out;
    out.set_type("new_message");

    spb::WireMessage & wire = *out.mutable_message();
    set_wire_version(wire, winner);
    wire.set_content(winner.get_content());
    wire.set_is_deleted(winner.is_tombstone());
    wire.set_created_at(core::format_timestamp(winner.get_created_at()));
    set_wire_user(*wire.mutable_user(), winner.get_user_id(),
        _store_session->get_user(winner.get_user_id()));

    _context->get_connection_hub()->broadcast(
        _conversation_id, _user_id, encode_frame(out));
}

void session::on_typing(const typing_frame &)
{
    core::timestamp_t now = core::server_time::get_time();
    connection_hub & hub = *_context->get_connection_hub();

    hub.set_typing(_conversation_id, _user_id, now);
    hub.touch_presence(_user_id, now);

    spb::TypingFrame out;
    out.set_type("typing");
    out.set_user_id(_user_id);
    out.set_user_name(display_name(_user));

    hub.broadcast(_conversation_id, _user_id, encode_frame(out));
}

void session::on_presence_ping(const presence_ping_frame &)
{
    core::timestamp_t now = core::server_time::get_time();
    connection_hub & hub = *_context->get_connection_hub();

    hub.touch_presence(_user_id, now);

    std::vector<user_id_t> connected = hub.list_connected(_conversation_id);
    connected.erase(std::remove(connected.begin(), connected.end(), _user_id),
        connected.end());

    spb::PresenceUpdateFrame out;
    out.set_type("presence_update");

    for(user_id_t user_id : hub.online_participants(connected, now))
    {
        out.add_online_users(user_id);
    }
    _connection->send(encode_frame(out));
}

void session::on_mark_read(const mark_read_frame & frame)
{
    if(_store_session->has_read_receipt(frame.message_id, _user_id))
        return;

    _store_session->record_read_receipt(frame.message_id, _user_id);

    spb::MessageReadFrame out;
    out.set_type("message_read");
    out.set_message_id(frame.message_id);
    out.set_user_id(_user_id);

    _context->get_connection_hub()->broadcast(
        _conversation_id, _user_id, encode_frame(out));
}

void session::on_delete_message(const delete_message_frame & frame)
{
    boost::optional<spb::PersistedMessage> message =
        _store_session->get_message(frame.message_id);

    if(!message)
    {
        send_error("Message not found");
        return;
    }
    if(message->conversation_id() != _conversation_id)
    {
        send_error("Message does not belong to this event");
        return;
    }
    if(message->user_id() != _user_id)
    {
        send_error("You can only delete your own messages");
        return;
    }

    _context->get_concurrent_io_service()->post(
        std::bind(&session::on_store_delete,
            _context->get_store(),
            _context->get_broadcast_channel(),
            _conversation_id,
            frame.message_id));
}

void session::on_store_delete(const store::store_ptr_t & store,
    const broadcast_channel_ptr_t & channel,
    conversation_id_t conversation_id, message_id_t message_id)
{
    try
    {
        store::store_session_ptr_t handle = store->open_session();
        handle->delete_message(message_id);
    }
    catch(const store::store_error & e)
    {
        LOG_WARN("failed to delete message " << message_id << ": "
            << e.what());
        return;
    }

    spb::MessageDeletedFrame out;
    out.set_type("message_deleted");
    out.set_message_id(message_id);

    channel->submit(conversation_id, boost::none, encode_frame(out));
}

void session::send_error(const std::string & message)
{
    spb::ErrorFrame out;
    out.set_type("error");
    out.set_message(message);

    _connection->send(encode_frame(out));
}

void session::close()
{
    if(_state == CLOSING || _state == CLOSED)
        return;

    _state = CLOSING;

    if(_registered)
    {
        connection_hub & hub = *_context->get_connection_hub();

        hub.unregister_connection(_conversation_id, _user_id, _connection);
        _registered = false;

        LOG_INFO("participant " << _user_id << " left conversation "
            << _conversation_id);

        // departure isn't announced while a newer connection remains
        if(!hub.get_connection(_conversation_id, _user_id))
        {
            spb::UserLeftFrame out;
            out.set_type("user_left");
            out.set_user_id(_user_id);

            hub.broadcast(_conversation_id, _user_id, encode_frame(out));
        }
    }

    _store_session.reset();
    _state = CLOSED;
}

std::ostream & operator << (std::ostream & out, session::state_t state)
{
    switch(state)
    {
    case session::CONNECTING: return out << "CONNECTING";
    case session::AUTHENTICATING: return out << "AUTHENTICATING";
    case session::AUTHORIZING: return out << "AUTHORIZING";
    case session::REPLAYING: return out << "REPLAYING";
    case session::OPEN: return out << "OPEN";
    case session::CLOSING: return out << "CLOSING";
    case session::CLOSED: return out << "CLOSED";
    }
    return out << "UNKNOWN";
}

}
}

