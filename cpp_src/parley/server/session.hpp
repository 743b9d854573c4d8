#ifndef PARLEY_SERVER_SESSION_HPP
#define PARLEY_SERVER_SESSION_HPP

#include "parley/server/fwd.hpp"
#include "parley/server/frame.hpp"
#include "parley/store/fwd.hpp"
#include "parley/sync/fwd.hpp"
#include "parley/core/protobuf/parley.pb.h"
#include "parley/fwd.hpp"
#include <boost/noncopyable.hpp>
#include <iosfwd>
#include <string>

namespace parley {
namespace server {

namespace spb = parley::core::protobuf;

// websocket close codes
static const unsigned short CLOSE_POLICY_VIOLATION = 1008;
static const unsigned short CLOSE_INTERNAL_ERROR = 1011;

/*!
 * One participant's chat session over one connection.
 *
 * States progress CONNECTING => AUTHENTICATING => AUTHORIZING =>
 *  REPLAYING => OPEN => CLOSING => CLOSED. A failed step closes the
 *  connection with a policy-violation reason, and the session moves
 *  straight to CLOSED.
 *
 * Whatever the exit path, close() releases the store handle, and (if the
 *  session reached registration) removes it from the connection_hub and
 *  announces the departure, exactly once.
 *
 * Only used from the serial io_service.
 */
class session : private boost::noncopyable
{
public:

    typedef session_ptr_t ptr_t;

    enum state_t
    {
        CONNECTING,
        AUTHENTICATING,
        AUTHORIZING,
        REPLAYING,
        OPEN,
        CLOSING,
        CLOSED
    };

    session(const context_ptr_t &, const connection_ptr_t &);

    ~session();

    /*!
     * Runs the session through authentication, authorization and
     *  replay of the conversation's recent history.
     *
     * Returns true if the session is OPEN. Otherwise the connection has
     *  been closed with a reason, and the session is CLOSED.
     */
    bool open(const std::string & token, conversation_id_t);

    /*!
     * Handles one inbound text frame of an OPEN session.
     *
     * A frame which fails to decode or to apply is logged and dropped.
     *  If the connection is found to be closed, the session is closed.
     */
    void on_frame(const std::string & text);

    /// Idempotent
    void close();

    state_t get_state() const
    { return _state; }

    user_id_t get_user_id() const
    { return _user_id; }

    conversation_id_t get_conversation_id() const
    { return _conversation_id; }

private:

    class frame_dispatch;
    friend class frame_dispatch;

    void reject(unsigned short code, const std::string & reason);

    bool authenticate(const std::string & token);
    bool authorize();
    void replay();

    void on_post_message(const post_message_frame &);
    void on_sync_message(const sync_message_frame &);
    void on_typing(const typing_frame &);
    void on_presence_ping(const presence_ping_frame &);
    void on_mark_read(const mark_read_frame &);
    void on_delete_message(const delete_message_frame &);

    // runs on the concurrent io_service
    static void on_store_delete(const store::store_ptr_t &,
        const broadcast_channel_ptr_t &,
        conversation_id_t, message_id_t);

    void send_error(const std::string & message);

    const context_ptr_t _context;
    const connection_ptr_t _connection;

    state_t _state;
    bool _registered;

    store::store_session_ptr_t _store_session;
    sync::message_synchronizer_ptr_t _synchronizer;

    user_id_t _user_id;
    conversation_id_t _conversation_id;

    spb::User _user;
    spb::Conversation _conversation;
};

std::ostream & operator << (std::ostream &, session::state_t);

}
}

#endif
