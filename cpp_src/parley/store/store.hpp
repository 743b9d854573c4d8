#ifndef PARLEY_STORE_STORE_HPP
#define PARLEY_STORE_STORE_HPP

#include "parley/store/fwd.hpp"
#include "parley/store/store_error.hpp"
#include "parley/core/protobuf/parley.pb.h"
#include "parley/fwd.hpp"
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <string>
#include <vector>

namespace parley {
namespace store {

namespace spb = parley::core::protobuf;

/*!
 * Conversation-scoped handle to the persistent store.
 *
 * A handle is opened per session and released (by destruction) on every
 *  session exit path. Calls may block, and throw store_error on failure.
 */
class store_session : private boost::noncopyable
{
public:

    virtual ~store_session()
    { }

    virtual boost::optional<spb::Conversation> get_conversation(
        conversation_id_t) = 0;

    virtual boost::optional<spb::User> get_user(user_id_t) = 0;

    virtual boost::optional<spb::PersistedMessage> get_message(
        message_id_t) = 0;

    /// The conversation's newest limit messages, oldest first
    virtual std::vector<spb::PersistedMessage> load_recent_messages(
        conversation_id_t, unsigned limit) = 0;

    /// Appends a message, returning it with its assigned id & created_at
    virtual spb::PersistedMessage persist_message(conversation_id_t,
        user_id_t author_id, const std::string & content) = 0;

    virtual bool has_read_receipt(message_id_t, user_id_t) = 0;

    virtual void record_read_receipt(message_id_t, user_id_t) = 0;

    /// Soft-deletes a message: content is cleared and is_deleted set
    virtual spb::PersistedMessage delete_message(message_id_t) = 0;
};

class store : private boost::noncopyable
{
public:

    typedef store_ptr_t ptr_t;

    virtual ~store()
    { }

    virtual store_session_ptr_t open_session() = 0;
};

}
}

#endif
