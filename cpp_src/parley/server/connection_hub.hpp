#ifndef PARLEY_SERVER_CONNECTION_HUB_HPP
#define PARLEY_SERVER_CONNECTION_HUB_HPP

#include "parley/server/fwd.hpp"
#include "parley/core/fwd.hpp"
#include "parley/fwd.hpp"
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace parley {
namespace server {

/*!
 * Registry of live connections per conversation, and of ephemeral
 *  presence & typing state.
 *
 * A conversation holds at most one connection per participant; a newer
 *  connection replaces the older entry. Presence is global (one
 *  last-activity time per participant), while typing is tracked per
 *  conversation.
 *
 * Not synchronized: only accessed from the serial io_service. Other
 *  threads reach broadcast() through broadcast_channel.
 */
class connection_hub : private boost::noncopyable
{
public:

    typedef connection_hub_ptr_t ptr_t;

    connection_hub(unsigned presence_timeout_seconds,
        unsigned typing_timeout_seconds);

    /// Inserts, or replaces, the participant's connection
    void register_connection(conversation_id_t, user_id_t,
        const connection_ptr_t &);

    /// Removes the participant's connection if present
    void unregister_connection(conversation_id_t, user_id_t);

    /*!
     * Removes the participant's connection only if it is still the
     *  registered one. Returns whether an entry was removed.
     */
    bool unregister_connection(conversation_id_t, user_id_t,
        const connection_ptr_t & expected);

    /// Returns nullptr if none exists
    connection_ptr_t get_connection(conversation_id_t, user_id_t) const;

    /// Participants with a registered connection, in ascending order
    std::vector<user_id_t> list_connected(conversation_id_t) const;

    /*!
     * Sends payload to every connection of the conversation other than
     *  exclude's (or to all, if exclude is none).
     *
     * Connections which fail the send are unregistered once the full
     *  fan-out completes. Returns the number of successful sends.
     */
    size_t broadcast(conversation_id_t,
        const boost::optional<user_id_t> & exclude,
        const std::string & payload);

    void touch_presence(user_id_t, core::timestamp_t now);

    /// True iff the participant was seen within the presence timeout
    bool is_online(user_id_t, core::timestamp_t now) const;

    /// Filters participants to those which are online
    std::vector<user_id_t> online_participants(
        const std::vector<user_id_t> & participants,
        core::timestamp_t now) const;

    void set_typing(conversation_id_t, user_id_t, core::timestamp_t now);

    /*!
     * Participants of the conversation which typed within the typing
     *  timeout, other than exclude. Expired entries are pruned.
     */
    std::vector<user_id_t> list_typing(conversation_id_t,
        core::timestamp_t now,
        const boost::optional<user_id_t> & exclude);

    /// Drops expired presence & typing entries
    void prune(core::timestamp_t now);

    core::timestamp_t get_presence_timeout() const
    { return _presence_timeout; }

    core::timestamp_t get_typing_timeout() const
    { return _typing_timeout; }

private:

    typedef std::map<user_id_t, connection_ptr_t> connections_t;
    typedef std::map<user_id_t, core::timestamp_t> typing_t;

    typedef std::unordered_map<conversation_id_t, connections_t
        > conversations_t;
    typedef std::unordered_map<conversation_id_t, typing_t> typing_index_t;
    typedef std::unordered_map<user_id_t, core::timestamp_t> presence_t;

    void prune_typing(typing_t &, core::timestamp_t now);

    const core::timestamp_t _presence_timeout;
    const core::timestamp_t _typing_timeout;

    conversations_t _connections;
    typing_index_t _typing;
    presence_t _presence;
};

}
}

#endif
