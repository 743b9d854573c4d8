#ifndef PARLEY_STORE_MEMORY_STORE_HPP
#define PARLEY_STORE_MEMORY_STORE_HPP

#include "parley/store/store.hpp"
#include "parley/core/fwd.hpp"
#include "parley/spinlock.hpp"
#include <functional>
#include <map>
#include <set>
#include <utility>

namespace parley {
namespace store {

/*!
 * Volatile store, seeded from spb::ServerConfig.
 *
 * Internally locked: sessions may be used concurrently from the serial
 *  io_service and from worker threads.
 */
class memory_store :
    public store,
    public std::enable_shared_from_this<memory_store>
{
public:

    typedef memory_store_ptr_t ptr_t;

    typedef std::function<core::timestamp_t()> clock_func_t;

    explicit memory_store(clock_func_t clock = clock_func_t());

    /// Loads users, conversations & messages of the config
    void seed(const spb::ServerConfig &);

    void add_user(const spb::User &);

    void add_conversation(const spb::Conversation &);

    /// Adds a historical message. Its id must be unused
    void add_message(const spb::PersistedMessage &);

    store_session_ptr_t open_session() override;

    /// Number of currently open sessions
    unsigned get_open_session_count() const;

private:

    class session;
    friend class session;

    core::timestamp_t now() const;

    const clock_func_t _clock;

    mutable spinlock _lock;

    typedef std::map<user_id_t, spb::User> users_t;
    typedef std::map<conversation_id_t, spb::Conversation> conversations_t;
    typedef std::map<message_id_t, spb::PersistedMessage> messages_t;
    typedef std::set<std::pair<message_id_t, user_id_t>> read_receipts_t;

    users_t _users;
    conversations_t _conversations;
    messages_t _messages;
    read_receipts_t _read_receipts;

    message_id_t _next_message_id;
    unsigned _open_sessions;
};

}
}

#endif
