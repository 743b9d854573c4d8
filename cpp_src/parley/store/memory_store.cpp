
#include "parley/store/memory_store.hpp"
#include "parley/core/server_time.hpp"
#include "parley/error.hpp"
#include "parley/log.hpp"
#include <algorithm>

namespace parley {
namespace store {

class memory_store::session : public store_session
{
public:

    explicit session(memory_store::ptr_t store)
     : _store(std::move(store))
    {
        spinlock::guard guard(_store->_lock);
        _store->_open_sessions += 1;
    }

    ~session()
    {
        spinlock::guard guard(_store->_lock);
        _store->_open_sessions -= 1;
    }

    boost::optional<spb::Conversation> get_conversation(
        conversation_id_t conversation_id) override
    {
        spinlock::guard guard(_store->_lock);

        conversations_t::const_iterator it =
            _store->_conversations.find(conversation_id);
        if(it == _store->_conversations.end())
            return boost::none;

        return it->second;
    }

    boost::optional<spb::User> get_user(user_id_t user_id) override
    {
        spinlock::guard guard(_store->_lock);

        users_t::const_iterator it = _store->_users.find(user_id);
        if(it == _store->_users.end())
            return boost::none;

        return it->second;
    }

    boost::optional<spb::PersistedMessage> get_message(
        message_id_t message_id) override
    {
        spinlock::guard guard(_store->_lock);

        messages_t::const_iterator it = _store->_messages.find(message_id);
        if(it == _store->_messages.end())
            return boost::none;

        return it->second;
    }

    std::vector<spb::PersistedMessage> load_recent_messages(
        conversation_id_t conversation_id, unsigned limit) override
    {
        std::vector<spb::PersistedMessage> result;
        {
            spinlock::guard guard(_store->_lock);

            for(const messages_t::value_type & entry : _store->_messages)
            {
                if(entry.second.conversation_id() == conversation_id)
                    result.push_back(entry.second);
            }
        }

        // oldest first; ids break timestamp ties
        std::stable_sort(result.begin(), result.end(),
            [](const spb::PersistedMessage & lhs,
               const spb::PersistedMessage & rhs)
            { return lhs.created_at() < rhs.created_at(); });

        if(result.size() > limit)
        {
            result.erase(result.begin(), result.end() - limit);
        }
        return result;
    }

    spb::PersistedMessage persist_message(conversation_id_t conversation_id,
        user_id_t author_id, const std::string & content) override
    {
        spb::PersistedMessage message;
        message.set_conversation_id(conversation_id);
        message.set_user_id(author_id);
        message.set_content(content);
        message.set_created_at(_store->now());

        spinlock::guard guard(_store->_lock);

        if(_store->_conversations.find(conversation_id) ==
           _store->_conversations.end())
        {
            throw store_error("no such conversation");
        }

        message.set_id(_store->_next_message_id++);
        _store->_messages.insert(std::make_pair(message.id(), message));
        return message;
    }

    bool has_read_receipt(message_id_t message_id, user_id_t user_id) override
    {
        spinlock::guard guard(_store->_lock);

        return _store->_read_receipts.count(
            std::make_pair(message_id, user_id)) != 0;
    }

    void record_read_receipt(message_id_t message_id,
        user_id_t user_id) override
    {
        spinlock::guard guard(_store->_lock);

        if(_store->_messages.find(message_id) == _store->_messages.end())
        {
            throw store_error("no such message");
        }
        _store->_read_receipts.insert(std::make_pair(message_id, user_id));
    }

    spb::PersistedMessage delete_message(message_id_t message_id) override
    {
        spinlock::guard guard(_store->_lock);

        messages_t::iterator it = _store->_messages.find(message_id);
        if(it == _store->_messages.end())
        {
            throw store_error("no such message");
        }

        it->second.set_is_deleted(true);
        it->second.clear_content();
        return it->second;
    }

private:

    const memory_store::ptr_t _store;
};

memory_store::memory_store(clock_func_t clock)
 :  _clock(std::move(clock)),
    _next_message_id(1),
    _open_sessions(0)
{ }

core::timestamp_t memory_store::now() const
{
    if(_clock)
        return _clock();

    return core::server_time::system_time();
}

void memory_store::seed(const spb::ServerConfig & config)
{
    for(const spb::User & user : config.user())
        add_user(user);

    for(const spb::Conversation & conversation : config.conversation())
        add_conversation(conversation);

    for(const spb::PersistedMessage & message : config.message())
        add_message(message);

    LOG_INFO("seeded " << config.user_size() << " users, "
        << config.conversation_size() << " conversations, "
        << config.message_size() << " messages");
}

void memory_store::add_user(const spb::User & user)
{
    spinlock::guard guard(_lock);
    _users[user.id()] = user;
}

void memory_store::add_conversation(const spb::Conversation & conversation)
{
    spinlock::guard guard(_lock);
    _conversations[conversation.id()] = conversation;
}

void memory_store::add_message(const spb::PersistedMessage & message)
{
    spinlock::guard guard(_lock);

    PARLEY_ASSERT(_messages.insert(
        std::make_pair(message.id(), message)).second);

    _next_message_id = std::max<message_id_t>(
        _next_message_id, message.id() + 1);
}

store_session_ptr_t memory_store::open_session()
{
    return store_session_ptr_t(new session(shared_from_this()));
}

unsigned memory_store::get_open_session_count() const
{
    spinlock::guard guard(_lock);
    return _open_sessions;
}

}
}

