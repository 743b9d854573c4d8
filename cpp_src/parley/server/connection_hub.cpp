
#include "parley/server/connection_hub.hpp"
#include "parley/server/connection.hpp"
#include "parley/core/timestamp.hpp"
#include "parley/log.hpp"

namespace parley {
namespace server {

connection_hub::connection_hub(unsigned presence_timeout_seconds,
    unsigned typing_timeout_seconds)
 :  _presence_timeout(core::seconds(presence_timeout_seconds)),
    _typing_timeout(core::seconds(typing_timeout_seconds))
{ }

void connection_hub::register_connection(conversation_id_t conversation_id,
    user_id_t user_id, const connection_ptr_t & conn)
{
    connection_ptr_t & entry = _connections[conversation_id][user_id];

    if(entry && entry != conn)
    {
        LOG_INFO("participant " << user_id << " of conversation "
            << conversation_id << " reconnected; replacing connection");
    }
    entry = conn;
}

void connection_hub::unregister_connection(conversation_id_t conversation_id,
    user_id_t user_id)
{
    conversations_t::iterator it = _connections.find(conversation_id);
    if(it == _connections.end())
        return;

    it->second.erase(user_id);

    if(it->second.empty())
        _connections.erase(it);
}

bool connection_hub::unregister_connection(conversation_id_t conversation_id,
    user_id_t user_id, const connection_ptr_t & expected)
{
    conversations_t::iterator it = _connections.find(conversation_id);
    if(it == _connections.end())
        return false;

    connections_t::iterator c_it = it->second.find(user_id);
    if(c_it == it->second.end() || c_it->second != expected)
        return false;

    it->second.erase(c_it);

    if(it->second.empty())
        _connections.erase(it);

    return true;
}

connection_ptr_t connection_hub::get_connection(
    conversation_id_t conversation_id, user_id_t user_id) const
{
    conversations_t::const_iterator it = _connections.find(conversation_id);
    if(it == _connections.end())
        return connection_ptr_t();

    connections_t::const_iterator c_it = it->second.find(user_id);
    if(c_it == it->second.end())
        return connection_ptr_t();

    return c_it->second;
}

std::vector<user_id_t> connection_hub::list_connected(
    conversation_id_t conversation_id) const
{
    std::vector<user_id_t> result;

    conversations_t::const_iterator it = _connections.find(conversation_id);
    if(it == _connections.end())
        return result;

    for(const connections_t::value_type & entry : it->second)
    {
        result.push_back(entry.first);
    }
    return result;
}

size_t connection_hub::broadcast(conversation_id_t conversation_id,
    const boost::optional<user_id_t> & exclude,
    const std::string & payload)
{
    conversations_t::iterator it = _connections.find(conversation_id);
    if(it == _connections.end())
        return 0;

    size_t delivered = 0;
    std::vector<connections_t::value_type> failed;

    for(const connections_t::value_type & entry : it->second)
    {
        if(exclude && *exclude == entry.first)
            continue;

        if(entry.second->send(payload))
            ++delivered;
        else
            failed.push_back(entry);
    }

    // removal is deferred until iteration completes
    for(const connections_t::value_type & entry : failed)
    {
        LOG_INFO("dropping participant " << entry.first
            << " of conversation " << conversation_id << ": send failed");

        unregister_connection(conversation_id, entry.first, entry.second);
    }
    return delivered;
}

void connection_hub::touch_presence(user_id_t user_id, core::timestamp_t now)
{
    _presence[user_id] = now;
}

bool connection_hub::is_online(user_id_t user_id, core::timestamp_t now) const
{
    presence_t::const_iterator it = _presence.find(user_id);
    if(it == _presence.end())
        return false;

    return now < it->second || now - it->second < _presence_timeout;
}

std::vector<user_id_t> connection_hub::online_participants(
    const std::vector<user_id_t> & participants,
    core::timestamp_t now) const
{
    std::vector<user_id_t> result;

    for(user_id_t user_id : participants)
    {
        if(is_online(user_id, now))
            result.push_back(user_id);
    }
    return result;
}

void connection_hub::set_typing(conversation_id_t conversation_id,
    user_id_t user_id, core::timestamp_t now)
{
    _typing[conversation_id][user_id] = now;
}

void connection_hub::prune_typing(typing_t & typing, core::timestamp_t now)
{
    for(typing_t::iterator it = typing.begin(); it != typing.end();)
    {
        if(now > it->second && now - it->second > _typing_timeout)
            it = typing.erase(it);
        else
            ++it;
    }
}

std::vector<user_id_t> connection_hub::list_typing(
    conversation_id_t conversation_id, core::timestamp_t now,
    const boost::optional<user_id_t> & exclude)
{
    std::vector<user_id_t> result;

    typing_index_t::iterator it = _typing.find(conversation_id);
    if(it == _typing.end())
        return result;

    prune_typing(it->second, now);

    for(const typing_t::value_type & entry : it->second)
    {
        if(exclude && *exclude == entry.first)
            continue;

        result.push_back(entry.first);
    }

    if(it->second.empty())
        _typing.erase(it);

    return result;
}

void connection_hub::prune(core::timestamp_t now)
{
    for(typing_index_t::iterator it = _typing.begin(); it != _typing.end();)
    {
        prune_typing(it->second, now);

        if(it->second.empty())
            it = _typing.erase(it);
        else
            ++it;
    }

    for(presence_t::iterator it = _presence.begin(); it != _presence.end();)
    {
        if(now > it->second && now - it->second >= _presence_timeout)
            it = _presence.erase(it);
        else
            ++it;
    }
}

}
}

