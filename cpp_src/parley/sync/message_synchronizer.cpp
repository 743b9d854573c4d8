
#include "parley/sync/message_synchronizer.hpp"
#include "parley/error.hpp"
#include "parley/log.hpp"
#include <algorithm>
#include <tuple>

namespace parley {
namespace sync {

using datamodel::author_id_t;
using datamodel::clock_state_t;
using datamodel::merge_result;
using datamodel::message_version;
using datamodel::vector_clock;

message_synchronizer::message_synchronizer(const std::string & conversation_id)
 : _conversation_id(conversation_id)
{
    LOG_DBG("synchronizer created for " << _conversation_id);
}

vector_clock & message_synchronizer::get_or_create_clock(author_id_t author_id)
{
    clocks_t::iterator it = _clocks.lower_bound(author_id);

    if(it == _clocks.end() || it->first != author_id)
    {
        // no current clock for this author; add one
        it = _clocks.insert(it,
            std::make_pair(author_id, vector_clock(author_id)));
    }
    return it->second;
}

void message_synchronizer::store_version(const message_version & version)
{
    versions_t::iterator it = _versions.find(version.get_message_id());

    if(it == _versions.end())
        _versions.insert(std::make_pair(version.get_message_id(), version));
    else
        it->second = version;
}

message_version message_synchronizer::create_version(
    message_id_t message_id, author_id_t author_id,
    const std::string & content, core::timestamp_t created_at)
{
    vector_clock & clock = get_or_create_clock(author_id);
    clock.tick();

    message_version version(message_id, clock.snapshot(),
        content, author_id, created_at);

    store_version(version);
    return version;
}

message_version message_synchronizer::initialize_version(
    message_id_t message_id, author_id_t author_id,
    const std::string & content, core::timestamp_t created_at)
{
    vector_clock & clock = get_or_create_clock(author_id);

    if(_versions.find(message_id) == _versions.end())
    {
        // find the author's latest message known so far
        const message_version * latest = nullptr;

        for(const versions_t::value_type & entry : _versions)
        {
            const message_version & candidate = entry.second;

            if(candidate.get_user_id() != author_id)
                continue;

            if(!latest || candidate.get_created_at() > latest->get_created_at())
                latest = &candidate;
        }

        if(latest)
        {
            clock.update(latest->get_vector_clock());
        }
        clock.tick();
    }

    message_version version(message_id, clock.snapshot(),
        content, author_id, created_at);

    store_version(version);
    return version;
}

merge_result message_synchronizer::merge(const message_version & incoming)
{
    PARLEY_ASSERT(vector_clock::max_tick(incoming.get_vector_clock()) <=
        vector_clock::max_remote_tick);

    versions_t::iterator it = _versions.find(incoming.get_message_id());

    if(it == _versions.end())
    {
        // previously unseen message: absorb each author's counter
        for(const clock_state_t::value_type & entry :
            incoming.get_vector_clock())
        {
            clock_state_t author_state;
            author_state.insert(entry);

            get_or_create_clock(entry.first).update(author_state);
        }

        _versions.insert(std::make_pair(incoming.get_message_id(), incoming));
        return merge_result(true, incoming);
    }

    const message_version & existing = it->second;

    if(incoming.get_version() > existing.get_version())
    {
        get_or_create_clock(incoming.get_user_id()).update(
            incoming.get_vector_clock());

        it->second = incoming;
        return merge_result(true, incoming);
    }
    if(incoming.get_version() < existing.get_version())
    {
        LOG_DBG("stale " << incoming << " vs current " << existing);
        return merge_result(false, existing);
    }

    if(incoming == existing)
    {
        // already merged
        return merge_result(false, existing);
    }

    // concurrent revisions of equal version
    message_version winner = resolve_conflict(existing, incoming);
    it->second = winner;

    return merge_result(true, winner);
}

const message_version & message_synchronizer::resolve_conflict(
    const message_version & existing,
    const message_version & incoming)
{
    if(incoming.get_created_at() > existing.get_created_at())
        return incoming;

    if(existing.get_created_at() > incoming.get_created_at())
        return existing;

    // timestamps are identical; larger user id is the deterministic winner
    if(incoming.get_user_id() > existing.get_user_id())
        return incoming;

    return existing;
}

std::vector<message_version> message_synchronizer::sync_with_remote(
    const std::vector<message_version> & remote_versions)
{
    std::vector<message_version> updated;

    for(const message_version & remote : remote_versions)
    {
        merge_result result = merge(remote);

        if(result.is_new)
            updated.push_back(std::move(result.winner));
    }
    return updated;
}

std::vector<message_version> message_synchronizer::get_ordered_messages(
    size_t limit) const
{
    std::vector<const message_version *> ordered;
    ordered.reserve(_versions.size());

    for(const versions_t::value_type & entry : _versions)
    {
        ordered.push_back(&entry.second);
    }

    std::sort(ordered.begin(), ordered.end(),
        [](const message_version * lhs, const message_version * rhs)
        {
            return std::make_tuple(lhs->get_version(),
                    lhs->get_created_at(), lhs->get_message_id()) <
                std::make_tuple(rhs->get_version(),
                    rhs->get_created_at(), rhs->get_message_id());
        });

    size_t first = 0;
    if(limit && ordered.size() > limit)
        first = ordered.size() - limit;

    std::vector<message_version> result;
    result.reserve(ordered.size() - first);

    for(size_t ind = first; ind != ordered.size(); ++ind)
    {
        result.push_back(*ordered[ind]);
    }
    return result;
}

const message_version * message_synchronizer::get_version(
    message_id_t message_id) const
{
    versions_t::const_iterator it = _versions.find(message_id);
    return it == _versions.end() ? nullptr : &it->second;
}

const vector_clock * message_synchronizer::get_clock(
    author_id_t author_id) const
{
    clocks_t::const_iterator it = _clocks.find(author_id);
    return it == _clocks.end() ? nullptr : &it->second;
}

}
}

