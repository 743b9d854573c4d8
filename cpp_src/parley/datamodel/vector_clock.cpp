
#include "parley/datamodel/vector_clock.hpp"
#include "parley/error.hpp"
#include <algorithm>
#include <limits>

namespace parley {
namespace datamodel {

const lamport_t vector_clock::max_remote_tick;

vector_clock::vector_clock(author_id_t owner)
 : _owner(owner)
{
    _state[_owner] = 0;
}

vector_clock::vector_clock(author_id_t owner,
    const clock_state_t & initial_state)
 : _owner(owner),
   _state(initial_state)
{
    // ensure the owner's counter is represented
    _state.insert(std::make_pair(_owner, 0));
}

lamport_t vector_clock::get(author_id_t author_id) const
{
    clock_state_t::const_iterator it = _state.find(author_id);
    return it == _state.end() ? 0 : it->second;
}

lamport_t vector_clock::tick()
{
    lamport_t & counter = _state[_owner];

    PARLEY_ASSERT(counter != std::numeric_limits<lamport_t>::max());
    return ++counter;
}

void vector_clock::update(const clock_state_t & remote_state)
{
    // check the owner's next counter before any state is folded in
    clock_state_t::const_iterator r_owner = remote_state.find(_owner);

    lamport_t owner_next = get(_owner);
    if(r_owner != remote_state.end())
        owner_next = std::max(owner_next, r_owner->second);

    PARLEY_ASSERT(owner_next != std::numeric_limits<lamport_t>::max());

    clock_state_t::iterator l_it = _state.begin();

    for(const clock_state_t::value_type & remote : remote_state)
    {
        // walk both (ordered) states in lock-step
        l_it = std::find_if(l_it, _state.end(),
            [&](const clock_state_t::value_type & local)
            { return local.first >= remote.first; });

        if(l_it == _state.end() || l_it->first != remote.first)
        {
            // author appears only in remote
            l_it = _state.insert(l_it, remote);
        }
        else if(l_it->second < remote.second)
        {
            l_it->second = remote.second;
        }
    }

    _state[_owner] += 1;
}

bool vector_clock::happens_before(const clock_state_t & remote_state) const
{
    return compare(_state, remote_state) == REMOTE_MORE_RECENT;
}

bool vector_clock::concurrent_with(const clock_state_t & remote_state) const
{
    return compare(_state, remote_state) == CLOCKS_DIVERGE;
}

vector_clock::clock_ancestry vector_clock::compare(
    const clock_state_t & local_state,
    const clock_state_t & remote_state)
{
    bool local_more_recent = false;
    bool remote_more_recent = false;

    clock_state_t::const_iterator l_it = local_state.begin();
    clock_state_t::const_iterator r_it = remote_state.begin();

    while(l_it != local_state.end() && r_it != remote_state.end())
    {
        if(l_it->first < r_it->first)
        {
            // author only in local
            if(l_it->second)
                local_more_recent = true;

            ++l_it;
        }
        else if(l_it->first > r_it->first)
        {
            // author only in remote
            if(r_it->second)
                remote_more_recent = true;

            ++r_it;
        }
        else
        {
            if(l_it->second > r_it->second)
                local_more_recent = true;
            else if(l_it->second < r_it->second)
                remote_more_recent = true;

            ++l_it; ++r_it;
        }
    }
    for(; l_it != local_state.end(); ++l_it)
    {
        if(l_it->second)
            local_more_recent = true;
    }
    for(; r_it != remote_state.end(); ++r_it)
    {
        if(r_it->second)
            remote_more_recent = true;
    }

    if(local_more_recent && remote_more_recent)
        return CLOCKS_DIVERGE;
    if(local_more_recent)
        return LOCAL_MORE_RECENT;
    if(remote_more_recent)
        return REMOTE_MORE_RECENT;

    return CLOCKS_EQUAL;
}

lamport_t vector_clock::max_tick(const clock_state_t & state)
{
    lamport_t result = 0;
    for(const clock_state_t::value_type & entry : state)
    {
        result = std::max(result, entry.second);
    }
    return result;
}

std::ostream & operator << (std::ostream & s, const clock_state_t & state)
{
    s << "{";
    for(clock_state_t::const_iterator it = state.begin();
        it != state.end(); ++it)
    {
        if(it != state.begin())
            s << ", ";

        s << it->first << ":" << it->second;
    }
    return s << "}";
}

}
}

