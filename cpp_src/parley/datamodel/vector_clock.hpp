#ifndef PARLEY_DATAMODEL_VECTOR_CLOCK_HPP
#define PARLEY_DATAMODEL_VECTOR_CLOCK_HPP

#include "parley/datamodel/fwd.hpp"
#include <ostream>

namespace parley {
namespace datamodel {

/*! \brief Logical clock of one author within a conversation

Partially orders the messages of a conversation as a composition of
per-author lamport counters (eg, a vector-clock). The owner's own counter
is advanced by tick() and update(); counters of other authors only ever
move forward through update().
*/
class vector_clock
{
public:

    /*!
     * Largest counter accepted from remote state. Headroom above it is
     *  reserved for local ticks, so a counter never wraps.
     */
    static const lamport_t max_remote_tick = 0x7fffffff;

    explicit vector_clock(author_id_t owner);

    vector_clock(author_id_t owner, const clock_state_t & initial_state);

    author_id_t get_owner() const
    { return _owner; }

    /// Counter of the author, or zero if unknown
    lamport_t get(author_id_t) const;

    /*!
     * Increments the owner's counter, returning the new value.
     *
     * Throws error::parley_exception if the counter is exhausted.
     */
    lamport_t tick();

    /*! \brief Folds remote clock state into this clock

    Each counter becomes the maximum of the local and remote value. The
    owner's counter is then incremented by exactly one: receipt of remote
    state is itself a local event. As a result update() is not idempotent
    with respect to the owner's counter.
    */
    void update(const clock_state_t & remote_state);

    /// True iff this clock is <= remote everywhere, and < somewhere
    bool happens_before(const clock_state_t & remote_state) const;

    /// True iff neither clock happens before the other
    bool concurrent_with(const clock_state_t & remote_state) const;

    /// Returns a copy of current counters
    clock_state_t snapshot() const
    { return _state; }

    enum clock_ancestry
    {
        CLOCKS_EQUAL = 0,
        LOCAL_MORE_RECENT = 1,
        REMOTE_MORE_RECENT = 2,
        CLOCKS_DIVERGE = 3
    };

    /*! \brief Determines the relative ordering of two clock states

    Absent authors compare as a zero counter. A clock is more recent than
    the other iff each of its counters is at least as large, and one is
    strictly larger. Clocks which are unequal but neither more recent
    diverge.
    */
    static clock_ancestry compare(
        const clock_state_t & local_state,
        const clock_state_t & remote_state);

    /// Largest counter of the state, or zero if empty
    static lamport_t max_tick(const clock_state_t &);

private:

    author_id_t _owner;
    clock_state_t _state;
};

std::ostream & operator << (std::ostream &, const clock_state_t &);

}
}

#endif
