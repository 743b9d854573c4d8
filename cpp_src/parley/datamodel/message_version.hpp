#ifndef PARLEY_DATAMODEL_MESSAGE_VERSION_HPP
#define PARLEY_DATAMODEL_MESSAGE_VERSION_HPP

#include "parley/datamodel/fwd.hpp"
#include "parley/core/fwd.hpp"
#include <string>

namespace parley {
namespace datamodel {

/*! \brief Snapshot of one message at one logical time

Instances are immutable. Two versions sharing a message id are successive
revisions of one logical message, distinguished by get_version() and by
their vector-clock snapshot.
*/
class message_version
{
public:

    message_version(message_id_t message_id,
        clock_state_t clock,
        std::string content,
        author_id_t user_id,
        core::timestamp_t created_at);

    message_id_t get_message_id() const
    { return _message_id; }

    const clock_state_t & get_vector_clock() const
    { return _vector_clock; }

    /// Empty content is a tombstone
    const std::string & get_content() const
    { return _content; }

    author_id_t get_user_id() const
    { return _user_id; }

    core::timestamp_t get_created_at() const
    { return _created_at; }

    /// Largest counter of the vector-clock snapshot
    lamport_t get_version() const
    { return _version; }

    bool is_tombstone() const
    { return _content.empty(); }

    /// Identical in every attribute
    bool operator == (const message_version &) const;

    bool operator != (const message_version & other) const
    { return !(*this == other); }

private:

    message_id_t _message_id;
    clock_state_t _vector_clock;
    std::string _content;
    author_id_t _user_id;
    core::timestamp_t _created_at;
    lamport_t _version;
};

std::ostream & operator << (std::ostream &, const message_version &);

}
}

#endif
