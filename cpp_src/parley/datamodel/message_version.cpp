
#include "parley/datamodel/message_version.hpp"
#include "parley/datamodel/vector_clock.hpp"
#include <ostream>

namespace parley {
namespace datamodel {

message_version::message_version(message_id_t message_id,
    clock_state_t clock,
    std::string content,
    author_id_t user_id,
    core::timestamp_t created_at)
 :  _message_id(message_id),
    _vector_clock(std::move(clock)),
    _content(std::move(content)),
    _user_id(user_id),
    _created_at(created_at),
    _version(vector_clock::max_tick(_vector_clock))
{ }

bool message_version::operator == (const message_version & o) const
{
    return  _message_id == o._message_id &&
            _user_id == o._user_id &&
            _created_at == o._created_at &&
            _vector_clock == o._vector_clock &&
            _content == o._content;
}

std::ostream & operator << (std::ostream & s, const message_version & v)
{
    return s << "message_version<" << v.get_message_id()
        << " v" << v.get_version() << " " << v.get_vector_clock()
        << " by " << v.get_user_id() << " @" << v.get_created_at() << ">";
}

}
}

