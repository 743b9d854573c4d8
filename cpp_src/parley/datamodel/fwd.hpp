#ifndef PARLEY_DATAMODEL_FWD_HPP
#define PARLEY_DATAMODEL_FWD_HPP

#include "parley/fwd.hpp"
#include <cstdint>
#include <map>

namespace parley {
namespace datamodel {

typedef user_id_t author_id_t;
typedef uint32_t lamport_t;

// Ordered on author_id. An author missing from the map has counter zero.
typedef std::map<author_id_t, lamport_t> clock_state_t;

class vector_clock;
class message_version;
struct merge_result;

}
}

#endif
