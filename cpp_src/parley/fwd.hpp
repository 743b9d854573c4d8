#ifndef PARLEY_FWD_HPP
#define PARLEY_FWD_HPP

#include <cstdint>

namespace parley {

// Identities assigned by the persistent store. Participants, message
//  authors and users share one id space.
typedef uint32_t user_id_t;
typedef uint32_t message_id_t;
typedef uint32_t conversation_id_t;

}

#endif // guard
