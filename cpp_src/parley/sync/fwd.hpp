#ifndef PARLEY_SYNC_FWD_HPP
#define PARLEY_SYNC_FWD_HPP

#include <memory>

namespace parley {
namespace sync {

class message_synchronizer;
typedef std::shared_ptr<message_synchronizer> message_synchronizer_ptr_t;

class synchronizer_registry;
typedef std::shared_ptr<synchronizer_registry> synchronizer_registry_ptr_t;

}
}

#endif
