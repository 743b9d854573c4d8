
#include "parley/sync/synchronizer_registry.hpp"
#include "parley/sync/message_synchronizer.hpp"

namespace parley {
namespace sync {

message_synchronizer_ptr_t synchronizer_registry::get_synchronizer(
    const std::string & conversation_id,
    const std::string & conversation_kind)
{
    std::string key = conversation_kind + ":" + conversation_id;

    synchronizers_t::iterator it = _synchronizers.find(key);
    if(it != _synchronizers.end())
        return it->second;

    message_synchronizer_ptr_t synchronizer =
        std::make_shared<message_synchronizer>(conversation_id);

    _synchronizers.insert(std::make_pair(std::move(key), synchronizer));
    return synchronizer;
}

}
}

