#ifndef PARLEY_SYNC_SYNCHRONIZER_REGISTRY_HPP
#define PARLEY_SYNC_SYNCHRONIZER_REGISTRY_HPP

#include "parley/sync/fwd.hpp"
#include <boost/noncopyable.hpp>
#include <string>
#include <unordered_map>

namespace parley {
namespace sync {

/*!
 * Process-wide index of message_synchronizer instances, keyed on
 *  (conversation kind, conversation id).
 *
 * Synchronizers are created on first access and live for the lifetime of
 *  the registry; there is no eviction.
 *
 * Not synchronized: only accessed from the serial io_service.
 */
class synchronizer_registry : private boost::noncopyable
{
public:

    typedef synchronizer_registry_ptr_t ptr_t;

    /// Returns the synchronizer of the conversation, creating it if needed
    message_synchronizer_ptr_t get_synchronizer(
        const std::string & conversation_id,
        const std::string & conversation_kind = "group");

    size_t size() const
    { return _synchronizers.size(); }

private:

    typedef std::unordered_map<std::string, message_synchronizer_ptr_t
        > synchronizers_t;

    synchronizers_t _synchronizers;
};

}
}

#endif
