#ifndef PARLEY_SYNC_MESSAGE_SYNCHRONIZER_HPP
#define PARLEY_SYNC_MESSAGE_SYNCHRONIZER_HPP

#include "parley/sync/fwd.hpp"
#include "parley/datamodel/merge_result.hpp"
#include "parley/datamodel/message_version.hpp"
#include "parley/datamodel/vector_clock.hpp"
#include "parley/core/fwd.hpp"
#include <boost/noncopyable.hpp>
#include <map>
#include <string>
#include <vector>

namespace parley {
namespace sync {

/*!
 * Causal message state of one conversation.
 *
 * Owns a vector_clock per author, and the winning message_version of each
 *  message id. At most one version is stored per message id.
 *
 * Not synchronized: instances are only touched from the serial io_service.
 */
class message_synchronizer : private boost::noncopyable
{
public:

    typedef message_synchronizer_ptr_t ptr_t;

    typedef std::map<message_id_t, datamodel::message_version> versions_t;
    typedef std::map<datamodel::author_id_t, datamodel::vector_clock> clocks_t;

    explicit message_synchronizer(const std::string & conversation_id);

    const std::string & get_conversation_id() const
    { return _conversation_id; }

    /*!
     * Mints the version of a locally sent message.
     *
     * Ticks the author's clock, and stores the resulting version as
     *  current for message_id, replacing any version already stored.
     */
    datamodel::message_version create_version(message_id_t,
        datamodel::author_id_t, const std::string & content,
        core::timestamp_t created_at);

    /*!
     * Rebuilds state from persisted history. Expected to be called in
     *  chronological order of created_at.
     *
     * If message_id is not yet known, the author's latest known message
     *  (by created_at) is folded into the author's clock, which is then
     *  ticked. A known message_id leaves clocks untouched, so history
     *  may be replayed repeatedly.
     *
     * In either case the version (with the author's current clock) is
     *  stored for message_id.
     */
    datamodel::message_version initialize_version(message_id_t,
        datamodel::author_id_t, const std::string & content,
        core::timestamp_t created_at);

    /*!
     * Reconciles an incoming version with the version stored for its id.
     *
     *  - Unknown id: accepted. Each author of the incoming snapshot has
     *    their counter absorbed into their clock.
     *  - Greater get_version(): accepted as a newer revision. The
     *    incoming author's clock absorbs the incoming snapshot.
     *  - Equal get_version(), identical version: no-op.
     *  - Equal get_version(), otherwise: concurrent edit. Strictly later
     *    created_at wins, with larger user id breaking exact ties.
     *  - Lesser get_version(): stale, and ignored.
     *
     * Throws error::parley_exception, with no state changed, if a counter
     *  of the incoming clock exceeds vector_clock::max_remote_tick.
     */
    datamodel::merge_result merge(const datamodel::message_version &);

    /*!
     * Merges each remote version in turn, returning the versions
     *  which merge() reported as new.
     */
    std::vector<datamodel::message_version> sync_with_remote(
        const std::vector<datamodel::message_version> &);

    /*!
     * Stored versions ordered on (version, created_at, message id),
     *  ascending. Returns the last limit entries; all if limit is zero.
     */
    std::vector<datamodel::message_version> get_ordered_messages(
        size_t limit) const;

    /// Returns nullptr if none exists
    const datamodel::message_version * get_version(message_id_t) const;

    /// Returns nullptr if none exists
    const datamodel::vector_clock * get_clock(datamodel::author_id_t) const;

    const versions_t & get_versions() const
    { return _versions; }

    const clocks_t & get_clocks() const
    { return _clocks; }

private:

    datamodel::vector_clock & get_or_create_clock(datamodel::author_id_t);

    void store_version(const datamodel::message_version &);

    static const datamodel::message_version & resolve_conflict(
        const datamodel::message_version & existing,
        const datamodel::message_version & incoming);

    const std::string _conversation_id;

    clocks_t _clocks;
    versions_t _versions;
};

}
}

#endif
