#ifndef PARLEY_CORE_TIMESTAMP_HPP
#define PARLEY_CORE_TIMESTAMP_HPP

#include "parley/core/fwd.hpp"
#include <string>

namespace parley {
namespace core {

static const timestamp_t usec_per_second = 1000000;

inline timestamp_t seconds(uint64_t s)
{ return s * usec_per_second; }

/// Formats as ISO-8601 UTC with microsecond precision,
///  eg "2024-05-01T10:00:00.250000Z"
std::string format_timestamp(timestamp_t);

/*!
 * Parses ISO-8601 date-time text. Fractional seconds are optional
 *  (truncated to microseconds), as is the zone designator, which may be
 *  'Z' or a +HH:MM / -HH:MM offset. Text without a designator is UTC.
 *
 * Returns false on malformed input.
 */
bool try_parse_timestamp(const std::string &, timestamp_t & out) throw();

/// As try_parse_timestamp, but throws std::runtime_error on failure
timestamp_t parse_timestamp(const std::string &);

}
}

#endif
