#ifndef PARLEY_CORE_CONFIG_HPP
#define PARLEY_CORE_CONFIG_HPP

#include "parley/core/protobuf/parley.pb.h"
#include <string>

namespace parley {
namespace core {

namespace spb = parley::core::protobuf;

/*!
 * Parses a text-format spb::ServerConfig.
 *
 * Throws error::parley_exception if the text is malformed, or if the
 *  described configuration is unusable (eg, a zero replay limit).
 */
spb::ServerConfig parse_config(const std::string & text);

/// Reads & parses the text-format spb::ServerConfig at path
spb::ServerConfig load_config(const std::string & path);

/// Checks invariants of a parsed configuration
void validate_config(const spb::ServerConfig &);

}
}

#endif
