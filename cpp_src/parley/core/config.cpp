
#include "parley/core/config.hpp"
#include "parley/error.hpp"
#include "parley/log.hpp"
#include <google/protobuf/text_format.h>
#include <fstream>
#include <sstream>

namespace parley {
namespace core {

spb::ServerConfig parse_config(const std::string & text)
{
    spb::ServerConfig config;

    if(!google::protobuf::TextFormat::ParseFromString(text, &config))
    {
        throw error::parley_exception("config_error",
            "failed to parse ServerConfig text");
    }
    validate_config(config);
    return config;
}

spb::ServerConfig load_config(const std::string & path)
{
    std::ifstream in(path.c_str());
    if(!in)
    {
        throw error::parley_exception("config_error",
            "failed to open " + path);
    }

    std::stringstream text;
    text << in.rdbuf();

    LOG_INFO("loading configuration from " << path);
    return parse_config(text.str());
}

void validate_config(const spb::ServerConfig & config)
{
    PARLEY_ASSERT(config.IsInitialized());
    PARLEY_ASSERT(config.port() != 0 && config.port() <= 0xffff);
    PARLEY_ASSERT(config.replay_limit() != 0);
    PARLEY_ASSERT(config.max_content_length() != 0);
    PARLEY_ASSERT(config.presence_timeout_seconds() != 0);
    PARLEY_ASSERT(config.typing_timeout_seconds() != 0);
    PARLEY_ASSERT(config.worker_threads() != 0);
}

}
}

