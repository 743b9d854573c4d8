
#include "parley/store/authenticator.hpp"

namespace parley {
namespace store {

user_id_t token_authenticator::verify_credential(const std::string & token)
{
    tokens_t::const_iterator it = _tokens.find(token);

    if(token.empty() || it == _tokens.end())
    {
        throw store_error("invalid credential");
    }
    return it->second;
}

}
}

