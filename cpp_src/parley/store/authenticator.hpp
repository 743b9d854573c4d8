#ifndef PARLEY_STORE_AUTHENTICATOR_HPP
#define PARLEY_STORE_AUTHENTICATOR_HPP

#include "parley/store/fwd.hpp"
#include "parley/store/store_error.hpp"
#include "parley/fwd.hpp"
#include <boost/noncopyable.hpp>
#include <string>
#include <unordered_map>

namespace parley {
namespace store {

class authenticator : private boost::noncopyable
{
public:

    typedef authenticator_ptr_t ptr_t;

    virtual ~authenticator()
    { }

    /// Resolves a bearer credential to a user, or throws store_error
    virtual user_id_t verify_credential(const std::string & token) = 0;
};

/// Authenticates against a fixed token => user table
class token_authenticator : public authenticator
{
public:

    typedef std::unordered_map<std::string, user_id_t> tokens_t;

    explicit token_authenticator(tokens_t tokens)
     : _tokens(std::move(tokens))
    { }

    user_id_t verify_credential(const std::string & token) override;

private:

    const tokens_t _tokens;
};

}
}

#endif
