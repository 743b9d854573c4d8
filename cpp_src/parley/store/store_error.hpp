#ifndef PARLEY_STORE_STORE_ERROR_HPP
#define PARLEY_STORE_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace parley {
namespace store {

/// A failed call into the persistent store or the authenticator
class store_error :
    public std::runtime_error
{
public:

    explicit store_error(const std::string & err)
     : std::runtime_error(err)
    { }
};

}
}

#endif
