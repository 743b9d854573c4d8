#ifndef PARLEY_STORE_FWD_HPP
#define PARLEY_STORE_FWD_HPP

#include <memory>

namespace parley {
namespace store {

class store;
typedef std::shared_ptr<store> store_ptr_t;

class store_session;
typedef std::unique_ptr<store_session> store_session_ptr_t;

class memory_store;
typedef std::shared_ptr<memory_store> memory_store_ptr_t;

class authenticator;
typedef std::shared_ptr<authenticator> authenticator_ptr_t;

class token_authenticator;

}
}

#endif
