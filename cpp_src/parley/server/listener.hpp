#ifndef PARLEY_SERVER_LISTENER_HPP
#define PARLEY_SERVER_LISTENER_HPP

#include "parley/server/fwd.hpp"
#include "parley/core/fwd.hpp"
#include <boost/asio.hpp>
#include <memory>
#include <string>

namespace parley {
namespace server {

class listener :
    public std::enable_shared_from_this<listener>
{
public:

    typedef listener_ptr_t ptr_t;

    /*!
     * Resolves & binds the context's configured hostname and port.
     *
     * Throws boost::system::system_error on resolution or bind failure.
     */
    explicit listener(const context_ptr_t &);

    ~listener();

    std::string get_address();
    unsigned short get_port();

    void initialize();

    void shutdown();

private:

    void on_accept(const boost::system::error_code & ec);

    const context_ptr_t _context;
    const core::io_service_ptr_t _io_service;

    boost::asio::ip::tcp::acceptor _accept_sock;

    // next connection to accept
    std::unique_ptr<boost::asio::ip::tcp::socket> _next_sock;
};

}
}

#endif
