
#include "parley/server/listener.hpp"
#include "parley/server/context.hpp"
#include "parley/server/client.hpp"
#include "parley/log.hpp"
#include <boost/lexical_cast.hpp>
#include <functional>

namespace parley {
namespace server {

using namespace boost::asio;

listener::listener(const context_ptr_t & context)
 :  _context(context),
    _io_service(context->get_serial_io_service()),
    _accept_sock(*_io_service)
{
    std::string str_port = boost::lexical_cast<std::string>(
        context->get_server_port());

    // build resolution query
    ip::tcp::resolver::query query(context->get_server_hostname(), str_port);

    // blocks, & throws on resolution failure
    ip::tcp::endpoint ep = *ip::tcp::resolver(*_io_service).resolve(query);

    // open & bind the listening socket
    _accept_sock.open(ep.protocol());
    _accept_sock.set_option(ip::tcp::acceptor::reuse_address(true));
    _accept_sock.bind(ep);
    _accept_sock.listen();

    LOG_INFO("listening on " << get_address() << ":" << get_port());
}

listener::~listener()
{
    LOG_DBG("");
}

std::string listener::get_address()
{ return _accept_sock.local_endpoint().address().to_string(); }

unsigned short listener::get_port()
{ return _accept_sock.local_endpoint().port(); }

void listener::initialize()
{
    _context->add_listener(reinterpret_cast<size_t>(this),
        shared_from_this());

    // next connection to accept
    on_accept(boost::system::error_code());
}

void listener::shutdown()
{
    LOG_DBG("");

    boost::system::error_code ec;
    _accept_sock.close(ec);

    if(ec)
        LOG_WARN("closing acceptor: " << ec.message());

    _context->drop_listener(reinterpret_cast<size_t>(this));
}

void listener::on_accept(const boost::system::error_code & ec)
{
    if(ec == boost::asio::error::operation_aborted)
    {
        LOG_DBG("accept cancelled");
        return;
    }
    if(ec)
    {
        LOG_ERR(ec.message());
        return;
    }

    if(_next_sock)
    {
        // frames are written whole; don't add Nagle delay
        _next_sock->set_option(ip::tcp::no_delay(true));

        // lifetime is managed by client's use in callbacks
        std::make_shared<client>(_context, std::move(*_next_sock)
            )->initialize();
    }

    // next connection to accept
    _next_sock.reset(new ip::tcp::socket(*_io_service));

    _accept_sock.async_accept(*_next_sock,
        std::bind(&listener::on_accept, shared_from_this(),
            std::placeholders::_1));
}

}
}

