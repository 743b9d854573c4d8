
#include "parley/server/client.hpp"
#include "parley/server/context.hpp"
#include "parley/server/request_target.hpp"
#include "parley/server/session.hpp"
#include "parley/error.hpp"
#include "parley/log.hpp"
#include <functional>

namespace parley {
namespace server {

namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;

using std::placeholders::_1;

namespace {

bool is_expected_disconnect(const boost::system::error_code & ec)
{
    return !ec ||
        ec == websocket::error::closed ||
        ec == http::error::end_of_stream ||
        ec == boost::asio::error::eof ||
        ec == boost::asio::error::operation_aborted ||
        ec == boost::asio::error::connection_reset;
}

}

client::client(const context_ptr_t & context,
    boost::asio::ip::tcp::socket sock)
 :  _context(context),
    _ws(std::move(sock)),
    _writing(false),
    _open(false),
    _closing(false),
    _close_pending(false),
    _disconnected(false)
{
    LOG_DBG("created " << this);
}

client::~client()
{
    LOG_DBG("destroyed " << this);
}

void client::initialize()
{
    _context->add_client(reinterpret_cast<size_t>(this), shared_from_this());

    http::async_read(_ws.next_layer(), _buffer, _request,
        std::bind(&client::on_request, shared_from_this(), _1));
}

void client::shutdown()
{
    if(_open)
        close(websocket::close_code::going_away, "Server shutdown");
    else
        on_disconnect(boost::asio::error::operation_aborted);
}

bool client::send(const std::string & payload)
{
    if(!is_open())
        return false;

    _write_queue.push_back(payload);

    if(!_writing)
        on_next_write();

    return true;
}

bool client::is_open() const
{
    return _open && !_closing;
}

void client::close(unsigned short code, const std::string & reason)
{
    if(!_open || _closing)
        return;

    _closing = true;
    _close_reason = websocket::close_reason(static_cast<websocket::close_code>(code), reason);

    if(_writing)
    {
        // queued frames are flushed first
        _close_pending = true;
        return;
    }
    _ws.async_close(_close_reason,
        std::bind(&client::on_close, shared_from_this(), _1));
}

void client::on_request(boost::system::error_code ec)
{
    if(ec)
    {
        on_disconnect(ec);
        return;
    }

    std::string target(_request.target().data(), _request.target().size());

    if(!websocket::is_upgrade(_request) || !parse_request_target(target))
    {
        LOG_INFO("rejecting request for " << log::ascii_escape(target));

        _response.version(_request.version());
        _response.result(http::status::not_found);
        _response.set(http::field::content_type, "text/plain");
        _response.body() = "Not found";
        _response.keep_alive(false);
        _response.prepare_payload();

        http::async_write(_ws.next_layer(), _response,
            std::bind(&client::on_reject, shared_from_this(), _1));
        return;
    }

    _ws.async_accept(_request,
        std::bind(&client::on_accept, shared_from_this(), _1));
}

void client::on_reject(boost::system::error_code ec)
{
    on_disconnect(ec);
}

void client::on_accept(boost::system::error_code ec)
{
    if(ec)
    {
        on_disconnect(ec);
        return;
    }

    _open = true;
    _ws.text(true);

    std::string target(_request.target().data(), _request.target().size());
    boost::optional<request_target> params = parse_request_target(target);
    PARLEY_ASSERT(params);

    _session = std::make_shared<session>(_context, shared_from_this());

    if(!_session->open(params->token, params->conversation_id))
    {
        // the session closed the connection; on_close completes teardown
        _session.reset();
        return;
    }

    on_next_frame();
}

void client::on_next_frame()
{
    _ws.async_read(_buffer,
        std::bind(&client::on_frame, shared_from_this(), _1));
}

void client::on_frame(boost::system::error_code ec)
{
    if(ec)
    {
        on_disconnect(ec);
        return;
    }

    std::string text = boost::beast::buffers_to_string(_buffer.data());
    _buffer.consume(_buffer.size());

    if(!_ws.got_text())
    {
        LOG_WARN("dropping binary frame");
    }
    else if(_session)
    {
        _session->on_frame(text);
    }

    if(!_disconnected)
        on_next_frame();
}

void client::on_next_write()
{
    _writing = true;

    _ws.async_write(boost::asio::buffer(_write_queue.front()),
        std::bind(&client::on_write, shared_from_this(), _1));
}

void client::on_write(boost::system::error_code ec)
{
    if(_disconnected)
    {
        // the write queue was discarded by on_disconnect()
        _writing = false;
        return;
    }

    if(ec)
    {
        _writing = false;
        on_disconnect(ec);
        return;
    }

    _write_queue.pop_front();

    if(!_write_queue.empty())
    {
        on_next_write();
        return;
    }

    _writing = false;

    if(_close_pending)
    {
        _close_pending = false;
        _ws.async_close(_close_reason,
            std::bind(&client::on_close, shared_from_this(), _1));
    }
}

void client::on_close(boost::system::error_code ec)
{
    on_disconnect(ec);
}

void client::on_disconnect(boost::system::error_code ec)
{
    if(_disconnected)
        return;

    _disconnected = true;
    _open = false;

    if(is_expected_disconnect(ec))
        LOG_DBG("disconnected: " << ec.message());
    else
        LOG_INFO("connection error: " << ec.message());

    if(_session)
    {
        _session->close();
        _session.reset();
    }
    _write_queue.clear();

    boost::asio::ip::tcp::socket & sock = _ws.next_layer();
    if(sock.is_open())
    {
        boost::system::error_code close_ec;
        sock.close(close_ec);

        if(close_ec)
            LOG_DBG("socket close: " << close_ec.message());
    }

    _context->drop_client(reinterpret_cast<size_t>(this));
}

}
}

