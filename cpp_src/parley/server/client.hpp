#ifndef PARLEY_SERVER_CLIENT_HPP
#define PARLEY_SERVER_CLIENT_HPP

#include "parley/server/fwd.hpp"
#include "parley/server/connection.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <deque>
#include <memory>
#include <string>

namespace parley {
namespace server {

/*!
 * Serves one accepted socket: reads the websocket upgrade request, and
 *  drives a session over the upgraded connection.
 *
 * Writes are queued, and performed one at a time. Lifetime is managed by
 *  the client's use in callbacks; it's destroyed when it falls out of
 *  the event-loop. Only used from the serial io_service.
 */
class client :
    public connection,
    public std::enable_shared_from_this<client>
{
public:

    typedef client_ptr_t ptr_t;

    client(const context_ptr_t &, boost::asio::ip::tcp::socket);

    ~client();

    void initialize();

    /// Closes the connection as the server goes away
    void shutdown();

    bool send(const std::string & payload) override;

    bool is_open() const override;

    void close(unsigned short code, const std::string & reason) override;

protected:

    /*!
     * Completion of the in-flight write. May run after on_disconnect(),
     *  when a failed read completes ahead of a successful write.
     */
    void on_write(boost::system::error_code);

    /*!
     * Tears down the session and the socket. Called once the connection
     *  is finished, whether cleanly or on error.
     */
    void on_disconnect(boost::system::error_code);

private:

    typedef boost::beast::websocket::stream<
        boost::asio::ip::tcp::socket> websocket_t;

    void on_request(boost::system::error_code);

    void on_reject(boost::system::error_code);

    void on_accept(boost::system::error_code);

    void on_next_frame();

    void on_frame(boost::system::error_code);

    void on_next_write();

    void on_close(boost::system::error_code);

    const context_ptr_t _context;

    websocket_t _ws;
    boost::beast::flat_buffer _buffer;

    boost::beast::http::request<boost::beast::http::string_body> _request;
    boost::beast::http::response<boost::beast::http::string_body> _response;

    session_ptr_t _session;

    std::deque<std::string> _write_queue;
    bool _writing;

    bool _open;
    bool _closing;
    bool _close_pending;
    bool _disconnected;
    boost::beast::websocket::close_reason _close_reason;
};

}
}

#endif
