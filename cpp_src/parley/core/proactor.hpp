#ifndef PARLEY_CORE_PROACTOR_HPP
#define PARLEY_CORE_PROACTOR_HPP

#include "parley/core/fwd.hpp"
#include "parley/spinlock.hpp"
#include <boost/asio.hpp>
#include <boost/thread/thread.hpp>
#include <functional>
#include <memory>

namespace parley {
namespace core {

class proactor :
    public std::enable_shared_from_this<proactor>
{
public:

    typedef proactor_ptr_t ptr_t;

    typedef std::function<void()> run_later_callback_t;

    /*!
    * Reference-counted singleton
    *  Only one proactor instance exists at a time, but the instance
    *  will be destroyed when the last client-held pointer goes out of
    *  scope.
    */
    static proactor::ptr_t get_proactor();

    virtual ~proactor();

    /*!
    *  The single-threaded io_service on which sessions, the connection
    *    hub, and message synchronizers run.
    *
    *  Because the io_service is known to be single-threaded, no
    *    explicit synchronization is required for any handlers running
    *    on that service.
    */
    const io_service_ptr_t & serial_io_service() const
    { return _serial_io_service; }

    /*!
    *  A multi-threaded io_service, intended for blocking handlers such
    *    as ones performing synchronous store IO. Handlers running here
    *    must hand results back to the serial io_service.
    */
    const io_service_ptr_t & concurrent_io_service() const
    { return _concurrent_io_service; }

    /*!
    *  Schedules a callable to be invoked at a future time on the serial
    *   io-service.
    */
    timer_ptr_t run_later(const run_later_callback_t &, unsigned delay_ms);

    /*!
    *  Starts worker_threads threads running the concurrent io_service,
    *   and runs the serial io_service on the calling thread.
    *
    *  Returns after shutdown(), once all workers have been joined.
    */
    void run(unsigned worker_threads);

    void shutdown();

private:

    proactor();

    static std::weak_ptr<proactor> _class_instance;
    static spinlock _class_lock;

    const io_service_ptr_t _serial_io_service;
    const io_service_ptr_t _concurrent_io_service;

    boost::thread_group _workers;
};

}
}

#endif
