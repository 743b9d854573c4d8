
#include "parley/core/proactor.hpp"
#include "parley/error.hpp"
#include "parley/log.hpp"

namespace parley {
namespace core {

// static initialization
std::weak_ptr<proactor> proactor::_class_instance;
spinlock proactor::_class_lock;

proactor::ptr_t proactor::get_proactor()
{
    spinlock::guard guard(_class_lock);

    ptr_t result = _class_instance.lock();
    if(result)
        return result;

    result = ptr_t(new proactor());
    _class_instance = result;
    return result;
}

proactor::proactor()
 : _serial_io_service(std::make_shared<boost::asio::io_service>()),
   _concurrent_io_service(std::make_shared<boost::asio::io_service>())
{
    LOG_DBG("called");
}

proactor::~proactor()
{
    LOG_DBG("called");
}

// helper for proactor::run_later callback dispatch
void on_run_later(const boost::system::error_code & ec,
    const proactor::run_later_callback_t & callback,
    const timer_ptr_t &)
{
    // if cancelled
    if(ec)
    { return; }

    callback();
}

timer_ptr_t proactor::run_later(const run_later_callback_t & callback,
    unsigned delay_ms)
{
    timer_ptr_t timer = std::make_shared<boost::asio::deadline_timer>(
        *_serial_io_service);
    timer->expires_from_now(boost::posix_time::milliseconds(delay_ms));

    // timer reference count is passed to the callback argument
    timer->async_wait(std::bind(&on_run_later,
        std::placeholders::_1, callback, timer));

    return timer;
}

void proactor::run(unsigned worker_threads)
{
    PARLEY_ASSERT(worker_threads != 0);

    // neither service returns while idle
    boost::asio::io_service::work serial_work(*_serial_io_service);
    boost::asio::io_service::work concurrent_work(*_concurrent_io_service);

    for(unsigned i = 0; i != worker_threads; ++i)
    {
        io_service_ptr_t io_srv = _concurrent_io_service;
        _workers.create_thread([io_srv]()
            {
                LOG_DBG("concurrent service declared");
                io_srv->run();
            });
    }

    LOG_DBG("serial service declared");
    _serial_io_service->run();

    _concurrent_io_service->stop();
    _workers.join_all();

    LOG_INFO("proactor stopped");
}

void proactor::shutdown()
{
    _serial_io_service->stop();
    _concurrent_io_service->stop();
}

}
}

