#ifndef PARLEY_SPINLOCK_HPP
#define PARLEY_SPINLOCK_HPP

#include <atomic>

namespace parley {

// Simple RAII spinlock wrapper around an atomic bool.
//  Guards short critical sections touched from more than one thread.
class spinlock
{
public:

    void acquire()
    {
        while(_lock.exchange(true, std::memory_order_acquire)) { }
    }

    void release()
    {
        _lock.store(false, std::memory_order_release);
    }

    class guard
    {
    public:
        guard(spinlock & sl)
         : _sl(sl)
        {
            _sl.acquire();
        }

        ~guard()
        {
            _sl.release();
        }

    private:
        spinlock& _sl;
    };

private:

    friend class guard;
    std::atomic<bool> _lock = {false};
};

}

#endif
