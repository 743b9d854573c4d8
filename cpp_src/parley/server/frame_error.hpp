#ifndef PARLEY_SERVER_FRAME_ERROR_HPP
#define PARLEY_SERVER_FRAME_ERROR_HPP

#include <stdexcept>
#include <string>

namespace parley {
namespace server {

/*!
 * Failure to decode or handle one inbound frame.
 *
 * Recovered by the session: the frame is dropped and the session
 *  continues with the next frame.
 */
class frame_error :
    public std::runtime_error
{
public:

    frame_error(unsigned code, const std::string & err)
     : std::runtime_error(err),
       _code(code)
    { }

    unsigned get_code() const
    { return _code; }

private:

    unsigned _code;
};

}
}

#endif
