#ifndef PARLEY_ERROR_HPP
#define PARLEY_ERROR_HPP

#include <exception>
#include <string>

#define PARLEY_ASSERT(arg)\
{\
    if(__builtin_expect(!(bool)(arg), 0))\
    {\
        throw parley::error::parley_exception(\
            "assertion_failure",\
            #arg,\
            __FILE__,\
            __PRETTY_FUNCTION__,\
            __LINE__);\
    }\
}

namespace parley {
namespace error {

class parley_exception : public std::exception
{
public:

    parley_exception(
        const std::string & type,
        const std::string & msg,
        const std::string & file = "",
        const std::string & func = "",
        unsigned line_no = 0);

    ~parley_exception() throw()
    {}

    virtual const char * what() const throw()
    { return _what.c_str(); }

    const std::string type;
    const std::string msg;
    const std::string file;
    const std::string func;
    const unsigned line_no;

private:

    std::string _what;
};

}
}

#endif
