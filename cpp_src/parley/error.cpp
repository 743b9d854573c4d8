#include "parley/error.hpp"
#include <sstream>

namespace parley {
namespace error {

// instantiate parley_exception in libparley
parley_exception::parley_exception(
    const std::string & _type,
    const std::string & _msg,
    const std::string & _file,
    const std::string & _func,
    unsigned _line_no)
 :  type(_type),
    msg(_msg),
    file(_file),
    func(_func),
    line_no(_line_no)
{
    std::stringstream s;

    s << "parley_exception<" << type << ">: " << msg;

    if(!file.empty())
    {
        s << "\n\t" << file << ":" << line_no << " {" << func << "}";
    }

    _what = s.str();
}

}
}

