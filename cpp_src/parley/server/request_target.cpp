
#include "parley/server/request_target.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/lexical_cast.hpp>
#include <cctype>
#include <vector>

namespace parley {
namespace server {

namespace {

const std::string path_prefix = "/events/";
const std::string path_suffix = "/ws";

int hex_value(char c)
{
    if(c >= '0' && c <= '9')
        return c - '0';
    if(c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if(c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

}

boost::optional<std::string> percent_decode(const std::string & in)
{
    std::string out;
    out.reserve(in.size());

    for(size_t i = 0; i != in.size(); ++i)
    {
        if(in[i] == '+')
        {
            out.push_back(' ');
        }
        else if(in[i] == '%')
        {
            if(i + 2 >= in.size())
                return boost::none;

            int high = hex_value(in[i + 1]);
            int low = hex_value(in[i + 2]);

            if(high < 0 || low < 0)
                return boost::none;

            out.push_back(static_cast<char>(high * 16 + low));
            i += 2;
        }
        else
        {
            out.push_back(in[i]);
        }
    }
    return out;
}

boost::optional<request_target> parse_request_target(
    const std::string & target)
{
    size_t query_begin = target.find('?');

    std::string path = target.substr(0, query_begin);
    std::string query;

    if(query_begin != std::string::npos)
        query = target.substr(query_begin + 1);

    if(!boost::algorithm::starts_with(path, path_prefix) ||
       !boost::algorithm::ends_with(path, path_suffix) ||
       path.size() <= path_prefix.size() + path_suffix.size())
    {
        return boost::none;
    }

    std::string id_str = path.substr(path_prefix.size(),
        path.size() - path_prefix.size() - path_suffix.size());

    for(char c : id_str)
    {
        if(!std::isdigit(static_cast<unsigned char>(c)))
            return boost::none;
    }

    request_target result;

    try
    {
        result.conversation_id =
            boost::lexical_cast<conversation_id_t>(id_str);
    }
    catch(const boost::bad_lexical_cast &)
    {
        // out of range
        return boost::none;
    }

    std::vector<std::string> params;
    boost::algorithm::split(params, query, boost::algorithm::is_any_of("&"));

    for(const std::string & param : params)
    {
        size_t eq = param.find('=');
        if(eq == std::string::npos)
            continue;

        if(param.substr(0, eq) != "token" || !result.token.empty())
            continue;

        boost::optional<std::string> token = percent_decode(
            param.substr(eq + 1));

        if(token)
            result.token = *token;
    }
    return result;
}

}
}

