
#include "parley/core/timestamp.hpp"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace parley {
namespace core {

namespace pt = boost::posix_time;
namespace gr = boost::gregorian;

namespace {

const pt::ptime & unix_epoch()
{
    static const pt::ptime epoch(gr::date(1970, 1, 1));
    return epoch;
}

// parses exactly `width` decimal digits at `pos`
bool read_digits(const std::string & in, size_t & pos,
    unsigned width, int & out)
{
    if(pos + width > in.size())
        return false;

    out = 0;
    for(unsigned i = 0; i != width; ++i, ++pos)
    {
        if(!std::isdigit(static_cast<unsigned char>(in[pos])))
            return false;

        out = out * 10 + (in[pos] - '0');
    }
    return true;
}

bool expect(const std::string & in, size_t & pos, char c)
{
    if(pos >= in.size() || in[pos] != c)
        return false;

    ++pos;
    return true;
}

}

std::string format_timestamp(timestamp_t ts)
{
    pt::ptime t = unix_epoch() + pt::microseconds(ts);

    gr::date d = t.date();
    pt::time_duration tod = t.time_of_day();

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06uZ",
        static_cast<int>(d.year()),
        static_cast<int>(d.month()),
        static_cast<int>(d.day()),
        static_cast<int>(tod.hours()),
        static_cast<int>(tod.minutes()),
        static_cast<int>(tod.seconds()),
        static_cast<unsigned>(ts % usec_per_second));

    return buf;
}

bool try_parse_timestamp(const std::string & in, timestamp_t & out) throw()
{
    size_t pos = 0;
    int year, month, day, hour, minute, second;

    if(!read_digits(in, pos, 4, year) || !expect(in, pos, '-') ||
       !read_digits(in, pos, 2, month) || !expect(in, pos, '-') ||
       !read_digits(in, pos, 2, day))
    {
        return false;
    }
    if(pos >= in.size() || (in[pos] != 'T' && in[pos] != ' '))
        return false;
    ++pos;

    if(!read_digits(in, pos, 2, hour) || !expect(in, pos, ':') ||
       !read_digits(in, pos, 2, minute) || !expect(in, pos, ':') ||
       !read_digits(in, pos, 2, second))
    {
        return false;
    }
    if(hour > 23 || minute > 59 || second > 59)
        return false;

    // optional fraction; digits beyond microseconds are dropped
    int64_t fraction = 0;
    if(pos < in.size() && in[pos] == '.')
    {
        ++pos;

        unsigned digits = 0;
        while(pos < in.size() &&
              std::isdigit(static_cast<unsigned char>(in[pos])))
        {
            if(digits < 6)
            {
                fraction = fraction * 10 + (in[pos] - '0');
            }
            ++digits; ++pos;
        }
        if(!digits)
            return false;

        for(; digits < 6; ++digits)
            fraction *= 10;
    }

    // optional zone designator
    int64_t offset_sec = 0;
    if(pos < in.size())
    {
        if(in[pos] == 'Z' && pos + 1 == in.size())
        {
            ++pos;
        }
        else if(in[pos] == '+' || in[pos] == '-')
        {
            int sign = (in[pos] == '+') ? 1 : -1;
            int off_hour, off_minute;
            ++pos;

            if(!read_digits(in, pos, 2, off_hour) || !expect(in, pos, ':') ||
               !read_digits(in, pos, 2, off_minute))
            {
                return false;
            }
            offset_sec = sign * (off_hour * 3600 + off_minute * 60);
        }
        if(pos != in.size())
            return false;
    }

    try
    {
        pt::ptime t(gr::date(year, month, day),
            pt::hours(hour) + pt::minutes(minute) + pt::seconds(second));

        int64_t usec = (t - unix_epoch()).total_microseconds() + fraction
            - offset_sec * static_cast<int64_t>(usec_per_second);

        if(usec < 0)
            return false;

        out = static_cast<timestamp_t>(usec);
    }
    catch(const std::out_of_range &)
    {
        // invalid calendar date
        return false;
    }
    return true;
}

timestamp_t parse_timestamp(const std::string & in)
{
    timestamp_t out;
    if(!try_parse_timestamp(in, out))
    {
        throw std::runtime_error("failed to parse timestamp from " + in);
    }
    return out;
}

}
}

