#include <fmt/format.h>

#include <pagedread/convert.hpp>

#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace pagedread
{

uint64_t toUint64(const char* s)
{
    char* end;
    errno = 0;
    // strtoull silently negates a leading minus sign
    if (s[0] == '-')
    {
        throw std::runtime_error(fmt::format("Invalid uint64: {}", s));
    }
    uint64_t ret = std::strtoull(s, &end, 0);
    if (errno || end[0] != '\0' || end == s)
    {
        throw std::runtime_error(fmt::format("Invalid uint64: {}", s));
    }
    return ret;
}

} // namespace pagedread
