#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <span>

#include <sys/random.h>
#include <sys/types.h>

#include "mpint/util/result.hpp"

#include "mpint/services.hpp"
#include "mpint/settings.hpp"

namespace mpint {

Result<void, Random_Source_Error> System_Random_Source::operator()(std::span<std::byte> out)
{
    while (!out.empty()) {
        const std::size_t request_size = std::min(out.size(), random_source_chunk_size);
        const ssize_t read_size = ::getrandom(out.data(), request_size, 0);
        if (read_size < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno == ENOSYS || errno == EPERM ? Random_Source_Error::unavailable
                                                     : Random_Source_Error::exhausted;
        }
        if (read_size == 0) {
            return Random_Source_Error::exhausted;
        }
        // Partial reads are legal (e.g. when interrupted by a signal),
        // so we simply continue with the remaining bytes.
        out = out.subspan(std::size_t(read_size));
    }
    return {};
}

} // namespace mpint
