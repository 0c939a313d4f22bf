#include <linedocs/common/constants.h>
#include <linedocs/sampler/position_sampler.h>

#include <algorithm>
#include <cstdint>
#include <limits>

namespace linedocs {

std::uint64_t sample_seek_position(std::mt19937_64 *random,
                                   std::uint64_t size) {
    if (random == nullptr || size <= 3) {
        return 0;
    }

    const std::int64_t signed_size = static_cast<std::int64_t>(
        std::min<std::uint64_t>(size, std::numeric_limits<std::int64_t>::max()));
    const std::int64_t range = signed_size / 3;

    std::int64_t result = static_cast<std::int64_t>(
        (*random)() & static_cast<std::uint64_t>(
                          std::numeric_limits<std::int64_t>::max())) %
        range;

    // leave room to scan forward for a line break
    if (result > signed_size - 7) {
        result = signed_size - 8;
    }
    if (result < 0) {
        result = 0;
    }

    result -= result % constants::sampler::ALIGNMENT_WIDTH;
    return static_cast<std::uint64_t>(result);
}

}  // namespace linedocs
