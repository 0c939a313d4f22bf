#ifndef LINEDOCS_SAMPLER_POSITION_SAMPLER_H
#define LINEDOCS_SAMPLER_POSITION_SAMPLER_H

#include <cstdint>
#include <random>

namespace linedocs {

/**
 * Pick a pseudo-random byte offset to start reading a corpus from.
 *
 * The result p satisfies 0 <= p < size / 3 and is a multiple of
 * constants::sampler::ALIGNMENT_WIDTH. Exactly one value is drawn from
 * random per call.
 *
 * @param random Seed source, nullptr means "read from the start"
 * @param size Corpus size in bytes, may be an estimate
 * @return 0 when random is nullptr or size <= 3
 */
std::uint64_t sample_seek_position(std::mt19937_64 *random,
                                   std::uint64_t size);

}  // namespace linedocs

#endif  // LINEDOCS_SAMPLER_POSITION_SAMPLER_H
