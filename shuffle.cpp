#include "shuffle.hpp"

#include "sonic_config.hpp"

#include <utility>

namespace sonicpx {

    ShuffleRng::ShuffleRng(uint32_t seed) : state_(seed) {}

    uint32_t ShuffleRng::nextU32()
    {
        state_ += SHUFFLE_INCREMENT;
        uint32_t t = state_;
        t = (t ^ (t >> 15)) * (t | 1u);
        t ^= t + (t ^ (t >> 7)) * (t | 61u);
        return t ^ (t >> 14);
    }

    double ShuffleRng::next()
    {
        return static_cast<double>(nextU32()) / 4294967296.0;
    }

    std::vector<uint32_t> shuffledPixelIndices(uint32_t totalPixels, uint32_t reserved)
    {
        if (totalPixels <= reserved) {
            return std::vector<uint32_t>();
        }
        const uint32_t count = totalPixels - reserved;
        std::vector<uint32_t> indices(count);
        for (uint32_t i = 0; i < count; ++i) {
            indices[i] = reserved + i;
        }

        ShuffleRng rng(SHUFFLE_SEED);
        for (uint32_t i = count - 1; i > 0; --i) {
            uint32_t j = static_cast<uint32_t>(rng.next() * (static_cast<double>(i) + 1.0));
            std::swap(indices[i], indices[j]);
        }
        return indices;
    }

}
