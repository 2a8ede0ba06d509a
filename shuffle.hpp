#ifndef SHUFFLE_HPP
#define SHUFFLE_HPP

#include <cstdint>
#include <vector>

namespace sonicpx {

    // Fixed-seed 32-bit generator. Every operation wraps modulo 2^32 so the
    // sequence matches images encoded by earlier releases bit for bit.
    class ShuffleRng {
    public:
        explicit ShuffleRng(uint32_t seed);

        uint32_t nextU32();
        // Uniform in [0, 1)
        double next();

    private:
        uint32_t state_;
    };

    // Permutation of [reserved, totalPixels): Fisher-Yates from the back,
    // driven by ShuffleRng(SHUFFLE_SEED). Empty when totalPixels <= reserved.
    std::vector<uint32_t> shuffledPixelIndices(uint32_t totalPixels, uint32_t reserved);

}

#endif // SHUFFLE_HPP
