#include "capacity_planner.hpp"

#include "codec_error.hpp"
#include "sonic_config.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace sonicpx {

    static uint64_t payloadPixels(int width, int height) {
        const uint64_t total = static_cast<uint64_t>(width) * static_cast<uint64_t>(height);
        return total > static_cast<uint64_t>(RESERVED_HEADER_PIXELS) ? total - RESERVED_HEADER_PIXELS : 0;
    }

    uint64_t payloadCapacityBits(int width, int height, int bpc)
    {
        return payloadPixels(width, height) * 3u * static_cast<uint64_t>(bpc);
    }

    uint64_t minRequiredBpc(uint64_t payloadBits, int width, int height)
    {
        if (payloadBits == 0) {
            return 0;
        }
        const uint64_t channels = payloadPixels(width, height) * 3u;
        if (channels == 0) {
            return std::numeric_limits<uint64_t>::max();
        }
        return (payloadBits + channels - 1) / channels;
    }

    CapacityPlan planCapacity(uint64_t payloadBits, int coverWidth, int coverHeight, int targetBpc)
    {
        if (coverWidth <= 0 || coverHeight <= 0) {
            throw CodecError(ErrorKind::InvalidArgument, "cover image is empty");
        }
        if (targetBpc < MIN_BPC || targetBpc > MAX_ENCODE_BPC) {
            throw CodecError(ErrorKind::InvalidArgument,
                             "bits per channel must be in [1," + std::to_string(MAX_ENCODE_BPC) +
                             "], got " + std::to_string(targetBpc));
        }

        const uint64_t totalPixels = static_cast<uint64_t>(coverWidth) * static_cast<uint64_t>(coverHeight);
        const uint64_t bpc = static_cast<uint64_t>(targetBpc);

        CapacityPlan plan;
        plan.bitsPerChannel = targetBpc;

        bool upscaleToFit = false;
        if (minRequiredBpc(payloadBits, coverWidth, coverHeight) > bpc) {
            // Restore feasibility at the requested density by growing the area
            const uint64_t desiredChannels = (payloadBits + bpc - 1) / bpc;
            const uint64_t desiredPixels = (desiredChannels + 2) / 3 + RESERVED_HEADER_PIXELS;
            plan.scale = std::sqrt(static_cast<double>(desiredPixels) / static_cast<double>(totalPixels));
            upscaleToFit = true;
        }

        const uint64_t capacity = payloadCapacityBits(coverWidth, coverHeight, targetBpc);
        plan.utilization = capacity > 0 ? static_cast<double>(payloadBits) / static_cast<double>(capacity) : 1.0;
        if (!upscaleToFit && plan.utilization > UTILIZATION_THRESHOLD) {
            plan.scale = HEADROOM_SCALE;
        }

        plan.scale = std::max(1.0, plan.scale);
        plan.newWidth = static_cast<int>(std::ceil(coverWidth * plan.scale));
        plan.newHeight = static_cast<int>(std::ceil(coverHeight * plan.scale));

        // sqrt() can land a hair under the exact ratio; never come up short
        while (payloadCapacityBits(plan.newWidth, plan.newHeight, targetBpc) < payloadBits) {
            ++plan.newHeight;
        }
        return plan;
    }

}
