#ifndef CAPACITY_PLANNER_HPP
#define CAPACITY_PLANNER_HPP

#include <cstdint>

namespace sonicpx {

    struct CapacityPlan {
        double scale = 1.0;       // >= 1; > 1 means the cover gets upscaled
        int newWidth = 0;
        int newHeight = 0;
        int bitsPerChannel = 0;   // always the requested density
        double utilization = 0.0; // at the original size
    };

    // Picks the cover size for payloadBits at targetBpc. Density never changes;
    // the cover grows instead, either until the payload fits or by the
    // headroom factor when more than half the capacity would be used.
    CapacityPlan planCapacity(uint64_t payloadBits, int coverWidth, int coverHeight, int targetBpc);

    // ceil(bits / (payload pixels * 3)); 0 for an empty payload
    uint64_t minRequiredBpc(uint64_t payloadBits, int width, int height);

    uint64_t payloadCapacityBits(int width, int height, int bpc);

}

#endif // CAPACITY_PLANNER_HPP
