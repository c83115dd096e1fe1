#pragma once

#include "frame_types.hpp"

namespace waterfall {

// Supplies the most recent spectral magnitudes on demand. sample() never
// blocks; it returns whatever the capture side has buffered so far.
class MagnitudeSource {
public:
    virtual ~MagnitudeSource() = default;

    virtual RawFrame sample() = 0;
    virtual double sample_rate() const = 0;
    virtual int bin_count() const = 0;
};

} // namespace waterfall
