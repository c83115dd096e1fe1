#pragma once

#include <cstddef>
#include <vector>
#include "frame_types.hpp"

namespace waterfall {

// Fixed-size RGBA surface that scrolls downward: each insert moves every row
// down by one and writes the new row at y = 0. Resizing discards history.
class ScrollBuffer {
public:
    static constexpr int bytes_per_pixel = 4;

    ScrollBuffer() = default;
    ScrollBuffer(int width, int height);

    void resize(int width, int height);
    void clear();

    // Returns false (and leaves the buffer untouched) when the row length
    // does not match the buffer width or the buffer has no area.
    bool insert_row(const PixelRow& row);

    int width() const { return width_; }
    int height() const { return height_; }
    // Rows holding inserted data, capped at height
    int filled_rows() const { return filled_rows_; }
    std::size_t rows_inserted() const { return rows_inserted_; }

    const unsigned char* rgba() const { return rgba_.data(); }
    std::size_t size_bytes() const { return rgba_.size(); }
    Rgb pixel(int x, int y) const;

private:
    int width_ = 0;
    int height_ = 0;
    int filled_rows_ = 0;
    std::size_t rows_inserted_ = 0;
    std::vector<unsigned char> rgba_; // width_ * height_ * 4
};

} // namespace waterfall
