#include "scroll_buffer.hpp"

#include <algorithm>
#include <cstring>

namespace waterfall {

ScrollBuffer::ScrollBuffer(int width, int height) {
    resize(width, height);
}

void ScrollBuffer::resize(int width, int height) {
    width_ = std::max(0, width);
    height_ = std::max(0, height);
    rgba_.assign(static_cast<size_t>(width_) * static_cast<size_t>(height_) * bytes_per_pixel, 0);
    // Opaque black so an unfilled area blits as background
    for (size_t i = 3; i < rgba_.size(); i += bytes_per_pixel) rgba_[i] = 255;
    filled_rows_ = 0;
    rows_inserted_ = 0;
}

void ScrollBuffer::clear() {
    resize(width_, height_);
}

bool ScrollBuffer::insert_row(const PixelRow& row) {
    if (width_ <= 0 || height_ <= 0) return false;
    if (static_cast<int>(row.size()) != width_) return false;

    const size_t stride = static_cast<size_t>(width_) * bytes_per_pixel;
    if (height_ > 1) {
        // Rows 0..h-2 become 1..h-1; the bottom row falls off
        std::memmove(rgba_.data() + stride, rgba_.data(), stride * static_cast<size_t>(height_ - 1));
    }
    unsigned char* dst = rgba_.data();
    for (int x = 0; x < width_; ++x) {
        dst[x*4+0] = row[x].r;
        dst[x*4+1] = row[x].g;
        dst[x*4+2] = row[x].b;
        dst[x*4+3] = 255;
    }
    filled_rows_ = std::min(height_, filled_rows_ + 1);
    ++rows_inserted_;
    return true;
}

Rgb ScrollBuffer::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return Rgb{};
    const unsigned char* p = rgba_.data() + (static_cast<size_t>(y) * width_ + x) * bytes_per_pixel;
    return Rgb{p[0], p[1], p[2]};
}

} // namespace waterfall
