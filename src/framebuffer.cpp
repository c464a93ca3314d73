#include "framebuffer.hpp"

#include <algorithm>

namespace picoled {

void Framebuffer::clear() {
    std::fill(data_.begin(), data_.end(), 0);
}

void Framebuffer::set_pixel(int x, int y, uint16_t color) {
    if (!contains(x, y)) return;
    data_[static_cast<size_t>(y) * cols_ + x] = color;
}

uint16_t Framebuffer::get_pixel(int x, int y) const {
    if (!contains(x, y)) return 0;
    return data_[static_cast<size_t>(y) * cols_ + x];
}

void Framebuffer::clear_block(int x0, int y0, int dx, int dy) {
    fill_rect(x0, y0, dx, dy, 0);
}

void Framebuffer::fill_rect(int x, int y, int w, int h, uint16_t color) {
    if (w <= 0 || h <= 0) return;
    // Clip to [0, cols) x [0, rows)
    int x0 = std::max(x, 0);
    int y0 = std::max(y, 0);
    // x + w may not fit in an int
    int x1 = static_cast<int>(std::min<int64_t>(static_cast<int64_t>(x) + w, cols_));
    int y1 = static_cast<int>(std::min<int64_t>(static_cast<int64_t>(y) + h, rows_));
    if (x0 >= x1 || y0 >= y1) return;
    for (int yy = y0; yy < y1; ++yy) {
        uint16_t* dst = data_.data() + static_cast<size_t>(yy) * cols_;
        std::fill(dst + x0, dst + x1, color);
    }
}

std::string Framebuffer::dump_row(uint16_t y) const {
    std::string line;
    if (y >= rows_) return line;
    line.reserve(cols_);
    const uint16_t* src = row(y);
    for (uint16_t x = 0; x < cols_; ++x) line.push_back(src[x] ? 'X' : '.');
    return line;
}

void Framebuffer::dump(std::FILE* out) const {
    for (const std::string& line : dump()) {
        std::fputs(line.c_str(), out);
        std::fputc('\n', out);
    }
}

} // namespace picoled
