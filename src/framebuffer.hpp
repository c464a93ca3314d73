#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <iterator>
#include <string>
#include <vector>

namespace picoled {

// Row-major grid of RGB565 words. Coordinates outside the grid are
// clipped: writes are dropped and reads return 0.
class Framebuffer {
public:
    class DumpLines;

    Framebuffer(uint16_t cols, uint16_t rows)
        : cols_(cols), rows_(rows), data_(static_cast<size_t>(cols) * rows, 0) {}

    uint16_t width() const { return cols_; }
    uint16_t height() const { return rows_; }
    const uint16_t* data() const { return data_.data(); }
    const uint16_t* row(uint16_t y) const { return data_.data() + static_cast<size_t>(y) * cols_; }

    void clear();
    void set_pixel(int x, int y, uint16_t color);
    uint16_t get_pixel(int x, int y) const;
    void clear_block(int x0, int y0, int dx, int dy);
    void fill_rect(int x, int y, int w, int h, uint16_t color);

    // One line per row, 'X' for lit pixels and '.' for black. Lines are
    // rendered on demand; iterating again renders them again.
    DumpLines dump() const;
    std::string dump_row(uint16_t y) const;
    void dump(std::FILE* out) const;

private:
    bool contains(int x, int y) const {
        return x >= 0 && x < cols_ && y >= 0 && y < rows_;
    }

    uint16_t cols_;
    uint16_t rows_;
    std::vector<uint16_t> data_;
};

class Framebuffer::DumpLines {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = std::string;

        iterator(const Framebuffer* fb, uint16_t y) : fb_(fb), y_(y) {}
        std::string operator*() const { return fb_->dump_row(y_); }
        iterator& operator++() { ++y_; return *this; }
        iterator operator++(int) { iterator prev = *this; ++y_; return prev; }
        bool operator==(const iterator& o) const { return fb_ == o.fb_ && y_ == o.y_; }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        const Framebuffer* fb_;
        uint16_t y_;
    };

    explicit DumpLines(const Framebuffer& fb) : fb_(&fb) {}
    iterator begin() const { return iterator(fb_, 0); }
    iterator end() const { return iterator(fb_, fb_->height()); }
    size_t size() const { return fb_->height(); }

private:
    const Framebuffer* fb_;
};

inline Framebuffer::DumpLines Framebuffer::dump() const { return DumpLines(*this); }

} // namespace picoled
