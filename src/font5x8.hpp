#pragma once

#include "glyph_source.hpp"

namespace picoled {

// Small 5-column font: space, '-', '.', ':', digits and A-Z. Lowercase
// letters map to their uppercase glyph; anything else is empty.
class Font5x8 : public GlyphSource {
public:
    static constexpr uint8_t kColumns = 5;

    Glyph glyph(char c) const override;
};

} // namespace picoled
