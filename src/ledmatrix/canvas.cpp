#include <ledmatrix/canvas.h>
#include <ytrace/ytrace.hpp>
#include <utility>

namespace ledmatrix {

Canvas::Canvas(Driver::Ptr driver, NativeBuffer* buffer) noexcept
    : _driver(std::move(driver)), _buffer(buffer) {}

Canvas::~Canvas() {
    if (_buffer) {
        _driver->releaseBuffer(_buffer);
    }
}

Canvas::Canvas(Canvas&& other) noexcept
    : _driver(std::move(other._driver)), _buffer(std::exchange(other._buffer, nullptr)) {}

Canvas& Canvas::operator=(Canvas&& other) noexcept {
    if (this != &other) {
        if (_buffer) {
            _driver->releaseBuffer(_buffer);
        }
        _driver = std::move(other._driver);
        _buffer = std::exchange(other._buffer, nullptr);
    }
    return *this;
}

NativeBuffer* Canvas::release() noexcept {
    _driver.reset();
    return std::exchange(_buffer, nullptr);
}

Size Canvas::size() const {
    Size s;
    if (_buffer) {
        _driver->bufferSize(_buffer, s.width, s.height);
    }
    return s;
}

void Canvas::set(int x, int y, const Color& color) {
    if (!_buffer) return;
    _driver->setPixel(_buffer, x, y, color);
}

void Canvas::clear() {
    if (!_buffer) return;
    _driver->clear(_buffer);
}

void Canvas::fill(const Color& color) {
    if (!_buffer) return;
    _driver->fill(_buffer, color);
}

void Canvas::drawLine(int x0, int y0, int x1, int y1, const Color& color) {
    if (!_buffer) return;
    _driver->drawLine(_buffer, x0, y0, x1, y1, color);
}

void Canvas::drawCircle(int x, int y, uint32_t radius, const Color& color) {
    if (!_buffer) return;
    _driver->drawCircle(_buffer, x, y, static_cast<int>(radius), color);
}

Result<int> Canvas::drawText(const Font& font, std::string_view text,
                             const TextDrawOptions& options) {
    if (text.find('\0') != std::string_view::npos) {
        ywarn("Canvas::drawText: text contains an embedded NUL byte");
        return Err<int>("Text contains an embedded NUL byte");
    }
    if (font.driver() != _driver && _buffer) {
        ywarn("Canvas::drawText: font {} belongs to another session", font.path().string());
        return Err<int>("Font was loaded by another driver session");
    }

    auto height = font.height();
    if (!height) {
        return Err<int>("Cannot draw text", height);
    }

    const NativeFont* nativeFont = font.native();
    auto glyphWidth = [&](uint32_t codepoint) {
        int w = font.characterWidth(codepoint);
        if (w < 0) w = font.characterWidth(0xFFFD);
        return w < 0 ? 0 : w;
    };

    TextMetrics metrics;
    metrics.fontHeight = *height;
    metrics.kerningOffset = options.kerningOffset();
    metrics.leading = options.leading();

    auto laidOut = layoutText(text, options.layout(), options.x(), options.y(), metrics,
                              glyphWidth);
    if (!laidOut) {
        ywarn("Canvas::drawText: {}", error_msg(laidOut));
        return Err<int>("Cannot lay out text", laidOut);
    }

    if (_buffer) {
        const Color& color = options.color();
        for (const auto& glyph : laidOut->glyphs) {
            _driver->drawGlyph(_buffer, nativeFont, glyph.x, glyph.y, color, glyph.codepoint);
        }
    }
    return Ok(laidOut->advance);
}

} // namespace ledmatrix
