#pragma once

#include <ledmatrix/color.h>
#include <ledmatrix/driver.h>
#include <ledmatrix/font.h>
#include <ledmatrix/result.hpp>
#include <ledmatrix/text-draw-options.h>
#include <cstdint>
#include <string_view>

namespace ledmatrix {

class Matrix;

struct Size {
    int width = 0;
    int height = 0;
    bool operator==(const Size&) const = default;
};

/**
 * Canvas - exclusive owner of one pixel buffer in a driver session.
 *
 * A Canvas is either the live canvas held by its Matrix or an off-screen
 * canvas held by the caller; Matrix::swap() exchanges the two roles. It can
 * be moved, never copied. A moved-from Canvas is empty and ignores every
 * drawing call.
 *
 * Drawing calls are non-const: only the side holding the Canvas may draw.
 * Moving a Canvas to another thread is safe; the buffer lives in the driver.
 */
class Canvas {
public:
    Canvas() = default;
    ~Canvas();

    Canvas(Canvas&& other) noexcept;
    Canvas& operator=(Canvas&& other) noexcept;
    Canvas(const Canvas&) = delete;
    Canvas& operator=(const Canvas&) = delete;

    bool empty() const { return _buffer == nullptr; }
    explicit operator bool() const { return !empty(); }

    // cols * chain length by rows * parallel; (0, 0) when empty
    Size size() const;

    // Out-of-range coordinates are silently ignored
    void set(int x, int y, const Color& color);
    void clear();
    void fill(const Color& color);
    void drawLine(int x0, int y0, int x1, int y1, const Color& color);
    void drawCircle(int x, int y, uint32_t radius, const Color& color);

    /**
     * Lays out and draws `text` with `font`.
     * Returns the advance in pixels: horizontal width for Horizontal,
     * vertical extent for Vertical and Wrapped.
     * Fails on an embedded NUL, a font from another session, a non-positive
     * wrap width, or a font whose height cannot be read.
     */
    Result<int> drawText(const Font& font, std::string_view text,
                         const TextDrawOptions& options);

    // Identity of the underlying buffer, stable across moves
    const NativeBuffer* native() const { return _buffer; }
    const Driver::Ptr& driver() const { return _driver; }

private:
    friend class Matrix;

    Canvas(Driver::Ptr driver, NativeBuffer* buffer) noexcept;

    // Gives up the buffer without returning it to the driver
    NativeBuffer* release() noexcept;

    Driver::Ptr _driver;
    NativeBuffer* _buffer = nullptr;
};

} // namespace ledmatrix
