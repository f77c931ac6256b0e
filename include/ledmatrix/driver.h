#pragma once

#include <ledmatrix/color.h>
#include <ledmatrix/result.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace ledmatrix {

class MatrixOptions;
class RuntimeOptions;

// Opaque driver resources. Each backend casts its own buffer and font types
// to these; the core only passes them back to the driver that produced them.
struct NativeBuffer;
struct NativeFont;

/**
 * Driver - the native panel engine behind a display session.
 *
 * A Driver instance IS the session: creating it initializes the panel and
 * starts scan-out, destroying it shuts the panel down. Canvas, Font and
 * Matrix keep a Driver::Ptr so the session outlives every handle into it.
 *
 * Backends:
 *   rgb-matrix - hzeller rpi-rgb-led-matrix, GPIO scan-out thread
 *   virtual    - in-memory panel for off-device runs and tests
 *
 * Buffer calls are not synchronized; the caller must hold exclusive access to
 * the buffer it mutates. swapOnVSync() is the only call that coordinates with
 * the refresh side.
 */
class Driver {
public:
    using Ptr = std::shared_ptr<Driver>;

    // Creates the backend named by runtimeOptions.driver()
    static Result<Ptr> create(const MatrixOptions& options,
                              const RuntimeOptions& runtimeOptions) noexcept;

    virtual ~Driver() = default;

    Driver(const Driver&) = delete;
    Driver& operator=(const Driver&) = delete;

    virtual const char* name() const = 0;

    // =========================================================================
    // Buffers
    // =========================================================================

    // Buffer currently scanned out
    virtual NativeBuffer* liveBuffer() = 0;

    virtual Result<NativeBuffer*> createBuffer() = 0;

    // Returns the buffer to the driver. A buffer that is still live is kept
    // until it is swapped out or the session ends.
    virtual void releaseBuffer(NativeBuffer* buffer) = 0;

    // Makes `next` live once the current frame has been fully shown and
    // returns the buffer that was live before.
    virtual NativeBuffer* swapOnVSync(NativeBuffer* next) = 0;

    virtual void bufferSize(const NativeBuffer* buffer, int& width, int& height) const = 0;

    // Out-of-range coordinates are ignored
    virtual void setPixel(NativeBuffer* buffer, int x, int y, const Color& color) = 0;
    virtual void clear(NativeBuffer* buffer) = 0;
    virtual void fill(NativeBuffer* buffer, const Color& color) = 0;
    virtual void drawLine(NativeBuffer* buffer, int x0, int y0, int x1, int y1,
                          const Color& color) = 0;
    virtual void drawCircle(NativeBuffer* buffer, int x, int y, int radius,
                            const Color& color) = 0;

    // =========================================================================
    // Fonts (BDF)
    // =========================================================================

    virtual Result<NativeFont*> loadFont(const std::string& bdfPath) = 0;
    virtual void releaseFont(NativeFont* font) = 0;

    // -1 when the font is not loaded
    virtual int fontHeight(const NativeFont* font) const = 0;
    virtual int fontBaseline(const NativeFont* font) const = 0;

    // Device width of the glyph, -1 when the font has none
    virtual int characterWidth(const NativeFont* font, uint32_t codepoint) const = 0;

    // Draws one glyph with its baseline at y. Falls back to U+FFFD when the
    // codepoint is missing. Returns the horizontal advance.
    virtual int drawGlyph(NativeBuffer* buffer, const NativeFont* font, int x, int y,
                          const Color& color, uint32_t codepoint) = 0;

protected:
    Driver() = default;
};

} // namespace ledmatrix
