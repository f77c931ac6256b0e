#pragma once

#include <ledmatrix/driver.h>
#include <ledmatrix/matrix-options.h>
#include <mutex>
#include <string>
#include <vector>

namespace rgb_matrix {
class RGBMatrix;
class FrameCanvas;
} // namespace rgb_matrix

namespace ledmatrix {

/**
 * RgbMatrixDriver - session on real HUB75 panels through hzeller's
 * rpi-rgb-led-matrix library.
 *
 * The library runs its own refresh thread and owns every FrameCanvas it
 * creates until the RGBMatrix is deleted, so released buffers are pooled and
 * handed out again instead of being freed.
 */
class RgbMatrixDriver : public Driver {
public:
    static Result<Driver::Ptr> create(const MatrixOptions& options,
                                      const RuntimeOptions& runtimeOptions) noexcept;

    ~RgbMatrixDriver() override;

    const char* name() const override { return RuntimeOptions::DRIVER_RGB_MATRIX; }

    NativeBuffer* liveBuffer() override;
    Result<NativeBuffer*> createBuffer() override;
    void releaseBuffer(NativeBuffer* buffer) override;
    NativeBuffer* swapOnVSync(NativeBuffer* next) override;

    void bufferSize(const NativeBuffer* buffer, int& width, int& height) const override;
    void setPixel(NativeBuffer* buffer, int x, int y, const Color& color) override;
    void clear(NativeBuffer* buffer) override;
    void fill(NativeBuffer* buffer, const Color& color) override;
    void drawLine(NativeBuffer* buffer, int x0, int y0, int x1, int y1,
                  const Color& color) override;
    void drawCircle(NativeBuffer* buffer, int x, int y, int radius,
                    const Color& color) override;

    Result<NativeFont*> loadFont(const std::string& bdfPath) override;
    void releaseFont(NativeFont* font) override;
    int fontHeight(const NativeFont* font) const override;
    int fontBaseline(const NativeFont* font) const override;
    int characterWidth(const NativeFont* font, uint32_t codepoint) const override;
    int drawGlyph(NativeBuffer* buffer, const NativeFont* font, int x, int y,
                  const Color& color, uint32_t codepoint) override;

private:
    RgbMatrixDriver(const MatrixOptions& options, const RuntimeOptions& runtimeOptions) noexcept;
    Result<void> init() noexcept;

    MatrixOptions _options;
    RuntimeOptions _runtimeOptions;

    rgb_matrix::RGBMatrix* _matrix = nullptr;

    std::mutex _mutex;          // guards _live, _liveReleased and _pool
    rgb_matrix::FrameCanvas* _live = nullptr;
    bool _liveReleased = false;
    std::vector<rgb_matrix::FrameCanvas*> _pool;
};

} // namespace ledmatrix
