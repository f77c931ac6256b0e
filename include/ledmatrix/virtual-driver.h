#pragma once

#include <ledmatrix/driver.h>
#include <ledmatrix/matrix-options.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace ledmatrix {

/**
 * VirtualDriver - a panel held in memory.
 *
 * Buffers are RGB arrays of the configured geometry, BDF fonts are parsed and
 * blitted in software. There is no refresh thread: scanOut() returns the
 * frame a refresh tick would show right now. The live-buffer pointer is
 * guarded so swapOnVSync() and scanOut() never observe a half-swapped state.
 */
class VirtualDriver : public Driver {
public:
    using Ptr = std::shared_ptr<VirtualDriver>;

    static Result<Ptr> create(const MatrixOptions& options,
                              const RuntimeOptions& runtimeOptions) noexcept;

    ~VirtualDriver() override;

    const char* name() const override { return RuntimeOptions::DRIVER_VIRTUAL; }

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

    // =========================================================================
    // Inspection (not available on hardware)
    // =========================================================================

    Result<Color> readPixel(const NativeBuffer* buffer, int x, int y) const;

    // Row-major copy of the live buffer as the panel shows it
    // (brightness and color inversion applied)
    std::vector<Color> scanOut() const;

    uint64_t frameCount() const;
    size_t bufferCount() const;
    size_t fontCount() const { return _fontCount.load(); }

private:
    struct Frame {
        int width = 0;
        int height = 0;
        std::vector<Color> pixels;
        bool released = false;
    };

    explicit VirtualDriver(const MatrixOptions& options) noexcept;
    Result<void> init() noexcept;

    static Frame* frame(NativeBuffer* buffer) { return reinterpret_cast<Frame*>(buffer); }
    static const Frame* frame(const NativeBuffer* buffer) {
        return reinterpret_cast<const Frame*>(buffer);
    }

    MatrixOptions _options;

    mutable std::mutex _mutex;          // guards _frames, _live, _frameCount
    std::vector<std::unique_ptr<Frame>> _frames;
    Frame* _live = nullptr;
    uint64_t _frameCount = 0;
    std::atomic<size_t> _fontCount{0};
};

} // namespace ledmatrix
