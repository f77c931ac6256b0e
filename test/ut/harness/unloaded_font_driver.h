#pragma once

//=============================================================================
// UnloadedFontDriver
//
// Virtual panel whose fonts load but then report the driver's "not loaded"
// height of -1, so the sentinel paths of Font and Canvas can be reached.
//=============================================================================

#include <ledmatrix/driver.h>
#include <ledmatrix/virtual-driver.h>
#include <cstdint>
#include <string>
#include <utility>

namespace ledmatrix::test {

class UnloadedFontDriver : public Driver {
public:
    explicit UnloadedFontDriver(VirtualDriver::Ptr panel) : _panel(std::move(panel)) {}

    const char* name() const override { return "unloaded-font"; }

    NativeBuffer* liveBuffer() override { return _panel->liveBuffer(); }
    Result<NativeBuffer*> createBuffer() override { return _panel->createBuffer(); }
    void releaseBuffer(NativeBuffer* buffer) override { _panel->releaseBuffer(buffer); }
    NativeBuffer* swapOnVSync(NativeBuffer* next) override { return _panel->swapOnVSync(next); }

    void bufferSize(const NativeBuffer* buffer, int& width, int& height) const override {
        _panel->bufferSize(buffer, width, height);
    }
    void setPixel(NativeBuffer* buffer, int x, int y, const Color& color) override {
        _panel->setPixel(buffer, x, y, color);
    }
    void clear(NativeBuffer* buffer) override { _panel->clear(buffer); }
    void fill(NativeBuffer* buffer, const Color& color) override { _panel->fill(buffer, color); }
    void drawLine(NativeBuffer* buffer, int x0, int y0, int x1, int y1,
                  const Color& color) override {
        _panel->drawLine(buffer, x0, y0, x1, y1, color);
    }
    void drawCircle(NativeBuffer* buffer, int x, int y, int radius, const Color& color) override {
        _panel->drawCircle(buffer, x, y, radius, color);
    }

    Result<NativeFont*> loadFont(const std::string& bdfPath) override {
        return _panel->loadFont(bdfPath);
    }
    void releaseFont(NativeFont* font) override { _panel->releaseFont(font); }

    int fontHeight(const NativeFont*) const override { return -1; }

    int fontBaseline(const NativeFont* font) const override { return _panel->fontBaseline(font); }
    int characterWidth(const NativeFont* font, uint32_t codepoint) const override {
        return _panel->characterWidth(font, codepoint);
    }
    int drawGlyph(NativeBuffer* buffer, const NativeFont* font, int x, int y, const Color& color,
                  uint32_t codepoint) override {
        return _panel->drawGlyph(buffer, font, x, y, color, codepoint);
    }

    VirtualDriver& panel() { return *_panel; }

private:
    VirtualDriver::Ptr _panel;
};

} // namespace ledmatrix::test
