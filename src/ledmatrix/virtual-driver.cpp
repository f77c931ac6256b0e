#include <ledmatrix/virtual-driver.h>
#include "bdf-font.h"
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cstdlib>

namespace ledmatrix {

static BdfFont* bdf(NativeFont* font) { return reinterpret_cast<BdfFont*>(font); }
static const BdfFont* bdf(const NativeFont* font) { return reinterpret_cast<const BdfFont*>(font); }

Result<VirtualDriver::Ptr> VirtualDriver::create(const MatrixOptions& options,
                                                 const RuntimeOptions& runtimeOptions) noexcept {
    (void)runtimeOptions;
    auto driver = Ptr(new VirtualDriver(options));
    if (auto res = driver->init(); !res) {
        return Err<Ptr>("Failed to initialize VirtualDriver", res);
    }
    return Ok(std::move(driver));
}

VirtualDriver::VirtualDriver(const MatrixOptions& options) noexcept
    : _options(options) {}

VirtualDriver::~VirtualDriver() {
    yinfo("VirtualDriver: shutdown after {} frames ({} buffers)", _frameCount, _frames.size());
}

Result<void> VirtualDriver::init() noexcept {
    auto live = createBuffer();
    if (!live) {
        return Err<void>("Failed to allocate live buffer", live);
    }
    _live = frame(*live);
    yinfo("VirtualDriver: {}x{} panel ({} rows x {} cols, chain {}, parallel {})",
          _options.width(), _options.height(), _options.rows(), _options.cols(),
          _options.chainLength(), _options.parallel());
    return Ok();
}

// =============================================================================
// Buffers
// =============================================================================

NativeBuffer* VirtualDriver::liveBuffer() {
    std::lock_guard<std::mutex> lock(_mutex);
    return reinterpret_cast<NativeBuffer*>(_live);
}

Result<NativeBuffer*> VirtualDriver::createBuffer() {
    const int width = _options.width();
    const int height = _options.height();
    if (width <= 0 || height <= 0) {
        return Err<NativeBuffer*>("Invalid panel geometry");
    }

    auto f = std::make_unique<Frame>();
    f->width = width;
    f->height = height;
    f->pixels.assign(static_cast<size_t>(width) * height, COLOR_BLACK);

    std::lock_guard<std::mutex> lock(_mutex);
    _frames.push_back(std::move(f));
    ydebug("VirtualDriver: buffer {} allocated ({} total)",
           static_cast<const void*>(_frames.back().get()), _frames.size());
    return Ok(reinterpret_cast<NativeBuffer*>(_frames.back().get()));
}

void VirtualDriver::releaseBuffer(NativeBuffer* buffer) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = std::find_if(_frames.begin(), _frames.end(),
                           [&](const auto& f) { return f.get() == frame(buffer); });
    if (it == _frames.end()) {
        ywarn("VirtualDriver: release of unknown buffer {}", static_cast<const void*>(buffer));
        return;
    }
    if (it->get() == _live) {
        // Still scanned out; dropped with the session
        (*it)->released = true;
        return;
    }
    _frames.erase(it);
}

NativeBuffer* VirtualDriver::swapOnVSync(NativeBuffer* next) {
    std::lock_guard<std::mutex> lock(_mutex);
    Frame* previous = _live;
    _live = frame(next);
    _live->released = false;
    ++_frameCount;

    // Its owner let go while it was on screen
    if (previous && previous->released) {
        std::erase_if(_frames, [&](const auto& f) { return f.get() == previous; });
    }
    return reinterpret_cast<NativeBuffer*>(previous);
}

void VirtualDriver::bufferSize(const NativeBuffer* buffer, int& width, int& height) const {
    const Frame* f = frame(buffer);
    width = f->width;
    height = f->height;
}

void VirtualDriver::setPixel(NativeBuffer* buffer, int x, int y, const Color& color) {
    Frame* f = frame(buffer);
    if (x < 0 || y < 0 || x >= f->width || y >= f->height) return;
    f->pixels[static_cast<size_t>(y) * f->width + x] = color;
}

void VirtualDriver::clear(NativeBuffer* buffer) {
    fill(buffer, COLOR_BLACK);
}

void VirtualDriver::fill(NativeBuffer* buffer, const Color& color) {
    Frame* f = frame(buffer);
    std::fill(f->pixels.begin(), f->pixels.end(), color);
}

// Bresenham
void VirtualDriver::drawLine(NativeBuffer* buffer, int x0, int y0, int x1, int y1,
                             const Color& color) {
    const int dx = std::abs(x1 - x0);
    const int dy = -std::abs(y1 - y0);
    const int sx = x0 < x1 ? 1 : -1;
    const int sy = y0 < y1 ? 1 : -1;
    int err = dx + dy;

    for (;;) {
        setPixel(buffer, x0, y0, color);
        if (x0 == x1 && y0 == y1) break;
        const int e2 = 2 * err;
        if (e2 >= dy) {
            err += dy;
            x0 += sx;
        }
        if (e2 <= dx) {
            err += dx;
            y0 += sy;
        }
    }
}

// Midpoint circle, eight octants per step
void VirtualDriver::drawCircle(NativeBuffer* buffer, int x0, int y0, int radius,
                               const Color& color) {
    int x = radius;
    int y = 0;
    int radiusError = 1 - x;
    while (y <= x) {
        setPixel(buffer, x + x0, y + y0, color);
        setPixel(buffer, y + x0, x + y0, color);
        setPixel(buffer, -x + x0, y + y0, color);
        setPixel(buffer, -y + x0, x + y0, color);
        setPixel(buffer, -x + x0, -y + y0, color);
        setPixel(buffer, -y + x0, -x + y0, color);
        setPixel(buffer, x + x0, -y + y0, color);
        setPixel(buffer, y + x0, -x + y0, color);
        ++y;
        if (radiusError < 0) {
            radiusError += 2 * y + 1;
        } else {
            --x;
            radiusError += 2 * (y - x + 1);
        }
    }
}

// =============================================================================
// Fonts
// =============================================================================

Result<NativeFont*> VirtualDriver::loadFont(const std::string& bdfPath) {
    auto font = std::make_unique<BdfFont>();
    if (auto res = font->load(bdfPath); !res) {
        return Err<NativeFont*>("Couldn't load font", res);
    }
    ++_fontCount;
    return Ok(reinterpret_cast<NativeFont*>(font.release()));
}

void VirtualDriver::releaseFont(NativeFont* font) {
    if (!font) return;
    delete bdf(font);
    --_fontCount;
}

int VirtualDriver::fontHeight(const NativeFont* font) const {
    return font ? bdf(font)->height() : -1;
}

int VirtualDriver::fontBaseline(const NativeFont* font) const {
    return font ? bdf(font)->baseline() : 0;
}

int VirtualDriver::characterWidth(const NativeFont* font, uint32_t codepoint) const {
    return font ? bdf(font)->characterWidth(codepoint) : -1;
}

int VirtualDriver::drawGlyph(NativeBuffer* buffer, const NativeFont* font, int x, int y,
                             const Color& color, uint32_t codepoint) {
    if (!font) return 0;
    return bdf(font)->drawGlyph(x, y, codepoint,
                                [&](int px, int py) { setPixel(buffer, px, py, color); });
}

// =============================================================================
// Inspection
// =============================================================================

Result<Color> VirtualDriver::readPixel(const NativeBuffer* buffer, int x, int y) const {
    const Frame* f = frame(buffer);
    if (!f) {
        return Err<Color>("readPixel: null buffer");
    }
    if (x < 0 || y < 0 || x >= f->width || y >= f->height) {
        return Err<Color>("readPixel: (" + std::to_string(x) + ", " + std::to_string(y) +
                          ") outside " + std::to_string(f->width) + "x" +
                          std::to_string(f->height));
    }
    return Ok(f->pixels[static_cast<size_t>(y) * f->width + x]);
}

std::vector<Color> VirtualDriver::scanOut() const {
    std::vector<Color> out;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        out = _live->pixels;
    }

    const int brightness = _options.brightness();
    const bool inverse = _options.inverseColors();
    if (brightness == 100 && !inverse) {
        return out;
    }

    auto shade = [&](uint8_t v) -> uint8_t {
        int scaled = v * brightness / 100;
        return static_cast<uint8_t>(inverse ? 255 - scaled : scaled);
    };
    for (auto& c : out) {
        c = Color{shade(c.red), shade(c.green), shade(c.blue)};
    }
    return out;
}

uint64_t VirtualDriver::frameCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _frameCount;
}

size_t VirtualDriver::bufferCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _frames.size();
}

} // namespace ledmatrix
