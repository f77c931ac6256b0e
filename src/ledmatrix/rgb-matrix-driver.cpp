#include "rgb-matrix-driver.h"
#include <ytrace/ytrace.hpp>
#include <led-matrix.h>
#include <graphics.h>
#include <algorithm>

namespace ledmatrix {

static rgb_matrix::FrameCanvas* canvas(NativeBuffer* buffer) {
    return reinterpret_cast<rgb_matrix::FrameCanvas*>(buffer);
}
static const rgb_matrix::FrameCanvas* canvas(const NativeBuffer* buffer) {
    return reinterpret_cast<const rgb_matrix::FrameCanvas*>(buffer);
}
static NativeBuffer* native(rgb_matrix::FrameCanvas* canvas) {
    return reinterpret_cast<NativeBuffer*>(canvas);
}
static const rgb_matrix::Font* rgbFont(const NativeFont* font) {
    return reinterpret_cast<const rgb_matrix::Font*>(font);
}
static rgb_matrix::Color rgbColor(const Color& c) {
    return rgb_matrix::Color(c.red, c.green, c.blue);
}
static const char* orNull(const std::string& s) {
    return s.empty() ? nullptr : s.c_str();
}

Result<Driver::Ptr> RgbMatrixDriver::create(const MatrixOptions& options,
                                            const RuntimeOptions& runtimeOptions) noexcept {
    auto driver = std::shared_ptr<RgbMatrixDriver>(new RgbMatrixDriver(options, runtimeOptions));
    if (auto res = driver->init(); !res) {
        return Err<Driver::Ptr>("Failed to initialize RgbMatrixDriver", res);
    }
    return Ok(Driver::Ptr(std::move(driver)));
}

RgbMatrixDriver::RgbMatrixDriver(const MatrixOptions& options,
                                 const RuntimeOptions& runtimeOptions) noexcept
    : _options(options), _runtimeOptions(runtimeOptions) {}

RgbMatrixDriver::~RgbMatrixDriver() {
    if (_matrix) {
        // Stops the refresh thread and frees every FrameCanvas
        delete _matrix;
        yinfo("RgbMatrixDriver: panel shut down");
    }
}

Result<void> RgbMatrixDriver::init() noexcept {
    rgb_matrix::RGBMatrix::Options o;
    o.hardware_mapping = _options.hardwareMapping().c_str();
    o.rows = _options.rows();
    o.cols = _options.cols();
    o.chain_length = _options.chainLength();
    o.parallel = _options.parallel();
    o.pwm_bits = _options.pwmBits();
    o.pwm_lsb_nanoseconds = _options.pwmLsbNanoseconds();
    o.pwm_dither_bits = _options.pwmDitherBits();
    o.brightness = _options.brightness();
    o.scan_mode = _options.scanMode();
    o.row_address_type = _options.rowAddressType();
    o.multiplexing = _options.multiplexing();
    o.disable_hardware_pulsing = !_options.hardwarePulsing();
    o.show_refresh_rate = _options.showRefreshRate();
    o.inverse_colors = _options.inverseColors();
    o.led_rgb_sequence = _options.ledRgbSequence().c_str();
    o.pixel_mapper_config = orNull(_options.pixelMapperConfig());
    o.panel_type = orNull(_options.panelType());
    o.limit_refresh_rate_hz = _options.limitRefreshRateHz();

    std::string validationError;
    if (!o.Validate(&validationError)) {
        return Err<void>("Rejected matrix options: " + validationError);
    }

    rgb_matrix::RuntimeOptions rt;
    rt.gpio_slowdown = _runtimeOptions.gpioSlowdown();
    rt.daemon = _runtimeOptions.daemon() ? 1 : 0;
    rt.drop_privileges = _runtimeOptions.dropPrivileges() ? 1 : 0;
    rt.do_gpio_init = _runtimeOptions.doGpioInit();

    _matrix = rgb_matrix::RGBMatrix::CreateFromOptions(o, rt);
    if (!_matrix) {
        return Err<void>("RGBMatrix::CreateFromOptions failed (GPIO access or mapping '" +
                         _options.hardwareMapping() + "')");
    }

    // Make the live frame one we hold a pointer to; the library's initial
    // frame becomes the first pooled buffer.
    _live = _matrix->CreateFrameCanvas();
    if (!_live) {
        return Err<void>("Failed to allocate live frame");
    }
    if (auto* initial = _matrix->SwapOnVSync(_live)) {
        _pool.push_back(initial);
    }

    yinfo("RgbMatrixDriver: {}x{} panel, mapping '{}', brightness {}%",
          _live->width(), _live->height(), _options.hardwareMapping(), _options.brightness());
    return Ok();
}

// =============================================================================
// Buffers
// =============================================================================

NativeBuffer* RgbMatrixDriver::liveBuffer() {
    std::lock_guard<std::mutex> lock(_mutex);
    return native(_live);
}

Result<NativeBuffer*> RgbMatrixDriver::createBuffer() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_pool.empty()) {
        auto* frame = _pool.back();
        _pool.pop_back();
        return Ok(native(frame));
    }
    auto* frame = _matrix->CreateFrameCanvas();
    if (!frame) {
        return Err<NativeBuffer*>("CreateFrameCanvas failed");
    }
    ydebug("RgbMatrixDriver: frame {} allocated", static_cast<const void*>(frame));
    return Ok(native(frame));
}

void RgbMatrixDriver::releaseBuffer(NativeBuffer* buffer) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto* frame = canvas(buffer);
    if (frame == _live) {
        // Still scanned out; pooled once it is swapped out
        _liveReleased = true;
        return;
    }
    if (std::find(_pool.begin(), _pool.end(), frame) == _pool.end()) {
        _pool.push_back(frame);
    }
}

NativeBuffer* RgbMatrixDriver::swapOnVSync(NativeBuffer* next) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto* previous = _matrix->SwapOnVSync(canvas(next));
    _live = canvas(next);
    if (_liveReleased && previous &&
        std::find(_pool.begin(), _pool.end(), previous) == _pool.end()) {
        _pool.push_back(previous);
    }
    _liveReleased = false;
    return native(previous);
}

void RgbMatrixDriver::bufferSize(const NativeBuffer* buffer, int& width, int& height) const {
    width = canvas(buffer)->width();
    height = canvas(buffer)->height();
}

void RgbMatrixDriver::setPixel(NativeBuffer* buffer, int x, int y, const Color& color) {
    canvas(buffer)->SetPixel(x, y, color.red, color.green, color.blue);
}

void RgbMatrixDriver::clear(NativeBuffer* buffer) {
    canvas(buffer)->Clear();
}

void RgbMatrixDriver::fill(NativeBuffer* buffer, const Color& color) {
    canvas(buffer)->Fill(color.red, color.green, color.blue);
}

void RgbMatrixDriver::drawLine(NativeBuffer* buffer, int x0, int y0, int x1, int y1,
                               const Color& color) {
    rgb_matrix::DrawLine(canvas(buffer), x0, y0, x1, y1, rgbColor(color));
}

void RgbMatrixDriver::drawCircle(NativeBuffer* buffer, int x, int y, int radius,
                                 const Color& color) {
    rgb_matrix::DrawCircle(canvas(buffer), x, y, radius, rgbColor(color));
}

// =============================================================================
// Fonts
// =============================================================================

Result<NativeFont*> RgbMatrixDriver::loadFont(const std::string& bdfPath) {
    auto font = std::make_unique<rgb_matrix::Font>();
    if (!font->LoadFont(bdfPath.c_str())) {
        return Err<NativeFont*>("Couldn't load font " + bdfPath);
    }
    return Ok(reinterpret_cast<NativeFont*>(font.release()));
}

void RgbMatrixDriver::releaseFont(NativeFont* font) {
    delete reinterpret_cast<rgb_matrix::Font*>(font);
}

int RgbMatrixDriver::fontHeight(const NativeFont* font) const {
    return font ? rgbFont(font)->height() : -1;
}

int RgbMatrixDriver::fontBaseline(const NativeFont* font) const {
    return font ? rgbFont(font)->baseline() : 0;
}

int RgbMatrixDriver::characterWidth(const NativeFont* font, uint32_t codepoint) const {
    return font ? rgbFont(font)->CharacterWidth(codepoint) : -1;
}

int RgbMatrixDriver::drawGlyph(NativeBuffer* buffer, const NativeFont* font, int x, int y,
                               const Color& color, uint32_t codepoint) {
    if (!font) return 0;
    return rgbFont(font)->DrawGlyph(canvas(buffer), x, y, rgbColor(color), codepoint);
}

} // namespace ledmatrix
