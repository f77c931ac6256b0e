#include <ledmatrix/matrix.h>
#include <ytrace/ytrace.hpp>

namespace ledmatrix {

Result<Matrix::Ptr> Matrix::create(const MatrixOptions& options,
                                   const RuntimeOptions& runtimeOptions) noexcept {
    auto driver = Driver::create(options, runtimeOptions);
    if (!driver) {
        yerror("Matrix::create: {}", error_msg(driver));
        return Err<Ptr>("Failed to open display session", driver);
    }

    return create(*driver, options, runtimeOptions);
}

Result<Matrix::Ptr> Matrix::create(Driver::Ptr driver, const MatrixOptions& options,
                                   const RuntimeOptions& runtimeOptions) noexcept {
    if (!driver) {
        return Err<Ptr>("Matrix::create: no driver");
    }
    auto matrix = Ptr(new Matrix(options, runtimeOptions, std::move(driver)));
    if (auto res = matrix->init(); !res) {
        return Err<Ptr>("Failed to initialize Matrix", res);
    }
    return Ok(std::move(matrix));
}

Matrix::Matrix(const MatrixOptions& options, const RuntimeOptions& runtimeOptions,
               Driver::Ptr driver) noexcept
    : _options(options), _runtimeOptions(runtimeOptions), _driver(std::move(driver)) {}

Matrix::~Matrix() {
    yinfo("Matrix: closing '{}' session after {} swaps", _driver->name(), _swapCount);
}

Result<void> Matrix::init() noexcept {
    NativeBuffer* live = _driver->liveBuffer();
    if (!live) {
        return Err<void>("Driver has no live buffer");
    }
    _live = Canvas(_driver, live);

    const Size size = _live.size();
    yinfo("Matrix: '{}' session open, {}x{}", _driver->name(), size.width, size.height);
    return Ok();
}

Result<Canvas> Matrix::offscreenCanvas() {
    auto buffer = _driver->createBuffer();
    if (!buffer) {
        yerror("Matrix::offscreenCanvas: {}", error_msg(buffer));
        return Err<Canvas>("Failed to allocate off-screen canvas", buffer);
    }
    return Ok(Canvas(_driver, *buffer));
}

Result<Canvas> Matrix::swap(Canvas&& canvas) {
    if (canvas.empty()) {
        ywarn("Matrix::swap: empty canvas");
        return Err<Canvas>("Cannot swap an empty canvas");
    }
    if (canvas.driver() != _driver) {
        ywarn("Matrix::swap: canvas belongs to another session");
        return Err<Canvas>("Canvas belongs to another display session");
    }

    NativeBuffer* live = _driver->liveBuffer();
    if (canvas.native() == live) {
        ywarn("Matrix::swap: canvas is already live");
        if (_live.empty()) {
            _live = std::move(canvas);
        }
        return Err<Canvas>("Canvas is already the live canvas");
    }
    if (!_live.empty() && _live.native() != live) {
        yerror("Matrix::swap: live slot holds {} but {} is on screen",
               static_cast<const void*>(_live.native()), static_cast<const void*>(live));
        return Err<Canvas>("Live canvas was replaced by assignment; move it out of canvas() "
                           "before swapping");
    }

    NativeBuffer* next = canvas.release();
    NativeBuffer* previous = _driver->swapOnVSync(next);

    // Empty when the caller moved the live canvas out and already owns it
    Canvas displaced = std::move(_live);
    _live = Canvas(_driver, next);
    ++_swapCount;

    ydebug("Matrix::swap #{}: {} -> {}", _swapCount, static_cast<const void*>(previous),
           static_cast<const void*>(next));
    return Ok(std::move(displaced));
}

} // namespace ledmatrix
