#pragma once

#include <ledmatrix/canvas.h>
#include <ledmatrix/driver.h>
#include <ledmatrix/matrix-options.h>
#include <ledmatrix/result.hpp>
#include <cstdint>
#include <memory>

namespace ledmatrix {

/**
 * Matrix - a display session.
 *
 * Opens the driver named by RuntimeOptions::driver(), owns the live canvas
 * (the buffer being scanned out) and exchanges it for off-screen canvases:
 *
 *   auto offscreen = matrix->offscreenCanvas();
 *   for (;;) {
 *       offscreen->clear();
 *       ... draw ...
 *       offscreen = matrix->swap(std::move(*offscreen));
 *   }
 *
 * swap() is the only point where the application coordinates with the
 * driver's refresh: the refresh shows either the whole old frame or the whole
 * new one.
 */
class Matrix {
public:
    using Ptr = std::shared_ptr<Matrix>;

    // Fails when the driver rejects the configuration; no session is left
    // open in that case
    static Result<Ptr> create(const MatrixOptions& options = MatrixOptions(),
                              const RuntimeOptions& runtimeOptions = RuntimeOptions()) noexcept;

    // Session on a driver that is already open
    static Result<Ptr> create(Driver::Ptr driver, const MatrixOptions& options,
                              const RuntimeOptions& runtimeOptions) noexcept;

    ~Matrix();

    Matrix(const Matrix&) = delete;
    Matrix& operator=(const Matrix&) = delete;

    // Live canvas; drawing shows on the next refresh, without tear protection.
    // Moving out of it is allowed; assigning another canvas into it makes the
    // next swap() fail until that canvas is moved out again.
    Canvas& canvas() { return _live; }

    // New buffer owned by the caller
    Result<Canvas> offscreenCanvas();

    /**
     * Makes `canvas` live on the next vertical sync and returns the canvas
     * that was live before. `canvas` is moved from only on success.
     * Fails on an empty canvas, a canvas of another session, the live canvas
     * itself (which then goes back to the session), or a live slot that was
     * assigned a different canvas.
     * When the caller has moved the live canvas out of canvas(), it already
     * owns the previous buffer and an empty Canvas is returned.
     */
    Result<Canvas> swap(Canvas&& canvas);

    const Driver::Ptr& driver() const { return _driver; }
    const MatrixOptions& options() const { return _options; }
    const RuntimeOptions& runtimeOptions() const { return _runtimeOptions; }
    uint64_t swapCount() const { return _swapCount; }

private:
    Matrix(const MatrixOptions& options, const RuntimeOptions& runtimeOptions,
           Driver::Ptr driver) noexcept;
    Result<void> init() noexcept;

    MatrixOptions _options;
    RuntimeOptions _runtimeOptions;
    Driver::Ptr _driver;
    Canvas _live;
    uint64_t _swapCount = 0;
};

} // namespace ledmatrix
