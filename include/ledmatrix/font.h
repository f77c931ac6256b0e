#pragma once

#include <ledmatrix/driver.h>
#include <ledmatrix/result.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace ledmatrix {

/**
 * Font - a BDF bitmap font loaded into a driver session.
 *
 * The native font is released exactly once, when the last Ptr goes away.
 * After loading it is read-only, so one Font may be shared by draw calls on
 * several threads.
 */
class Font {
public:
    using Ptr = std::shared_ptr<Font>;

    // Fails on a path with an embedded NUL, a missing file, or a file the
    // driver rejects. No native font exists after a failure.
    static Result<Ptr> create(Driver::Ptr driver, const std::filesystem::path& path) noexcept;

    ~Font();

    Font(const Font&) = delete;
    Font& operator=(const Font&) = delete;

    // Line height in pixels; an unloaded font is an error, not -1
    Result<int> height() const;

    // Pixels from the top of the glyph box to the baseline
    int baseline() const;

    // Device width of the glyph, -1 when the font has none
    int characterWidth(uint32_t codepoint) const;

    const std::filesystem::path& path() const { return _path; }
    const NativeFont* native() const { return _native; }
    const Driver::Ptr& driver() const { return _driver; }

private:
    Font(Driver::Ptr driver, std::filesystem::path path) noexcept;
    Result<void> init() noexcept;

    Driver::Ptr _driver;
    std::filesystem::path _path;
    NativeFont* _native = nullptr;
};

} // namespace ledmatrix
