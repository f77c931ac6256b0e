#include <ledmatrix/font.h>
#include <ytrace/ytrace.hpp>
#include <system_error>

namespace ledmatrix {

Result<Font::Ptr> Font::create(Driver::Ptr driver, const std::filesystem::path& path) noexcept {
    if (!driver) {
        return Err<Ptr>("Font::create: no driver session");
    }
    auto font = Ptr(new Font(std::move(driver), path));
    if (auto res = font->init(); !res) {
        return Err<Ptr>("Failed to load font " + path.string(), res);
    }
    return Ok(std::move(font));
}

Font::Font(Driver::Ptr driver, std::filesystem::path path) noexcept
    : _driver(std::move(driver)), _path(std::move(path)) {}

Font::~Font() {
    if (_native) {
        _driver->releaseFont(_native);
        ydebug("Font: released {}", _path.string());
    }
}

Result<void> Font::init() noexcept {
    const std::string pathStr = _path.string();

    // The native loader takes a C string
    if (pathStr.find('\0') != std::string::npos) {
        return Err<void>("Font path contains an embedded NUL byte");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(_path, ec)) {
        return Err<void>("Font file not found: " + pathStr);
    }

    auto native = _driver->loadFont(pathStr);
    if (!native) {
        ywarn("Font: driver '{}' rejected {}: {}", _driver->name(), pathStr, error_msg(native));
        return Err<void>("Driver rejected font file", native);
    }
    _native = *native;

    yinfo("Font: loaded {} (height={} baseline={})", pathStr,
          _driver->fontHeight(_native), _driver->fontBaseline(_native));
    return Ok();
}

Result<int> Font::height() const {
    const int h = _driver->fontHeight(_native);
    if (h < 0) {
        return Err<int>("Font " + _path.string() + " is not loaded");
    }
    return Ok(h);
}

int Font::baseline() const {
    return _driver->fontBaseline(_native);
}

int Font::characterWidth(uint32_t codepoint) const {
    return _driver->characterWidth(_native, codepoint);
}

} // namespace ledmatrix
