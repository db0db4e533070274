#pragma once

namespace restor::restore {
    // True when the operating system can extend a file with zeros by truncating it
    // past its end. The filesystem being restored to may still refuse, so writers
    // must always be ready to fall back to a regular write.
    [[nodiscard]] constexpr bool sparse_files_supported() noexcept {
#if defined(_WIN32)
        return false;
#else
        return true;
#endif
    }
} // namespace restor::restore
