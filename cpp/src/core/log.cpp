#include "restor/core/log.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace restor::core {
    namespace {
        void vlog(const char* level, const char* fmt, va_list ap) noexcept {
            // One buffered line per call so concurrent writers do not interleave mid-line.
            char line[1024];
            int n = std::snprintf(line, sizeof(line), "%s: ", level);
            if (n < 0) {
                return;
            }
            size_t off = static_cast<size_t>(n);
            if (off < sizeof(line)) {
                std::vsnprintf(line + off, sizeof(line) - off, fmt, ap);
            }
            std::fprintf(stderr, "%s\n", line);
        }
    } // namespace

    bool debug_enabled() noexcept {
        static const bool enabled = [] {
            const char* v = std::getenv("RESTOR_DEBUG");
            return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
        }();
        return enabled;
    }

    void log_error(const char* fmt, ...) noexcept {
        va_list ap;
        va_start(ap, fmt);
        vlog("error", fmt, ap);
        va_end(ap);
    }

    void log_info(const char* fmt, ...) noexcept {
        va_list ap;
        va_start(ap, fmt);
        vlog("info", fmt, ap);
        va_end(ap);
    }

    void log_debug(const char* fmt, ...) noexcept {
        if (!debug_enabled()) {
            return;
        }
        va_list ap;
        va_start(ap, fmt);
        vlog("debug", fmt, ap);
        va_end(ap);
    }
} // namespace restor::core
