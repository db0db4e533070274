#pragma once

namespace restor::core {
    // Diagnostics go to stderr as "<level>: <message>" lines.
    // Debug lines are emitted only when RESTOR_DEBUG is set to something other than "" or "0".

    [[nodiscard]] bool debug_enabled() noexcept;

    __attribute__((format(printf, 1, 2))) void log_error(const char* fmt, ...) noexcept;
    __attribute__((format(printf, 1, 2))) void log_info(const char* fmt, ...) noexcept;
    __attribute__((format(printf, 1, 2))) void log_debug(const char* fmt, ...) noexcept;
} // namespace restor::core
