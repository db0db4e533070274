#include "restor/restore/zero_block.hpp"

#include <array>

#include "restor/core/log.hpp"
#include "restor/restore/platform.hpp"
#include "restor/storage/hashing.hpp"

namespace restor::restore {
    namespace {
        const std::array<restor::core::u8, kZeroBlockSize> kZeros{};

        ZeroBlock make_zero_block() noexcept {
            ZeroBlock z{};
            z.data = kZeros.data();
            z.size = kZeroBlockSize;
            if (sparse_files_supported()) {
                const restor::core::Status s = restor::storage::hash_compute(z.view(), &z.id);
                if (!restor::core::is_ok(s)) {
                    // Leaves the null id in place, which disables sparse writes.
                    restor::core::log_error("zero block: hashing failed (code=%s)",
                        restor::core::status_code_name(s.code));
                    z.id = restor::core::Hash256{};
                }
            }
            return z;
        }
    } // namespace

    const ZeroBlock& zero_block() noexcept {
        static const ZeroBlock z = make_zero_block();
        return z;
    }

    bool is_zero_block_id(const restor::core::Hash256& id) noexcept {
        const ZeroBlock& z = zero_block();
        if (restor::storage::hash_is_zero(z.id)) {
            return false;
        }
        return id == z.id;
    }
} // namespace restor::restore
