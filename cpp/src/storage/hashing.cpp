#include "restor/storage/hashing.hpp"

#include <cstddef>

#include <blake3.h>

namespace restor::storage {
    restor::core::Status hash_compute(BufferView data, restor::core::Hash256* out) noexcept {
        if (out == nullptr){
            return restor::core::make_status(restor::core::StatusDomain::Storage, restor::core::StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr){
            return restor::core::make_status(restor::core::StatusDomain::Storage, restor::core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0){
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return restor::core::ok_status();
    }

    void hash_to_hex(const restor::core::Hash256& h, char* out, std::size_t out_size) noexcept {
        static const char hex[] = "0123456789abcdef";
        if (out == nullptr || out_size == 0) {
            return;
        }
        std::size_t pos = 0;
        for (std::size_t i = 0; i < h.b.size() && pos + 2 < out_size; ++i) {
            out[pos++] = hex[(h.b[i] >> 4) & 0xF];
            out[pos++] = hex[h.b[i] & 0xF];
        }
        out[pos] = '\0';
    }
} // namespace restor::storage
