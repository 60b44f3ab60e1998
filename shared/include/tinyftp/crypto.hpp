/**
 * TinyFTP - Running BLAKE2b digest of transferred content, built on libsodium.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <sodium.h>

namespace tinyftp::crypto
{

    /**
     * Accumulates the chunks of one transfer in the order they cross the
     * connection. finish() yields the lowercase hex digest; the object must
     * not be updated afterwards.
     */
    class TransferDigest
    {
    public:
        TransferDigest();

        void update(std::string_view chunk);
        std::string finish();

        std::size_t bytes() const noexcept
        {
            return bytes_;
        }

    private:
        crypto_generichash_state state_{};
        std::size_t bytes_{0};
        bool finished_{false};
    };

} // namespace tinyftp::crypto
