#include "tinyftp/crypto.hpp"

#include <array>
#include <mutex>
#include <stdexcept>

namespace tinyftp::crypto
{

    namespace
    {

        void init_sodium()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                if (sodium_init() < 0)
                {
                    throw std::runtime_error("libsodium could not be initialised");
                } });
        }

    } // namespace

    TransferDigest::TransferDigest()
    {
        init_sodium();
        if (crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("Could not start transfer digest");
        }
    }

    void TransferDigest::update(std::string_view chunk)
    {
        if (finished_)
        {
            throw std::logic_error("Transfer digest already finished");
        }
        if (chunk.empty())
        {
            return;
        }
        if (crypto_generichash_update(&state_, reinterpret_cast<const unsigned char *>(chunk.data()),
                                      chunk.size()) != 0)
        {
            throw std::runtime_error("Could not update transfer digest");
        }
        bytes_ += chunk.size();
    }

    std::string TransferDigest::finish()
    {
        if (finished_)
        {
            throw std::logic_error("Transfer digest already finished");
        }
        std::array<unsigned char, crypto_generichash_BYTES> digest{};
        if (crypto_generichash_final(&state_, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("Could not finish transfer digest");
        }
        finished_ = true;

        std::array<char, crypto_generichash_BYTES * 2 + 1> hex{};
        sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
        return std::string(hex.data(), digest.size() * 2);
    }

} // namespace tinyftp::crypto
