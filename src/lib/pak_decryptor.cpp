#define OPENSSL_SUPPRESS_DEPRECATED

#include "nabunet/pak/pak_decryptor.h"

#include <cstring>

#include <openssl/des.h>

#include "nabunet/core/logging.h"
#include "nabunet/pak/pak_format.h"

namespace nabunet::pak {

static constexpr const char* TAG = "decrypt";

static constexpr std::size_t DES_BLOCK = 8;

DecryptResult decrypt_pak(const std::vector<std::uint8_t>& blob,
                          const DesKeyMaterial& km)
{
    DecryptResult out;

    if (blob.empty() || (blob.size() % DES_BLOCK) != 0) {
        NN_LOGE(TAG, "ciphertext length %zu is not a positive multiple of %zu",
                blob.size(), DES_BLOCK);
        out.error = PakError::DecryptError;
        return out;
    }

    DES_cblock key;
    DES_cblock iv;
    std::memcpy(key, km.key, sizeof(key));
    std::memcpy(iv, km.iv, sizeof(iv));

    if (DES_is_weak_key(&key)) {
        NN_LOGE(TAG, "refusing weak DES key");
        out.error = PakError::DecryptError;
        return out;
    }

    DES_key_schedule schedule;
    DES_set_key_unchecked(&key, &schedule);

    std::vector<std::uint8_t> plain(blob.size());
    DES_ncbc_encrypt(blob.data(), plain.data(), static_cast<long>(blob.size()),
                     &schedule, &iv, DES_DECRYPT);

    const std::uint8_t pad = plain.back();
    if (pad == 0 || pad > DES_BLOCK) {
        NN_LOGE(TAG, "bad padding length %u", pad);
        out.error = PakError::DecryptError;
        return out;
    }
    for (std::size_t i = plain.size() - pad; i < plain.size(); ++i) {
        if (plain[i] != pad) {
            NN_LOGE(TAG, "bad padding byte %02X at %zu", plain[i], i);
            out.error = PakError::DecryptError;
            return out;
        }
    }
    plain.resize(plain.size() - pad);

    if (!plausible_pak(plain.data(), plain.size())) {
        NN_LOGE(TAG, "decrypted %zu bytes do not look like a pak", plain.size());
        out.error = PakError::DecryptError;
        return out;
    }

    out.plaintext = std::move(plain);
    return out;
}

} // namespace nabunet::pak
