#pragma once

#include <cstdint>
#include <vector>

#include "nabunet/pak/pak_types.h"

namespace nabunet::pak {

// Single-DES CBC key material.
struct DesKeyMaterial {
    std::uint8_t key[8];
    std::uint8_t iv[8];
};

// Key and IV used by the cloud archive for .npak files.
inline constexpr DesKeyMaterial CLOUD_KEY_MATERIAL{
    {0x6E, 0x58, 0x61, 0x32, 0x62, 0x79, 0x75, 0x7A},
    {0x0C, 0x15, 0x2B, 0x11, 0x39, 0x23, 0x43, 0x1B},
};

struct DecryptResult {
    PakError error{PakError::None};
    std::vector<std::uint8_t> plaintext;

    bool ok() const noexcept { return error == PakError::None; }
};

// Decrypt an encrypted pak blob (DES-CBC, PKCS#7 padding).
// DecryptError when the blob is empty or not block aligned, the padding is
// invalid, or the plaintext does not start with a plausible segment record.
DecryptResult decrypt_pak(const std::vector<std::uint8_t>& blob,
                          const DesKeyMaterial& km = CLOUD_KEY_MATERIAL);

} // namespace nabunet::pak
