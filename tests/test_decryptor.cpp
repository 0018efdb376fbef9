#include "doctest.h"

#include "pak_test_helpers.h"

#include "nabunet/pak/pak_decryptor.h"
#include "nabunet/pak/pak_format.h"

#include <cstdint>
#include <vector>

using namespace nabunet::pak;
using nabunet::tests::PAK7_CIPHER;
using nabunet::tests::PAK7_PLAIN;
using nabunet::tests::bytes_of;

TEST_CASE("decrypt_pak: known ciphertext yields the packaged plaintext")
{
    DecryptResult r = decrypt_pak(PAK7_CIPHER);
    REQUIRE(r.ok());
    CHECK(r.plaintext == PAK7_PLAIN);

    PakResult parsed = parse_pak(7, r.plaintext);
    REQUIRE(parsed.ok());
    CHECK(parsed.image->assemble() == bytes_of("HELLO NABU"));
}

TEST_CASE("decrypt_pak: is a pure function of its input")
{
    DecryptResult a = decrypt_pak(PAK7_CIPHER);
    DecryptResult b = decrypt_pak(PAK7_CIPHER);
    REQUIRE(a.ok());
    CHECK(a.plaintext == b.plaintext);
}

TEST_CASE("decrypt_pak: malformed blobs are DecryptError")
{
    SUBCASE("empty") {
        CHECK(decrypt_pak({}).error == PakError::DecryptError);
    }
    SUBCASE("not block aligned") {
        std::vector<std::uint8_t> blob(PAK7_CIPHER.begin(), PAK7_CIPHER.end() - 1);
        CHECK(decrypt_pak(blob).error == PakError::DecryptError);
    }
    SUBCASE("truncated by a whole block") {
        std::vector<std::uint8_t> blob(PAK7_CIPHER.begin(), PAK7_CIPHER.end() - 8);
        CHECK(decrypt_pak(blob).error == PakError::DecryptError);
    }
    SUBCASE("all zero") {
        CHECK(decrypt_pak(std::vector<std::uint8_t>(16, 0x00)).error == PakError::DecryptError);
    }
    SUBCASE("valid padding but not a pak") {
        // "NABU PAK TEST" encrypted with the cloud key
        const std::vector<std::uint8_t> blob = {
            0xb1, 0xf8, 0x2d, 0x15, 0x69, 0xb9, 0x94, 0x72,
            0x63, 0x72, 0x50, 0x6e, 0x7d, 0x52, 0x8f, 0x3b,
        };
        DecryptResult r = decrypt_pak(blob);
        CHECK(r.error == PakError::DecryptError);
        CHECK(r.plaintext.empty());
    }
}

TEST_CASE("decrypt_pak: a different key does not decrypt cloud paks")
{
    DesKeyMaterial other = CLOUD_KEY_MATERIAL;
    other.key[0] ^= 0x02;
    DecryptResult r = decrypt_pak(PAK7_CIPHER, other);
    CHECK_FALSE(r.ok());
}
