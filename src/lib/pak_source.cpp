#include "nabunet/pak/pak_source.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

#include <openssl/evp.h>

#include "nabunet/core/logging.h"
#include "nabunet/pak/pak_decryptor.h"

namespace nabunet::pak {

static constexpr const char* TAG = "paksrc";

static constexpr const char* PAK_EXTENSION  = ".pak";
static constexpr const char* NPAK_EXTENSION = ".npak";
static constexpr const char* CLOUD_NAME_SALT = "nabu";
static constexpr const char* CLOUD_USER_AGENT = "NABU";

static std::string join_path(const std::string& dir, const std::string& file)
{
    if (dir.empty() || dir == "/") {
        return "/" + file;
    }
    if (dir.back() == '/') {
        return dir + file;
    }
    return dir + "/" + file;
}

// ---------- directory source ----------

class DirectoryPakSource final : public IPakSource {
public:
    DirectoryPakSource(fs::IFileSystem& fs, std::string dir)
        : _fs(fs), _dir(std::move(dir)) {}

    const char* name() const noexcept override { return "pak directory"; }

    PakResult load(PakId id) override
    {
        const std::string path = join_path(_dir, format_pak_id(id) + PAK_EXTENSION);
        if (!_fs.exists(path)) {
            return PakResult{PakError::UnknownProgram, nullptr};
        }

        std::vector<std::uint8_t> bytes;
        if (!fs::read_file(_fs, path, bytes)) {
            NN_LOGE(TAG, "failed to read %s from '%s'", path.c_str(), _fs.name().c_str());
            return PakResult{PakError::StorageReadError, nullptr};
        }

        NN_LOGI(TAG, "reading segments from %s: %zu bytes", path.c_str(), bytes.size());
        return parse_pak(id, bytes);
    }

private:
    fs::IFileSystem& _fs;
    std::string _dir;
};

// ---------- raw image source ----------

class RawImagePakSource final : public IPakSource {
public:
    RawImagePakSource(fs::IFileSystem& fs, std::string path, PakId boundId, SegmentOptions opts)
        : _fs(fs), _path(std::move(path)), _boundId(boundId), _opts(opts) {}

    const char* name() const noexcept override { return "raw image"; }

    PakResult load(PakId id) override
    {
        if (id != _boundId) {
            return PakResult{PakError::UnknownProgram, nullptr};
        }

        std::vector<std::uint8_t> bytes;
        if (!fs::read_file(_fs, _path, bytes)) {
            NN_LOGE(TAG, "failed to read raw image %s from '%s'",
                    _path.c_str(), _fs.name().c_str());
            return PakResult{PakError::StorageReadError, nullptr};
        }

        NN_LOGI(TAG, "segmenting raw image %s (%zu bytes) as pak %s",
                _path.c_str(), bytes.size(), format_pak_id(id).c_str());
        return segment_raw_image(id, bytes, _opts);
    }

private:
    fs::IFileSystem& _fs;
    std::string _path;
    PakId _boundId;
    SegmentOptions _opts;
};

// ---------- cloud source ----------

class CloudPakSource final : public IPakSource {
public:
    CloudPakSource(net::IHttpClient& http, std::string baseUrl)
        : _http(http), _baseUrl(std::move(baseUrl))
    {
        if (!_baseUrl.empty() && _baseUrl.back() != '/') {
            _baseUrl.push_back('/');
        }
    }

    const char* name() const noexcept override { return "cloud"; }

    PakResult load(PakId id) override
    {
        net::HttpRequest req;
        req.url = _baseUrl + cloud_pak_file_name(id);
        req.headers.emplace_back("User-Agent", CLOUD_USER_AGENT);

        NN_LOGI(TAG, "fetching pak %s from %s", format_pak_id(id).c_str(), req.url.c_str());
        net::HttpResponse resp = _http.get(req);

        if (!resp.transport_ok()) {
            NN_LOGE(TAG, "pak %s: %s: %s", format_pak_id(id).c_str(),
                    to_string(PakError::NetworkError),
                    resp.error.empty() ? "no response" : resp.error.c_str());
            return PakResult{PakError::NetworkError, nullptr};
        }
        if (resp.status == 404) {
            NN_LOGW(TAG, "pak %s not found in cloud", format_pak_id(id).c_str());
            return PakResult{PakError::UnknownProgram, nullptr};
        }
        if (resp.status != 200) {
            NN_LOGE(TAG, "pak %s: %s: HTTP %u", format_pak_id(id).c_str(),
                    to_string(PakError::NetworkError), static_cast<unsigned>(resp.status));
            return PakResult{PakError::NetworkError, nullptr};
        }

        DecryptResult dec = decrypt_pak(resp.body);
        // The encrypted blob is not kept past this point.
        resp.body.clear();
        resp.body.shrink_to_fit();
        if (!dec.ok()) {
            return PakResult{dec.error, nullptr};
        }

        return parse_pak(id, dec.plaintext);
    }

private:
    net::IHttpClient& _http;
    std::string _baseUrl;
};

// ---------- factories & helpers ----------

std::unique_ptr<IPakSource> make_directory_pak_source(fs::IFileSystem& fs, std::string dir)
{
    return std::make_unique<DirectoryPakSource>(fs, std::move(dir));
}

std::unique_ptr<IPakSource> make_raw_image_source(fs::IFileSystem& fs,
                                                  std::string path,
                                                  PakId boundId,
                                                  SegmentOptions opts)
{
    return std::make_unique<RawImagePakSource>(fs, std::move(path), boundId, opts);
}

std::unique_ptr<IPakSource> make_cloud_pak_source(net::IHttpClient& http, std::string baseUrl)
{
    return std::make_unique<CloudPakSource>(http, std::move(baseUrl));
}

std::string cloud_pak_file_name(PakId id)
{
    const std::string seed = format_pak_id(id) + CLOUD_NAME_SALT;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_Digest(seed.data(), seed.size(), digest, &digestLen, EVP_md5(), nullptr) != 1) {
        NN_LOGE(TAG, "MD5 digest failed for pak %s", format_pak_id(id).c_str());
        return {};
    }

    std::string out;
    out.reserve(digestLen * 3 + 5);
    char hex[3];
    for (unsigned int i = 0; i < digestLen; ++i) {
        if (i) out.push_back('-');
        std::snprintf(hex, sizeof(hex), "%02X", digest[i]);
        out.append(hex, 2);
    }
    out.append(NPAK_EXTENSION);
    return out;
}

std::vector<PakId> list_pak_ids(fs::IFileSystem& fs, const std::string& dir)
{
    std::vector<PakId> ids;
    std::vector<fs::FileInfo> entries;
    if (!fs.listDirectory(dir, entries)) {
        NN_LOGW(TAG, "cannot list '%s' on '%s'", dir.c_str(), fs.name().c_str());
        return ids;
    }

    const std::string ext = PAK_EXTENSION;
    for (const auto& e : entries) {
        if (e.isDirectory) continue;

        auto slash = e.path.find_last_of('/');
        std::string base = (slash == std::string::npos) ? e.path : e.path.substr(slash + 1);
        if (base.size() != 6 + ext.size()) continue;

        std::string tail = base.substr(6);
        std::transform(tail.begin(), tail.end(), tail.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (tail != ext) continue;

        PakId id = 0;
        if (parse_pak_id(std::string_view(base).substr(0, 6), id)) {
            ids.push_back(id);
        }
    }

    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace nabunet::pak
