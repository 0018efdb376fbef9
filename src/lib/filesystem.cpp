#include "nabunet/fs/filesystem.h"
#include "nabunet/core/logging.h"

namespace nabunet::fs {

static constexpr const char* TAG = "fs";

bool read_file(IFileSystem& fs, const std::string& path, std::vector<std::uint8_t>& out)
{
    FileInfo info{};
    if (!fs.stat(path, info) || info.isDirectory) {
        return false;
    }

    auto file = fs.open(path, "rb");
    if (!file) {
        return false;
    }

    out.assign(static_cast<std::size_t>(info.sizeBytes), 0);
    std::size_t got = 0;
    while (got < out.size()) {
        const std::size_t n = file->read(out.data() + got, out.size() - got);
        if (n == 0) {
            break;
        }
        got += n;
    }

    if (got != out.size()) {
        NN_LOGW(TAG, "short read on '%s' (%s): %zu of %zu bytes",
                path.c_str(), fs.name().c_str(), got, out.size());
        out.clear();
        return false;
    }
    return true;
}

} // namespace nabunet::fs
