#pragma once

#include <memory>
#include <string>
#include "nabunet/fs/filesystem.h"

namespace nabunet::fs {

// stdio-backed filesystem rooted at `rootDir` on the host.
std::unique_ptr<IFileSystem>
create_stdio_filesystem(const std::string& rootDir,
                        const std::string& name);

} // namespace nabunet::fs
