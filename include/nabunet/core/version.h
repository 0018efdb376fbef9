#pragma once

namespace nabunet {

const char* version();

} // namespace nabunet
