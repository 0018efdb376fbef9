#include "nabunet/core/version.h"

#ifndef NN_VERSION
#error "NN_VERSION must be defined by the build"
#endif

namespace nabunet {

const char* version()
{
    return NN_VERSION;
}

} // namespace nabunet
