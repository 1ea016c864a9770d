/* SPDX-License-Identifier: MPL-2.0 */

#include "../../include/tapewire.h"
#include "utils/err.hpp"

int tapewire_errno (void)
{
    return errno;
}

const char *tapewire_strerror (int errnum_)
{
    return tapewire::errno_to_string (errnum_);
}

void tapewire_version (int *major_, int *minor_, int *patch_)
{
    *major_ = TAPEWIRE_VERSION_MAJOR;
    *minor_ = TAPEWIRE_VERSION_MINOR;
    *patch_ = TAPEWIRE_VERSION_PATCH;
}
