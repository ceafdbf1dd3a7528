/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/err.hpp"
#include "utils/macros.hpp"

const char *jtp::errno_to_string (int errno_)
{
    return strerror (errno_);
}

void jtp::jtp_abort (const char *errmsg_)
{
    LIBJTP_UNUSED (errmsg_);
    abort ();
}
