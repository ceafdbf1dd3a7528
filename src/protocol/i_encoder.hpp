/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __JTP_I_ENCODER_HPP_INCLUDED__
#define __JTP_I_ENCODER_HPP_INCLUDED__

#include <stddef.h>

#include "utils/macros.hpp"

namespace jtp
{
//  Interface to be implemented by fragment producers.

struct i_encoder
{
    virtual ~i_encoder () JTP_DEFAULT;

    //  The function returns the next fragment of the message. The fragment
    //  is written to a supplied buffer. If no buffer is supplied (data_
    //  is NULL) encoder will provide buffer of its own.
    //  Function returns 0 when the message is exhausted.
    virtual size_t encode (unsigned char **data_, size_t size_) = 0;

    //  Size of the fragment the next encode call will produce.
    virtual size_t next_size () const = 0;
};
}

#endif
