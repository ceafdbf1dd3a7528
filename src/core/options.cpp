/* SPDX-License-Identifier: MPL-2.0 */

#include <string.h>
#include <stdlib.h>

#include "core/options.hpp"
#include "protocol/jtp_protocol.hpp"
#include "utils/err.hpp"

static int opt_invalid ()
{
#if defined(JTP_ACT_MILITANT)
    jtp_assert (false);
#endif
    errno = EINVAL;
    return -1;
}

int jtp::do_getopt (void *const optval_,
                    size_t *const optvallen_,
                    const void *value_,
                    const size_t value_len_)
{
    if (*optvallen_ < value_len_) {
        return opt_invalid ();
    }
    memcpy (optval_, value_, value_len_);
    memset (static_cast<char *> (optval_) + value_len_, 0,
            *optvallen_ - value_len_);
    *optvallen_ = value_len_;
    return 0;
}

template <typename T>
static int do_setopt (const void *const optval_,
                      const size_t optvallen_,
                      T *const out_value_)
{
    if (optvallen_ == sizeof (T) && optval_ != NULL) {
        memcpy (out_value_, optval_, sizeof (T));
        return 0;
    }
    return opt_invalid ();
}

size_t jtp::default_max_payload_size ()
{
    const char *env = getenv ("JTP_MAX_PAYLOAD");
    if (!env || *env == '\0')
        return jtp_default_max_payload;

    char *end = NULL;
    const long value = strtol (env, &end, 10);
    if (*end != '\0' || value <= 0
        || static_cast<unsigned long> (value) > max_datagram_payload)
        return jtp_default_max_payload;
    return static_cast<size_t> (value);
}

jtp::options_t::options_t () :
    source_id (0),
    max_payload_size (default_max_payload_size ()),
    filter_types (false),
    max_message_size (-1),
    defer_fragments (100),
    defer_bytes (64 * 1024),
    yield_interval (10)
{
}

bool jtp::options_t::accepts (uint8_t message_type_) const
{
    return !filter_types
           || accepted_types.find (message_type_) != accepted_types.end ();
}

int jtp::options_t::setopt (int option_,
                            const void *optval_,
                            size_t optvallen_)
{
    const bool is_int = (optvallen_ == sizeof (int) && optval_ != NULL);
    int value = 0;
    if (is_int)
        memcpy (&value, optval_, sizeof (int));

    switch (option_) {
        case JTP_SOURCE_ID:
            return do_setopt (optval_, optvallen_, &source_id);

        case JTP_MAX_PAYLOAD:
            if (is_int && value > 0
                && static_cast<size_t> (value) <= max_datagram_payload) {
                max_payload_size = static_cast<size_t> (value);
                return 0;
            }
            break;

        case JTP_ACCEPT_TYPE:
            //  NULL/0 switches the filter off again.
            if (optval_ == NULL && optvallen_ == 0) {
                accepted_types.clear ();
                filter_types = false;
                return 0;
            }
            if (is_int && value >= 0 && value <= jtp_max_message_type) {
                accepted_types.insert (static_cast<uint8_t> (value));
                filter_types = true;
                return 0;
            }
            break;

        case JTP_MAX_MESSAGE_SIZE: {
            int64_t size = 0;
            if (do_setopt (optval_, optvallen_, &size) == 0 && size >= -1) {
                max_message_size = size;
                return 0;
            }
            break;
        }

        case JTP_DEFER_FRAGMENTS:
            if (is_int && value >= 0) {
                defer_fragments = value;
                return 0;
            }
            break;

        case JTP_DEFER_BYTES: {
            int64_t bytes = 0;
            if (do_setopt (optval_, optvallen_, &bytes) == 0 && bytes >= 0) {
                defer_bytes = bytes;
                return 0;
            }
            break;
        }

        case JTP_YIELD_INTERVAL:
            if (is_int && value > 0) {
                yield_interval = value;
                return 0;
            }
            break;

        default:
            break;
    }

    return opt_invalid ();
}

int jtp::options_t::getopt (int option_,
                            void *optval_,
                            size_t *optvallen_) const
{
    if (optval_ == NULL || optvallen_ == NULL)
        return opt_invalid ();

    switch (option_) {
        case JTP_SOURCE_ID:
            return do_getopt (optval_, optvallen_, &source_id,
                              sizeof (source_id));

        case JTP_MAX_PAYLOAD: {
            const int value = static_cast<int> (max_payload_size);
            return do_getopt (optval_, optvallen_, &value, sizeof (value));
        }

        case JTP_MAX_MESSAGE_SIZE:
            return do_getopt (optval_, optvallen_, &max_message_size,
                              sizeof (max_message_size));

        case JTP_DEFER_FRAGMENTS:
            return do_getopt (optval_, optvallen_, &defer_fragments,
                              sizeof (defer_fragments));

        case JTP_DEFER_BYTES:
            return do_getopt (optval_, optvallen_, &defer_bytes,
                              sizeof (defer_bytes));

        case JTP_YIELD_INTERVAL:
            return do_getopt (optval_, optvallen_, &yield_interval,
                              sizeof (yield_interval));

        default:
            break;
    }

    return opt_invalid ();
}
