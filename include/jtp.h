/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __JTP_H_INCLUDED__
#define __JTP_H_INCLUDED__

/*  Version macros for compile-time API version detection                     */
#define JTP_VERSION_MAJOR 1
#define JTP_VERSION_MINOR 0
#define JTP_VERSION_PATCH 0

#define JTP_MAKE_VERSION(major, minor, patch)                                  \
    ((major) *10000 + (minor) *100 + (patch))
#define JTP_VERSION                                                            \
    JTP_MAKE_VERSION (JTP_VERSION_MAJOR, JTP_VERSION_MINOR, JTP_VERSION_PATCH)

#ifdef __cplusplus
extern "C" {
#endif

#include <errno.h>
#include <stddef.h>
#include <stdint.h>

/*  Handle DSO symbol visibility                                             */
#if defined JTP_NO_EXPORT
#define JTP_EXPORT
#else
#if defined _WIN32
#if defined JTP_STATIC
#define JTP_EXPORT
#elif defined DLL_EXPORT
#define JTP_EXPORT __declspec(dllexport)
#else
#define JTP_EXPORT __declspec(dllimport)
#endif
#else
#if (defined __GNUC__ && __GNUC__ >= 4) || defined __INTEL_COMPILER
#define JTP_EXPORT __attribute__ ((visibility ("default")))
#else
#define JTP_EXPORT
#endif
#endif
#endif

/******************************************************************************/
/*  JTP errors.                                                               */
/******************************************************************************/
#define JTP_HAUSNUMERO 156484712

#ifndef EPROTO
#define EPROTO (JTP_HAUSNUMERO + 1)
#endif
#ifndef EMSGSIZE
#define EMSGSIZE (JTP_HAUSNUMERO + 2)
#endif
#ifndef ENOBUFS
#define ENOBUFS (JTP_HAUSNUMERO + 3)
#endif

JTP_EXPORT int jtp_errno (void);
JTP_EXPORT const char *jtp_strerror (int errnum_);
JTP_EXPORT void jtp_version (int *major_, int *minor_, int *patch_);

/******************************************************************************/
/*  Wire protocol constants.                                                  */
/******************************************************************************/
#define JTP_MAGIC 0x4A
#define JTP_PROTOCOL_VERSION 0
#define JTP_HEADER_SIZE 12
#define JTP_MAX_MESSAGE_TYPES 64
#define JTP_MAX_FRAGMENT_COUNT 0xFFFF
#define JTP_MAX_PAYLOAD_DFLT 1200

/*  Protocol error taxonomy. Codes 1, 4 and 5 are never reported; they      */
/*  name the silent rejections.                                              */
#define JTP_ERR_NOT_PROTOCOL 1
#define JTP_ERR_PACKET_TOO_SHORT 2
#define JTP_ERR_UNSUPPORTED_VERSION 3
#define JTP_ERR_WRONG_SOURCE 4
#define JTP_ERR_FILTERED_TYPE 5
#define JTP_ERR_INVALID_FRAGMENT 6
#define JTP_ERR_DUPLICATE_FRAGMENT 7
#define JTP_ERR_FRAGMENT_COUNT_EXCEEDED 8
#define JTP_ERR_REASSEMBLY_FAILED 9
#define JTP_ERR_INVALID_MESSAGE_TYPE 10
#define JTP_ERR_INVALID_INPUT_TYPE 11
#define JTP_ERR_MESSAGE_TOO_LARGE 12
#define JTP_ERR_MESSAGE_ID_MISMATCH 13

JTP_EXPORT const char *jtp_error_reason (int code_);

/******************************************************************************/
/*  Encoder / decoder options.                                                */
/******************************************************************************/
#define JTP_SOURCE_ID 1
#define JTP_MAX_PAYLOAD 2
#define JTP_ACCEPT_TYPE 3
#define JTP_MAX_MESSAGE_SIZE 4
#define JTP_DEFER_FRAGMENTS 5
#define JTP_DEFER_BYTES 6
#define JTP_YIELD_INTERVAL 7

/******************************************************************************/
/*  Encoder.                                                                  */
/******************************************************************************/
JTP_EXPORT void *jtp_encoder_new (uint32_t source_id_);
JTP_EXPORT int jtp_encoder_close (void *encoder_);
JTP_EXPORT int
jtp_encoder_setopt (void *encoder_, int option_, const void *optval_, size_t optvallen_);
JTP_EXPORT int
jtp_encoder_getopt (void *encoder_, int option_, void *optval_, size_t *optvallen_);

#define JTP_EVENT_FRAGMENT_PRODUCED 0x0020
#define JTP_EVENT_MESSAGE_ENCODED 0x0040
#define JTP_EVENT_ENCODER_ALL                                                  \
    (JTP_EVENT_FRAGMENT_PRODUCED | JTP_EVENT_MESSAGE_ENCODED)

typedef struct jtp_encoder_event_t
{
    int event;
    int message_type;
    uint16_t message_id;
    uint16_t fragment_index;
    uint16_t fragment_count;
    /*  Payload bytes of the whole message, JTP_EVENT_MESSAGE_ENCODED only.  */
    size_t total_bytes;
    /*  The wire fragment, JTP_EVENT_FRAGMENT_PRODUCED only. Valid for the   */
    /*  duration of the callback.                                            */
    const void *data;
    size_t size;
} jtp_encoder_event_t;

typedef void (jtp_encoder_event_fn) (const jtp_encoder_event_t *event_,
                                     void *hint_);

JTP_EXPORT int jtp_encoder_set_handler (void *encoder_,
                                        jtp_encoder_event_fn *handler_,
                                        int events_,
                                        void *hint_);

/*  Starts fragmenting a payload. The payload must stay valid until          */
/*  jtp_encoder_next has returned 0. Returns the fragment count.             */
JTP_EXPORT int jtp_encoder_fragment (void *encoder_,
                                     const void *data_,
                                     size_t size_,
                                     int message_type_);

/*  Writes the next fragment into buf_ and returns its size, 0 when the     */
/*  current message is exhausted, -1 on error.                               */
JTP_EXPORT int jtp_encoder_next (void *encoder_, void *buf_, size_t size_);

/******************************************************************************/
/*  Decoder.                                                                  */
/******************************************************************************/
#define JTP_EVENT_MESSAGE_START 0x0001
#define JTP_EVENT_FRAGMENT_RECEIVED 0x0002
#define JTP_EVENT_MESSAGE_COMPLETE 0x0004
#define JTP_EVENT_MESSAGE_INCOMPLETE 0x0008
#define JTP_EVENT_ERROR 0x0010
#define JTP_EVENT_ALL                                                          \
    (JTP_EVENT_MESSAGE_START | JTP_EVENT_FRAGMENT_RECEIVED                     \
     | JTP_EVENT_MESSAGE_COMPLETE | JTP_EVENT_MESSAGE_INCOMPLETE               \
     | JTP_EVENT_ERROR)

typedef struct jtp_decoder_event_t
{
    int event;
    int message_type;
    uint16_t message_id;
    uint16_t fragment_index;
    uint16_t fragment_count;
    uint16_t fragments_received;
    size_t total_bytes;
    /*  Reassembled payload, JTP_EVENT_MESSAGE_COMPLETE only. Valid for the  */
    /*  duration of the callback.                                            */
    const void *data;
    size_t size;
    /*  JTP_ERR_* code and reason, JTP_EVENT_ERROR only.                     */
    int error;
    const char *reason;
} jtp_decoder_event_t;

typedef void (jtp_event_fn) (const jtp_decoder_event_t *event_, void *hint_);

JTP_EXPORT void *jtp_decoder_new (uint32_t source_id_);
JTP_EXPORT int jtp_decoder_close (void *decoder_);
JTP_EXPORT int
jtp_decoder_setopt (void *decoder_, int option_, const void *optval_, size_t optvallen_);
JTP_EXPORT int
jtp_decoder_getopt (void *decoder_, int option_, void *optval_, size_t *optvallen_);
JTP_EXPORT int jtp_decoder_set_handler (void *decoder_,
                                        jtp_event_fn *handler_,
                                        int events_,
                                        void *hint_);

/*  Returns 1 when the fragment was processed, 0 when it was ignored.       */
JTP_EXPORT int jtp_decoder_accept (void *decoder_, const void *data_, size_t size_);

/*  Drops the in-flight message of one type, or of every type when          */
/*  message_type_ is -1.                                                     */
JTP_EXPORT int jtp_decoder_reset (void *decoder_, int message_type_);

#ifdef __cplusplus
}
#endif

#endif
