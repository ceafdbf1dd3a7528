/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __JTP_MACROS_HPP_INCLUDED__
#define __JTP_MACROS_HPP_INCLUDED__

/******************************************************************************/
/*  JTP Internal Use                                                          */
/******************************************************************************/

#define LIBJTP_UNUSED(object) (void) object

/******************************************************************************/

#if !defined JTP_HAVE_NOEXCEPT && __cplusplus >= 201103L
#define JTP_HAVE_NOEXCEPT
#endif

#if !defined JTP_OVERRIDE
#if defined JTP_HAVE_NOEXCEPT
#define JTP_OVERRIDE override
#else
#define JTP_OVERRIDE
#endif
#endif

#if !defined JTP_FINAL
#if defined JTP_HAVE_NOEXCEPT
#define JTP_FINAL final
#else
#define JTP_FINAL
#endif
#endif

#if !defined JTP_DEFAULT
#if defined JTP_HAVE_NOEXCEPT
#define JTP_DEFAULT = default;
#else
#define JTP_DEFAULT                                                            \
    {                                                                          \
    }
#endif
#endif

#if !defined JTP_NON_COPYABLE_NOR_MOVABLE
#if defined JTP_HAVE_NOEXCEPT
#define JTP_NON_COPYABLE_NOR_MOVABLE(classname)                                \
  public:                                                                      \
    classname (const classname &) = delete;                                    \
    classname &operator= (const classname &) = delete;                         \
    classname (classname &&) = delete;                                         \
    classname &operator= (classname &&) = delete;
#else
#define JTP_NON_COPYABLE_NOR_MOVABLE(classname)                                \
  private:                                                                     \
    classname (const classname &);                                             \
    classname &operator= (const classname &);
#endif
#endif

#endif
