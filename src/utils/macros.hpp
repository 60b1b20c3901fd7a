/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_MACROS_HPP_INCLUDED__
#define __ZSOCK_MACROS_HPP_INCLUDED__

/******************************************************************************/
/*  zsock Internal Use                                                        */
/******************************************************************************/

#define LIBZSOCK_UNUSED(object) (void) object
#define LIBZSOCK_DELETE(p_object)                                              \
    {                                                                          \
        delete p_object;                                                       \
        p_object = 0;                                                          \
    }

/******************************************************************************/

#if !defined ZSOCK_NOEXCEPT
#define ZSOCK_NOEXCEPT noexcept
#endif

#if !defined ZSOCK_OVERRIDE
#define ZSOCK_OVERRIDE override
#endif

#if !defined ZSOCK_FINAL
#define ZSOCK_FINAL final
#endif

#if !defined ZSOCK_DEFAULT
#define ZSOCK_DEFAULT = default;
#endif

#if !defined ZSOCK_NON_COPYABLE_NOR_MOVABLE
#define ZSOCK_NON_COPYABLE_NOR_MOVABLE(classname)                              \
  public:                                                                      \
    classname (const classname &) = delete;                                    \
    classname &operator= (const classname &) = delete;                         \
    classname (classname &&) = delete;                                         \
    classname &operator= (classname &&) = delete;
#endif

#endif
