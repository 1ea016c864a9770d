/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_MACROS_HPP_INCLUDED__
#define __TAPEWIRE_MACROS_HPP_INCLUDED__

/******************************************************************************/
/*  tapewire internal use                                                     */
/******************************************************************************/

#define LIBTAPEWIRE_UNUSED(object) (void) object

/******************************************************************************/

#if !defined TAPEWIRE_OVERRIDE
#if defined TAPEWIRE_HAVE_NOEXCEPT
#define TAPEWIRE_OVERRIDE override
#else
#define TAPEWIRE_OVERRIDE
#endif
#endif

#if !defined TAPEWIRE_FINAL
#if defined TAPEWIRE_HAVE_NOEXCEPT
#define TAPEWIRE_FINAL final
#else
#define TAPEWIRE_FINAL
#endif
#endif

#if !defined TAPEWIRE_DEFAULT
#if defined TAPEWIRE_HAVE_NOEXCEPT
#define TAPEWIRE_DEFAULT = default;
#else
#define TAPEWIRE_DEFAULT                                                       \
    {                                                                          \
    }
#endif
#endif

#if !defined TAPEWIRE_NON_COPYABLE_NOR_MOVABLE
#if defined TAPEWIRE_HAVE_NOEXCEPT
#define TAPEWIRE_NON_COPYABLE_NOR_MOVABLE(classname)                           \
  public:                                                                      \
    classname (const classname &) = delete;                                    \
    classname &operator= (const classname &) = delete;                         \
    classname (classname &&) = delete;                                         \
    classname &operator= (classname &&) = delete;
#else
#define TAPEWIRE_NON_COPYABLE_NOR_MOVABLE(classname)                           \
  private:                                                                     \
    classname (const classname &);                                             \
    classname &operator= (const classname &);
#endif
#endif

#endif
