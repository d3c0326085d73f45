#pragma once

/** Defines a FINA_PUBLIC visibility attribute macro, which is used on all public interfaces.
 *  This can be defined before including `fina.hpp` to directly control symbol visibility.
 *  The reader relies on POSIX file mapping, so only GCC-compatible compilers are handled here.
 */
#ifndef FINA_PUBLIC
#  if defined(__GNUC__) && __GNUC__ >= 4
#    define FINA_PUBLIC __attribute__((visibility("default")))
#  else
#    define FINA_PUBLIC
#  endif
#endif
