/** Defines a THERMITE_PUBLIC visibility attribute macro, which is used on all public interfaces.
 *  This can be defined before including `thermite.hpp` to directly control symbol visibility.
 *  If not defined externally, this library attempts to export symbols from the translation unit
 *  where THERMITE_IMPLEMENTATION is defined, and import them anywhere else.
 */
#ifndef THERMITE_PUBLIC
#  if defined _WIN32 || defined __CYGWIN__
#    ifdef __GNUC__
#      define THERMITE_EXPORT __attribute__((dllexport))
#      define THERMITE_IMPORT __attribute__((dllimport))
#    else
#      define THERMITE_EXPORT __declspec(dllexport)
#      define THERMITE_IMPORT __declspec(dllimport)
#    endif
#    ifdef THERMITE_IMPLEMENTATION
#      define THERMITE_PUBLIC THERMITE_EXPORT
#    else
#      define THERMITE_PUBLIC THERMITE_IMPORT
#    endif
#  else
#    define THERMITE_EXPORT __attribute__((visibility("default")))
#    define THERMITE_IMPORT
#    if __GNUC__ >= 4
#      define THERMITE_PUBLIC __attribute__((visibility("default")))
#    else
#      define THERMITE_PUBLIC
#    endif
#  endif
#endif
