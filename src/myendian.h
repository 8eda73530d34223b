/*
Machine endian related defines and functions.
The binary document format is little-endian on every platform, so all
multi-byte fields pass through toLittle() before they are written and
fromLittle() after they are read.

Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#ifndef arbor_endian_h
#define arbor_endian_h


#include <stdint.h>
#include <string.h>

#if defined (_MSC_VER)  ||  defined (__MINGW64__)
   // MSVC generally compiles to x86 or little-endian ARM.
#  define LITTLE_ENDIAN 1234
#  define BIG_ENDIAN    4321
#  define BYTE_ORDER    LITTLE_ENDIAN
#else
#  include <endian.h>
#endif


#ifndef _MSC_VER

#  include <byteswap.h>

#else

static inline uint16_t
bswap_16 (uint16_t x)
{
  return (x >> 8) | (x << 8);
}

static inline uint32_t
bswap_32 (uint32_t x)
{
  return ((x & 0xFF000000) >> 24) | ((x & 0xFF0000) >> 8) | ((x & 0xFF00) << 8) | ((x & 0xFF) << 24);
}

static inline uint64_t
bswap_64 (uint64_t x)
{
  return (((uint64_t) bswap_32 (x & 0xFFFFFFFFull)) << 32) | (bswap_32 (x >> 32));
}

#endif


namespace arbor
{
#if BYTE_ORDER == LITTLE_ENDIAN

    static inline uint32_t toLittle   (uint32_t x) {return x;}
    static inline uint64_t toLittle   (uint64_t x) {return x;}
    static inline uint32_t fromLittle (uint32_t x) {return x;}
    static inline uint64_t fromLittle (uint64_t x) {return x;}

#else

    static inline uint32_t toLittle   (uint32_t x) {return bswap_32 (x);}
    static inline uint64_t toLittle   (uint64_t x) {return bswap_64 (x);}
    static inline uint32_t fromLittle (uint32_t x) {return bswap_32 (x);}
    static inline uint64_t fromLittle (uint64_t x) {return bswap_64 (x);}

#endif

    /// Raw bit pattern of a double, for writing it as a 64-bit integer.
    static inline uint64_t
    bitsOf (double value)
    {
        uint64_t result;
        memcpy (&result, &value, sizeof (result));
        return result;
    }

    static inline double
    doubleOf (uint64_t bits)
    {
        double result;
        memcpy (&result, &bits, sizeof (result));
        return result;
    }
}


#endif
