#ifndef _IN_RAWSTRUCT_CORE_PLATFORM_H
#define _IN_RAWSTRUCT_CORE_PLATFORM_H
#include <type_traits>
#include <stdint.h>

#ifdef WIN32
#define NOMINMAX
#include <windows.h>
#include <stdlib.h>

#undef ERROR

#define START_PACKED __pragma( pack(push, 1) )
#define END_PACKED   __pragma( pack(pop))

#define NO_INLINE    __declspec(noinline)

#define RAWSTRUCT_LITTLE_ENDIAN_HOST 1

#define likely(x)   x
#define unlikely(x) x

inline uint16_t bswap( uint16_t v ) { return _byteswap_ushort( v ); }
inline uint32_t bswap( uint32_t v ) { return _byteswap_ulong( v ); }
inline uint64_t bswap( uint64_t v ) { return _byteswap_uint64( v ); }

#else

#define START_PACKED
#define END_PACKED __attribute__((packed))

#define NO_INLINE  __attribute__ ((noinline))

#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
#define RAWSTRUCT_LITTLE_ENDIAN_HOST 0
#else
#define RAWSTRUCT_LITTLE_ENDIAN_HOST 1
#endif

#define likely(x)   __builtin_expect ( (x), 1 )
#define unlikely(x) __builtin_expect ( (x), 0 )

inline constexpr uint16_t bswap( uint16_t v ) { return __builtin_bswap16( v ); }
inline constexpr uint32_t bswap( uint32_t v ) { return __builtin_bswap32( v ); }
inline constexpr uint64_t bswap( uint64_t v ) { return __builtin_bswap64( v ); }

#endif

inline constexpr uint8_t bswap( uint8_t v ) { return v; }

#endif
