#ifndef _IN_RAWSTRUCT_CORE_HASH_H
#define _IN_RAWSTRUCT_CORE_HASH_H

#include <cstddef>
#include <cstring>

namespace rawstruct::hash
{

//C-string hash helpers, used for maps keyed on names owned elsewhere
struct CStrHash
{
    std::size_t operator()( const char * s ) const noexcept
    {
        //FNV-1a
        std::size_t h = 14695981039346656037ULL;
        for( const unsigned char * p = ( const unsigned char * ) s; *p; ++p )
        {
            h ^= *p;
            h *= 1099511628211ULL;
        }
        return h;
    }
};

struct CStrEq
{
    bool operator()( const char * lhs, const char * rhs ) const noexcept
    {
        return strcmp( lhs, rhs ) == 0;
    }
};

}

#endif
