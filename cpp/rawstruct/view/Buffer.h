#ifndef _IN_RAWSTRUCT_VIEW_BUFFER_H
#define _IN_RAWSTRUCT_VIEW_BUFFER_H

/************************************************************************
 ** Buffer is the fixed length byte storage a StructView is bound to.
 ** It either owns its memory ( allocate / copyOf ) or wraps memory owned
 ** by someone else ( wrap ), ie a shared memory segment or a frame
 ** handed out by a network stack.  A Buffer never resizes.
 ***********************************************************************/
#include <rawstruct/core/Enum.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rawstruct
{

struct EncodingTraits
{
    enum _enum : uint8_t
    {
        UNKNOWN,
        UTF8,
        ASCII,
        LATIN1,
        HEX,
        BASE64,
        UTF16LE,

        NUM_TYPES
    };

    static const EnumAliases & aliases();

protected:
    _enum m_value;
};

using Encoding = Enum<EncodingTraits>;

class Buffer;
using BufferPtr = std::shared_ptr<Buffer>;

class Buffer
{
public:
    static constexpr size_t npos = static_cast<size_t>( -1 );

    //zero filled, owned
    static BufferPtr allocate( size_t size );

    //owned copy of size bytes at data
    static BufferPtr copyOf( const void * data, size_t size );

    //non-owning, caller guarantees data outlives the buffer.  A null data pointer yields a handle that
    //is not a valid byte sequence, views refuse to bind to it
    static BufferPtr wrap( void * data, size_t size );

    ~Buffer() {}

    Buffer( const Buffer & ) = delete;
    Buffer & operator=( const Buffer & ) = delete;

    size_t size() const        { return m_size; }
    bool   isOwner() const     { return m_storage != nullptr; }
    bool   isValid() const     { return m_data != nullptr; }

    uint8_t * data()             { return m_data; }
    const uint8_t * data() const { return m_data; }

    //unchecked
    uint8_t & operator[]( size_t index )             { return m_data[ index ]; }
    const uint8_t & operator[]( size_t index ) const { return m_data[ index ]; }

    uint8_t & at( size_t index );
    const uint8_t & at( size_t index ) const { return const_cast<Buffer *>( this ) -> at( index ); }

    void fill( uint8_t value );

    //copies [sourceStart, sourceEnd) into target starting at targetStart, truncated to what fits in target.
    //returns number of bytes copied
    size_t copy( Buffer & target, size_t targetStart = 0, size_t sourceStart = 0, size_t sourceEnd = npos ) const;

    bool equals( const Buffer & rhs ) const;

    //numeric dump of every byte
    std::vector<uint8_t> toJSON() const;

    //decodes [start, end) using the given text encoding, output is utf8.  The range is clamped to the buffer
    std::string toString( Encoding encoding, size_t start = 0, size_t end = npos ) const;

    //encoding names are case insensitive, unknown names raise ValueError
    std::string toString( const std::string & encoding = "utf8", size_t start = 0, size_t end = npos ) const;
    std::string toString( const char * encoding, size_t start = 0, size_t end = npos ) const
    {
        return toString( std::string( encoding ), start, end );
    }

private:
    Buffer( std::unique_ptr<uint8_t[]> storage, uint8_t * data, size_t size );

    std::unique_ptr<uint8_t[]> m_storage;
    uint8_t *                  m_data;
    size_t                     m_size;
};

}

#endif
