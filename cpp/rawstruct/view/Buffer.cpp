#include <rawstruct/core/Exception.h>
#include <rawstruct/view/Buffer.h>
#include <algorithm>
#include <cctype>
#include <codecvt>
#include <cstring>
#include <locale>
#include <stdexcept>

namespace rawstruct
{

INIT_RAWSTRUCT_ENUM( Encoding,
    "UNKNOWN",
    "utf8",
    "ascii",
    "latin1",
    "hex",
    "base64",
    "utf16le"
);

const EnumAliases & EncodingTraits::aliases()
{
    static EnumAliases s_aliases{
        { "utf-8",    "utf8" },
        { "binary",   "latin1" },
        { "ucs2",     "utf16le" },
        { "ucs-2",    "utf16le" },
        { "utf-16le", "utf16le" }
    };
    return s_aliases;
}

Buffer::Buffer( std::unique_ptr<uint8_t[]> storage, uint8_t * data, size_t size ) : m_storage( std::move( storage ) ),
                                                                                     m_data( data ),
                                                                                     m_size( size )
{
}

BufferPtr Buffer::allocate( size_t size )
{
    //value-initialized, ie zero filled.  Always allocate at least one byte so an empty buffer is still a valid one
    std::unique_ptr<uint8_t[]> storage( new uint8_t[ std::max<size_t>( size, 1 ) ]() );
    uint8_t * data = storage.get();
    return BufferPtr( new Buffer( std::move( storage ), data, size ) );
}

BufferPtr Buffer::copyOf( const void * data, size_t size )
{
    BufferPtr buffer = allocate( size );
    if( size )
        memcpy( buffer -> data(), data, size );
    return buffer;
}

BufferPtr Buffer::wrap( void * data, size_t size )
{
    return BufferPtr( new Buffer( nullptr, static_cast<uint8_t *>( data ), size ) );
}

uint8_t & Buffer::at( size_t index )
{
    if( index >= m_size )
        RAWSTRUCT_THROW( RangeError, "Buffer index " << index << " out of range for buffer of " << m_size << " bytes" );
    return m_data[ index ];
}

void Buffer::fill( uint8_t value )
{
    if( m_size )
        memset( m_data, value, m_size );
}

size_t Buffer::copy( Buffer & target, size_t targetStart, size_t sourceStart, size_t sourceEnd ) const
{
    sourceEnd = std::min( sourceEnd, m_size );
    if( sourceStart > sourceEnd )
        RAWSTRUCT_THROW( RangeError, "Buffer copy source range [" << sourceStart << ", " << sourceEnd << ") is invalid for buffer of " << m_size << " bytes" );
    if( targetStart > target.size() )
        RAWSTRUCT_THROW( RangeError, "Buffer copy target start " << targetStart << " out of range for buffer of " << target.size() << " bytes" );

    size_t count = std::min( sourceEnd - sourceStart, target.size() - targetStart );
    if( count )
        memmove( target.data() + targetStart, m_data + sourceStart, count );
    return count;
}

bool Buffer::equals( const Buffer & rhs ) const
{
    return m_size == rhs.m_size && ( m_size == 0 || memcmp( m_data, rhs.m_data, m_size ) == 0 );
}

std::vector<uint8_t> Buffer::toJSON() const
{
    return std::vector<uint8_t>( m_data, m_data + m_size );
}

static void appendUtf8( std::string & out, uint32_t codepoint )
{
    if( codepoint < 0x80 )
        out += static_cast<char>( codepoint );
    else
    {
        out += static_cast<char>( 0xC0 | ( codepoint >> 6 ) );
        out += static_cast<char>( 0x80 | ( codepoint & 0x3F ) );
    }
}

static std::string encodeBase64( const uint8_t * data, size_t len )
{
    static const char s_alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve( ( ( len + 2 ) / 3 ) * 4 );

    size_t i = 0;
    for( ; i + 2 < len; i += 3 )
    {
        uint32_t n = ( uint32_t( data[i] ) << 16 ) | ( uint32_t( data[i + 1] ) << 8 ) | data[i + 2];
        out += s_alphabet[ ( n >> 18 ) & 0x3F ];
        out += s_alphabet[ ( n >> 12 ) & 0x3F ];
        out += s_alphabet[ ( n >> 6 ) & 0x3F ];
        out += s_alphabet[ n & 0x3F ];
    }

    if( i < len )
    {
        uint32_t n = uint32_t( data[i] ) << 16;
        if( i + 1 < len )
            n |= uint32_t( data[i + 1] ) << 8;

        out += s_alphabet[ ( n >> 18 ) & 0x3F ];
        out += s_alphabet[ ( n >> 12 ) & 0x3F ];
        out += i + 1 < len ? s_alphabet[ ( n >> 6 ) & 0x3F ] : '=';
        out += '=';
    }

    return out;
}

std::string Buffer::toString( Encoding encoding, size_t start, size_t end ) const
{
    end = std::min( end, m_size );
    if( start >= end )
        return std::string();

    const uint8_t * begin = m_data + start;
    size_t len = end - start;

    std::string out;
    switch( encoding )
    {
        case Encoding::UTF8:
            out.assign( reinterpret_cast<const char *>( begin ), len );
            break;

        case Encoding::ASCII:
            out.reserve( len );
            for( size_t i = 0; i < len; ++i )
                out += static_cast<char>( begin[i] & 0x7F );
            break;

        case Encoding::LATIN1:
            out.reserve( len );
            for( size_t i = 0; i < len; ++i )
                appendUtf8( out, begin[i] );
            break;

        case Encoding::HEX:
        {
            static const char s_digits[] = "0123456789abcdef";
            out.reserve( len * 2 );
            for( size_t i = 0; i < len; ++i )
            {
                out += s_digits[ begin[i] >> 4 ];
                out += s_digits[ begin[i] & 0x0F ];
            }
            break;
        }

        case Encoding::BASE64:
            out = encodeBase64( begin, len );
            break;

        case Encoding::UTF16LE:
        {
            //a trailing odd byte is dropped
            std::u16string units( len / 2, u'\0' );
            for( size_t i = 0; i < units.size(); ++i )
                units[i] = static_cast<char16_t>( begin[ 2 * i ] | ( begin[ 2 * i + 1 ] << 8 ) );

            try
            {
                std::wstring_convert<std::codecvt_utf8_utf16<char16_t>, char16_t> converter;
                out = converter.to_bytes( units );
            }
            catch( const std::range_error & )
            {
                RAWSTRUCT_THROW( ValueError, "Buffer bytes [" << start << ", " << end << ") are not valid utf16le" );
            }
            break;
        }

        case Encoding::UNKNOWN:
        case Encoding::NUM_TYPES:
            RAWSTRUCT_THROW( ValueError, "Buffer can't be decoded with encoding " << encoding );
    }

    return out;
}

std::string Buffer::toString( const std::string & encoding, size_t start, size_t end ) const
{
    std::string name( encoding );
    std::transform( name.begin(), name.end(), name.begin(), []( unsigned char c ) { return std::tolower( c ); } );
    return toString( Encoding( name ), start, end );
}

}
