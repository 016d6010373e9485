#ifndef _IN_RAWSTRUCT_VIEW_FIELDCODEC_H
#define _IN_RAWSTRUCT_VIEW_FIELDCODEC_H

#include <rawstruct/core/Exception.h>
#include <rawstruct/core/Platform.h>
#include <rawstruct/view/Buffer.h>
#include <rawstruct/view/FieldType.h>
#include <rawstruct/view/FieldValue.h>
#include <cstring>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace rawstruct
{

class FieldCodec;
using FieldCodecPtr = std::shared_ptr<const FieldCodec>;

//Reads and writes the on-wire representation of one field.  Codecs are stateless and shared between
//every shape that uses them.  Offsets are absolute positions in the buffer, callers guarantee that
//offset + size() fits
class FieldCodec
{
public:
    virtual ~FieldCodec() {}

    //registry name, ie "uint32le"
    const std::string & name() const { return m_name; }
    FieldType type() const           { return m_type; }
    size_t    size() const           { return m_size; }

    virtual FieldValue read( const Buffer & buffer, size_t offset ) const = 0;

    //raises TypeError if value holds an alternative this codec can't encode, RangeError if it doesn't fit
    virtual void write( Buffer & buffer, size_t offset, const FieldValue & value ) const = 0;

    //registry lookup, see FieldCodecRegistry
    static FieldCodecPtr fromName( const std::string & name );

    template<typename T>
    static const FieldCodecPtr & native( ByteOrder order = ByteOrder::host() );

    static const FieldCodecPtr & BOOL();
    static FieldCodecPtr fixedString( size_t size );

    //ie uint32le, int8, doublebe
    static std::string standardName( FieldType type, ByteOrder order );

protected:
    FieldCodec( FieldType type, size_t size, const std::string & name ) : m_name( name ), m_type( type ), m_size( size )
    {}

    [[noreturn]] void raiseTypeError( const FieldValue & value ) const;

private:
    std::string m_name;
    FieldType   m_type;
    size_t      m_size;
};

//fixed width integers and floating point, in either byte order
template<typename T>
class NativeFieldCodec final : public FieldCodec
{
    static_assert( std::is_arithmetic_v<T> && !std::is_same_v<T,bool> );

    using Bits = std::conditional_t<sizeof(T) == 1, uint8_t,
                 std::conditional_t<sizeof(T) == 2, uint16_t,
                 std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>>;

public:
    NativeFieldCodec( ByteOrder order, const std::string & name ) : FieldCodec( FieldType::fromCType<T>::type, sizeof( T ), name ),
                                                                    m_order( order )
    {}

    ByteOrder byteOrder() const { return m_order; }

    T decode( const uint8_t * p ) const
    {
        Bits bits;
        memcpy( &bits, p, sizeof( bits ) );
        if( !m_order.isHost() )
            bits = bswap( bits );

        T value;
        memcpy( &value, &bits, sizeof( value ) );
        return value;
    }

    void encode( uint8_t * p, T value ) const
    {
        Bits bits;
        memcpy( &bits, &value, sizeof( bits ) );
        if( !m_order.isHost() )
            bits = bswap( bits );
        memcpy( p, &bits, sizeof( bits ) );
    }

    FieldValue read( const Buffer & buffer, size_t offset ) const override
    {
        return decode( buffer.data() + offset );
    }

    void write( Buffer & buffer, size_t offset, const FieldValue & value ) const override
    {
        encode( buffer.data() + offset, coerce( value ) );
    }

    T coerce( const FieldValue & value ) const;

private:
    ByteOrder m_order;
};

class BoolFieldCodec final : public FieldCodec
{
public:
    BoolFieldCodec() : FieldCodec( FieldType::BOOL, 1, "bool" ) {}

    FieldValue read( const Buffer & buffer, size_t offset ) const override
    {
        return buffer[ offset ] != 0;
    }

    void write( Buffer & buffer, size_t offset, const FieldValue & value ) const override
    {
        if( !std::holds_alternative<bool>( value ) )
            raiseTypeError( value );
        buffer[ offset ] = std::get<bool>( value ) ? 1 : 0;
    }
};

//char[N]: reads stop at the first NUL, writes pad the remainder with NULs.  A string of exactly N bytes
//is stored without a terminator
class FixedStringFieldCodec final : public FieldCodec
{
public:
    FixedStringFieldCodec( size_t size );

    FieldValue read( const Buffer & buffer, size_t offset ) const override;
    void write( Buffer & buffer, size_t offset, const FieldValue & value ) const override;
};

//name -> codec.  Prepopulated with the standard codecs:
//  bool, int8, uint8, {int,uint}{16,32,64}[le|be], float[le|be], double[le|be], char[N]
//Names without a byte order suffix use host order.  Not thread safe for registration
class FieldCodecRegistry
{
public:
    static FieldCodecRegistry & instance();

    //returns false if name is already registered
    bool registerCodec( const std::string & name, FieldCodecPtr codec );

    //raises ConfigurationError for unknown names
    FieldCodecPtr lookup( const std::string & name ) const;

    bool exists( const std::string & name ) const;

private:
    FieldCodecRegistry();

    std::unordered_map<std::string,FieldCodecPtr> m_codecs;
};

inline FieldCodecPtr FieldCodec::fromName( const std::string & name )
{
    return FieldCodecRegistry::instance().lookup( name );
}

template<typename T>
inline const FieldCodecPtr & FieldCodec::native( ByteOrder order )
{
    static constexpr FieldTypeTraits::_enum s_type = FieldType::fromCType<T>::type;

    static FieldCodecPtr s_little = std::make_shared<const NativeFieldCodec<T>>( ByteOrder::LITTLE, standardName( s_type, ByteOrder::LITTLE ) );
    static FieldCodecPtr s_big    = std::make_shared<const NativeFieldCodec<T>>( ByteOrder::BIG, standardName( s_type, ByteOrder::BIG ) );
    if( order == ByteOrder::LITTLE )
        return s_little;
    if( order == ByteOrder::BIG )
        return s_big;
    RAWSTRUCT_THROW( ValueError, "field codecs need an explicit byte order, got " << order );
}

template<typename T>
inline T NativeFieldCodec<T>::coerce( const FieldValue & value ) const
{
    return std::visit( [this, &value]( auto && arg ) -> T {
            using V = std::decay_t<decltype( arg )>;
            if constexpr( std::is_same_v<V,T> )
                return arg;
            else if constexpr( ( std::is_integral_v<V> && !std::is_same_v<V,bool> ) ||
                               ( std::is_floating_point_v<V> && std::is_floating_point_v<T> ) )
            {
                if( !valueFits<T>( arg ) )
                    RAWSTRUCT_THROW( RangeError, "value " << FieldValue( arg ) << " is out of range for " << name() << " field" );
                return static_cast<T>( arg );
            }
            else
                raiseTypeError( value );
        }, value );
}

}

#endif
