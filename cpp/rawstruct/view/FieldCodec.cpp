#include <rawstruct/view/FieldCodec.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace rawstruct
{

void FieldCodec::raiseTypeError( const FieldValue & value ) const
{
    RAWSTRUCT_THROW( TypeError, name() << " field expects a value of type " << type() << " but got " << valueType( value )
                     << " ( " << value << " )" );
}

std::string FieldCodec::standardName( FieldType type, ByteOrder order )
{
    std::string name = type.asString();
    std::transform( name.begin(), name.end(), name.begin(), []( unsigned char c ) { return std::tolower( c ); } );

    switch( type )
    {
        case FieldType::BOOL:
        case FieldType::INT8:
        case FieldType::UINT8:
            return name;
        default:
            break;
    }

    return name + ( order == ByteOrder::BIG ? "be" : "le" );
}

const FieldCodecPtr & FieldCodec::BOOL()
{
    static FieldCodecPtr s_codec = std::make_shared<const BoolFieldCodec>();
    return s_codec;
}

FieldCodecPtr FieldCodec::fixedString( size_t size )
{
    return std::make_shared<const FixedStringFieldCodec>( size );
}

FixedStringFieldCodec::FixedStringFieldCodec( size_t size ) : FieldCodec( FieldType::STRING, size, "char[" + std::to_string( size ) + "]" )
{
}

FieldValue FixedStringFieldCodec::read( const Buffer & buffer, size_t offset ) const
{
    const char * begin = reinterpret_cast<const char *>( buffer.data() + offset );
    const char * end   = static_cast<const char *>( memchr( begin, 0, size() ) );
    return std::string( begin, end ? end : begin + size() );
}

void FixedStringFieldCodec::write( Buffer & buffer, size_t offset, const FieldValue & value ) const
{
    auto * str = std::get_if<std::string>( &value );
    if( !str )
        raiseTypeError( value );

    if( str -> size() > size() )
        RAWSTRUCT_THROW( RangeError, "string of " << str -> size() << " bytes does not fit in " << name() << " field" );

    uint8_t * dest = buffer.data() + offset;
    memcpy( dest, str -> data(), str -> size() );
    memset( dest + str -> size(), 0, size() - str -> size() );
}

FieldCodecRegistry & FieldCodecRegistry::instance()
{
    static FieldCodecRegistry s_instance;
    return s_instance;
}

template<typename T>
static void registerNative( FieldCodecRegistry & registry )
{
    auto & host = FieldCodec::native<T>( ByteOrder::host() );
    if constexpr( sizeof( T ) == 1 )
        registry.registerCodec( host -> name(), host );
    else
    {
        auto & little = FieldCodec::native<T>( ByteOrder::LITTLE );
        auto & big    = FieldCodec::native<T>( ByteOrder::BIG );
        registry.registerCodec( little -> name(), little );
        registry.registerCodec( big -> name(), big );

        //unsuffixed names are host order
        std::string plain = host -> name();
        registry.registerCodec( plain.substr( 0, plain.size() - 2 ), host );
    }
}

FieldCodecRegistry::FieldCodecRegistry()
{
    registerCodec( "bool", FieldCodec::BOOL() );
    registerNative<int8_t>( *this );
    registerNative<uint8_t>( *this );
    registerNative<int16_t>( *this );
    registerNative<uint16_t>( *this );
    registerNative<int32_t>( *this );
    registerNative<uint32_t>( *this );
    registerNative<int64_t>( *this );
    registerNative<uint64_t>( *this );
    registerNative<float>( *this );
    registerNative<double>( *this );
}

bool FieldCodecRegistry::registerCodec( const std::string & name, FieldCodecPtr codec )
{
    if( !codec )
        RAWSTRUCT_THROW( ConfigurationError, "attempted to register null codec under name " << name );
    return m_codecs.emplace( name, std::move( codec ) ).second;
}

bool FieldCodecRegistry::exists( const std::string & name ) const
{
    return m_codecs.find( name ) != m_codecs.end();
}

FieldCodecPtr FieldCodecRegistry::lookup( const std::string & name ) const
{
    auto it = m_codecs.find( name );
    if( it != m_codecs.end() )
        return it -> second;

    //char[N]
    static const std::string s_prefix = "char[";
    if( name.size() > s_prefix.size() + 1 && name.compare( 0, s_prefix.size(), s_prefix ) == 0 && name.back() == ']' )
    {
        std::string digits = name.substr( s_prefix.size(), name.size() - s_prefix.size() - 1 );
        if( std::all_of( digits.begin(), digits.end(), []( unsigned char c ) { return std::isdigit( c ); } ) )
        {
            size_t size = strtoull( digits.c_str(), nullptr, 10 );
            if( size > 0 )
                return FieldCodec::fixedString( size );
        }
    }

    RAWSTRUCT_THROW( ConfigurationError, "no field codec registered under name \"" << name << "\"" );
}

}
