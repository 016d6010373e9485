#include <gtest/gtest.h>
#include <rawstruct/view/FieldCodec.h>
#include <limits>

using namespace rawstruct;

static std::vector<uint8_t> encoded( const FieldCodecPtr & codec, const FieldValue & value )
{
    auto buffer = Buffer::allocate( codec -> size() );
    codec -> write( *buffer, 0, value );
    return buffer -> toJSON();
}

TEST( FieldCodec, byte_order )
{
    auto le = FieldCodec::fromName( "uint32le" );
    auto be = FieldCodec::fromName( "uint32be" );

    ASSERT_EQ( encoded( le, uint32_t( 0x01020304 ) ), std::vector<uint8_t>( { 4, 3, 2, 1 } ) );
    ASSERT_EQ( encoded( be, uint32_t( 0x01020304 ) ), std::vector<uint8_t>( { 1, 2, 3, 4 } ) );

    ASSERT_EQ( encoded( FieldCodec::fromName( "int16be" ), int16_t( -2 ) ), std::vector<uint8_t>( { 0xFF, 0xFE } ) );
    ASSERT_EQ( encoded( FieldCodec::fromName( "uint16le" ), uint16_t( 1000 ) ), std::vector<uint8_t>( { 0xE8, 0x03 } ) );
    ASSERT_EQ( encoded( FieldCodec::fromName( "uint64be" ), uint64_t( 0x0102030405060708 ) ),
               std::vector<uint8_t>( { 1, 2, 3, 4, 5, 6, 7, 8 } ) );

    //1.0f is 0x3F800000
    ASSERT_EQ( encoded( FieldCodec::fromName( "floatbe" ), 1.0f ), std::vector<uint8_t>( { 0x3F, 0x80, 0, 0 } ) );
    ASSERT_EQ( encoded( FieldCodec::fromName( "floatle" ), 1.0f ), std::vector<uint8_t>( { 0, 0, 0x80, 0x3F } ) );
}

TEST( FieldCodec, read_back )
{
    uint8_t raw[8] = { 0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC, 0xDE, 0xF0 };
    auto buffer = Buffer::wrap( raw, sizeof( raw ) );

    ASSERT_EQ( std::get<uint16_t>( FieldCodec::fromName( "uint16be" ) -> read( *buffer, 0 ) ), 0x1234 );
    ASSERT_EQ( std::get<uint16_t>( FieldCodec::fromName( "uint16le" ) -> read( *buffer, 0 ) ), 0x3412 );
    ASSERT_EQ( std::get<uint32_t>( FieldCodec::fromName( "uint32be" ) -> read( *buffer, 4 ) ), 0x9ABCDEF0u );
    ASSERT_EQ( std::get<int8_t>( FieldCodec::fromName( "int8" ) -> read( *buffer, 7 ) ), int8_t( -16 ) );
    ASSERT_EQ( std::get<uint8_t>( FieldCodec::fromName( "uint8" ) -> read( *buffer, 7 ) ), 0xF0 );

    uint8_t dbl[8] = { 0x40, 0x09, 0x21, 0xFB, 0x54, 0x44, 0x2D, 0x18 };
    auto dbuffer = Buffer::wrap( dbl, sizeof( dbl ) );
    ASSERT_DOUBLE_EQ( std::get<double>( FieldCodec::fromName( "doublebe" ) -> read( *dbuffer, 0 ) ), 3.141592653589793 );
}

TEST( FieldCodec, unsuffixed_names_use_host_order )
{
    ASSERT_EQ( FieldCodec::fromName( "uint32" ), FieldCodec::native<uint32_t>() );
    ASSERT_EQ( FieldCodec::fromName( "double" ), FieldCodec::native<double>( ByteOrder::host() ) );
    ASSERT_EQ( FieldCodec::fromName( "uint32le" ), FieldCodec::native<uint32_t>( ByteOrder::LITTLE ) );
    ASSERT_EQ( FieldCodec::fromName( "int64be" ), FieldCodec::native<int64_t>( ByteOrder::BIG ) );
    ASSERT_THROW( FieldCodec::native<int16_t>( ByteOrder::UNKNOWN ), ValueError );
}

TEST( FieldCodec, names_and_types )
{
    auto codec = FieldCodec::fromName( "int16be" );
    ASSERT_EQ( codec -> name(), "int16be" );
    ASSERT_EQ( codec -> type(), FieldType::INT16 );
    ASSERT_EQ( codec -> size(), 2u );

    ASSERT_EQ( FieldCodec::fromName( "uint8" ) -> name(), "uint8" );
    ASSERT_EQ( FieldCodec::fromName( "bool" ) -> type(), FieldType::BOOL );
    ASSERT_EQ( FieldCodec::fromName( "doublele" ) -> size(), 8u );

    ASSERT_EQ( FieldCodec::standardName( FieldType::UINT64, ByteOrder::BIG ), "uint64be" );
    ASSERT_EQ( FieldCodec::standardName( FieldType::INT8, ByteOrder::BIG ), "int8" );
}

TEST( FieldCodec, integer_coercion )
{
    auto codec = FieldCodec::fromName( "uint8" );

    //any integer alternative that fits is accepted
    ASSERT_EQ( encoded( codec, int32_t( 200 ) ), std::vector<uint8_t>( { 200 } ) );
    ASSERT_EQ( encoded( codec, int64_t( 0 ) ), std::vector<uint8_t>( { 0 } ) );
    ASSERT_EQ( encoded( codec, uint64_t( 255 ) ), std::vector<uint8_t>( { 255 } ) );

    ASSERT_THROW( encoded( codec, int32_t( 256 ) ), RangeError );
    ASSERT_THROW( encoded( codec, int32_t( -1 ) ), RangeError );

    auto i16 = FieldCodec::fromName( "int16le" );
    ASSERT_EQ( encoded( i16, int32_t( -32768 ) ), std::vector<uint8_t>( { 0x00, 0x80 } ) );
    ASSERT_THROW( encoded( i16, int32_t( 32768 ) ), RangeError );
    ASSERT_THROW( encoded( i16, uint64_t( 1 ) << 63 ), RangeError );

    auto u64 = FieldCodec::fromName( "uint64le" );
    ASSERT_NO_THROW( encoded( u64, int64_t( 1 ) ) );
    ASSERT_THROW( encoded( u64, int64_t( -1 ) ), RangeError );

    auto i64 = FieldCodec::fromName( "int64le" );
    ASSERT_THROW( encoded( i64, uint64_t( 1 ) << 63 ), RangeError );
}

TEST( FieldCodec, type_errors )
{
    auto codec = FieldCodec::fromName( "uint16le" );
    ASSERT_THROW( encoded( codec, true ), TypeError );
    ASSERT_THROW( encoded( codec, 1.5 ), TypeError );
    ASSERT_THROW( encoded( codec, std::string( "7" ) ), TypeError );
    ASSERT_THROW( encoded( codec, FieldValue() ), TypeError );

    ASSERT_THROW( encoded( FieldCodec::BOOL(), int32_t( 1 ) ), TypeError );
    ASSERT_THROW( encoded( FieldCodec::fromName( "char[4]" ), int32_t( 1 ) ), TypeError );

    try
    {
        encoded( codec, std::string( "hello" ) );
        FAIL() << "expected TypeError";
    }
    catch( const TypeError & e )
    {
        ASSERT_EQ( e.description(), "uint16le field expects a value of type UINT16 but got STRING ( \"hello\" )" );
    }
}

TEST( FieldCodec, floating )
{
    auto f = FieldCodec::fromName( "doublele" );
    auto buffer = Buffer::allocate( 8 );

    f -> write( *buffer, 0, 2.5 );
    ASSERT_EQ( std::get<double>( f -> read( *buffer, 0 ) ), 2.5 );

    //integers widen into floating fields
    f -> write( *buffer, 0, int32_t( -3 ) );
    ASSERT_EQ( std::get<double>( f -> read( *buffer, 0 ) ), -3.0 );

    auto single = FieldCodec::fromName( "floatbe" );
    single -> write( *buffer, 0, 0.5 );
    ASSERT_EQ( std::get<float>( single -> read( *buffer, 0 ) ), 0.5f );

    //doubles beyond float's range don't fit, infinities do
    ASSERT_THROW( single -> write( *buffer, 0, 1e300 ), RangeError );
    ASSERT_THROW( single -> write( *buffer, 0, -1e300 ), RangeError );
    single -> write( *buffer, 0, std::numeric_limits<double>::infinity() );
    ASSERT_EQ( std::get<float>( single -> read( *buffer, 0 ) ), std::numeric_limits<float>::infinity() );
}

TEST( FieldCodec, boolean )
{
    auto codec = FieldCodec::BOOL();
    ASSERT_EQ( encoded( codec, true ), std::vector<uint8_t>( { 1 } ) );
    ASSERT_EQ( encoded( codec, false ), std::vector<uint8_t>( { 0 } ) );

    uint8_t raw[1] = { 0x7F };
    ASSERT_EQ( std::get<bool>( codec -> read( *Buffer::wrap( raw, 1 ), 0 ) ), true );
}

TEST( FieldCodec, fixed_string )
{
    auto codec = FieldCodec::fromName( "char[6]" );
    ASSERT_EQ( codec -> size(), 6u );
    ASSERT_EQ( codec -> type(), FieldType::STRING );
    ASSERT_EQ( codec -> name(), "char[6]" );

    ASSERT_EQ( encoded( codec, std::string( "abc" ) ), std::vector<uint8_t>( { 'a', 'b', 'c', 0, 0, 0 } ) );
    ASSERT_EQ( encoded( codec, std::string( "abcdef" ) ), std::vector<uint8_t>( { 'a', 'b', 'c', 'd', 'e', 'f' } ) );
    ASSERT_THROW( encoded( codec, std::string( "abcdefg" ) ), RangeError );

    uint8_t raw[6] = { 'h', 'i', 0, 'x', 'y', 'z' };
    ASSERT_EQ( std::get<std::string>( codec -> read( *Buffer::wrap( raw, 6 ), 0 ) ), "hi" );

    uint8_t full[6] = { 'a', 'b', 'c', 'd', 'e', 'f' };
    ASSERT_EQ( std::get<std::string>( codec -> read( *Buffer::wrap( full, 6 ), 0 ) ), "abcdef" );
}

TEST( FieldCodecRegistry, lookup )
{
    auto & registry = FieldCodecRegistry::instance();
    ASSERT_TRUE( registry.exists( "int32be" ) );
    ASSERT_TRUE( registry.exists( "bool" ) );
    ASSERT_FALSE( registry.exists( "int8le" ) );

    ASSERT_THROW( FieldCodec::fromName( "int24" ), ConfigurationError );
    ASSERT_THROW( FieldCodec::fromName( "char[0]" ), ConfigurationError );
    ASSERT_THROW( FieldCodec::fromName( "char[]" ), ConfigurationError );
    ASSERT_THROW( FieldCodec::fromName( "char[x]" ), ConfigurationError );

    //shared singletons
    ASSERT_EQ( FieldCodec::fromName( "uint16be" ), FieldCodec::fromName( "uint16be" ) );
}

TEST( FieldCodecRegistry, register_custom )
{
    auto & registry = FieldCodecRegistry::instance();
    ASSERT_TRUE( registry.registerCodec( "tag", FieldCodec::fixedString( 4 ) ) );
    ASSERT_FALSE( registry.registerCodec( "tag", FieldCodec::fixedString( 8 ) ) );
    ASSERT_EQ( FieldCodec::fromName( "tag" ) -> size(), 4u );

    ASSERT_THROW( registry.registerCodec( "null", FieldCodecPtr() ), ConfigurationError );
}
