#include <rawstruct/core/Exception.h>
#include <gtest/gtest.h>
#include <string>

using namespace rawstruct;

static void raiseRange( int v )
{
    RAWSTRUCT_THROW( RangeError, "value " << v << " is out of range" );
}

TEST( Exception, message_format )
{
    try
    {
        raiseRange( 300 );
        FAIL() << "expected RangeError";
    }
    catch( const RangeError & e )
    {
        ASSERT_EQ( e.exceptionType(), "RangeError" );
        ASSERT_EQ( e.description(), "value 300 is out of range" );

        std::string what = e.what();
        ASSERT_EQ( what.find( "test_exception.cpp:raiseRange:" ), 0u );
        ASSERT_NE( what.find( ":RangeError: value 300 is out of range" ), std::string::npos );
    }
}

TEST( Exception, hierarchy )
{
    ASSERT_THROW( RAWSTRUCT_THROW( ConfigurationError, "bad shape" ), ConfigurationError );
    ASSERT_THROW( RAWSTRUCT_THROW( ConfigurationError, "bad shape" ), ValueError );
    ASSERT_THROW( RAWSTRUCT_THROW( TypeError, "bad type" ), RuntimeException );
    ASSERT_THROW( RAWSTRUCT_THROW( KeyError, "bad key" ), Exception );
    ASSERT_THROW( RAWSTRUCT_THROW( RangeError, "bad range" ), std::exception );
}

TEST( Exception, true_or_throw )
{
    ASSERT_NO_THROW( RAWSTRUCT_TRUE_OR_THROW( 1 + 1 == 2, ValueError, "math works" ) );
    ASSERT_THROW( RAWSTRUCT_TRUE_OR_THROW( 1 + 1 == 3, ValueError, "math is broken" ), ValueError );
}

TEST( Exception, copy_keeps_description )
{
    try
    {
        RAWSTRUCT_THROW( KeyError, "no field named " << "foo" );
    }
    catch( const KeyError & e )
    {
        KeyError copy( e );
        ASSERT_EQ( copy.description(), "no field named foo" );
        ASSERT_EQ( copy.exceptionType(), "KeyError" );
        ASSERT_EQ( std::string( copy.what() ), std::string( e.what() ) );
        ASSERT_EQ( copy.btsize(), e.btsize() );
    }
}
