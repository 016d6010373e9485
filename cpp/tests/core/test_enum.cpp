#include <rawstruct/core/Enum.h>
#include <gtest/gtest.h>
#include <sstream>
#include <unordered_set>

using namespace rawstruct;

struct TestEnumTraits
{
    enum _enum : unsigned char
    {
        UNKNOWN = 0,
        A,
        B,
        C,
        F,

        NUM_TYPES
    };

    static const EnumAliases & aliases()
    {
        static EnumAliases s_aliases{ { "alpha", "A" }, { "foxtrot", "F" }, { "nope", "MISSING" } };
        return s_aliases;
    }

protected:
    _enum m_value;
};

using TestEnum = Enum<TestEnumTraits>;

INIT_RAWSTRUCT_ENUM( TestEnum,
    "UNKNOWN",
    "A",
    "B",
    "C",
    "F"
);

struct LenientEnumTraits
{
    enum _enum : unsigned char
    {
        UNKNOWN = 0,
        X,
        Y,

        NUM_TYPES
    };

    static const bool UNKNOWN_ON_INVALID_VALUE = true;

protected:
    _enum m_value;
};

using LenientEnum = Enum<LenientEnumTraits>;

INIT_RAWSTRUCT_ENUM( LenientEnum,
    "UNKNOWN",
    "X",
    "Y"
);

TEST( EnumTest, basic_functionality )
{
    ASSERT_EQ( TestEnum::A, TestEnum::A );
    ASSERT_EQ( TestEnum::A, TestEnum( TestEnum::A ) );
    ASSERT_EQ( TestEnum( TestEnum::A ), TestEnum::A );
    ASSERT_EQ( TestEnum::A, TestEnum( 1 ) );

    ASSERT_NE( TestEnum::A, TestEnum::B );
    ASSERT_NE( TestEnum::A, TestEnum( TestEnum::B ) );
    ASSERT_NE( TestEnum( TestEnum::B ), TestEnum::A );
    ASSERT_NE( TestEnum::A, TestEnum( 2 ) );

    ASSERT_EQ( TestEnum( 1 ).asString(), "A" );
    ASSERT_EQ( TestEnum( 2 ).asString(), "B" );

    ASSERT_EQ( TestEnum( "A" ), TestEnum::A );
    ASSERT_EQ( TestEnum( "B" ), TestEnum::B );
    ASSERT_EQ( TestEnum( "F" ), TestEnum::F );
    ASSERT_EQ( TestEnum( std::string( "F" ) ), TestEnum::F );

    ASSERT_EQ( TestEnum( TestEnum( TestEnum::F ).asString() ), TestEnum( TestEnum::F ) );

    ASSERT_TRUE( TestEnum( TestEnum::C ).isKnown() );
    ASSERT_TRUE( TestEnum().isUnknown() );
    ASSERT_EQ( TestEnum::numTypes(), 5u );

    std::stringstream oss;
    oss << TestEnum( "UNKNOWN" );
    ASSERT_EQ( oss.str(), "UNKNOWN" );

    ASSERT_THROW( TestEnum( "FOO" ), ValueError );
    ASSERT_THROW( TestEnum( 23 ), ValueError );
    ASSERT_THROW( TestEnum( -1 ), ValueError );
}

TEST( EnumTest, aliases )
{
    ASSERT_EQ( TestEnum( "alpha" ), TestEnum::A );
    ASSERT_EQ( TestEnum( "foxtrot" ), TestEnum::F );

    //aliases resolve to the canonical name
    ASSERT_EQ( TestEnum( "alpha" ).asString(), "A" );

    //an alias pointing at a name that doesn't exist is ignored
    ASSERT_THROW( TestEnum( "nope" ), ValueError );
}

TEST( EnumTest, unknown_on_invalid_value )
{
    ASSERT_EQ( LenientEnum( "Y" ), LenientEnum::Y );
    ASSERT_EQ( LenientEnum( "Z" ), LenientEnum::UNKNOWN );
    ASSERT_EQ( LenientEnum( 7 ), LenientEnum::UNKNOWN );
}

TEST( EnumTest, hashing )
{
    std::unordered_set<TestEnum> seen;
    seen.insert( TestEnum::A );
    seen.insert( TestEnum( "alpha" ) );
    seen.insert( TestEnum::B );
    ASSERT_EQ( seen.size(), 2u );
}
