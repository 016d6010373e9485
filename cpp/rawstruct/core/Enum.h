#ifndef _IN_RAWSTRUCT_CORE_ENUM_H
#define _IN_RAWSTRUCT_CORE_ENUM_H

#include <rawstruct/core/Exception.h>
#include <rawstruct/core/Platform.h>
#include <rawstruct/core/System.h>
#include <ostream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>
#include <string.h>

namespace rawstruct {

/*
String-mapped enums.  Define a traits struct holding a plain enum named _enum, with UNKNOWN = 0 first
and NUM_TYPES last, plus a protected m_value member:

struct ByteOrderTraits
{
    enum _enum : uint8_t
    {
        UNKNOWN = 0,
        LITTLE,
        BIG,

        NUM_TYPES
    };

    //Optional: aliases accepted when parsing strings, in addition to the canonical names
    //static const EnumAliases & aliases();

    //Optional: return UNKNOWN instead of throwing on bad strings / values
    //static const bool UNKNOWN_ON_INVALID_VALUE = true;

protected:
    _enum m_value;
};

using ByteOrder = Enum<ByteOrderTraits>;

and in a cpp file:

INIT_RAWSTRUCT_ENUM( ByteOrder,
    "UNKNOWN",
    "LITTLE",
    "BIG"
);
*/

template<typename T>
auto UnknownOnInvalidValue( int ) -> decltype( T::UNKNOWN_ON_INVALID_VALUE ) { return T::UNKNOWN_ON_INVALID_VALUE; }

template<typename T>
bool UnknownOnInvalidValue( long ) { return false; }

using EnumAliases = std::vector<std::pair<std::string,std::string>>;

template<typename T>
auto EnumAliasesOf( int ) -> decltype( T::aliases() ) { return T::aliases(); }

template<typename T>
const EnumAliases & EnumAliasesOf( long ) { static EnumAliases s_empty; return s_empty; }

START_PACKED
template<typename EnumTraits>
struct Enum : public EnumTraits
{
    using EnumV   = typename EnumTraits::_enum;
    using Mapping = std::vector<std::string>;
    using UType   = typename std::underlying_type<EnumV>::type;

    constexpr Enum( EnumV v ) { this -> m_value = v; }
    constexpr Enum() { this -> m_value = EnumTraits::UNKNOWN; }
    constexpr Enum( const Enum & rhs ) { this -> m_value = rhs.m_value; }

    Enum & operator=( const Enum & rhs ) { this -> m_value = rhs.m_value; return *this; }

    Enum( const char * s ) { this -> m_value = reverseMap().fromString( s ); }
    Enum( const std::string & s ) : Enum( s.c_str() ) {}
    explicit Enum( int v );

    static const std::string & asString( EnumV v ) { return mapping()[ v ]; }

    const std::string & asString() const { return asString( this -> m_value ); }
    const char * asCString() const       { return asString( this -> m_value ).c_str(); }

    //pulls in all comparison operators since we auto-convert to the raw enum
    constexpr operator EnumV() const { return this -> m_value; }

    constexpr UType value() const { return this -> m_value; }

    bool isKnown() const   { return this -> m_value != EnumTraits::UNKNOWN; }
    bool isUnknown() const { return this -> m_value == EnumTraits::UNKNOWN; }

    static constexpr size_t numTypes() { return ( size_t ) EnumTraits::NUM_TYPES; }

protected:
    struct ReverseMap : public std::unordered_map<std::string, EnumV>
    {
        ReverseMap( const Mapping & mapping, const EnumAliases & aliases )
        {
            int v = 0;
            for( auto & s : mapping )
                this -> emplace( s, ( EnumV ) v++ );

            for( auto & alias : aliases )
            {
                auto it = this -> find( alias.second );
                if( it != this -> end() )
                    this -> emplace( alias.first, it -> second );
            }
        }

        EnumV fromString( const char * s ) const
        {
            auto it = this -> find( s );
            if( it == this -> end() )
            {
                if( UnknownOnInvalidValue<EnumTraits>( 0 ) )
                    return EnumTraits::UNKNOWN;

                RAWSTRUCT_THROW( ValueError, "Unrecognized enum value: " << s << " for enum " << cpp_type_name<EnumTraits>() );
            }

            return it -> second;
        }
    };

    //defined by INIT_RAWSTRUCT_ENUM
    static const Mapping & mapping();

    static const ReverseMap & reverseMap()
    {
        static ReverseMap s_reverseMap( mapping(), EnumAliasesOf<EnumTraits>( 0 ) );
        return s_reverseMap;
    }

} END_PACKED;

template<typename EnumTraits>
Enum<EnumTraits>::Enum( int v )
{
    if( v < 0 || ( size_t ) v >= numTypes() )
    {
        if( UnknownOnInvalidValue<EnumTraits>( 0 ) )
            this -> m_value = EnumTraits::UNKNOWN;
        else
            RAWSTRUCT_THROW( ValueError, "enum value: " << v << " out of range for enum " << cpp_type_name<EnumTraits>() );
    }
    else
        this -> m_value = ( EnumV ) v;
}

template<typename EnumTraits>
std::ostream & operator<<( std::ostream & o, Enum<EnumTraits> e )
{
    o << e.asString();
    return o;
}

}

namespace std {

template<typename EnumTraits>
struct hash<rawstruct::Enum<EnumTraits>>
{
    size_t operator()( rawstruct::Enum<EnumTraits> e ) const
    {
        return std::hash<typename rawstruct::Enum<EnumTraits>::UType>()( e.value() );
    }
};

}

#define INIT_RAWSTRUCT_ENUM( ENUM, ... )                    \
    template<> const ENUM::Mapping & ENUM::mapping() {      \
        static ENUM::Mapping s_mapping( { __VA_ARGS__ } );  \
        return s_mapping;                                   \
    }

#endif
