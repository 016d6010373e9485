#ifndef _IN_RAWSTRUCT_VIEW_FIELDVALUE_H
#define _IN_RAWSTRUCT_VIEW_FIELDVALUE_H

#include <rawstruct/core/Exception.h>
#include <rawstruct/core/System.h>
#include <rawstruct/view/FieldType.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>

namespace rawstruct
{

//Every value that can flow through a field accessor.  monostate is "no value"
using FieldValue = std::variant<std::monostate,bool,int8_t,uint8_t,int16_t,uint16_t,int32_t,uint32_t,int64_t,uint64_t,float,double,std::string>;

//type tag of the alternative currently held, UNKNOWN for monostate
inline FieldType valueType( const FieldValue & value )
{
    return std::visit( []( auto && arg ) -> FieldType {
            using T = std::decay_t<decltype( arg )>;
            if constexpr( std::is_same_v<T,std::monostate> )
                return FieldType::UNKNOWN;
            else
                return FieldType::fromCType<T>::type;
        }, value );
}

//Maps a plain C++ value onto the matching fixed width alternative, ie long long -> int64_t, const char * -> std::string
template<typename T>
FieldValue makeFieldValue( const T & v )
{
    if constexpr( std::is_same_v<T,FieldValue> || std::is_same_v<T,bool> )
        return v;
    else if constexpr( std::is_integral_v<T> )
    {
        using Fixed = std::conditional_t<std::is_signed_v<T>,
                      std::conditional_t<sizeof(T) == 1, int8_t,
                      std::conditional_t<sizeof(T) == 2, int16_t,
                      std::conditional_t<sizeof(T) == 4, int32_t, int64_t>>>,
                      std::conditional_t<sizeof(T) == 1, uint8_t,
                      std::conditional_t<sizeof(T) == 2, uint16_t,
                      std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>>>;
        return static_cast<Fixed>( v );
    }
    else if constexpr( std::is_same_v<T,float> )
        return v;
    else if constexpr( std::is_floating_point_v<T> )
        return static_cast<double>( v );
    else
    {
        static_assert( std::is_convertible_v<const T &, std::string>, "unsupported field value type" );
        return std::string( v );
    }
}

inline std::ostream & operator<<( std::ostream & o, const FieldValue & value )
{
    std::visit( [&o]( auto && arg ) {
            using T = std::decay_t<decltype( arg )>;
            if constexpr( std::is_same_v<T,std::monostate> )
                o << "<none>";
            else if constexpr( std::is_same_v<T,bool> )
                o << ( arg ? "true" : "false" );
            else if constexpr( std::is_same_v<T,int8_t> || std::is_same_v<T,uint8_t> )
                o << static_cast<int>( arg );
            else if constexpr( std::is_same_v<T,std::string> )
                o << '"' << arg << '"';
            else
                o << arg;
        }, value );
    return o;
}

//true when the arithmetic value v survives conversion to T without overflow.  Floating values headed
//for an integer are checked after truncation toward zero, NaN never fits
template<typename T, typename V>
bool valueFits( V v )
{
    static_assert( std::is_arithmetic_v<T> && std::is_arithmetic_v<V>, "valueFits expects arithmetic types" );

    if constexpr( std::is_integral_v<T> && std::is_integral_v<V> )
    {
        if constexpr( std::is_signed_v<V> == std::is_signed_v<T> )
            return v >= std::numeric_limits<T>::min() && v <= std::numeric_limits<T>::max();
        else if constexpr( std::is_signed_v<V> )
            return v >= 0 && static_cast<std::make_unsigned_t<V>>( v ) <= std::numeric_limits<T>::max();
        else
            return v <= static_cast<std::make_unsigned_t<T>>( std::numeric_limits<T>::max() );
    }
    else if constexpr( std::is_integral_v<T> )
    {
        //2^digits is exact in V and one past T's max
        V truncated = std::trunc( v );
        V upper = std::ldexp( V( 1 ), std::numeric_limits<T>::digits );
        V lower = std::is_signed_v<T> ? -upper : V( 0 );
        return truncated >= lower && truncated < upper;
    }
    else if constexpr( std::is_floating_point_v<V> && sizeof( V ) > sizeof( T ) )
        return !std::isfinite( v ) || ( v >= std::numeric_limits<T>::lowest() && v <= std::numeric_limits<T>::max() );
    else
        return true;
}

//Extracts a value as T.  Integer and floating alternatives convert to any arithmetic T they fit in,
//RangeError when they don't.  Everything else must match exactly
template<typename T>
T valueAs( const FieldValue & value )
{
    static_assert( std::is_arithmetic_v<T> || std::is_same_v<T,std::string>, "unsupported field value type" );

    return std::visit( []( auto && arg ) -> T {
            using ActualT = std::decay_t<decltype( arg )>;
            if constexpr( std::is_same_v<ActualT,T> )
                return arg;
            else if constexpr( std::is_arithmetic_v<T> && !std::is_same_v<T,bool> &&
                               std::is_arithmetic_v<ActualT> && !std::is_same_v<ActualT,bool> )
            {
                if( !valueFits<T>( arg ) )
                    RAWSTRUCT_THROW( RangeError, "field value " << FieldValue( arg ) << " is out of range for " << cpp_type_name<T>() );
                return static_cast<T>( arg );
            }
            else
                RAWSTRUCT_THROW( TypeError, "field value of type " << valueType( FieldValue( arg ) ) << " can't be converted to " << cpp_type_name<T>() );
        }, value );
}

}

#endif
