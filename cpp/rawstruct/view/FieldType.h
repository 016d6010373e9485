#ifndef _IN_RAWSTRUCT_VIEW_FIELDTYPE_H
#define _IN_RAWSTRUCT_VIEW_FIELDTYPE_H

#include <rawstruct/core/Enum.h>
#include <cstdint>
#include <string>

namespace rawstruct
{

struct FieldTypeTraits
{
    enum _enum : uint8_t
    {
        UNKNOWN,
        BOOL,
        INT8,
        UINT8,
        INT16,
        UINT16,
        INT32,
        UINT32,
        INT64,
        UINT64,
        FLOAT,
        DOUBLE,

        //fixed width text, NUL padded
        STRING,

        NUM_TYPES
    };

    template<typename T>
    struct fromCType;

    template<uint8_t T>
    struct toCType;

    bool isInteger() const  { return m_value >= INT8 && m_value <= UINT64; }
    bool isFloating() const { return m_value == FLOAT || m_value == DOUBLE; }

protected:
    _enum m_value;
};

using FieldType = Enum<FieldTypeTraits>;

struct ByteOrderTraits
{
    enum _enum : uint8_t
    {
        UNKNOWN,
        LITTLE,
        BIG,

        NUM_TYPES
    };

    static constexpr _enum host() { return RAWSTRUCT_LITTLE_ENDIAN_HOST ? LITTLE : BIG; }

    bool isHost() const { return m_value == host(); }

protected:
    _enum m_value;
};

using ByteOrder = Enum<ByteOrderTraits>;

template<> struct FieldTypeTraits::fromCType<bool>        { static constexpr FieldTypeTraits::_enum type = FieldTypeTraits::BOOL;   };
template<> struct FieldTypeTraits::fromCType<int8_t>      { static constexpr FieldTypeTraits::_enum type = FieldTypeTraits::INT8;   };
template<> struct FieldTypeTraits::fromCType<uint8_t>     { static constexpr FieldTypeTraits::_enum type = FieldTypeTraits::UINT8;  };
template<> struct FieldTypeTraits::fromCType<int16_t>     { static constexpr FieldTypeTraits::_enum type = FieldTypeTraits::INT16;  };
template<> struct FieldTypeTraits::fromCType<uint16_t>    { static constexpr FieldTypeTraits::_enum type = FieldTypeTraits::UINT16; };
template<> struct FieldTypeTraits::fromCType<int32_t>     { static constexpr FieldTypeTraits::_enum type = FieldTypeTraits::INT32;  };
template<> struct FieldTypeTraits::fromCType<uint32_t>    { static constexpr FieldTypeTraits::_enum type = FieldTypeTraits::UINT32; };
template<> struct FieldTypeTraits::fromCType<int64_t>     { static constexpr FieldTypeTraits::_enum type = FieldTypeTraits::INT64;  };
template<> struct FieldTypeTraits::fromCType<uint64_t>    { static constexpr FieldTypeTraits::_enum type = FieldTypeTraits::UINT64; };
template<> struct FieldTypeTraits::fromCType<float>       { static constexpr FieldTypeTraits::_enum type = FieldTypeTraits::FLOAT;  };
template<> struct FieldTypeTraits::fromCType<double>      { static constexpr FieldTypeTraits::_enum type = FieldTypeTraits::DOUBLE; };
template<> struct FieldTypeTraits::fromCType<std::string> { static constexpr FieldTypeTraits::_enum type = FieldTypeTraits::STRING; };

template<> struct FieldTypeTraits::toCType<FieldTypeTraits::BOOL>   { using type = bool;        };
template<> struct FieldTypeTraits::toCType<FieldTypeTraits::INT8>   { using type = int8_t;      };
template<> struct FieldTypeTraits::toCType<FieldTypeTraits::UINT8>  { using type = uint8_t;     };
template<> struct FieldTypeTraits::toCType<FieldTypeTraits::INT16>  { using type = int16_t;     };
template<> struct FieldTypeTraits::toCType<FieldTypeTraits::UINT16> { using type = uint16_t;    };
template<> struct FieldTypeTraits::toCType<FieldTypeTraits::INT32>  { using type = int32_t;     };
template<> struct FieldTypeTraits::toCType<FieldTypeTraits::UINT32> { using type = uint32_t;    };
template<> struct FieldTypeTraits::toCType<FieldTypeTraits::INT64>  { using type = int64_t;     };
template<> struct FieldTypeTraits::toCType<FieldTypeTraits::UINT64> { using type = uint64_t;    };
template<> struct FieldTypeTraits::toCType<FieldTypeTraits::FLOAT>  { using type = float;       };
template<> struct FieldTypeTraits::toCType<FieldTypeTraits::DOUBLE> { using type = double;      };
template<> struct FieldTypeTraits::toCType<FieldTypeTraits::STRING> { using type = std::string; };

}

#endif
