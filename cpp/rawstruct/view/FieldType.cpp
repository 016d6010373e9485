#include <rawstruct/view/FieldType.h>

namespace rawstruct
{

INIT_RAWSTRUCT_ENUM( FieldType,
    "UNKNOWN",
    "BOOL",
    "INT8",
    "UINT8",
    "INT16",
    "UINT16",
    "INT32",
    "UINT32",
    "INT64",
    "UINT64",
    "FLOAT",
    "DOUBLE",
    "STRING"
);

INIT_RAWSTRUCT_ENUM( ByteOrder,
    "UNKNOWN",
    "LITTLE",
    "BIG"
);

}
