#ifndef _IN_RAWSTRUCT_CORE_SYSTEM_H
#define _IN_RAWSTRUCT_CORE_SYSTEM_H

//Common low level system methods / defines
#include <string>
#include <typeinfo>
#include <stdint.h>
#include <stdlib.h>
#include <rawstruct/core/Platform.h>

#ifndef WIN32
#include <cxxabi.h>
#endif

namespace rawstruct
{

//returns an empty string if the symbol can't be demangled
inline std::string demangle( const char * mangled )
{
#ifndef WIN32
    int status = 0;
    char * demangled = abi::__cxa_demangle( mangled, NULL, NULL, &status );
    if( !demangled )
        return std::string();
    std::string result( demangled );
    free( demangled );
    return result;
#else
    return std::string( mangled );
#endif
}

//useful for error messages carrying type information
template<typename T>
std::string cpp_type_name()
{
    const char * raw = typeid( T ).name();
    std::string result = demangle( raw );
    return result.empty() ? std::string( raw ) : result;
}

}

#endif
