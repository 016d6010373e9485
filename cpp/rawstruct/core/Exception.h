#ifndef _IN_RAWSTRUCT_CORE_EXCEPTION_H
#define _IN_RAWSTRUCT_CORE_EXCEPTION_H

#include <exception>
#include <sstream>
#include <stdlib.h>
#include <string.h>
#include <rawstruct/core/Platform.h>

namespace rawstruct
{

class Exception : public std::exception
{
public:
    Exception( const char * exType, const std::string & description, const char * file, const char * func, int line ) :
        m_exType( exType ), m_description( description ), m_file( file ), m_function( func ), m_line( line ),
        m_backtracesize( 0 ), m_backtracemessages( nullptr )
    {
        setbt();
    }

    Exception( const char * exType, const std::string & description ) : Exception( exType, description, "", "", -1 )
    {}
    ~Exception() { free( m_backtracemessages ); }
    Exception( const Exception & );
    Exception( Exception && );

    const char * what() const noexcept override { return full( false ).c_str(); }
    const std::string & full( bool includeBacktrace ) const noexcept
    {
        m_full.clear();
        if( m_line >= 0 )
            m_full = m_file + ":" + m_function + ":" + std::to_string( m_line ) + ":";
        m_full += m_exType + ": " + m_description;
        if( includeBacktrace && m_backtracesize > 0 )
            m_full += '\n' + backtraceString();
        return m_full;
    }

    const std::string & exceptionType() const noexcept { return m_exType; }
    const std::string & description() const noexcept   { return m_description; }

    char ** btmessages() const { return m_backtracemessages; }
    int btsize() const { return m_backtracesize; }

    std::string backtraceString() const;
    void writeBacktrace( std::ostream & ) const;
    void writeBacktrace( std::ostream && dest ) const { writeBacktrace( dest ); }

private:
    void setbt();

    mutable std::string m_full;
    std::string         m_exType;
    std::string         m_description;
    std::string         m_file;
    std::string         m_function;
    int                 m_line;
    int                 m_backtracesize;
    char **             m_backtracemessages;
};

#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)
#define RAWSTRUCT_DECLARE_EXCEPTION( DerivedException, BaseException ) class DerivedException : public BaseException { public: DerivedException( const char * exType, const std::string &r, const char * file, const char * func, int line ) : BaseException( exType, r, file, func, line ) {} };

RAWSTRUCT_DECLARE_EXCEPTION( RuntimeException,   Exception )
RAWSTRUCT_DECLARE_EXCEPTION( ValueError,         RuntimeException )
RAWSTRUCT_DECLARE_EXCEPTION( KeyError,           RuntimeException )
RAWSTRUCT_DECLARE_EXCEPTION( TypeError,          RuntimeException )
RAWSTRUCT_DECLARE_EXCEPTION( RangeError,         RuntimeException )

//malformed struct layouts, raised when a shape is built
RAWSTRUCT_DECLARE_EXCEPTION( ConfigurationError, ValueError )

template<typename T>
[[noreturn]] NO_INLINE void throw_exc( T && e );

template<typename T>
[[noreturn]] inline void throw_exc( T && e ) { throw e; }

#define RAWSTRUCT_THROW( EX_TYPE, MSG ) do { std::stringstream desc; desc << MSG ;  rawstruct::throw_exc(EX_TYPE( #EX_TYPE, desc.str(), __FILENAME__ , __FUNCTION__ , __LINE__  )); } while( 0 )

#define RAWSTRUCT_TRUE_OR_THROW( EXPR, EXCEPTION_TYPE, MESSAGE ) do {if( unlikely(!((EXPR))) ) { RAWSTRUCT_THROW( EXCEPTION_TYPE, MESSAGE ); }} while(false)

}

#endif
