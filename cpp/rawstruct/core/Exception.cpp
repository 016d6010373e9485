#include <rawstruct/core/Exception.h>
#include <rawstruct/core/System.h>

#include <signal.h>
#include <string.h>

#include <iostream>
#include <cstdlib>

#ifndef WIN32
#include <execinfo.h>
#endif

//Uncaught rawstruct exceptions are reported on std::cerr together with the backtrace captured at the throw site
static void rawstruct_terminate( void );
static bool set_fatal_signal_handlers();

static const bool SET_TERMINATE = std::set_terminate( rawstruct_terminate );
static const bool SET_SIGNAL_HANDLERS = set_fatal_signal_handlers();

static void printBacktrace( char ** messages, int size, std::ostream & dest )
{
    if( !messages )
    {
        dest << "Backtrace unavailable\n" << std::endl;
        return;
    }

    for( int i = 0; i < size; ++i )
    {
        //symbol lines look like ./module(function+0x15c) [0x8048a6d]
        char tmp[1024];
        strncpy( tmp, messages[i], sizeof( tmp ) - 1 );
        tmp[ sizeof( tmp ) - 1 ] = 0;

        char * open = strchr( tmp, '(' );
        char * plus = open ? strchr( open, '+' ) : nullptr;

        if( open && plus )
        {
            *plus = '\0';
            std::string symbol = rawstruct::demangle( open + 1 );
            dest << "[bt]: (" << i << ") " << ( symbol.empty() ? messages[i] : symbol ) << std::endl;
        }
        else
            dest << "[bt]: (" << i << ") " << messages[i] << std::endl;
    }

    dest << std::endl;
}

static void printCurrentBacktrace()
{
#ifndef WIN32
    void * frames[50];
    int size = backtrace( frames, 50 );
    char ** messages = backtrace_symbols( frames, size );
    printBacktrace( messages, size, std::cerr );
    free( messages );
#endif
}

void rawstruct_terminate()
{
    static int rethrown = 0;

    try
    {
        if( !rethrown++ )
            throw;
    }
    catch( const rawstruct::Exception & ex )
    {
        std::cerr << "rawstruct: unhandled " << ex.exceptionType() << ": " << ex.what() << std::endl;
        if( ex.btsize() > 0 )
            printBacktrace( ex.btmessages(), ex.btsize(), std::cerr );
    }
    catch( const std::exception & e )
    {
        std::cerr << "rawstruct: unhandled std::exception: " << e.what() << std::endl;
    }
    catch( ... )
    {
        std::cerr << "rawstruct: unhandled exception of unknown type" << std::endl;
    }

    printCurrentBacktrace();

    signal( SIGABRT, SIG_DFL );
    signal( SIGSEGV, SIG_DFL );

    abort();
}

#ifndef WIN32
static void fatal_signal_handler( int sig_num, siginfo_t * info, void * )
{
    std::cerr << "rawstruct: signal " << sig_num << " (" << strsignal( sig_num ) << ") at address "
              << info -> si_addr << std::endl;

    printCurrentBacktrace();

    signal( SIGABRT, SIG_DFL );
    signal( SIGSEGV, SIG_DFL );
    signal( SIGBUS, SIG_DFL );

    abort();
}

bool set_fatal_signal_handlers()
{
    static struct sigaction sigact;

    sigact.sa_sigaction = fatal_signal_handler;
    sigact.sa_flags = SA_RESTART | SA_SIGINFO;

    sigaction( SIGABRT, &sigact, NULL );
    sigaction( SIGSEGV, &sigact, NULL );
    sigaction( SIGBUS, &sigact, NULL );
    return true;
}
#else
static void fatal_signal_handler( int sig_num )
{
    std::cerr << "rawstruct: signal " << sig_num << std::endl;

    signal( SIGABRT, SIG_DFL );
    signal( SIGSEGV, SIG_DFL );
    abort();
}

bool set_fatal_signal_handlers()
{
    signal( SIGABRT, fatal_signal_handler );
    signal( SIGSEGV, fatal_signal_handler );
    return true;
}
#endif

void rawstruct::Exception::setbt()
{
#ifndef WIN32
    void * frames[50];
    m_backtracesize = backtrace( frames, 50 );
    m_backtracemessages = backtrace_symbols( frames, m_backtracesize );
#endif
}

//backtrace_symbols returns a single malloc'd block holding the pointer table followed by the strings,
//so a copy has to rebase every pointer into the new block
static char ** dupe_backtraces( char ** bt, int n )
{
    if( bt == nullptr )
        return nullptr;

    size_t len = n * sizeof( char * );
    for( int i = 0; i < n; ++i )
        len += strlen( bt[ i ] ) + 1;
    char ** newbt = ( char ** ) malloc( len );
    memcpy( newbt, bt, len );

    for( int i = 0; i < n; ++i )
        newbt[i] = ( char * ) newbt + ( bt[ i ] - ( char * ) bt );

    return newbt;
}

rawstruct::Exception::Exception( const rawstruct::Exception & orig ) :
    m_full( orig.m_full ),
    m_exType( orig.m_exType ),
    m_description( orig.m_description ),
    m_file( orig.m_file ),
    m_function( orig.m_function ),
    m_line( orig.m_line ),
    m_backtracesize( orig.m_backtracesize ),
    m_backtracemessages( dupe_backtraces( orig.m_backtracemessages, orig.m_backtracesize ) )
{
}

rawstruct::Exception::Exception( rawstruct::Exception && donor ) :
    m_full( std::move( donor.m_full ) ),
    m_exType( std::move( donor.m_exType ) ),
    m_description( std::move( donor.m_description ) ),
    m_file( std::move( donor.m_file ) ),
    m_function( std::move( donor.m_function ) ),
    m_line( donor.m_line ),
    m_backtracesize( donor.m_backtracesize ),
    m_backtracemessages( donor.m_backtracemessages )
{
    donor.m_backtracemessages = nullptr;
    donor.m_backtracesize = 0;
}

void rawstruct::Exception::writeBacktrace( std::ostream & dest ) const
{
    if( m_backtracesize != 0 )
        printBacktrace( m_backtracemessages, m_backtracesize, dest );
}

std::string rawstruct::Exception::backtraceString() const
{
    std::stringstream out;
    writeBacktrace( out );
    return out.str();
}
