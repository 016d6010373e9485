#include <rawstruct/view/StructView.h>

namespace rawstruct
{

StructView::StructView( StructShapePtr shape, BufferPtr buffer, ViewOptions options ) : m_shape( std::move( shape ) ),
                                                                                        m_start( 0 ),
                                                                                        m_owner( false ),
                                                                                        m_caching( options.caching ),
                                                                                        m_pending( 0 )
{
    RAWSTRUCT_TRUE_OR_THROW( m_shape, ValueError, "StructView requires a StructShape" );

    bind( std::move( buffer ), options.start );

    if( m_caching )
        m_cache.resize( m_shape -> numFields() );
}

void StructView::bind( BufferPtr buffer, size_t start )
{
    size_t required = m_shape -> size();

    if( !buffer )
    {
        m_buffer = Buffer::allocate( required );
        m_start  = 0;
        m_owner  = true;
        return;
    }

    RAWSTRUCT_TRUE_OR_THROW( buffer -> isValid(), TypeError,
                             "StructView " << m_shape -> name() << " expects a Buffer over valid memory, got a Buffer with no memory region" );

    size_t actual = start < buffer -> size() ? buffer -> size() - start : 0;
    if( actual < required )
        RAWSTRUCT_THROW( RangeError, "StructView " << m_shape -> name() << ": At least " << required << " bytes were needed, but only "
                         << actual << " bytes were given" );

    m_buffer = std::move( buffer );
    m_start  = start;
    m_owner  = false;
}

const ShapeField & StructView::resolve( const FieldHandle & handle ) const
{
    if( unlikely( !m_shape -> owns( handle ) ) )
        RAWSTRUCT_THROW( KeyError, "FieldHandle does not belong to StructShape " << m_shape -> name() );
    return m_shape -> field( handle.index() );
}

void StructView::set( const ShapeField & field, FieldValue value )
{
    if( !m_caching )
    {
        field.write( *m_buffer, m_start, value );
        return;
    }

    auto & slot = m_cache[ field.index() ];
    if( !slot )
        ++m_pending;
    slot = std::move( value );
}

void StructView::setBufferHandle( BufferPtr buffer, size_t start )
{
    bind( std::move( buffer ), start );
}

void StructView::serialize()
{
    if( !m_caching || m_pending == 0 )
        return;

    //encode into a scratch copy of our region first so that a failing codec leaves the live buffer untouched
    size_t size = m_shape -> size();
    BufferPtr scratch = Buffer::allocate( size );
    m_buffer -> copy( *scratch, 0, m_start, m_start + size );

    for( auto & field : m_shape -> fields() )
    {
        auto & slot = m_cache[ field.index() ];
        if( slot )
            field.write( *scratch, 0, *slot );
    }

    scratch -> copy( *m_buffer, m_start );

    for( auto & slot : m_cache )
        slot.reset();
    m_pending = 0;
}

BufferPtr StructView::toBuffer() const
{
    return Buffer::copyOf( m_buffer -> data() + m_start, m_shape -> size() );
}

std::ostream & operator<<( std::ostream & o, const StructView & view )
{
    auto & shape = *view.shape();
    o << shape.name() << "( ";
    for( size_t i = 0; i < shape.numFields(); ++i )
    {
        auto & field = shape.field( i );
        if( i > 0 )
            o << ", ";
        o << field.fieldname() << "=" << view.get( field.fieldname() );
    }
    o << " )";
    return o;
}

}
