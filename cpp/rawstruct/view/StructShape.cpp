#include <rawstruct/view/StructShape.h>
#include <rawstruct/view/StructView.h>
#include <algorithm>
#include <atomic>
#include <limits>

namespace rawstruct
{

/*
Field placement.  Fields are laid out in declaration order with no alignment padding, each one right after
the previous one's end.  A field with an explicit offset is placed there and the cursor continues from its end,
so a later auto-placed field follows the explicit one.  Explicit offsets may point backwards into an earlier
field, which is how unions over the same bytes are declared.

The name map is keyed on the c_str of the names held in m_fields, so m_fields must not reallocate once the
map is built.
*/

static std::atomic<uint64_t> s_nextShapeId( 1 );

StructShape::StructShape( const std::string & name, const std::vector<FieldSpec> & fields,
                          size_t totalLength ) : m_name( name ), m_id( s_nextShapeId++ ), m_size( 0 )
{
    if( fields.empty() )
        RAWSTRUCT_THROW( ConfigurationError, "StructShape " << name << " must define at least 1 field" );

    m_fields.reserve( fields.size() );

    size_t cursor = 0;
    size_t extent = 0;
    for( auto & spec : fields )
    {
        if( spec.name.empty() )
            RAWSTRUCT_THROW( ConfigurationError, "StructShape " << name << " field " << m_fields.size() << " has an empty name" );

        if( !spec.codec )
            RAWSTRUCT_THROW( ConfigurationError, "StructShape " << name << " field " << spec.name << " has no codec" );

        size_t size = spec.size ? spec.size : spec.codec -> size();
        if( size == 0 )
            RAWSTRUCT_THROW( ConfigurationError, "StructShape " << name << " field " << spec.name << " has size 0" );

        if( size != spec.codec -> size() )
            RAWSTRUCT_THROW( ConfigurationError, "StructShape " << name << " field " << spec.name << " declared with size " << size
                             << " but codec " << spec.codec -> name() << " has size " << spec.codec -> size() );

        size_t offset = spec.offset == FieldSpec::AUTO_OFFSET ? cursor : spec.offset;
        if( offset > std::numeric_limits<size_t>::max() - size )
            RAWSTRUCT_THROW( ConfigurationError, "StructShape " << name << " field " << spec.name << " at offset " << offset
                             << " with size " << size << " runs past the addressable range" );

        m_fields.emplace_back( ShapeField( spec.name, spec.codec, offset, size, m_fields.size() ) );

        cursor = offset + size;
        extent = std::max( extent, cursor );
    }

    for( auto & field : m_fields )
    {
        if( !m_fieldMap.emplace( field.fieldname().c_str(), field.index() ).second )
            RAWSTRUCT_THROW( ConfigurationError, "StructShape " << name << " attempted to add existing field " << field.fieldname() );
    }

    if( totalLength == 0 )
        m_size = extent;
    else if( totalLength < extent )
        RAWSTRUCT_THROW( ConfigurationError, "StructShape " << name << " declared with total length " << totalLength
                         << " but its fields need " << extent << " bytes" );
    else
        m_size = totalLength;
}

const ShapeField & StructShape::fieldOrThrow( const std::string & name ) const
{
    auto * f = field( name );
    if( !f )
        RAWSTRUCT_THROW( KeyError, "StructShape " << m_name << " has no field named " << name );
    return *f;
}

FieldHandle StructShape::fieldHandle( const std::string & name ) const
{
    return FieldHandle( this, m_id, fieldOrThrow( name ).index() );
}

StructShapePtr StructShape::sharedShape() const
{
    auto self = weak_from_this().lock();
    if( !self )
        RAWSTRUCT_THROW( RuntimeException, "StructShape " << m_name << " is not owned by a StructShapePtr, build it with StructShape::make" );
    return self;
}

StructView StructShape::create( ViewOptions options ) const
{
    return StructView( sharedShape(), nullptr, options );
}

StructView StructShape::create( BufferPtr buffer, ViewOptions options ) const
{
    return StructView( sharedShape(), std::move( buffer ), options );
}

std::string StructShape::layout() const
{
    std::string out;
    out.resize( size(), ' ' );

    for( auto & field : m_fields )
    {
        char type = ' ';
        switch( field.type() )
        {
            case FieldType::BOOL:   type = 'b'; break;
            case FieldType::INT8:   type = 'c'; break;
            case FieldType::UINT8:  type = 'C'; break;
            case FieldType::INT16:  type = 'h'; break;
            case FieldType::UINT16: type = 'H'; break;
            case FieldType::INT32:  type = 'd'; break;
            case FieldType::UINT32: type = 'D'; break;
            case FieldType::INT64:  type = 'l'; break;
            case FieldType::UINT64: type = 'L'; break;
            case FieldType::FLOAT:  type = 'f'; break;
            case FieldType::DOUBLE: type = 'F'; break;
            case FieldType::STRING: type = 's'; break;
            case FieldType::UNKNOWN:
            case FieldType::NUM_TYPES:
                break;
        }

        //overlapping bytes are marked
        for( size_t c = 0; c < field.size(); ++c )
        {
            char & slot = out[ field.offset() + c ];
            slot = slot == ' ' ? type : '*';
        }
    }

    return out;
}

}
