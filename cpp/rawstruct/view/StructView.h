#ifndef _IN_RAWSTRUCT_VIEW_STRUCTVIEW_H
#define _IN_RAWSTRUCT_VIEW_STRUCTVIEW_H

#include <rawstruct/view/Buffer.h>
#include <rawstruct/view/FieldValue.h>
#include <rawstruct/view/StructShape.h>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace rawstruct
{

class StructView;

//Result of view[ "field" ].  Assigning sets the field, converting gets it.  Only valid while the view is alive
class FieldProxy
{
public:
    FieldProxy( const FieldProxy & ) = default;

    FieldValue value() const;

    template<typename T>
    T as() const { return valueAs<T>( value() ); }

    template<typename T, typename = std::enable_if_t<std::is_arithmetic_v<T> || std::is_same_v<T,std::string>>>
    operator T() const { return as<T>(); }

    FieldProxy & operator=( const FieldValue & value );

    template<typename T, typename = std::enable_if_t<std::is_arithmetic_v<T> || std::is_same_v<T,std::string>>>
    FieldProxy & operator=( const T & value ) { return *this = makeFieldValue( value ); }

    FieldProxy & operator=( const char * value ) { return *this = FieldValue( std::string( value ) ); }

    //view[ "a" ] = view[ "b" ] copies the value, not the proxy
    FieldProxy & operator=( const FieldProxy & rhs ) { return *this = rhs.value(); }

    const ShapeField & field() const { return *m_field; }

private:
    FieldProxy( StructView & view, const ShapeField & field ) : m_view( view ), m_field( &field ) {}

    friend class StructView;

    StructView &       m_view;
    const ShapeField * m_field;
};

/* StructView

Typed accessor over shape.size() bytes of a Buffer, starting at start().  The view either allocates its own
zeroed buffer or adopts one handed in by the caller, who keeps a reference and may keep mutating it directly.
Writes through an adopted buffer are visible to every other holder and vice versa.

With caching enabled set() only records the value and get() returns the recorded value.  Nothing is validated
or written until serialize(), which either writes every pending value or none of them.

Reads are never bounds checked per call, the length is validated once whenever a buffer is bound.  Bytes that
were never written read back as whatever the buffer holds, zeros for a view allocated buffer.

No locking is done.  Sharing an adopted buffer across threads requires external synchronization.
*/
class StructView
{
public:
    //buffer nullptr allocates a fresh zeroed buffer owned by the view, options.start is then ignored.
    //raises TypeError if buffer does not wrap valid memory, RangeError if it is too short for the shape
    StructView( StructShapePtr shape, BufferPtr buffer = nullptr, ViewOptions options = ViewOptions() );

    const StructShapePtr & shape() const { return m_shape; }

    bool   isCaching() const { return m_caching; }
    size_t start() const     { return m_start; }

    //true if the bound buffer was allocated by the view rather than adopted
    bool   isOwner() const   { return m_owner; }

    //number of values waiting for serialize()
    size_t pendingCount() const { return m_pending; }

    FieldValue get( const std::string & name ) const { return get( m_shape -> fieldOrThrow( name ) ); }
    FieldValue get( const FieldHandle & handle ) const { return get( resolve( handle ) ); }

    template<typename T>
    T getAs( const std::string & name ) const { return valueAs<T>( get( name ) ); }

    template<typename T>
    T getAs( const FieldHandle & handle ) const { return valueAs<T>( get( handle ) ); }

    template<typename T>
    void set( const std::string & name, const T & value ) { set( m_shape -> fieldOrThrow( name ), makeFieldValue( value ) ); }

    template<typename T>
    void set( const FieldHandle & handle, const T & value ) { set( resolve( handle ), makeFieldValue( value ) ); }

    FieldProxy operator[]( const std::string & name )   { return FieldProxy( *this, m_shape -> fieldOrThrow( name ) ); }
    FieldProxy operator[]( const FieldHandle & handle ) { return FieldProxy( *this, resolve( handle ) ); }

    //flushes pending values, no-op unless caching
    void serialize();

    //the live buffer, not a copy
    const BufferPtr & getBufferHandle() const { return m_buffer; }

    //rebinds with the same checks as construction, nullptr allocates a fresh zeroed buffer.
    //pending values are kept and land in the new buffer on serialize()
    void setBufferHandle( BufferPtr buffer = nullptr, size_t start = 0 );

    //copy of the shape.size() bytes this view covers
    BufferPtr toBuffer() const;

    //every byte of the live buffer, including bytes outside the view
    std::vector<uint8_t> toJSON() const { return m_buffer -> toJSON(); }

    //decodes bytes of the live buffer, see Buffer::toString
    std::string toString( Encoding encoding, size_t start = 0, size_t end = Buffer::npos ) const
    {
        return m_buffer -> toString( encoding, start, end );
    }

    std::string toString( const std::string & encoding = "utf8", size_t start = 0, size_t end = Buffer::npos ) const
    {
        return m_buffer -> toString( encoding, start, end );
    }

    std::string toString( const char * encoding, size_t start = 0, size_t end = Buffer::npos ) const
    {
        return m_buffer -> toString( encoding, start, end );
    }

private:
    const ShapeField & resolve( const FieldHandle & handle ) const;

    FieldValue get( const ShapeField & field ) const
    {
        if( m_caching )
        {
            auto & slot = m_cache[ field.index() ];
            if( slot )
                return *slot;
        }
        return field.read( *m_buffer, m_start );
    }

    void set( const ShapeField & field, FieldValue value );

    void bind( BufferPtr buffer, size_t start );

    friend class FieldProxy;

    using Cache = std::vector<std::optional<FieldValue>>;

    StructShapePtr m_shape;
    BufferPtr      m_buffer;
    size_t         m_start;
    bool           m_owner;
    bool           m_caching;
    Cache          m_cache;
    size_t         m_pending;
};

std::ostream & operator<<( std::ostream & o, const StructView & view );

inline FieldValue FieldProxy::value() const
{
    return m_view.get( *m_field );
}

inline FieldProxy & FieldProxy::operator=( const FieldValue & value )
{
    m_view.set( *m_field, value );
    return *this;
}

}

#endif
