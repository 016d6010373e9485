#ifndef _IN_RAWSTRUCT_VIEW_STRUCTSHAPE_H
#define _IN_RAWSTRUCT_VIEW_STRUCTSHAPE_H

#include <rawstruct/core/Hash.h>
#include <rawstruct/view/Buffer.h>
#include <rawstruct/view/FieldCodec.h>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace rawstruct
{

class StructShape;
class StructView;

using StructShapePtr = std::shared_ptr<const StructShape>;

//Field declaration handed to StructShape.  size 0 means "the codec's size", AUTO_OFFSET places the field
//right after the previously declared one
struct FieldSpec
{
    static constexpr size_t AUTO_OFFSET = static_cast<size_t>( -1 );

    FieldSpec( const std::string & name_, FieldCodecPtr codec_, size_t size_ = 0, size_t offset_ = AUTO_OFFSET ) :
        name( name_ ), codec( std::move( codec_ ) ), size( size_ ), offset( offset_ )
    {}

    //codec looked up by registry name, ie { "length", "uint32be" }
    FieldSpec( const std::string & name_, const std::string & codecName, size_t size_ = 0, size_t offset_ = AUTO_OFFSET ) :
        FieldSpec( name_, FieldCodec::fromName( codecName ), size_, offset_ )
    {}

    FieldSpec( const std::string & name_, const char * codecName, size_t size_ = 0, size_t offset_ = AUTO_OFFSET ) :
        FieldSpec( name_, std::string( codecName ), size_, offset_ )
    {}

    std::string   name;
    FieldCodecPtr codec;
    size_t        size;
    size_t        offset;
};

class ShapeField
{
public:
    const std::string &   fieldname() const { return m_fieldname; }
    const FieldCodecPtr & codec() const     { return m_codec; }
    FieldType             type() const      { return m_codec -> type(); }
    size_t                offset() const    { return m_offset; } //offset from the start of the struct
    size_t                size() const      { return m_size; }   //size of field in bytes
    size_t                index() const     { return m_index; }  //declaration order

    //base is where the struct starts in buffer
    FieldValue read( const Buffer & buffer, size_t base ) const
    {
        return m_codec -> read( buffer, base + m_offset );
    }

    void write( Buffer & buffer, size_t base, const FieldValue & value ) const
    {
        m_codec -> write( buffer, base + m_offset, value );
    }

private:
    ShapeField( const std::string & fieldname, FieldCodecPtr codec, size_t offset, size_t size, size_t index ) :
        m_fieldname( fieldname ), m_codec( std::move( codec ) ), m_offset( offset ), m_size( size ), m_index( index )
    {}

    friend class StructShape;

    std::string   m_fieldname;
    FieldCodecPtr m_codec;
    size_t        m_offset;
    size_t        m_size;
    size_t        m_index;
};

/*
Pre-resolved field reference, avoids the name lookup on hot paths.  Only valid with views of the shape that
produced it.  A handle does not keep its shape alive: the caller must hold the StructShapePtr for as long as the
handle is in use.  Shapes stamp their handles with a process-unique id, so a stale handle is rejected by a new
shape that happens to reuse the old address.
*/
class FieldHandle
{
public:
    FieldHandle() : m_shape( nullptr ), m_shapeId( 0 ), m_index( 0 ) {}

    size_t index() const           { return m_index; }
    const StructShape * shape() const { return m_shape; }
    uint64_t shapeId() const       { return m_shapeId; }
    explicit operator bool() const { return m_shape != nullptr; }

private:
    FieldHandle( const StructShape * shape, uint64_t shapeId, size_t index ) : m_shape( shape ), m_shapeId( shapeId ), m_index( index ) {}

    friend class StructShape;

    const StructShape * m_shape;
    uint64_t            m_shapeId;
    size_t              m_index;
};

struct ViewOptions
{
    ViewOptions( bool caching_ = false, size_t start_ = 0 ) : caching( caching_ ), start( start_ ) {}

    //defer writes until StructView::serialize()
    bool   caching;

    //where the struct starts in an adopted buffer
    size_t start;
};

/* StructShape

The immutable layout of a struct: ordered fields with their offsets and codecs, plus the total byte length.
Offsets are resolved once here and shared by every StructView built from the shape.
Fields may overlap ( union-style aliasing ), that is taken as intended and not validated.
*/
class StructShape : public std::enable_shared_from_this<StructShape>
{
public:
    using Fields = std::vector<ShapeField>;

    //totalLength 0 derives the length from the fields.  Build shapes through make(), create() needs the shape
    //to be owned by a StructShapePtr and raises RuntimeException otherwise
    StructShape( const std::string & name, const std::vector<FieldSpec> & fields, size_t totalLength = 0 );

    StructShape( const StructShape & ) = delete;
    StructShape & operator=( const StructShape & ) = delete;

    static StructShapePtr make( const std::string & name, const std::vector<FieldSpec> & fields, size_t totalLength = 0 )
    {
        return std::make_shared<StructShape>( name, fields, totalLength );
    }

    const std::string & name() const { return m_name; }
    uint64_t id() const              { return m_id; }
    size_t size() const              { return m_size; }
    size_t numFields() const         { return m_fields.size(); }
    const Fields & fields() const    { return m_fields; }

    const ShapeField & field( size_t index ) const { return m_fields[ index ]; }

    //nullptr if missing
    const ShapeField * field( const char * name ) const
    {
        auto it = m_fieldMap.find( name );
        return it == m_fieldMap.end() ? nullptr : &m_fields[ it -> second ];
    }

    const ShapeField * field( const std::string & name ) const { return field( name.c_str() ); }

    //raises KeyError if missing
    const ShapeField & fieldOrThrow( const std::string & name ) const;
    FieldHandle fieldHandle( const std::string & name ) const;

    bool owns( const FieldHandle & handle ) const
    {
        return handle.shape() == this && handle.shapeId() == m_id && handle.index() < m_fields.size();
    }

    StructView create( ViewOptions options = ViewOptions() ) const;
    StructView create( BufferPtr buffer, ViewOptions options = ViewOptions() ) const;

    //for debugging layouts, one character per byte
    std::string layout() const;

private:
    StructShapePtr sharedShape() const;

    using FieldMap = std::unordered_map<const char *, size_t, hash::CStrHash, hash::CStrEq>;

    std::string m_name;
    uint64_t    m_id;
    Fields      m_fields;
    FieldMap    m_fieldMap;
    size_t      m_size;
};

}

#endif
