#include <stdio.h>

#include <AnalyzerHelpers.h>

#include "USBTypes.h"

bool USBDecodeError::Set( USBErrorKind kind, const std::string& message, const char* field, size_t offset )
{
    // keep the innermost failure
    if( IsSet() )
        return false;

    mKind = kind;
    mMessage = message;
    mField = field ? field : "";
    mOffset = offset;

    return false;
}

std::string USBDecodeError::GetText() const
{
    if( !IsSet() )
        return std::string();

    std::string ret_val = mKind == ERR_Truncated ? "Truncated: " : "Invalid argument: ";
    ret_val += mMessage;

    if( !mField.empty() )
        ret_val += " (field " + mField + " at offset " + int2str( mOffset ) + ")";

    return ret_val;
}

bool USBStringRef::Resolve( const std::string& value )
{
    if( mResolved )
        return false;

    mValue = value;
    mResolved = true;
    return true;
}

std::string USBVersion::ToString() const
{
    std::string ret_val;
    if( mBCD & 0xf000 )
        ret_val += int2str( mBCD >> 12 );

    ret_val += int2str( ( mBCD >> 8 ) & 0x0f );
    ret_val += ".";
    ret_val += int2str( ( mBCD >> 4 ) & 0x0f );
    ret_val += int2str( mBCD & 0x0f );

    return ret_val;
}

USBDescriptorReader::USBDescriptorReader( const U8* data, size_t size, size_t base )
    : mData( data ), mSize( data ? size : 0 ), mOffset( 0 ), mBase( base )
{
}

USBDescriptorReader::USBDescriptorReader( const std::vector<U8>& data, size_t base )
    : mData( data.empty() ? NULL : &data.front() ), mSize( data.size() ), mOffset( 0 ), mBase( base )
{
}

bool USBDescriptorReader::Fail( USBErrorKind kind, const std::string& message, const char* field )
{
    return mError.Set( kind, message, field, mBase + mOffset );
}

bool USBDescriptorReader::Need( size_t numBytes, const char* field )
{
    if( mError.IsSet() )
        return false;

    if( numBytes > mSize - mOffset )
        return Fail( ERR_Truncated,
                     std::string( field ) + " needs " + int2str( numBytes ) + " bytes, " + int2str( mSize - mOffset ) + " left",
                     field );

    return true;
}

bool USBDescriptorReader::NeedElements( size_t count, size_t elementSize, const char* field )
{
    if( mError.IsSet() )
        return false;

    if( count > ( mSize - mOffset ) / elementSize )
        return Fail( ERR_Truncated,
                     std::string( field ) + " has " + int2str( count ) + " elements of " + int2str( elementSize ) + " bytes, " +
                         int2str( mSize - mOffset ) + " bytes left",
                     field );

    return true;
}

U32 USBDescriptorReader::GetLE( size_t numBytes )
{
    U32 ret_val = 0;
    for( size_t cnt = 0; cnt < numBytes; ++cnt )
        ret_val |= U32( mData[ mOffset + cnt ] ) << ( cnt * 8 );

    mOffset += numBytes;
    return ret_val;
}

bool USBDescriptorReader::Read( U8& val, const char* field )
{
    if( !Need( 1, field ) )
        return false;

    val = mData[ mOffset++ ];
    return true;
}

bool USBDescriptorReader::Read( U16& val, const char* field )
{
    if( !Need( 2, field ) )
        return false;

    val = U16( GetLE( 2 ) );
    return true;
}

bool USBDescriptorReader::Read( U32& val, const char* field )
{
    if( !Need( 4, field ) )
        return false;

    val = GetLE( 4 );
    return true;
}

bool USBDescriptorReader::Read( U64& val, const char* field )
{
    if( !Need( 8, field ) )
        return false;

    U64 lo = GetLE( 4 );
    U64 hi = GetLE( 4 );
    val = ( hi << 32 ) | lo;
    return true;
}

bool USBDescriptorReader::Read24( U32& val, const char* field )
{
    if( !Need( 3, field ) )
        return false;

    val = GetLE( 3 );
    return true;
}

bool USBDescriptorReader::ReadBCD( USBVersion& val, const char* field )
{
    return Read( val.mBCD, field );
}

bool USBDescriptorReader::ReadString( USBStringRef& val, const char* field )
{
    return Read( val.mIndex, field );
}

bool USBDescriptorReader::ReadArray( std::vector<U8>& vals, size_t count, const char* field )
{
    if( !Need( count, field ) )
        return false;

    vals.assign( mData + mOffset, mData + mOffset + count );
    mOffset += count;
    return true;
}

bool USBDescriptorReader::ReadArray( std::vector<U16>& vals, size_t count, const char* field )
{
    if( !NeedElements( count, 2, field ) )
        return false;

    vals.clear();
    for( size_t cnt = 0; cnt < count; ++cnt )
        vals.push_back( U16( GetLE( 2 ) ) );

    return true;
}

bool USBDescriptorReader::ReadArray( std::vector<U32>& vals, size_t count, const char* field )
{
    if( !NeedElements( count, 4, field ) )
        return false;

    vals.clear();
    for( size_t cnt = 0; cnt < count; ++cnt )
        vals.push_back( GetLE( 4 ) );

    return true;
}

bool USBDescriptorReader::ReadArray24( std::vector<U32>& vals, size_t count, const char* field )
{
    if( !NeedElements( count, 3, field ) )
        return false;

    vals.clear();
    for( size_t cnt = 0; cnt < count; ++cnt )
        vals.push_back( GetLE( 3 ) );

    return true;
}

bool USBDescriptorReader::ReadSized( U32& val, size_t numBytes, const char* field )
{
    if( numBytes > 4 )
        return Fail( ERR_InvalidArg, std::string( field ) + " wider than 4 bytes", field );

    if( !Need( numBytes, field ) )
        return false;

    val = GetLE( numBytes );
    return true;
}

void USBDescriptorReader::ReadRemaining( std::vector<U8>& vals )
{
    vals.clear();
    if( mOffset < mSize )
        vals.assign( mData + mOffset, mData + mSize );

    mOffset = mSize;
}

bool USBDescriptorReader::Skip( size_t numBytes, const char* field )
{
    if( !Need( numBytes, field ) )
        return false;

    mOffset += numBytes;
    return true;
}

bool USBDescriptorReader::Peek( size_t ahead, U8& val ) const
{
    if( ahead >= mSize - mOffset )
        return false;

    val = mData[ mOffset + ahead ];
    return true;
}

void USBDescriptorWriter::PutLE( U32 val, size_t numBytes )
{
    for( size_t cnt = 0; cnt < numBytes; ++cnt )
        mOut.push_back( U8( val >> ( cnt * 8 ) ) );
}

void USBDescriptorWriter::Write( U8 val )
{
    mOut.push_back( val );
}

void USBDescriptorWriter::Write( U16 val )
{
    PutLE( val, 2 );
}

void USBDescriptorWriter::Write( U32 val )
{
    PutLE( val, 4 );
}

void USBDescriptorWriter::Write( U64 val )
{
    PutLE( U32( val ), 4 );
    PutLE( U32( val >> 32 ), 4 );
}

void USBDescriptorWriter::Write24( U32 val )
{
    PutLE( val, 3 );
}

void USBDescriptorWriter::Write( const USBVersion& val )
{
    PutLE( val.mBCD, 2 );
}

void USBDescriptorWriter::Write( const USBStringRef& val )
{
    mOut.push_back( val.mIndex );
}

void USBDescriptorWriter::WriteArray( const std::vector<U8>& vals )
{
    mOut.insert( mOut.end(), vals.begin(), vals.end() );
}

void USBDescriptorWriter::WriteArray( const std::vector<U16>& vals )
{
    for( std::vector<U16>::const_iterator i( vals.begin() ); i != vals.end(); ++i )
        PutLE( *i, 2 );
}

void USBDescriptorWriter::WriteArray( const std::vector<U32>& vals )
{
    for( std::vector<U32>::const_iterator i( vals.begin() ); i != vals.end(); ++i )
        PutLE( *i, 4 );
}

void USBDescriptorWriter::WriteArray24( const std::vector<U32>& vals )
{
    for( std::vector<U32>::const_iterator i( vals.begin() ); i != vals.end(); ++i )
        PutLE( *i, 3 );
}

void USBDescriptorWriter::WriteSized( U32 val, size_t numBytes )
{
    PutLE( val, numBytes );
}

std::vector<std::string> GetBitmapStrings( U64 bitmap, const char* const* labels, size_t numLabels )
{
    std::vector<std::string> ret_val;
    for( size_t bit = 0; bit < numLabels && bit < 64; ++bit )
    {
        if( ( bitmap >> bit ) & 1 && labels[ bit ] != NULL )
            ret_val.push_back( labels[ bit ] );
    }

    return ret_val;
}

std::vector<UACControlEntry> GetBitmapControls( U32 controls, const char* const* labels, size_t numLabels, UACControlType type )
{
    std::vector<UACControlEntry> ret_val;
    for( size_t ndx = 0; ndx < numLabels; ++ndx )
    {
        UACControlEntry entry;
        entry.mLabel = labels[ ndx ];

        if( type == CT_BmControl1 )
        {
            if( ndx >= 32 || ( ( controls >> ndx ) & 1 ) == 0 )
                continue;

            entry.mSetting = CS_Present;
        }
        else
        {
            if( ndx >= 16 )
                break;

            U32 bits = ( controls >> ( ndx * 2 ) ) & 0x3;

            // 0b00 means the control is not there
            if( bits == 0 )
                continue;

            entry.mSetting = UACControlSetting( bits );
        }

        ret_val.push_back( entry );
    }

    return ret_val;
}

std::string int2str_sal( const U64 i, DisplayBase base, const int max_bits )
{
    char number_str[ 256 ];
    AnalyzerHelpers::GetNumberString( i, base, max_bits, number_str, sizeof( number_str ) );
    return number_str;
}

std::string hex2str( const std::vector<U8>& data, const char* separator )
{
    std::string ret_val;
    char buff[ 4 ];
    for( std::vector<U8>::const_iterator i( data.begin() ); i != data.end(); ++i )
    {
        if( i != data.begin() )
            ret_val += separator;

        sprintf( buff, "%02x", *i );
        ret_val += buff;
    }

    return ret_val;
}
