#include <spdlog/spdlog.h>

#include "USBDescriptors.h"
#include "USBClassDescriptors.h"
#include "USBLookupTables.h"

void USBRawDescriptor::Encode( std::vector<U8>& out ) const
{
    out.insert( out.end(), mData.begin(), mData.end() );
}

static void AppendUTF8( std::string& str, U32 cp )
{
    if( cp < 0x80 )
    {
        str += char( cp );
    }
    else if( cp < 0x800 )
    {
        str += char( 0xc0 | ( cp >> 6 ) );
        str += char( 0x80 | ( cp & 0x3f ) );
    }
    else if( cp < 0x10000 )
    {
        str += char( 0xe0 | ( cp >> 12 ) );
        str += char( 0x80 | ( ( cp >> 6 ) & 0x3f ) );
        str += char( 0x80 | ( cp & 0x3f ) );
    }
    else
    {
        str += char( 0xf0 | ( cp >> 18 ) );
        str += char( 0x80 | ( ( cp >> 12 ) & 0x3f ) );
        str += char( 0x80 | ( ( cp >> 6 ) & 0x3f ) );
        str += char( 0x80 | ( cp & 0x3f ) );
    }
}

bool USBStringDescriptor::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mLength, "bLength" ) || !reader.Read( mDescriptorType, "bDescriptorType" ) )
        return false;

    reader.ReadRemaining( mData );

    mValue.clear();
    for( size_t ndx = 0; ndx + 1 < mData.size(); ndx += 2 )
    {
        U32 unit = mData[ ndx ] | ( mData[ ndx + 1 ] << 8 );

        // surrogate pair
        if( unit >= 0xd800 && unit < 0xdc00 && ndx + 3 < mData.size() )
        {
            U32 low = mData[ ndx + 2 ] | ( mData[ ndx + 3 ] << 8 );
            if( low >= 0xdc00 && low < 0xe000 )
            {
                unit = 0x10000 + ( ( unit - 0xd800 ) << 10 ) + ( low - 0xdc00 );
                ndx += 2;
            }
        }

        AppendUTF8( mValue, unit );
    }

    return true;
}

void USBStringDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    writer.Write( mLength );
    writer.Write( mDescriptorType );
    writer.WriteArray( mData );
}

// bytes that bLength declares past the fixed fields; nothing beyond bLength is consumed
static bool ReadDeclaredJunk( USBDescriptorReader& reader, U8 length, std::vector<U8>& junk )
{
    junk.clear();
    if( length <= reader.GetOffset() )
        return true;

    return reader.ReadArray( junk, length - reader.GetOffset(), "bLength" );
}

bool USBInterfaceAssociationDescriptor::Decode( USBDescriptorReader& reader )
{
    if( reader.GetRemaining() < 8 )
        return reader.Fail( ERR_InvalidArg, "Interface Association descriptor too short" );

    return reader.Read( mLength, "bLength" ) && reader.Read( mDescriptorType, "bDescriptorType" ) &&
           reader.Read( mFirstInterface, "bFirstInterface" ) && reader.Read( mInterfaceCount, "bInterfaceCount" ) &&
           reader.Read( mFunctionClass, "bFunctionClass" ) && reader.Read( mFunctionSubClass, "bFunctionSubClass" ) &&
           reader.Read( mFunctionProtocol, "bFunctionProtocol" ) && reader.ReadString( mFunction, "iFunction" ) &&
           ReadDeclaredJunk( reader, mLength, mJunk );
}

void USBInterfaceAssociationDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    writer.Write( mLength );
    writer.Write( mDescriptorType );
    writer.Write( mFirstInterface );
    writer.Write( mInterfaceCount );
    writer.Write( mFunctionClass );
    writer.Write( mFunctionSubClass );
    writer.Write( mFunctionProtocol );
    writer.Write( mFunction );
    writer.WriteArray( mJunk );
}

bool USBSecurityDescriptor::Decode( USBDescriptorReader& reader )
{
    if( reader.GetRemaining() < 5 )
        return reader.Fail( ERR_InvalidArg, "Security descriptor too short" );

    return reader.Read( mLength, "bLength" ) && reader.Read( mDescriptorType, "bDescriptorType" ) &&
           reader.Read( mTotalLength, "wTotalLength" ) && reader.Read( mNumEncryptionTypes, "bNumEncryptionTypes" ) &&
           ReadDeclaredJunk( reader, mLength, mJunk );
}

void USBSecurityDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    writer.Write( mLength );
    writer.Write( mDescriptorType );
    writer.Write( mTotalLength );
    writer.Write( mNumEncryptionTypes );
    writer.WriteArray( mJunk );
}

bool USBEncryptionDescriptor::Decode( USBDescriptorReader& reader )
{
    if( reader.GetRemaining() < 5 )
        return reader.Fail( ERR_InvalidArg, "Encryption Type descriptor too short" );

    return reader.Read( mLength, "bLength" ) && reader.Read( mDescriptorType, "bDescriptorType" ) &&
           reader.Read( mEncryptionType, "bEncryptionType" ) && reader.Read( mEncryptionValue, "bEncryptionValue" ) &&
           reader.Read( mAuthKeyIndex, "bAuthKeyIndex" ) && ReadDeclaredJunk( reader, mLength, mJunk );
}

void USBEncryptionDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    writer.Write( mLength );
    writer.Write( mDescriptorType );
    writer.Write( mEncryptionType );
    writer.Write( mEncryptionValue );
    writer.Write( mAuthKeyIndex );
    writer.WriteArray( mJunk );
}

bool USBSSEndpointCompanionDescriptor::Decode( USBDescriptorReader& reader )
{
    if( reader.GetRemaining() < 6 )
        return reader.Fail( ERR_InvalidArg, "SS Endpoint Companion descriptor too short" );

    return reader.Read( mLength, "bLength" ) && reader.Read( mDescriptorType, "bDescriptorType" ) &&
           reader.Read( mMaxBurst, "bMaxBurst" ) && reader.Read( mAttributes, "bmAttributes" ) &&
           reader.Read( mBytesPerInterval, "wBytesPerInterval" ) && ReadDeclaredJunk( reader, mLength, mJunk );
}

void USBSSEndpointCompanionDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    writer.Write( mLength );
    writer.Write( mDescriptorType );
    writer.Write( mMaxBurst );
    writer.Write( mAttributes );
    writer.Write( mBytesPerInterval );
    writer.WriteArray( mJunk );
}

bool USBHIDReportDescriptor::Decode( USBDescriptorReader& reader )
{
    if( reader.GetRemaining() < 3 )
        return reader.Fail( ERR_InvalidArg, "HID report descriptor too short" );

    if( !reader.Read( mDescriptorType, "bDescriptorType" ) || !reader.Read( mLength, "wDescriptorLength" ) )
        return false;

    reader.ReadRemaining( mData );
    return true;
}

void USBHIDReportDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    if( mHasLengthPrefix )
        writer.Write( mBLength );

    writer.Write( mDescriptorType );
    writer.Write( mLength );
    writer.WriteArray( mData );
}

bool USBInterfaceDescriptor::Decode( USBDescriptorReader& reader )
{
    if( reader.GetRemaining() < 9 )
        return reader.Fail( ERR_InvalidArg, "Interface descriptor too short" );

    return reader.Read( mLength, "bLength" ) && reader.Read( mDescriptorType, "bDescriptorType" ) &&
           reader.Read( mInterfaceNumber, "bInterfaceNumber" ) && reader.Read( mAlternateSetting, "bAlternateSetting" ) &&
           reader.Read( mNumEndpoints, "bNumEndpoints" ) && reader.Read( mInterfaceClass, "bInterfaceClass" ) &&
           reader.Read( mInterfaceSubClass, "bInterfaceSubClass" ) &&
           reader.Read( mInterfaceProtocol, "bInterfaceProtocol" ) && reader.ReadString( mInterface, "iInterface" ) &&
           ReadDeclaredJunk( reader, mLength, mJunk );
}

void USBInterfaceDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    writer.Write( mLength );
    writer.Write( mDescriptorType );
    writer.Write( mInterfaceNumber );
    writer.Write( mAlternateSetting );
    writer.Write( mNumEndpoints );
    writer.Write( mInterfaceClass );
    writer.Write( mInterfaceSubClass );
    writer.Write( mInterfaceProtocol );
    writer.Write( mInterface );
    writer.WriteArray( mJunk );
}

template <class T>
static std::unique_ptr<USBDescriptor> DecodeFixed( const U8* data, size_t size, USBDecodeError& error )
{
    std::unique_ptr<T> desc( new T );
    USBDescriptorReader reader( data, size );
    if( !desc->Decode( reader ) )
    {
        error = reader.GetError();
        return std::unique_ptr<USBDescriptor>();
    }

    return std::unique_ptr<USBDescriptor>( desc.release() );
}

std::unique_ptr<USBDescriptor> USBDescriptorDecode( const U8* data, size_t size, USBDecodeError& error )
{
    if( data == NULL || size < 2 )
    {
        error.Set( ERR_InvalidArg, "Descriptor type too short, must be at least 2 bytes" );
        return std::unique_ptr<USBDescriptor>();
    }

    // bLength can not be below 2, keep whatever the device sent
    if( data[ 0 ] < 2 )
    {
        spdlog::debug( "bLength {} classified as junk", data[ 0 ] );
        return std::unique_ptr<USBDescriptor>( new USBRawDescriptor( DK_Junk, data, size ) );
    }

    switch( data[ 1 ] )
    {
    case DT_DEVICE:
    case DT_CONFIGURATION:
    case DT_INTERFACE:
    case DT_ENDPOINT:
        return std::unique_ptr<USBDescriptor>( USBGenericDescriptorDecode( data, size, error ).release() );

    case DT_STRING:
        return DecodeFixed<USBStringDescriptor>( data, size, error );

    case DT_INTERFACE_ASSOCIATION:
        return DecodeFixed<USBInterfaceAssociationDescriptor>( data, size, error );

    case DT_SECURITY:
        return DecodeFixed<USBSecurityDescriptor>( data, size, error );

    case DT_ENCRYPTION_TYPE:
        return DecodeFixed<USBEncryptionDescriptor>( data, size, error );

    case DT_SS_ENDPOINT_COMPANION:
        return DecodeFixed<USBSSEndpointCompanionDescriptor>( data, size, error );

    case DT_HID_REPORT:
    {
        // the envelope follows bLength
        std::unique_ptr<USBHIDReportDescriptor> desc( new USBHIDReportDescriptor );
        USBDescriptorReader reader( data + 1, size - 1, 1 );
        if( !desc->Decode( reader ) )
        {
            error = reader.GetError();
            return std::unique_ptr<USBDescriptor>();
        }

        desc->mHasLengthPrefix = true;
        desc->mBLength = data[ 0 ];
        return std::unique_ptr<USBDescriptor>( desc.release() );
    }

    case DT_DEVICE_QUALIFIER:
    case DT_OTHER_SPEED_CONFIGURATION:
    case DT_INTERFACE_POWER:
    case DT_OTG:
    case DT_DEBUG:
    case DT_KEY:
    case DT_BOS:
    case DT_DEVICE_CAPABILITY:
    case DT_WIRELESS_ENDPOINT_COMPANION:
    case DT_HID:
    case DT_HID_PHYS:
    case DT_CS_INTERFACE:
    case DT_HUB:
    case DT_SUPERSPEED_HUB:
    case DT_SSP_ISOC_ENDPOINT_COMPANION:
        return std::unique_ptr<USBDescriptor>( new USBRawDescriptor( DK_Marker, data, size ) );
    }

    spdlog::debug( "unknown descriptor type 0x{:02x}, {} bytes kept", data[ 1 ], size );
    return std::unique_ptr<USBDescriptor>( new USBRawDescriptor( DK_Unknown, data, size ) );
}
