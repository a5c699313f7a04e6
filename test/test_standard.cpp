#include "test.hpp"

#include "USBClassDescriptors.h"
#include "USBDescriptors.h"
#include "USBLookupTables.h"

void test_decode_entry_conditions()
{
    USBDecodeError error;

    // not even bLength and bDescriptorType
    const U8 one[] = { 0x01 };
    ASSERT( !USBDescriptorDecode( Bytes( one ), error ) );
    ASSERT( error.mKind == ERR_InvalidArg );

    error.Clear();
    ASSERT( !USBDescriptorDecode( NULL, 0, error ) );
    ASSERT( error.mKind == ERR_InvalidArg );

    // bLength below 2 is junk, nothing else is looked at
    const U8 junk[] = { 0x01, 0x04, 0xff, 0xff };
    error.Clear();
    std::unique_ptr<USBDescriptor> desc = USBDescriptorDecode( Bytes( junk ), error );
    ASSERT( desc && desc->GetKind() == DK_Junk );
    ASSERT( !error.IsSet() );
    ASSERT( desc->ToBytes() == Bytes( junk ) );

    const U8 zero[] = { 0x00, 0x00 };
    desc = USBDescriptorDecode( Bytes( zero ), error );
    ASSERT( desc && desc->GetKind() == DK_Junk );
}

void test_interface_association()
{
    const U8 data[] = { 0x08, 0x0B, 0x00, 0x02, 0xEF, 0x02, 0x01, 0x00 };
    USBDecodeError error;
    std::unique_ptr<USBDescriptor> desc = USBDescriptorDecode( Bytes( data ), error );
    ASSERT( desc && desc->GetKind() == DK_InterfaceAssociation );

    const USBInterfaceAssociationDescriptor& iad = static_cast<const USBInterfaceAssociationDescriptor&>( *desc );
    ASSERT( iad.mLength == 8 );
    ASSERT( iad.mDescriptorType == 0x0B );
    ASSERT( iad.mFirstInterface == 0 );
    ASSERT( iad.mInterfaceCount == 2 );
    ASSERT( iad.mFunctionClass == 0xEF );
    ASSERT( iad.mFunctionSubClass == 0x02 );
    ASSERT( iad.mFunctionProtocol == 0x01 );
    ASSERT( iad.mFunction.mIndex == 0 );
    ASSERT( desc->ToBytes() == Bytes( data ) );

    const U8 shortIad[] = { 0x08, 0x0B, 0x00, 0x02, 0xEF };
    ASSERT( !USBDescriptorDecode( Bytes( shortIad ), error ) );
    ASSERT( error.mKind == ERR_InvalidArg );

    // bLength declares two bytes past iFunction: they are kept and written back
    const U8 padded[] = { 0x0A, 0x0B, 0x00, 0x02, 0xEF, 0x02, 0x01, 0x00, 0xAA, 0xBB };
    error.Clear();
    desc = USBDescriptorDecode( Bytes( padded ), error );
    ASSERT( desc && desc->GetKind() == DK_InterfaceAssociation );
    const USBInterfaceAssociationDescriptor& paddedIad = static_cast<const USBInterfaceAssociationDescriptor&>( *desc );
    ASSERT( paddedIad.mLength == 10 );
    ASSERT( paddedIad.mJunk.size() == 2 && paddedIad.mJunk[ 0 ] == 0xAA && paddedIad.mJunk[ 1 ] == 0xBB );
    ASSERT( desc->ToBytes() == Bytes( padded ) );

    // bytes past bLength belong to the next descriptor
    const U8 followed[] = { 0x08, 0x0B, 0x00, 0x02, 0xEF, 0x02, 0x01, 0x00, 0x09, 0x04 };
    desc = USBDescriptorDecode( Bytes( followed ), error );
    ASSERT( desc );
    ASSERT( static_cast<const USBInterfaceAssociationDescriptor&>( *desc ).mJunk.empty() );
    ASSERT( desc->ToBytes() == Bytes( data ) );

    // bLength promises more than the slice holds
    const U8 cut[] = { 0x0A, 0x0B, 0x00, 0x02, 0xEF, 0x02, 0x01, 0x00, 0xAA };
    error.Clear();
    ASSERT( !USBDescriptorDecode( Bytes( cut ), error ) );
    ASSERT( error.mKind == ERR_Truncated );
    ASSERT( error.mOffset == 8 );
}

void test_security()
{
    USBDecodeError error;

    // needs 5 bytes
    const U8 shortSecurity[] = { 0x05, 0x0C, 0x05 };
    ASSERT( !USBDescriptorDecode( Bytes( shortSecurity ), error ) );
    ASSERT( error.mKind == ERR_InvalidArg );

    const U8 data[] = { 0x05, 0x0C, 0x0a, 0x00, 0x01 };
    error.Clear();
    std::unique_ptr<USBDescriptor> desc = USBDescriptorDecode( Bytes( data ), error );
    ASSERT( desc && desc->GetKind() == DK_Security );

    const USBSecurityDescriptor& sec = static_cast<const USBSecurityDescriptor&>( *desc );
    ASSERT( sec.mTotalLength == 10 );
    ASSERT( sec.mNumEncryptionTypes == 1 );
    ASSERT( desc->ToBytes() == Bytes( data ) );

    const U8 paddedSecurity[] = { 0x06, 0x0C, 0x0a, 0x00, 0x01, 0xff };
    desc = USBDescriptorDecode( Bytes( paddedSecurity ), error );
    ASSERT( desc );
    ASSERT( desc->ToBytes() == Bytes( paddedSecurity ) );

    const U8 paddedEncryption[] = { 0x07, 0x0E, 0x02, 0x01, 0x03, 0x00, 0x00 };
    desc = USBDescriptorDecode( Bytes( paddedEncryption ), error );
    ASSERT( desc );
    ASSERT( static_cast<const USBEncryptionDescriptor&>( *desc ).mJunk.size() == 2 );
    ASSERT( desc->ToBytes() == Bytes( paddedEncryption ) );
}

void test_encryption()
{
    const U8 data[] = { 0x05, 0x0E, 0x02, 0x01, 0x03 };
    USBDecodeError error;
    std::unique_ptr<USBDescriptor> desc = USBDescriptorDecode( Bytes( data ), error );
    ASSERT( desc && desc->GetKind() == DK_Encryption );

    const USBEncryptionDescriptor& enc = static_cast<const USBEncryptionDescriptor&>( *desc );
    ASSERT( enc.GetEncryptionType() == ET_Ccm1 );
    ASSERT( std::string( GetEncryptionTypeName( enc.mEncryptionType ) ) == "CCM_1" );
    ASSERT( enc.mEncryptionValue == 1 );
    ASSERT( enc.mAuthKeyIndex == 3 );

    // reserved codes are kept as they are
    const U8 reserved[] = { 0x05, 0x0E, 0x09, 0x00, 0x00 };
    desc = USBDescriptorDecode( Bytes( reserved ), error );
    ASSERT( desc );
    ASSERT( static_cast<const USBEncryptionDescriptor&>( *desc ).GetEncryptionType() == ET_Reserved );
    ASSERT( desc->ToBytes() == Bytes( reserved ) );
}

void test_string_descriptor()
{
    const U8 data[] = { 0x0A, 0x03, 'U', 0x00, 'S', 0x00, 'B', 0x00, 0xe9, 0x00 };
    USBDecodeError error;
    std::unique_ptr<USBDescriptor> desc = USBDescriptorDecode( Bytes( data ), error );
    ASSERT( desc && desc->GetKind() == DK_String );

    const USBStringDescriptor& str = static_cast<const USBStringDescriptor&>( *desc );
    ASSERT( str.mValue == "USB\xc3\xa9" );
    ASSERT( str.mData.size() == 8 );
    ASSERT( desc->ToBytes() == Bytes( data ) );

    // a surrogate pair is one code point
    const U8 emoji[] = { 0x06, 0x03, 0x3d, 0xd8, 0x00, 0xde };
    desc = USBDescriptorDecode( Bytes( emoji ), error );
    ASSERT( desc );
    ASSERT( static_cast<const USBStringDescriptor&>( *desc ).mValue == "\xf0\x9f\x98\x80" );
}

void test_ss_companion()
{
    const U8 data[] = { 0x06, 0x30, 0x0f, 0x00, 0x00, 0x04 };
    USBDecodeError error;
    std::unique_ptr<USBDescriptor> desc = USBDescriptorDecode( Bytes( data ), error );
    ASSERT( desc && desc->GetKind() == DK_SSEndpointCompanion );

    const USBSSEndpointCompanionDescriptor& ss = static_cast<const USBSSEndpointCompanionDescriptor&>( *desc );
    ASSERT( ss.mMaxBurst == 15 );
    ASSERT( ss.mBytesPerInterval == 0x0400 );
    ASSERT( desc->ToBytes() == Bytes( data ) );

    const U8 padded[] = { 0x07, 0x30, 0x0f, 0x00, 0x00, 0x04, 0x5a };
    desc = USBDescriptorDecode( Bytes( padded ), error );
    ASSERT( desc );
    ASSERT( static_cast<const USBSSEndpointCompanionDescriptor&>( *desc ).mJunk.size() == 1 );
    ASSERT( desc->ToBytes() == Bytes( padded ) );

    const U8 shortSS[] = { 0x06, 0x30, 0x0f, 0x00 };
    ASSERT( !USBDescriptorDecode( Bytes( shortSS ), error ) );
    ASSERT( error.mKind == ERR_InvalidArg );
}

void test_hid_report_envelope()
{
    // bLength, then the {bDescriptorType, wDescriptorLength} envelope
    const U8 data[] = { 0x04, 0x22, 0x3f, 0x00 };
    USBDecodeError error;
    std::unique_ptr<USBDescriptor> desc = USBDescriptorDecode( Bytes( data ), error );
    ASSERT( desc && desc->GetKind() == DK_HIDReport );

    const USBHIDReportDescriptor& report = static_cast<const USBHIDReportDescriptor&>( *desc );
    ASSERT( report.mHasLengthPrefix );
    ASSERT( report.mBLength == 4 );
    ASSERT( report.mLength == 0x3f );
    ASSERT( desc->ToBytes() == Bytes( data ) );

    const U8 shortReport[] = { 0x03, 0x22, 0x3f };
    ASSERT( !USBDescriptorDecode( Bytes( shortReport ), error ) );
    ASSERT( error.mKind == ERR_InvalidArg );
}

void test_marker_and_unknown()
{
    USBDecodeError error;

    const U8 qualifier[] = { 0x0a, 0x06, 0x00, 0x02, 0x00, 0x00, 0x00, 0x40, 0x01, 0x00 };
    std::unique_ptr<USBDescriptor> desc = USBDescriptorDecode( Bytes( qualifier ), error );
    ASSERT( desc && desc->GetKind() == DK_Marker );
    ASSERT( desc->GetDescriptorType() == DT_DEVICE_QUALIFIER );
    ASSERT( desc->ToBytes() == Bytes( qualifier ) );

    const U8 bos[] = { 0x05, 0x0f, 0x16, 0x00, 0x02 };
    desc = USBDescriptorDecode( Bytes( bos ), error );
    ASSERT( desc && desc->GetKind() == DK_Marker );

    const U8 vendor[] = { 0x04, 0x41, 0x12, 0x34 };
    desc = USBDescriptorDecode( Bytes( vendor ), error );
    ASSERT( desc && desc->GetKind() == DK_Unknown );
    ASSERT( desc->GetDescriptorType() == 0x41 );
    ASSERT( desc->ToBytes() == Bytes( vendor ) );
    ASSERT( !error.IsSet() );
}

void test_standard_round_trip()
{
    // device, configuration, interface and endpoint wait for class context as generic descriptors
    const U8 device[] = { 0x12, 0x01, 0x00, 0x02, 0x00, 0x00, 0x00, 0x40, 0x6b, 0x1d,
                          0x04, 0x01, 0x00, 0x01, 0x01, 0x02, 0x03, 0x01 };
    const U8 config[] = { 0x09, 0x02, 0x22, 0x00, 0x01, 0x01, 0x00, 0xa0, 0x32 };
    const U8 iface[] = { 0x09, 0x04, 0x00, 0x00, 0x01, 0x03, 0x01, 0x02, 0x00 };
    const U8 endpoint[] = { 0x07, 0x05, 0x81, 0x03, 0x08, 0x00, 0x0a };

    const std::vector<U8> inputs[] = { Bytes( device ), Bytes( config ), Bytes( iface ), Bytes( endpoint ) };
    for( size_t cnt = 0; cnt < sizeof( inputs ) / sizeof( inputs[ 0 ] ); ++cnt )
    {
        USBDecodeError error;
        std::unique_ptr<USBDescriptor> desc = USBDescriptorDecode( inputs[ cnt ], error );
        ASSERT( desc && desc->GetKind() == DK_Class );
        ASSERT( static_cast<const USBClassDescriptor&>( *desc ).GetClassKind() == CDK_Generic );
        ASSERT( desc->GetDescriptorType() == inputs[ cnt ][ 1 ] );
        ASSERT( desc->ToBytes() == inputs[ cnt ] );
    }

    // the typed interface view the walker uses
    std::vector<U8> ifaceBytes = Bytes( iface );
    USBInterfaceDescriptor typed;
    USBDescriptorReader reader( ifaceBytes );
    ASSERT( typed.Decode( reader ) );
    ASSERT( typed.mInterfaceClass == CC_HID );
    ASSERT( typed.mInterfaceSubClass == 1 && typed.mInterfaceProtocol == 2 );

    std::vector<U8> out;
    typed.Encode( out );
    ASSERT( out == ifaceBytes );

    const U8 paddedIface[] = { 0x0a, 0x04, 0x00, 0x00, 0x01, 0x03, 0x01, 0x02, 0x00, 0x77 };
    std::vector<U8> paddedBytes = Bytes( paddedIface );
    USBInterfaceDescriptor paddedTyped;
    USBDescriptorReader paddedReader( paddedBytes );
    ASSERT( paddedTyped.Decode( paddedReader ) );
    ASSERT( paddedTyped.mJunk.size() == 1 && paddedTyped.mJunk[ 0 ] == 0x77 );
    out.clear();
    paddedTyped.Encode( out );
    ASSERT( out == paddedBytes );
}
