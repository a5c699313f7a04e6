#include "test.hpp"

#include "USBClassDescriptors.h"
#include "USBDescriptors.h"
#include "USBLookupTables.h"

// decodes bytes from the standard stream and applies the class context of the interface
static std::unique_ptr<USBDescriptor> DecodeInClass( const std::vector<U8>& bytes, const USBClassTriplet& triplet,
                                                     USBDecodeError& error )
{
    std::unique_ptr<USBDescriptor> desc( USBGenericDescriptorDecode( &bytes.front(), bytes.size(), error ).release() );
    if( desc && !ApplyClassContext( desc, triplet, error ) )
        return std::unique_ptr<USBDescriptor>();

    return desc;
}

static USBClassDescriptorKind GetClassKind( const USBDescriptor& desc )
{
    return static_cast<const USBClassDescriptor&>( desc ).GetClassKind();
}

void test_generic_descriptor()
{
    USBDecodeError error;

    const U8 header[] = { 0x24, 0x01 };
    ASSERT( !USBGenericDescriptorDecode( header, sizeof( header ), error ) );
    ASSERT( error.mKind == ERR_InvalidArg );

    // bLength past the bytes handed in
    const U8 overrun[] = { 0x09, 0x24, 0x01, 0x00 };
    error.Clear();
    ASSERT( !USBGenericDescriptorDecode( overrun, sizeof( overrun ), error ) );
    ASSERT( error.mKind == ERR_InvalidArg );

    const U8 data[] = { 0x06, 0x24, 0x03, 0xaa, 0xbb, 0xcc };
    error.Clear();
    std::unique_ptr<USBGenericDescriptor> generic = USBGenericDescriptorDecode( data, sizeof( data ), error );
    ASSERT( generic );
    ASSERT( generic->mDescriptorSubtype == 0x03 );
    ASSERT( generic->mData.size() == 3 );
    ASSERT( generic->GetExpectedDataLength() == 3 );
    ASSERT( !generic->mHasTriplet );
    ASSERT( generic->ToBytes() == Bytes( data ) );
}

void test_hid_descriptor()
{
    const USBClassTriplet hid( CC_HID, 1, 1 );
    USBDecodeError error;

    const U8 data[] = { 0x09, 0x21, 0x11, 0x01, 0x00, 0x01, 0x22, 0x3f, 0x00 };
    std::unique_ptr<USBDescriptor> desc = DecodeInClass( Bytes( data ), hid, error );
    ASSERT( desc && GetClassKind( *desc ) == CDK_HID );

    const USBHIDDescriptor& h = static_cast<const USBHIDDescriptor&>( *desc );
    ASSERT( h.mBcdHID.ToString() == "1.11" );
    ASSERT( h.mCountryCode == 0 );
    ASSERT( h.mNumDescriptors == 1 );
    ASSERT( h.mDescriptors.size() == 1 );
    ASSERT( h.mDescriptors[ 0 ].mDescriptorType == DT_HID_REPORT );
    ASSERT( h.mDescriptors[ 0 ].mLength == 0x3f );
    ASSERT( !h.mDescriptors[ 0 ].mHasLengthPrefix );
    ASSERT( h.mJunk.empty() );
    ASSERT( desc->ToBytes() == Bytes( data ) );

    // two records announced, one present
    const U8 missing[] = { 0x09, 0x21, 0x11, 0x01, 0x00, 0x02, 0x22, 0x3f, 0x00 };
    error.Clear();
    ASSERT( !DecodeInClass( Bytes( missing ), hid, error ) );
    ASSERT( error.mKind == ERR_InvalidArg );

    const U8 shortHid[] = { 0x05, 0x21, 0x11, 0x01, 0x00 };
    error.Clear();
    ASSERT( !DecodeInClass( Bytes( shortHid ), hid, error ) );
    ASSERT( error.mKind == ERR_InvalidArg );
}

void test_ccid_descriptor()
{
    const USBClassTriplet ccid( CC_SmartCard, 0, 0 );
    USBDecodeError error;

    std::vector<U8> data( 54, 0 );
    data[ 0 ] = 0x36;
    data[ 1 ] = 0x21;
    data[ 2 ] = 0x10;
    data[ 3 ] = 0x01;
    data[ 5 ] = 0x07; // 5V, 3V and 1.8V
    data[ 6 ] = 0x03; // T=0 and T=1
    data[ 44 ] = 0x0f;
    data[ 45 ] = 0x01;
    data[ 53 ] = 0x01;

    std::unique_ptr<USBDescriptor> desc = DecodeInClass( data, ccid, error );
    ASSERT( desc && GetClassKind( *desc ) == CDK_CCID );

    const USBCCIDDescriptor& c = static_cast<const USBCCIDDescriptor&>( *desc );
    ASSERT( c.mBcdCCID.ToString() == "1.10" );
    ASSERT( c.mVoltageSupport == 0x07 );
    ASSERT( c.mProtocols == 0x03 );
    ASSERT( c.mMaxCCIDMessageLength == 0x010f );
    ASSERT( c.mMaxCCIDBusySlots == 1 );
    ASSERT( desc->ToBytes() == data );

    // one byte short of the fixed layout
    data.pop_back();
    data[ 0 ] = 0x35;
    error.Clear();
    ASSERT( !DecodeInClass( data, ccid, error ) );
    ASSERT( error.mKind == ERR_InvalidArg );
}

void test_printer_descriptor()
{
    const USBClassTriplet printer( CC_Printer, 1, 4 );
    USBDecodeError error;

    const U8 data[] = { 0x0a, 0x21, 0x01, 0x01, 0x00, 0x04, 0x02, 0x00, 0x01, 0x03 };
    std::unique_ptr<USBDescriptor> desc = DecodeInClass( Bytes( data ), printer, error );
    ASSERT( desc && GetClassKind( *desc ) == CDK_Printer );

    USBPrinterDescriptor& p = static_cast<USBPrinterDescriptor&>( *desc );
    ASSERT( p.mNumDescriptors == 1 );
    ASSERT( p.mDescriptors.size() == 1 );
    ASSERT( p.mDescriptors[ 0 ].mCapabilities == 0x0002 );
    ASSERT( p.mDescriptors[ 0 ].mVersionsSupported == 1 );
    ASSERT( p.mDescriptors[ 0 ].mUUID.mIndex == 3 );
    ASSERT( desc->ToBytes() == Bytes( data ) );

    std::vector<USBStringRef*> refs;
    p.GetStringRefs( refs );
    ASSERT( refs.size() == 1 && refs[ 0 ]->mIndex == 3 );

    // a record that claims more than is left
    const U8 overrun[] = { 0x0a, 0x21, 0x01, 0x01, 0x00, 0x09, 0x02, 0x00, 0x01, 0x03 };
    error.Clear();
    ASSERT( !DecodeInClass( Bytes( overrun ), printer, error ) );
    ASSERT( error.mKind == ERR_InvalidArg );

    const U8 shortPrinter[] = { 0x03, 0x21, 0x01 };
    error.Clear();
    ASSERT( !DecodeInClass( Bytes( shortPrinter ), printer, error ) );
    ASSERT( error.mKind == ERR_InvalidArg );
}

void test_cdc_descriptor()
{
    const USBClassTriplet cdc( CC_CommunicationsAndCDCControl, 6, 0 );
    USBDecodeError error;

    const U8 header[] = { 0x05, 0x24, 0x00, 0x10, 0x01 };
    std::unique_ptr<USBDescriptor> desc = DecodeInClass( Bytes( header ), cdc, error );
    ASSERT( desc && GetClassKind( *desc ) == CDK_Communication );

    const USBCommunicationDescriptor& h = static_cast<const USBCommunicationDescriptor&>( *desc );
    ASSERT( h.GetSubtype() == DST_HEADER );
    ASSERT( !h.mHasString );
    ASSERT( desc->ToBytes() == Bytes( header ) );

    // iMACAddress is the first byte after the subtype
    const U8 ethernet[] = { 0x0d, 0x24, 0x0f, 0x04, 0x00, 0x00, 0x00, 0x00, 0xea, 0x05, 0x00, 0x00, 0x00 };
    desc = DecodeInClass( Bytes( ethernet ), cdc, error );
    ASSERT( desc );

    const USBCommunicationDescriptor& eth = static_cast<const USBCommunicationDescriptor&>( *desc );
    ASSERT( eth.GetSubtype() == DST_ETHERNET_NETWORKING );
    ASSERT( eth.mHasString && eth.mString.mIndex == 4 );
    ASSERT( std::string( GetCDCDescriptorSubtypeName( eth.mDescriptorSubtype ) ).size() > 0 );
    ASSERT( desc->ToBytes() == Bytes( ethernet ) );

    // the data class uses the same functional descriptors
    const U8 unionDesc[] = { 0x05, 0x24, 0x06, 0x00, 0x01 };
    desc = DecodeInClass( Bytes( unionDesc ), USBClassTriplet( CC_CDCData, 0, 0 ), error );
    ASSERT( desc && GetClassKind( *desc ) == CDK_Communication );

    const U8 vendor[] = { 0x04, 0x24, 0xfe, 0x00 };
    desc = DecodeInClass( Bytes( vendor ), cdc, error );
    ASSERT( desc );
    ASSERT( static_cast<const USBCommunicationDescriptor&>( *desc ).GetSubtype() == DST_Undefined );
}

void test_video_descriptor()
{
    const USBClassTriplet uvc( CC_Video, 1, 0 );
    USBDecodeError error;

    const U8 inputTerminal[] = { 0x08, 0x24, 0x02, 0x01, 0x01, 0x02, 0x00, 0x05 };
    std::unique_ptr<USBDescriptor> desc = DecodeInClass( Bytes( inputTerminal ), uvc, error );
    ASSERT( desc && GetClassKind( *desc ) == CDK_Video );
    ASSERT( static_cast<const USBVideoDescriptor&>( *desc ).mHasString );
    ASSERT( static_cast<const USBVideoDescriptor&>( *desc ).mString.mIndex == 5 );

    // iSelector follows the bNrInPins source IDs
    const U8 selector[] = { 0x08, 0x24, 0x04, 0x02, 0x02, 0x01, 0x03, 0x06 };
    desc = DecodeInClass( Bytes( selector ), uvc, error );
    ASSERT( desc );
    ASSERT( static_cast<const USBVideoDescriptor&>( *desc ).mString.mIndex == 6 );
    ASSERT( desc->ToBytes() == Bytes( selector ) );

    // cut before the string index: decoded, but without one
    const U8 cut[] = { 0x07, 0x24, 0x04, 0x02, 0x02, 0x01, 0x03 };
    desc = DecodeInClass( Bytes( cut ), uvc, error );
    ASSERT( desc );
    ASSERT( !static_cast<const USBVideoDescriptor&>( *desc ).mHasString );

    // video streaming interfaces are not specialized
    desc = DecodeInClass( Bytes( selector ), USBClassTriplet( CC_Video, 2, 0 ), error );
    ASSERT( desc && GetClassKind( *desc ) == CDK_Generic );
}

void test_context_fallback()
{
    USBDecodeError error;

    // audio control descriptors stay generic, tagged with their triplet
    const U8 audio[] = { 0x09, 0x24, 0x01, 0x00, 0x01, 0x09, 0x00, 0x01, 0x01 };
    std::unique_ptr<USBDescriptor> desc = DecodeInClass( Bytes( audio ), USBClassTriplet( CC_Audio, 1, 0 ), error );
    ASSERT( desc && GetClassKind( *desc ) == CDK_Generic );

    const USBGenericDescriptor& generic = static_cast<const USBGenericDescriptor&>( *desc );
    ASSERT( generic.mHasTriplet );
    ASSERT( generic.mTriplet.mClass == CC_Audio );
    ASSERT( desc->ToBytes() == Bytes( audio ) );

    // a tagged descriptor is not specialized again
    ASSERT( ApplyClassContext( desc, USBClassTriplet( CC_HID, 0, 0 ), error ) );
    ASSERT( GetClassKind( *desc ) == CDK_Generic );

    // a class without specialized layouts
    desc = DecodeInClass( Bytes( audio ), USBClassTriplet( CC_MassStorage, 6, 0x50 ), error );
    ASSERT( desc && GetClassKind( *desc ) == CDK_Generic );

    // non class descriptors pass through untouched
    const U8 iad[] = { 0x08, 0x0B, 0x00, 0x02, 0xEF, 0x02, 0x01, 0x00 };
    std::unique_ptr<USBDescriptor> other = USBDescriptorDecode( Bytes( iad ), error );
    ASSERT( ApplyClassContext( other, USBClassTriplet( CC_HID, 0, 0 ), error ) );
    ASSERT( other->GetKind() == DK_InterfaceAssociation );

    // a failed specialization leaves the generic descriptor in place
    const U8 shortHid[] = { 0x05, 0x21, 0x11, 0x01, 0x00 };
    desc.reset( USBGenericDescriptorDecode( shortHid, sizeof( shortHid ), error ).release() );
    ASSERT( desc );
    error.Clear();
    ASSERT( !ApplyClassContext( desc, USBClassTriplet( CC_HID, 0, 0 ), error ) );
    ASSERT( error.IsSet() );
    ASSERT( desc && GetClassKind( *desc ) == CDK_Generic );
    ASSERT( !static_cast<const USBGenericDescriptor&>( *desc ).mHasTriplet );

    // every specialized layout rejects a descriptor cut after its header
    const U8 header[] = { 0x03, 0x24, 0x01 };
    std::unique_ptr<USBGenericDescriptor> cut = USBGenericDescriptorDecode( header, sizeof( header ), error );
    ASSERT( cut );
    const USBClassTriplet triplets[] = { USBClassTriplet( CC_HID, 0, 0 ),
                                         USBClassTriplet( CC_SmartCard, 0, 0 ),
                                         USBClassTriplet( CC_Printer, 1, 2 ),
                                         USBClassTriplet( CC_CommunicationsAndCDCControl, 2, 1 ),
                                         USBClassTriplet( CC_Audio, UAC_SUBCLASS_MIDISTREAMING, 0 ),
                                         USBClassTriplet( CC_Video, 1, 0 ) };
    for( size_t i = 0; i < sizeof( triplets ) / sizeof( triplets[ 0 ] ); ++i )
    {
        error.Clear();
        ASSERT( !SpecializeClassDescriptor( *cut, triplets[ i ], error ) );
        ASSERT( error.mKind == ERR_InvalidArg );
    }
}
