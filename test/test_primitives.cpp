#include "test.hpp"

#include "USBLookupTables.h"
#include "USBTypes.h"

void test_reader()
{
    const U8 data[] = { 0x12, 0x34, 0x12, 0x78, 0x56, 0x34, 0x12, 0x00, 0x77, 0x03 };
    std::vector<U8> bytes = Bytes( data );

    USBDescriptorReader reader( bytes );
    U8 b;
    U16 w;
    U32 d;
    ASSERT( reader.Read( b, "b" ) && b == 0x12 );
    ASSERT( reader.Read( w, "w" ) && w == 0x1234 );
    ASSERT( reader.Read( d, "d" ) && d == 0x12345678 );
    ASSERT( reader.GetOffset() == 7 );
    ASSERT( reader.GetRemaining() == 3 );

    U8 peeked;
    ASSERT( reader.Peek( 1, peeked ) && peeked == 0x77 );
    ASSERT( !reader.Peek( 3, peeked ) );
    ASSERT( reader.GetOffset() == 7 );

    // a count that points past the end fails before anything is consumed
    std::vector<U8> arr;
    ASSERT( !reader.ReadArray( arr, 4, "baSourceID" ) );
    ASSERT( reader.GetError().mKind == ERR_Truncated );
    ASSERT( reader.GetError().mField == "baSourceID" );
    ASSERT( reader.GetError().mOffset == 7 );
    ASSERT( reader.GetOffset() == 7 );

    // the first failure is the one reported
    ASSERT( !reader.Read( d, "dwOther" ) );
    ASSERT( reader.GetError().mField == "baSourceID" );

    // 24 bit values and the base offset used in reports
    const U8 freq[] = { 0x44, 0xac, 0x00, 0x80, 0xbb };
    USBDescriptorReader freqReader( freq, sizeof( freq ), 8 );
    U32 rate;
    ASSERT( freqReader.Read24( rate, "tSamFreq" ) && rate == 44100 );
    ASSERT( !freqReader.Read24( rate, "tSamFreq" ) );
    ASSERT( freqReader.GetError().mOffset == 11 );

    // bControlSize driven values
    const U8 sized[] = { 0x01, 0x02, 0x03 };
    USBDescriptorReader sizedReader( sized, sizeof( sized ) );
    U32 val;
    ASSERT( sizedReader.ReadSized( val, 3, "bmaControls" ) && val == 0x030201 );
    ASSERT( sizedReader.AtEnd() );

    USBDescriptorReader wideReader( sized, sizeof( sized ) );
    ASSERT( !wideReader.ReadSized( val, 5, "bmaControls" ) );
    ASSERT( wideReader.GetError().mKind == ERR_InvalidArg );

    // remaining bytes, then nothing
    USBDescriptorReader restReader( sized, sizeof( sized ) );
    ASSERT( restReader.Skip( 1, "skip" ) );
    restReader.ReadRemaining( arr );
    ASSERT( arr.size() == 2 && arr[ 0 ] == 0x02 );
    restReader.ReadRemaining( arr );
    ASSERT( arr.empty() );

    // a null slice has no bytes
    USBDescriptorReader empty( NULL, 10 );
    ASSERT( empty.AtEnd() );
    ASSERT( !empty.Read( b, "bLength" ) );
}

void test_writer()
{
    std::vector<U8> out;
    USBDescriptorWriter writer( out );
    writer.Write( U8( 0x09 ) );
    writer.Write( U16( 0x0201 ) );
    writer.Write24( 48000 );
    writer.Write( U32( 0xdeadbeef ) );
    writer.WriteSized( 0x0403, 2 );
    writer.Write( USBStringRef( 5 ) );

    const U8 expected[] = { 0x09, 0x01, 0x02, 0x80, 0xbb, 0x00, 0xef, 0xbe, 0xad, 0xde, 0x03, 0x04, 0x05 };
    ASSERT( out == Bytes( expected ) );
    ASSERT( writer.GetSize() == sizeof( expected ) );

    ASSERT( hex2str( Bytes( expected ) ).substr( 0, 8 ) == "09 01 02" );
    ASSERT( hex2str( std::vector<U8>( out.begin(), out.begin() + 3 ), "" ) == "090102" );
}

void test_version()
{
    USBVersion usb( 0x0200 );
    ASSERT( usb.ToString() == "2.00" );
    ASSERT( usb.GetMajor() == 2 && usb.GetMinor() == 0 );

    USBVersion hid( 0x0111 );
    ASSERT( hid.ToString() == "1.11" );
    ASSERT( hid.GetMinor() == 1 && hid.GetSubMinor() == 1 );

    USBVersion big( 0x1234 );
    ASSERT( big.ToString() == "12.34" );
    ASSERT( big.GetMajor() == 12 );
}

void test_bitmap_strings()
{
    // clock source attributes 0x03 flag bit 0 and bit 1 together
    std::vector<std::string> attrs =
        GetBitmapStrings( 0x03, UAC2_CLOCK_SOURCE_ATTRIBUTES, CountOf( UAC2_CLOCK_SOURCE_ATTRIBUTES ) );
    ASSERT( attrs.size() == 2 );
    ASSERT( attrs[ 0 ] == "External" );
    ASSERT( attrs[ 1 ] == "Internal fixed" );

    // bits past the label table are ignored
    attrs = GetBitmapStrings( 0xf0, UAC2_CLOCK_SOURCE_ATTRIBUTES, CountOf( UAC2_CLOCK_SOURCE_ATTRIBUTES ) );
    ASSERT( attrs.empty() );

    std::vector<std::string> caps = GetBitmapStrings( 0x801, MIDI_ELEMENT_CAPABILITIES, CountOf( MIDI_ELEMENT_CAPABILITIES ) );
    ASSERT( caps.size() == 2 );
    ASSERT( caps[ 0 ] == "Undefined" && caps[ 1 ] == "DLS2 (Downloadable Sounds Level 2)" );
}

void test_bitmap_controls()
{
    // one bit per control: both controls are simply present
    std::vector<UACControlEntry> controls =
        GetBitmapControls( 0x03, UAC1_FEATURE_UNIT_BMCONTROLS, CountOf( UAC1_FEATURE_UNIT_BMCONTROLS ), CT_BmControl1 );
    ASSERT( controls.size() == 2 );
    ASSERT( controls[ 0 ].mLabel == "Mute" && controls[ 0 ].mSetting == CS_Present );
    ASSERT( controls[ 1 ].mLabel == "Volume" && controls[ 1 ].mSetting == CS_Present );

    // the same byte with two bits per control is a single read/write control
    controls = GetBitmapControls( 0x03, UAC2_SELECTOR_UNIT_BMCONTROLS, CountOf( UAC2_SELECTOR_UNIT_BMCONTROLS ),
                                  CT_BmControl2 );
    ASSERT( controls.size() == 1 );
    ASSERT( controls[ 0 ].mLabel == "Selector" && controls[ 0 ].mSetting == CS_ReadWrite );

    // 0b01 read-only, 0b10 illegal, 0b00 absent
    controls = GetBitmapControls( 0x21, UAC2_FEATURE_UNIT_BMCONTROLS, CountOf( UAC2_FEATURE_UNIT_BMCONTROLS ), CT_BmControl2 );
    ASSERT( controls.size() == 2 );
    ASSERT( controls[ 0 ].mLabel == "Mute" && controls[ 0 ].mSetting == CS_ReadOnly );
    ASSERT( controls[ 1 ].mLabel == "Bass" && controls[ 1 ].mSetting == CS_IllegalValue );
    ASSERT( std::string( GetUACControlSettingName( CS_IllegalValue ) ) == "ILLEGAL VALUE (0b10)" );
    ASSERT( std::string( GetUACControlSettingName( CS_ReadWrite ) ) == "read/write" );

    ASSERT( GetBitmapControls( 0, UAC1_FEATURE_UNIT_BMCONTROLS, CountOf( UAC1_FEATURE_UNIT_BMCONTROLS ), CT_BmControl1 ).empty() );
}

void test_string_ref()
{
    USBStringRef ref( 3 );
    ASSERT( !ref.IsResolved() );
    ASSERT( ref.Resolve( "Speaker" ) );
    ASSERT( ref.IsResolved() && ref.mValue == "Speaker" );

    // set at most once
    ASSERT( !ref.Resolve( "Microphone" ) );
    ASSERT( ref.mValue == "Speaker" );
    ASSERT( ref.mIndex == 3 );
}
