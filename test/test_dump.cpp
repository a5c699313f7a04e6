#include "test.hpp"

#include <sstream>
#include <string>

#include "USBDescriptorDump.h"
#include "USBDescriptorParser.h"
#include "USBDumpSettings.h"

// HID keyboard: configuration, interface, HID descriptor, interrupt endpoint
static const U8 KEYBOARD_CONFIG[] = {
    0x09, 0x02, 0x22, 0x00, 0x01, 0x01, 0x00, 0xa0, 0x32,
    0x09, 0x04, 0x00, 0x00, 0x01, 0x03, 0x01, 0x01, 0x00,
    0x09, 0x21, 0x11, 0x01, 0x00, 0x01, 0x22, 0x3f, 0x00,
    0x07, 0x05, 0x81, 0x03, 0x08, 0x00, 0x0a,
};

// AudioControl interface with header, input terminal and feature unit
static const U8 SPEAKER_CONFIG[] = {
    0x09, 0x02, 0x30, 0x00, 0x01, 0x01, 0x00, 0x80, 0x32,
    0x09, 0x04, 0x00, 0x00, 0x00, 0x01, 0x01, 0x00, 0x00,
    0x09, 0x24, 0x01, 0x00, 0x01, 0x1e, 0x00, 0x01, 0x01,
    0x0c, 0x24, 0x02, 0x01, 0x01, 0x01, 0x00, 0x02, 0x03, 0x00, 0x00, 0x02,
    0x09, 0x24, 0x06, 0x02, 0x01, 0x01, 0x03, 0x00, 0x03,
};

static bool HasLine( const std::string& text, const std::string& line )
{
    return ( "\n" + text ).find( "\n" + line + "\n" ) != std::string::npos;
}

static bool Contains( const std::string& text, const std::string& part )
{
    return text.find( part ) != std::string::npos;
}

static std::string DumpBlob( const std::vector<U8>& blob, const USBDumpSettings& settings, bool expectOk = true )
{
    USBDescriptorParser parser;
    ASSERT( parser.Parse( blob ) == expectOk );

    std::ostringstream out;
    USBDescriptorDump dump( out, settings );
    dump.DumpConfiguration( parser );
    return out.str();
}

void test_dump_configuration()
{
    USBDumpSettings settings;
    std::string text = DumpBlob( Bytes( KEYBOARD_CONFIG ), settings );

    ASSERT( HasLine( text, "Configuration Descriptor:" ) );
    ASSERT( HasLine( text, "  bLength" + std::string( 22, ' ' ) + "9" ) );
    ASSERT( Contains( text, "Bus powered, Remote wakeup supported" ) );
    ASSERT( Contains( text, "100mA" ) );

    ASSERT( HasLine( text, "  Interface Descriptor:" ) );
    ASSERT( HasLine( text, "    HID Device Descriptor:" ) );
    ASSERT( Contains( text, "HID_REPORT" ) );
    ASSERT( HasLine( text, "    Endpoint Descriptor:" ) );
    ASSERT( Contains( text, "EP 1 IN" ) );
    ASSERT( Contains( text, "Interrupt" ) );
    ASSERT( !Contains( text, "Warning" ) );

    // a wider indent moves every nested line
    settings.mIndent = 4;
    text = DumpBlob( Bytes( KEYBOARD_CONFIG ), settings );
    ASSERT( HasLine( text, "    Interface Descriptor:" ) );
    ASSERT( HasLine( text, "        HID Device Descriptor:" ) );

    // a narrow field column
    settings.mIndent = 2;
    settings.mFieldWidth = 8;
    text = DumpBlob( Bytes( KEYBOARD_CONFIG ), settings );
    ASSERT( HasLine( text, "  bLength      9" ) );
}

void test_dump_warnings()
{
    USBDumpSettings settings;

    // bLength of the interface runs past the blob
    const U8 cut[] = { 0x09, 0x02, 0x12, 0x00, 0x01, 0x01, 0x00, 0x80, 0x32, 0x09, 0x04, 0x00, 0x00 };
    std::string text = DumpBlob( Bytes( cut ), settings, false );
    ASSERT( HasLine( text, "  INTERFACE Descriptor:" ) );
    ASSERT( HasLine( text, "    Warning: Descriptor too short" ) );
    ASSERT( HasLine( text, "    data: 09 04 00 00" ) );
    ASSERT( Contains( text, "\nWarning: Truncated: " ) );

    // junk after the configuration
    const U8 junk[] = { 0x09, 0x02, 0x0c, 0x00, 0x00, 0x01, 0x00, 0x80, 0x32, 0x00, 0xff, 0xff };
    text = DumpBlob( Bytes( junk ), settings, false );
    ASSERT( Contains( text, "Junk: 00 ff ff" ) );
    ASSERT( Contains( text, "\nWarning: Invalid argument: " ) );

    // extra bytes after the jack list
    const U8 endpoint[] = { 0x07, 0x25, 0x01, 0x01, 0x03, 0xaa, 0xbb };
    USBDescriptorReader reader( endpoint, sizeof( endpoint ) );
    MIDIEndpointDescriptor ep;
    ASSERT( ep.Decode( reader ) );
    ASSERT( ep.mJunk.size() == 2 );

    std::ostringstream out;
    USBDescriptorDump dump( out, settings );
    dump.DumpMidiEndpoint( ep, 0 );
    ASSERT( HasLine( out.str(), "MIDIStreaming Endpoint Descriptor:" ) );
    ASSERT( HasLine( out.str(), "  junk at descriptor end: aa bb" ) );

    settings.mShowJunk = false;
    std::ostringstream quiet;
    USBDescriptorDump quietDump( quiet, settings );
    quietDump.DumpMidiEndpoint( ep, 0 );
    ASSERT( !Contains( quiet.str(), "junk" ) );
}

void test_dump_audio()
{
    USBDumpSettings settings;
    std::vector<U8> blob = Bytes( SPEAKER_CONFIG );

    USBDescriptorParser parser;
    ASSERT( parser.Parse( blob ) );

    USBStringTable table;
    table.SetString( 3, "Volume" );
    ASSERT( parser.ResolveStrings( table ) == 1 );

    std::ostringstream out;
    USBDescriptorDump dump( out, settings );
    dump.DumpConfiguration( parser );
    std::string text = out.str();

    ASSERT( HasLine( text, "    AudioControl Interface Descriptor:" ) );
    ASSERT( Contains( text, "(HEADER)" ) );
    ASSERT( Contains( text, "(INPUT_TERMINAL)" ) );
    ASSERT( Contains( text, "(FEATURE_UNIT)" ) );
    ASSERT( HasLine( text, "        Mute Control" ) );
    ASSERT( HasLine( text, "        Volume Control" ) );
    ASSERT( Contains( text, "Left Front (L)" ) );
    ASSERT( HasLine( text, "      iFeature" + std::string( 21, ' ' ) + "3 Volume" ) );

    // resolved strings are left out when disabled
    settings.mResolveStrings = false;
    std::ostringstream plain;
    USBDescriptorDump plainDump( plain, settings );
    plainDump.DumpConfiguration( parser );
    ASSERT( HasLine( plain.str(), "      iFeature" + std::string( 21, ' ' ) + "3" ) );

    // an unknown protocol keeps the envelope and warns
    const U8 header[] = { 0x09, 0x24, 0x01, 0x00, 0x01, 0x1e, 0x00, 0x01, 0x01 };
    USBDecodeError error;
    std::unique_ptr<UACDescriptor> desc = UACDescriptorDecode( header, sizeof( header ), UACC_AudioControl, 0x10, error );
    ASSERT( desc );

    std::ostringstream illegal;
    USBDescriptorDump illegalDump( illegal, settings );
    illegalDump.DumpAudio( *desc, 0 );
    ASSERT( HasLine( illegal.str(), "AudioControl Interface Descriptor:" ) );
    ASSERT( HasLine( illegal.str(), "  Warning: HEADER descriptors are illegal for Unknown" ) );
}
