#include "test.hpp"

#include "USBDescriptorParser.h"
#include "USBLookupTables.h"

// keyboard: configuration, HID interface, HID descriptor, interrupt endpoint
static const U8 HID_CONFIG[] = {
    0x09, 0x02, 0x22, 0x00, 0x01, 0x01, 0x00, 0xa0, 0x32,
    0x09, 0x04, 0x00, 0x00, 0x01, 0x03, 0x01, 0x01, 0x00,
    0x09, 0x21, 0x11, 0x01, 0x00, 0x01, 0x22, 0x3f, 0x00,
    0x07, 0x05, 0x81, 0x03, 0x08, 0x00, 0x0a,
};

// UAC1 speaker: AudioControl with header, input terminal and feature unit, one streaming interface
static const U8 UAC1_CONFIG[] = {
    0x09, 0x02, 0x64, 0x00, 0x02, 0x01, 0x00, 0x80, 0x32,
    0x09, 0x04, 0x00, 0x00, 0x00, 0x01, 0x01, 0x00, 0x00,
    0x09, 0x24, 0x01, 0x00, 0x01, 0x1e, 0x00, 0x01, 0x01,
    0x0c, 0x24, 0x02, 0x01, 0x01, 0x01, 0x00, 0x02, 0x03, 0x00, 0x00, 0x02,
    0x09, 0x24, 0x06, 0x02, 0x01, 0x01, 0x03, 0x00, 0x03,
    0x09, 0x04, 0x01, 0x00, 0x00, 0x01, 0x02, 0x00, 0x00,
    0x09, 0x04, 0x01, 0x01, 0x01, 0x01, 0x02, 0x00, 0x00,
    0x07, 0x24, 0x01, 0x01, 0x01, 0x01, 0x00,
    0x0b, 0x24, 0x02, 0x01, 0x02, 0x02, 0x10, 0x01, 0x44, 0xac, 0x00,
    0x09, 0x05, 0x01, 0x09, 0xc8, 0x00, 0x01, 0x00, 0x00,
    0x07, 0x25, 0x01, 0x01, 0x00, 0x00, 0x00,
};

void test_parser_walk()
{
    std::vector<U8> blob = Bytes( HID_CONFIG );
    USBDescriptorParser parser;
    ASSERT( parser.Parse( blob ) );
    ASSERT( !parser.GetError().IsSet() );

    const std::vector<USBParsedDescriptor>& descs = parser.GetDescriptors();
    ASSERT( descs.size() == 4 );
    ASSERT( descs[ 0 ].mOffset == 0 && descs[ 1 ].mOffset == 9 && descs[ 2 ].mOffset == 18 && descs[ 3 ].mOffset == 27 );
    ASSERT( !descs[ 0 ].mInInterface );
    ASSERT( descs[ 0 ].GetDescriptorType() == DT_CONFIGURATION );

    ASSERT( descs[ 1 ].mInInterface && descs[ 1 ].mTriplet.mClass == CC_HID );
    ASSERT( descs[ 2 ].mDescriptor );
    ASSERT( static_cast<const USBClassDescriptor&>( *descs[ 2 ].mDescriptor ).GetClassKind() == CDK_HID );
    ASSERT( descs[ 3 ].IsDecoded() && descs[ 3 ].mInterfaceNumber == 0 );

    USBClassTriplet triplet;
    ASSERT( parser.GetClassForInterface( 0, triplet ) );
    ASSERT( triplet.mClass == CC_HID && triplet.mSubClass == 1 && triplet.mProtocol == 1 );
    ASSERT( !parser.GetClassForInterface( 1, triplet ) );

    std::vector<U8> out;
    parser.Encode( out );
    ASSERT( out == blob );

    // a MIDI function, class specific endpoint included
    const U8 midiConfig[] = {
        0x09, 0x04, 0x01, 0x00, 0x01, 0x01, 0x03, 0x00, 0x00,
        0x07, 0x24, 0x01, 0x00, 0x01, 0x25, 0x00,
        0x06, 0x24, 0x02, 0x01, 0x01, 0x05,
        0x09, 0x05, 0x01, 0x02, 0x40, 0x00, 0x00, 0x00, 0x00,
        0x05, 0x25, 0x01, 0x01, 0x01,
    };
    std::vector<U8> midiBlob = Bytes( midiConfig );
    USBDescriptorParser midiParser;
    ASSERT( midiParser.Parse( midiBlob ) );
    const std::vector<USBParsedDescriptor>& midi = midiParser.GetDescriptors();
    ASSERT( midi.size() == 5 );
    ASSERT( static_cast<const USBClassDescriptor&>( *midi[ 1 ].mDescriptor ).GetClassKind() == CDK_MIDI );
    ASSERT( static_cast<const USBClassDescriptor&>( *midi[ 2 ].mDescriptor ).GetClassKind() == CDK_MIDI );
    ASSERT( midi[ 4 ].mMidiEndpoint && midi[ 4 ].mMidiEndpoint->mAssocJackIDs.size() == 1 );
    out.clear();
    midiParser.Encode( out );
    ASSERT( out == midiBlob );

    // a class descriptor the class rejects stays generic and the walk goes on
    const U8 badHid[] = {
        0x09, 0x04, 0x00, 0x00, 0x01, 0x03, 0x00, 0x00, 0x00,
        0x05, 0x21, 0x11, 0x01, 0x00,
        0x07, 0x05, 0x81, 0x03, 0x08, 0x00, 0x0a,
    };
    USBDescriptorParser badParser;
    ASSERT( badParser.Parse( badHid, sizeof( badHid ) ) );
    const std::vector<USBParsedDescriptor>& bad = badParser.GetDescriptors();
    ASSERT( bad.size() == 3 );
    ASSERT( bad[ 1 ].mDescriptor );
    ASSERT( static_cast<const USBClassDescriptor&>( *bad[ 1 ].mDescriptor ).GetClassKind() == CDK_Generic );
    ASSERT( bad[ 1 ].mError.mKind == ERR_InvalidArg );
    ASSERT( bad[ 2 ].IsDecoded() && !bad[ 2 ].mError.IsSet() );
}

void test_parser_audio_function()
{
    std::vector<U8> blob = Bytes( UAC1_CONFIG );
    USBDescriptorParser parser;
    ASSERT( parser.Parse( blob ) );

    const std::vector<USBParsedDescriptor>& descs = parser.GetDescriptors();
    ASSERT( descs.size() == 11 );
    ASSERT( descs[ 2 ].mAudio && descs[ 2 ].mAudio->GetKind() == UACK_Header1 );
    ASSERT( descs[ 3 ].mAudio && descs[ 3 ].mAudio->GetKind() == UACK_InputTerminal1 );
    ASSERT( descs[ 4 ].mAudio && descs[ 4 ].mAudio->GetKind() == UACK_FeatureUnit1 );
    ASSERT( descs[ 4 ].mAudio->mContext == UACC_AudioControl );
    ASSERT( descs[ 7 ].mAudio && descs[ 7 ].mAudio->GetKind() == UACK_StreamingInterface1 );
    ASSERT( descs[ 7 ].mInterfaceNumber == 1 );
    ASSERT( descs[ 8 ].mAudio && descs[ 8 ].mAudio->GetKind() == UACK_FormatTypeI1 );
    ASSERT( descs[ 9 ].mDescriptor && !descs[ 9 ].mAudio );
    ASSERT( descs[ 10 ].mAudio && descs[ 10 ].mAudio->GetKind() == UACK_DataStreamingEndpoint1 );
    ASSERT( descs[ 10 ].mAudio->mContext == UACC_AudioStreamingEndpoint );

    std::vector<U8> out;
    parser.Encode( out );
    ASSERT( out == blob );

    // UAC2: the streaming interface reports protocol 0 and still follows its AudioControl interface
    const U8 uac2[] = {
        0x09, 0x02, 0x59, 0x00, 0x02, 0x01, 0x00, 0x80, 0x32,
        0x08, 0x0b, 0x00, 0x02, 0x01, 0x00, 0x20, 0x00,
        0x09, 0x04, 0x00, 0x00, 0x00, 0x01, 0x01, 0x20, 0x00,
        0x09, 0x24, 0x01, 0x00, 0x02, 0x08, 0x40, 0x00, 0x00,
        0x08, 0x24, 0x0a, 0x10, 0x01, 0x07, 0x00, 0x00,
        0x09, 0x04, 0x01, 0x00, 0x01, 0x01, 0x02, 0x00, 0x00,
        0x10, 0x24, 0x01, 0x01, 0x00, 0x01, 0x01, 0x00, 0x00, 0x00, 0x02, 0x03, 0x00, 0x00, 0x00, 0x00,
        0x06, 0x24, 0x02, 0x01, 0x02, 0x10,
        0x07, 0x05, 0x81, 0x05, 0x00, 0x02, 0x01,
        0x08, 0x25, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00,
    };
    std::vector<U8> uac2Blob = Bytes( uac2 );
    USBDescriptorParser uac2Parser;
    ASSERT( uac2Parser.Parse( uac2Blob ) );

    const std::vector<USBParsedDescriptor>& d2 = uac2Parser.GetDescriptors();
    ASSERT( d2.size() == 10 );
    ASSERT( d2[ 1 ].mDescriptor && d2[ 1 ].mDescriptor->GetKind() == DK_InterfaceAssociation );
    ASSERT( d2[ 3 ].mAudio->GetKind() == UACK_Header2 );
    ASSERT( d2[ 3 ].mAudio->mProtocol == UAC_PROTOCOL_2 );
    ASSERT( d2[ 4 ].mAudio->GetKind() == UACK_ClockSource2 );
    ASSERT( d2[ 6 ].mAudio->GetKind() == UACK_StreamingInterface2 );
    ASSERT( d2[ 6 ].mTriplet.mProtocol == 0 );
    ASSERT( d2[ 7 ].mAudio->GetKind() == UACK_FormatTypeI2 );
    ASSERT( d2[ 9 ].mAudio->GetKind() == UACK_DataStreamingEndpoint2 );

    out.clear();
    uac2Parser.Encode( out );
    ASSERT( out == uac2Blob );
}

void test_parser_stops()
{
    // one byte of junk
    const U8 one[] = { 0x01 };
    USBDescriptorParser parser;
    ASSERT( !parser.Parse( one, sizeof( one ) ) );
    ASSERT( parser.GetError().mKind == ERR_InvalidArg );
    ASSERT( parser.GetDescriptors().size() == 1 );
    ASSERT( parser.GetDescriptors()[ 0 ].mDescriptor->GetKind() == DK_Junk );

    // junk after a good descriptor takes the rest of the blob
    const U8 junk[] = { 0x09, 0x02, 0x0c, 0x00, 0x00, 0x01, 0x00, 0x80, 0x32, 0x00, 0xff, 0xff };
    std::vector<U8> junkBlob = Bytes( junk );
    USBDescriptorParser junkParser;
    ASSERT( !junkParser.Parse( junkBlob ) );
    ASSERT( junkParser.GetDescriptors().size() == 2 );
    ASSERT( junkParser.GetDescriptors()[ 1 ].mBytes.size() == 3 );
    ASSERT( junkParser.GetError().mOffset == 9 );
    std::vector<U8> out;
    junkParser.Encode( out );
    ASSERT( out == junkBlob );

    // bLength past the end of the blob
    const U8 cut[] = { 0x09, 0x02, 0x12, 0x00, 0x01, 0x01, 0x00, 0x80, 0x32, 0x09, 0x04, 0x00, 0x00 };
    std::vector<U8> cutBlob = Bytes( cut );
    USBDescriptorParser cutParser;
    ASSERT( !cutParser.Parse( cutBlob ) );
    ASSERT( cutParser.GetError().mKind == ERR_Truncated );
    ASSERT( cutParser.GetError().mOffset == 9 );
    const std::vector<USBParsedDescriptor>& descs = cutParser.GetDescriptors();
    ASSERT( descs.size() == 2 );
    ASSERT( !descs[ 1 ].IsDecoded() );
    ASSERT( descs[ 1 ].mError.mKind == ERR_Truncated );
    out.clear();
    cutParser.Encode( out );
    ASSERT( out == cutBlob );

    USBDescriptorParser emptyParser;
    ASSERT( emptyParser.Parse( std::vector<U8>() ) );
    ASSERT( emptyParser.GetDescriptors().empty() );

    // reset drops everything from the previous blob
    cutParser.ResetParser();
    ASSERT( cutParser.GetDescriptors().empty() && !cutParser.GetError().IsSet() );
}

void test_string_table()
{
    USBStringTable table;
    const U8 name[] = { 0x10, 0x03, 'L', 0x00, 'i', 0x00, 'n', 0x00, 'e', 0x00, ' ', 0x00, 'I', 0x00, 'n', 0x00 };
    USBDecodeError error;
    std::unique_ptr<USBDescriptor> desc = USBDescriptorDecode( Bytes( name ), error );
    ASSERT( desc && desc->GetKind() == DK_String );
    table.AddStringDescriptor( 2, static_cast<const USBStringDescriptor&>( *desc ) );
    table.SetString( 3, "Volume" );
    table.SetString( 0, "language IDs" );
    ASSERT( table.GetCount() == 3 );

    std::string value;
    ASSERT( table.GetString( 2, value ) && value == "Line In" );
    ASSERT( !table.GetString( 9, value ) );

    std::vector<U8> blob = Bytes( UAC1_CONFIG );
    USBDescriptorParser parser;
    ASSERT( parser.Parse( blob ) );

    // iTerminal and iFeature, index 0 references stay empty
    ASSERT( parser.ResolveStrings( table ) == 2 );
    std::vector<USBParsedDescriptor>& descs = parser.GetDescriptors();
    const UACInputTerminal1& it = static_cast<const UACInputTerminal1&>( *descs[ 3 ].mAudio->mEntity );
    ASSERT( it.mTerminal.IsResolved() && it.mTerminal.mValue == "Line In" );
    ASSERT( !it.mChannelNames.IsResolved() );
    const UACFeatureUnit1& fu = static_cast<const UACFeatureUnit1&>( *descs[ 4 ].mAudio->mEntity );
    ASSERT( fu.mFeature.mValue == "Volume" );

    // nothing is resolved twice
    ASSERT( parser.ResolveStrings( table ) == 0 );

    USBStringRef first( 3 );
    USBStringRef none( 0 );
    std::vector<USBStringRef*> refs;
    refs.push_back( &first );
    refs.push_back( &none );
    ASSERT( ResolveStrings( refs, table ) == 1 );
    ASSERT( first.mValue == "Volume" && !none.IsResolved() );

    table.Clear();
    ASSERT( table.GetCount() == 0 );
}
