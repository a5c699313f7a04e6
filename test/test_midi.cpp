#include "test.hpp"

#include "USBClassDescriptors.h"
#include "USBDescriptors.h"
#include "USBLookupTables.h"
#include "USBMidiDescriptors.h"

static const USBClassTriplet MIDI_STREAMING( CC_Audio, UAC_SUBCLASS_MIDISTREAMING, 0 );

static std::unique_ptr<USBDescriptor> DecodeMidi( const std::vector<U8>& bytes )
{
    USBDecodeError error;
    std::unique_ptr<USBDescriptor> desc( USBGenericDescriptorDecode( &bytes.front(), bytes.size(), error ).release() );
    ASSERT( desc );
    ASSERT( ApplyClassContext( desc, MIDI_STREAMING, error ) );
    ASSERT( static_cast<const USBClassDescriptor&>( *desc ).GetClassKind() == CDK_MIDI );
    ASSERT( desc->ToBytes() == bytes );
    return desc;
}

void test_midi_entities()
{
    const U8 header[] = { 0x07, 0x24, 0x01, 0x00, 0x01, 0x41, 0x00 };
    std::unique_ptr<USBDescriptor> desc = DecodeMidi( Bytes( header ) );
    const USBMidiDescriptor* midi = static_cast<const USBMidiDescriptor*>( desc.get() );
    ASSERT( midi->GetSubtype() == MS_HEADER );
    ASSERT( midi->mBody && midi->mBody->GetSubtype() == MS_HEADER );
    const MIDIHeader& h = static_cast<const MIDIHeader&>( *midi->mBody );
    ASSERT( h.mBcdMSC.ToString() == "1.00" );
    ASSERT( h.mTotalLength == 0x41 );

    const U8 outJack[] = { 0x09, 0x24, 0x03, 0x01, 0x02, 0x01, 0x01, 0x01, 0x06 };
    desc = DecodeMidi( Bytes( outJack ) );
    midi = static_cast<const USBMidiDescriptor*>( desc.get() );
    ASSERT( midi->mBody );
    const MIDIOutputJack& out = static_cast<const MIDIOutputJack&>( *midi->mBody );
    ASSERT( std::string( GetMIDIJackTypeName( out.mJackType ) ) == "Embedded" );
    ASSERT( out.mJackID == 2 );
    ASSERT( out.mSources.size() == 1 );
    ASSERT( out.mSources[ 0 ].mSourceID == 1 && out.mSources[ 0 ].mSourcePin == 1 );
    ASSERT( out.mJack.mIndex == 6 );

    const U8 element[] = { 0x0e, 0x24, 0x04, 0x03, 0x01, 0x02, 0x01, 0x01, 0x00, 0x00, 0x02, 0x01, 0x08, 0x07 };
    desc = DecodeMidi( Bytes( element ) );
    midi = static_cast<const USBMidiDescriptor*>( desc.get() );
    ASSERT( midi->mBody );
    const MIDIElement& el = static_cast<const MIDIElement&>( *midi->mBody );
    ASSERT( el.mElementID == 3 );
    ASSERT( el.mNrOutputPins == 1 );
    ASSERT( el.mElCapsSize == 2 );
    ASSERT( el.GetCapabilities() == 0x0801 );
    std::vector<std::string> caps =
        GetBitmapStrings( U32( el.GetCapabilities() ), MIDI_ELEMENT_CAPABILITIES, CountOf( MIDI_ELEMENT_CAPABILITIES ) );
    ASSERT( caps.size() == 2 && caps[ 1 ] == "DLS2 (Downloadable Sounds Level 2)" );
    ASSERT( el.mElement.mIndex == 7 );

    // three pins announced, one byte of pins present: the descriptor survives without a body
    const U8 cut[] = { 0x07, 0x24, 0x03, 0x01, 0x02, 0x03, 0x01 };
    desc = DecodeMidi( Bytes( cut ) );
    midi = static_cast<const USBMidiDescriptor*>( desc.get() );
    ASSERT( !midi->mBody );
    ASSERT( midi->mBodyError.mKind == ERR_Truncated );
    ASSERT( midi->mBodyError.mField == "baSourceID" );
    ASSERT( midi->mBodyError.mOffset == 6 );

    const U8 undefined[] = { 0x04, 0x24, 0x07, 0x00 };
    desc = DecodeMidi( Bytes( undefined ) );
    midi = static_cast<const USBMidiDescriptor*>( desc.get() );
    ASSERT( midi->GetSubtype() == MS_UNDEFINED );
    ASSERT( !midi->mBody && !midi->mBodyError.IsSet() );

    // direct entity decode
    USBDecodeError error;
    const U8 inBody[] = { 0x01, 0x01, 0x05 };
    std::unique_ptr<MIDIEntity> entity = MIDIEntityDecode( MS_MIDI_IN_JACK, inBody, sizeof( inBody ), 3, error );
    ASSERT( entity && entity->GetSubtype() == MS_MIDI_IN_JACK );
    ASSERT( !MIDIEntityDecode( MS_UNDEFINED, inBody, sizeof( inBody ), 3, error ) );
    ASSERT( !error.IsSet() );
}

void test_midi_descriptor_strings()
{
    const U8 inJack[] = { 0x06, 0x24, 0x02, 0x01, 0x01, 0x05 };
    std::unique_ptr<USBDescriptor> desc = DecodeMidi( Bytes( inJack ) );
    USBMidiDescriptor* midi = static_cast<USBMidiDescriptor*>( desc.get() );
    ASSERT( midi->mHasString && midi->mString.mIndex == 5 );
    ASSERT( std::string( GetMIDIJackTypeName( inJack[ 3 ] ) ) == "Embedded" );

    std::vector<USBStringRef*> refs;
    desc->GetStringRefs( refs );
    ASSERT( refs.size() == 1 && refs[ 0 ]->mIndex == 5 );

    const U8 outJack[] = { 0x09, 0x24, 0x03, 0x02, 0x02, 0x01, 0x01, 0x01, 0x06 };
    desc = DecodeMidi( Bytes( outJack ) );
    midi = static_cast<USBMidiDescriptor*>( desc.get() );
    ASSERT( midi->mHasString && midi->mString.mIndex == 6 );

    const U8 element[] = { 0x0e, 0x24, 0x04, 0x03, 0x01, 0x02, 0x01, 0x01, 0x00, 0x00, 0x02, 0x01, 0x08, 0x07 };
    desc = DecodeMidi( Bytes( element ) );
    midi = static_cast<USBMidiDescriptor*>( desc.get() );
    ASSERT( midi->mHasString && midi->mString.mIndex == 7 );

    // the string index is past the end, so there is none
    const U8 cut[] = { 0x07, 0x24, 0x03, 0x01, 0x02, 0x03, 0x01 };
    desc = DecodeMidi( Bytes( cut ) );
    midi = static_cast<USBMidiDescriptor*>( desc.get() );
    ASSERT( !midi->mHasString );
    refs.clear();
    desc->GetStringRefs( refs );
    ASSERT( refs.empty() );

    // too short for a MIDI descriptor: the generic copy stays
    const U8 tiny[] = { 0x03, 0x24, 0x02 };
    std::vector<U8> tinyBytes = Bytes( tiny );
    USBDecodeError error;
    std::unique_ptr<USBDescriptor> generic( USBGenericDescriptorDecode( &tinyBytes.front(), tinyBytes.size(), error ).release() );
    ASSERT( generic );
    ASSERT( !ApplyClassContext( generic, MIDI_STREAMING, error ) );
    ASSERT( error.mKind == ERR_InvalidArg );
    ASSERT( static_cast<const USBClassDescriptor&>( *generic ).GetClassKind() == CDK_Generic );
}

void test_midi_endpoint()
{
    const U8 general[] = { 0x06, 0x25, 0x01, 0x02, 0x01, 0x03 };
    std::vector<U8> bytes = Bytes( general );
    USBDescriptorReader reader( bytes );
    MIDIEndpointDescriptor ep;
    ASSERT( ep.Decode( reader ) );
    ASSERT( ep.IsGeneral() );
    ASSERT( ep.mNumEmbMIDIJack == 2 );
    ASSERT( ep.mAssocJackIDs.size() == 2 && ep.mAssocJackIDs[ 1 ] == 3 );
    ASSERT( std::string( GetMIDIEndpointSubtypeName( ep.mDescriptorSubtype ) ) == "GENERAL" );

    std::vector<U8> out;
    ep.Encode( out );
    ASSERT( out == bytes );

    const U8 shortEp[] = { 0x03, 0x25, 0x01 };
    USBDescriptorReader shortReader( shortEp, sizeof( shortEp ) );
    MIDIEndpointDescriptor shortDesc;
    ASSERT( !shortDesc.Decode( shortReader ) );
    ASSERT( shortReader.GetError().mKind == ERR_InvalidArg );

    const U8 overrun[] = { 0x05, 0x25, 0x01, 0x03, 0x01 };
    USBDescriptorReader overrunReader( overrun, sizeof( overrun ) );
    MIDIEndpointDescriptor overrunDesc;
    ASSERT( !overrunDesc.Decode( overrunReader ) );
    ASSERT( overrunReader.GetError().mKind == ERR_Truncated );
    ASSERT( overrunReader.GetError().mField == "baAssocJackID" );

    const U8 undefined[] = { 0x04, 0x25, 0x00, 0x00 };
    USBDescriptorReader undefinedReader( undefined, sizeof( undefined ) );
    MIDIEndpointDescriptor undefinedDesc;
    ASSERT( undefinedDesc.Decode( undefinedReader ) );
    ASSERT( !undefinedDesc.IsGeneral() );
}
