#include <spdlog/spdlog.h>

#include "USBMidiDescriptors.h"
#include "USBLookupTables.h"

bool MIDIHeader::Decode( USBDescriptorReader& reader )
{
    if( !reader.ReadBCD( mBcdMSC, "bcdMSC" ) || !reader.Read( mTotalLength, "wTotalLength" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void MIDIHeader::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mBcdMSC );
    writer.Write( mTotalLength );
    writer.WriteArray( mJunk );
}

bool MIDIInputJack::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mJackType, "bJackType" ) || !reader.Read( mJackID, "bJackID" ) || !reader.ReadString( mJack, "iJack" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void MIDIInputJack::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mJackType );
    writer.Write( mJackID );
    writer.Write( mJack );
    writer.WriteArray( mJunk );
}

static bool ReadSourcePins( USBDescriptorReader& reader, U8 count, std::vector<MIDISourcePin>& sources )
{
    std::vector<U8> raw;
    if( !reader.ReadArray( raw, size_t( count ) * 2, "baSourceID" ) )
        return false;

    sources.clear();
    for( size_t cnt = 0; cnt < count; ++cnt )
    {
        MIDISourcePin pin;
        pin.mSourceID = raw[ cnt * 2 ];
        pin.mSourcePin = raw[ cnt * 2 + 1 ];
        sources.push_back( pin );
    }

    return true;
}

static void WriteSourcePins( USBDescriptorWriter& writer, const std::vector<MIDISourcePin>& sources )
{
    for( std::vector<MIDISourcePin>::const_iterator i( sources.begin() ); i != sources.end(); ++i )
    {
        writer.Write( i->mSourceID );
        writer.Write( i->mSourcePin );
    }
}

bool MIDIOutputJack::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mJackType, "bJackType" ) || !reader.Read( mJackID, "bJackID" ) ||
        !reader.Read( mNrInputPins, "bNrInputPins" ) )
        return false;

    // iJack follows the source pin pairs
    if( !ReadSourcePins( reader, mNrInputPins, mSources ) || !reader.ReadString( mJack, "iJack" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void MIDIOutputJack::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mJackType );
    writer.Write( mJackID );
    writer.Write( mNrInputPins );
    WriteSourcePins( writer, mSources );
    writer.Write( mJack );
    writer.WriteArray( mJunk );
}

bool MIDIElement::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mElementID, "bElementID" ) || !reader.Read( mNrInputPins, "bNrInputPins" ) )
        return false;

    if( !ReadSourcePins( reader, mNrInputPins, mSources ) )
        return false;

    if( !reader.Read( mNrOutputPins, "bNrOutputPins" ) || !reader.Read( mInTerminalLink, "bInTerminalLink" ) ||
        !reader.Read( mOutTerminalLink, "bOutTerminalLink" ) || !reader.Read( mElCapsSize, "bElCapsSize" ) )
        return false;

    if( !reader.ReadArray( mElementCaps, mElCapsSize, "bmElementCaps" ) || !reader.ReadString( mElement, "iElement" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void MIDIElement::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mElementID );
    writer.Write( mNrInputPins );
    WriteSourcePins( writer, mSources );
    writer.Write( mNrOutputPins );
    writer.Write( mInTerminalLink );
    writer.Write( mOutTerminalLink );
    writer.Write( mElCapsSize );
    writer.WriteArray( mElementCaps );
    writer.Write( mElement );
    writer.WriteArray( mJunk );
}

U64 MIDIElement::GetCapabilities() const
{
    U64 ret_val = 0;
    for( size_t cnt = 0; cnt < mElementCaps.size() && cnt < 8; ++cnt )
        ret_val |= U64( mElementCaps[ cnt ] ) << ( cnt * 8 );

    return ret_val;
}

std::unique_ptr<MIDIEntity> MIDIEntityDecode( U8 subtype, const U8* data, size_t size, size_t base, USBDecodeError& error )
{
    std::unique_ptr<MIDIEntity> entity;
    switch( subtype )
    {
    case MS_HEADER:
        entity.reset( new MIDIHeader );
        break;
    case MS_MIDI_IN_JACK:
        entity.reset( new MIDIInputJack );
        break;
    case MS_MIDI_OUT_JACK:
        entity.reset( new MIDIOutputJack );
        break;
    case MS_ELEMENT:
        entity.reset( new MIDIElement );
        break;
    default:
        return entity;
    }

    USBDescriptorReader reader( data, size, base );
    if( !entity->Decode( reader ) )
    {
        error = reader.GetError();
        spdlog::warn( "MIDI {} body not decoded: {}", GetMIDIInterfaceSubtypeName( subtype ), error.GetText() );
        entity.reset();
    }

    return entity;
}

bool MIDIEndpointDescriptor::Decode( USBDescriptorReader& reader )
{
    if( reader.GetRemaining() < 4 )
        return reader.Fail( ERR_InvalidArg, "MIDI endpoint descriptor too short" );

    if( !reader.Read( mLength, "bLength" ) || !reader.Read( mDescriptorType, "bDescriptorType" ) ||
        !reader.Read( mDescriptorSubtype, "bDescriptorSubtype" ) || !reader.Read( mNumEmbMIDIJack, "bNumEmbMIDIJack" ) )
        return false;

    if( !reader.ReadArray( mAssocJackIDs, mNumEmbMIDIJack, "baAssocJackID" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void MIDIEndpointDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    writer.Write( mLength );
    writer.Write( mDescriptorType );
    writer.Write( mDescriptorSubtype );
    writer.Write( mNumEmbMIDIJack );
    writer.WriteArray( mAssocJackIDs );
    writer.WriteArray( mJunk );
}
