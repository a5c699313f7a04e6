#include <spdlog/spdlog.h>

#include "USBDescriptorParser.h"
#include "USBLookupTables.h"

void USBParsedDescriptor::GetStringRefs( std::vector<USBStringRef*>& refs )
{
    if( mDescriptor )
        mDescriptor->GetStringRefs( refs );
    else if( mAudio )
        mAudio->GetStringRefs( refs );
}

void USBParsedDescriptor::Encode( std::vector<U8>& out ) const
{
    if( mAudio )
        mAudio->Encode( out );
    else if( mMidiEndpoint )
        mMidiEndpoint->Encode( out );
    else if( mDescriptor )
        mDescriptor->Encode( out );
    else
        out.insert( out.end(), mBytes.begin(), mBytes.end() );
}

bool USBStringTable::GetString( U8 index, std::string& value ) const
{
    USBStringContainer::const_iterator srch( mStrings.find( index ) );
    if( srch == mStrings.end() )
        return false;

    value = srch->second;
    return true;
}

size_t ResolveStrings( const std::vector<USBStringRef*>& refs, const USBStringTable& table )
{
    size_t ret_val = 0;
    std::string value;
    for( std::vector<USBStringRef*>::const_iterator i( refs.begin() ); i != refs.end(); ++i )
    {
        USBStringRef* ref = *i;
        if( ref == NULL || ref->mIndex == 0 || ref->IsResolved() )
            continue;

        if( table.GetString( ref->mIndex, value ) && ref->Resolve( value ) )
            ++ret_val;
    }

    return ret_val;
}

void USBDescriptorParser::ResetParser()
{
    mInterfaceClasses.clear();
    mInInterface = false;
    mInterfaceNumber = 0;
    mHasAudioControl = false;
    mAudioControlProtocol = UAC_PROTOCOL_1;
    mDescriptors.clear();
    mError.Clear();
}

U8 USBDescriptorParser::GetAudioProtocol( const USBClassTriplet& triplet ) const
{
    // streaming interfaces follow the AudioControl interface of the function
    if( triplet.mSubClass != UAC_SUBCLASS_AUDIOCONTROL && mHasAudioControl )
        return mAudioControlProtocol;

    return triplet.mProtocol;
}

void USBDescriptorParser::ParseInterface( USBParsedDescriptor& entry )
{
    USBInterfaceDescriptor iface;
    USBDescriptorReader reader( entry.mBytes );
    if( !iface.Decode( reader ) )
    {
        // no usable class context until the next interface
        entry.mError = reader.GetError();
        mInInterface = false;
        return;
    }

    USBClassTriplet triplet( iface.mInterfaceClass, iface.mInterfaceSubClass, iface.mInterfaceProtocol );

    mInterfaceNumber = iface.mInterfaceNumber;
    mInterfaceClasses[ mInterfaceNumber ] = triplet;
    mInInterface = true;

    if( triplet.mClass == CC_Audio && triplet.mSubClass == UAC_SUBCLASS_AUDIOCONTROL )
    {
        mHasAudioControl = true;
        mAudioControlProtocol = triplet.mProtocol;
        spdlog::debug( "interface {} is {} AudioControl", mInterfaceNumber,
                       GetUACProtocolName( GetUACProtocol( triplet.mProtocol ) ) );
    }
    else
    {
        spdlog::debug( "interface {} class {} ({:02x}/{:02x}/{:02x})", mInterfaceNumber, GetUSBClassName( triplet.mClass ),
                       triplet.mClass, triplet.mSubClass, triplet.mProtocol );
    }
}

void USBDescriptorParser::ParseClassSpecific( USBParsedDescriptor& entry )
{
    const U8* data = &entry.mBytes.front();
    size_t size = entry.mBytes.size();
    const USBClassTriplet& triplet = entry.mTriplet;
    U8 descType = entry.GetDescriptorType();

    if( triplet.mClass == CC_Audio )
    {
        UACDescriptorContext context = UACC_AudioControl;
        bool isUAC = false;

        if( triplet.mSubClass == UAC_SUBCLASS_AUDIOCONTROL && descType == DT_CS_INTERFACE )
        {
            isUAC = true;
        }
        else if( triplet.mSubClass == UAC_SUBCLASS_AUDIOSTREAMING )
        {
            isUAC = descType == DT_CS_INTERFACE || descType == DT_CS_ENDPOINT;
            context = descType == DT_CS_INTERFACE ? UACC_AudioStreaming : UACC_AudioStreamingEndpoint;
        }
        else if( triplet.mSubClass == UAC_SUBCLASS_MIDISTREAMING && descType == DT_CS_ENDPOINT )
        {
            std::unique_ptr<MIDIEndpointDescriptor> midi( new MIDIEndpointDescriptor );
            USBDescriptorReader reader( entry.mBytes );
            if( midi->Decode( reader ) )
                entry.mMidiEndpoint = std::move( midi );
            else
                entry.mError = reader.GetError();

            return;
        }

        if( isUAC )
        {
            entry.mAudio = UACDescriptorDecode( data, size, context, GetAudioProtocol( triplet ), entry.mError );
            return;
        }
    }

    std::unique_ptr<USBGenericDescriptor> generic = USBGenericDescriptorDecode( data, size, entry.mError );
    if( !generic )
        return;

    // on failure the generic form stays, the error is kept next to it
    std::unique_ptr<USBDescriptor> desc( generic.release() );
    ApplyClassContext( desc, triplet, entry.mError );
    entry.mDescriptor = std::move( desc );
}

bool USBDescriptorParser::Parse( const U8* data, size_t size )
{
    size_t offset = 0;
    while( data != NULL && offset < size )
    {
        USBParsedDescriptor entry;
        entry.mOffset = offset;
        entry.mInInterface = mInInterface;
        entry.mInterfaceNumber = mInterfaceNumber;
        if( mInInterface )
            entry.mTriplet = mInterfaceClasses[ mInterfaceNumber ];

        size_t remaining = size - offset;
        U8 length = data[ offset ];

        // junk swallows the rest of the blob, there is no length to skip by
        if( length < 2 )
        {
            entry.mBytes.assign( data + offset, data + size );
            entry.mDescriptor.reset( new USBRawDescriptor( DK_Junk, data + offset, remaining ) );
            mDescriptors.push_back( std::move( entry ) );

            spdlog::warn( "junk at offset {} ends the descriptor walk, {} bytes left", offset, remaining );
            return mError.Set( ERR_InvalidArg, "junk descriptor, bLength " + int2str( length ), "bLength", offset );
        }

        if( length > remaining )
        {
            entry.mBytes.assign( data + offset, data + size );
            entry.mError.Set( ERR_Truncated,
                              "bLength " + int2str( length ) + " exceeds the " + int2str( remaining ) + " bytes left",
                              "bLength", offset );
            mDescriptors.push_back( std::move( entry ) );

            spdlog::warn( "descriptor at offset {} is truncated: {}", offset, mDescriptors.back().mError.GetText() );
            return mError.Set( ERR_Truncated, mDescriptors.back().mError.mMessage, "bLength", offset );
        }

        entry.mBytes.assign( data + offset, data + offset + length );
        U8 descType = entry.GetDescriptorType();

        if( descType == DT_INTERFACE )
        {
            ParseInterface( entry );

            // the interface itself belongs to its own context
            entry.mInInterface = mInInterface;
            entry.mInterfaceNumber = mInterfaceNumber;
            if( mInInterface )
                entry.mTriplet = mInterfaceClasses[ mInterfaceNumber ];
        }
        else if( descType == DT_CONFIGURATION || descType == DT_OTHER_SPEED_CONFIGURATION )
        {
            mInInterface = false;
            mHasAudioControl = false;
            entry.mInInterface = false;
        }

        if( entry.mInInterface && ( descType == DT_HID || descType == DT_CS_INTERFACE || descType == DT_CS_ENDPOINT ) )
        {
            ParseClassSpecific( entry );
        }
        else
        {
            USBDecodeError error;
            entry.mDescriptor = USBDescriptorDecode( entry.mBytes, error );
            if( !entry.mDescriptor && !entry.mError.IsSet() )
                entry.mError = error;
        }

        if( entry.mError.IsSet() )
            spdlog::warn( "{} descriptor at offset {}: {}", GetDescriptorName( descType ), offset, entry.mError.GetText() );

        mDescriptors.push_back( std::move( entry ) );
        offset += length;
    }

    return true;
}

size_t USBDescriptorParser::ResolveStrings( const USBStringTable& table )
{
    std::vector<USBStringRef*> refs;
    for( std::vector<USBParsedDescriptor>::iterator i( mDescriptors.begin() ); i != mDescriptors.end(); ++i )
        i->GetStringRefs( refs );

    return ::ResolveStrings( refs, table );
}

void USBDescriptorParser::Encode( std::vector<U8>& out ) const
{
    for( std::vector<USBParsedDescriptor>::const_iterator i( mDescriptors.begin() ); i != mDescriptors.end(); ++i )
        i->Encode( out );
}
