#include <spdlog/spdlog.h>

#include "USBAudioDescriptors.h"
#include "USBLookupTables.h"

UACInterface GetUACInterface( U8 subtype, UACProtocol protocol )
{
    switch( protocol )
    {
    case UAC_PROTOCOL_1:
        switch( subtype )
        {
        case 0x01:
            return UACI_Header;
        case 0x02:
            return UACI_InputTerminal;
        case 0x03:
            return UACI_OutputTerminal;
        case 0x04:
            return UACI_MixerUnit;
        case 0x05:
            return UACI_SelectorUnit;
        case 0x06:
            return UACI_FeatureUnit;
        case 0x07:
            return UACI_ProcessingUnit;
        case 0x08:
            return UACI_ExtensionUnit;
        }
        break;

    case UAC_PROTOCOL_2:
        switch( subtype )
        {
        case 0x01:
            return UACI_Header;
        case 0x02:
            return UACI_InputTerminal;
        case 0x03:
            return UACI_OutputTerminal;
        case 0x04:
            return UACI_MixerUnit;
        case 0x05:
            return UACI_SelectorUnit;
        case 0x06:
            return UACI_FeatureUnit;
        case 0x07:
            return UACI_EffectUnit;
        case 0x08:
            return UACI_ProcessingUnit;
        case 0x09:
            return UACI_ExtensionUnit;
        case 0x0a:
            return UACI_ClockSource;
        case 0x0b:
            return UACI_ClockSelector;
        case 0x0c:
            return UACI_ClockMultiplier;
        case 0x0d:
            return UACI_SampleRateConverter;
        }
        break;

    case UAC_PROTOCOL_3:
        // UAC3 numbers its subtypes the way UACInterface does
        if( subtype <= UACI_PowerDomain )
            return UACInterface( subtype );
        break;

    default:
        break;
    }

    return UACI_Undefined;
}

static UACDescriptorKind GetControlKind( UACInterface iface, UACProtocol protocol )
{
    // one row per entity: UAC1, UAC2, UAC3
    switch( iface )
    {
    case UACI_Header:
        return protocol == UAC_PROTOCOL_1 ? UACK_Header1 : protocol == UAC_PROTOCOL_2 ? UACK_Header2 : UACK_Header3;
    case UACI_InputTerminal:
        return protocol == UAC_PROTOCOL_1   ? UACK_InputTerminal1
               : protocol == UAC_PROTOCOL_2 ? UACK_InputTerminal2
                                            : UACK_InputTerminal3;
    case UACI_OutputTerminal:
        return protocol == UAC_PROTOCOL_1   ? UACK_OutputTerminal1
               : protocol == UAC_PROTOCOL_2 ? UACK_OutputTerminal2
                                            : UACK_OutputTerminal3;
    case UACI_ExtendedTerminal:
        return protocol == UAC_PROTOCOL_3 ? UACK_ExtendedTerminalHeader : UACK_Invalid;
    case UACI_MixerUnit:
        return protocol == UAC_PROTOCOL_1 ? UACK_MixerUnit1 : protocol == UAC_PROTOCOL_2 ? UACK_MixerUnit2 : UACK_MixerUnit3;
    case UACI_SelectorUnit:
        return protocol == UAC_PROTOCOL_1   ? UACK_SelectorUnit1
               : protocol == UAC_PROTOCOL_2 ? UACK_SelectorUnit2
                                            : UACK_SelectorUnit3;
    case UACI_FeatureUnit:
        return protocol == UAC_PROTOCOL_1   ? UACK_FeatureUnit1
               : protocol == UAC_PROTOCOL_2 ? UACK_FeatureUnit2
                                            : UACK_FeatureUnit3;
    case UACI_EffectUnit:
        return protocol == UAC_PROTOCOL_1 ? UACK_Invalid : protocol == UAC_PROTOCOL_2 ? UACK_EffectUnit2 : UACK_EffectUnit3;
    case UACI_ProcessingUnit:
        return protocol == UAC_PROTOCOL_1   ? UACK_ProcessingUnit1
               : protocol == UAC_PROTOCOL_2 ? UACK_ProcessingUnit2
                                            : UACK_ProcessingUnit3;
    case UACI_ExtensionUnit:
        return protocol == UAC_PROTOCOL_1   ? UACK_ExtensionUnit1
               : protocol == UAC_PROTOCOL_2 ? UACK_ExtensionUnit2
                                            : UACK_ExtensionUnit3;
    case UACI_ClockSource:
        return protocol == UAC_PROTOCOL_1 ? UACK_Invalid : protocol == UAC_PROTOCOL_2 ? UACK_ClockSource2 : UACK_ClockSource3;
    case UACI_ClockSelector:
        return protocol == UAC_PROTOCOL_1   ? UACK_Invalid
               : protocol == UAC_PROTOCOL_2 ? UACK_ClockSelector2
                                            : UACK_ClockSelector3;
    case UACI_ClockMultiplier:
        return protocol == UAC_PROTOCOL_1   ? UACK_Invalid
               : protocol == UAC_PROTOCOL_2 ? UACK_ClockMultiplier2
                                            : UACK_ClockMultiplier3;
    case UACI_SampleRateConverter:
        return protocol == UAC_PROTOCOL_1   ? UACK_Invalid
               : protocol == UAC_PROTOCOL_2 ? UACK_SampleRateConverter2
                                            : UACK_SampleRateConverter3;
    case UACI_PowerDomain:
        return protocol == UAC_PROTOCOL_3 ? UACK_PowerDomain : UACK_Invalid;
    case UACI_Undefined:
    case UACI_Connectors:
        break;
    }

    return UACK_Undefined;
}

static UACDescriptorKind GetStreamingKind( U8 subtype, UACProtocol protocol, const U8* payload, size_t size )
{
    switch( subtype )
    {
    case UACS_General:
        return protocol == UAC_PROTOCOL_1   ? UACK_StreamingInterface1
               : protocol == UAC_PROTOCOL_2 ? UACK_StreamingInterface2
                                            : UACK_StreamingInterface3;

    case UACS_FormatType:
        if( protocol == UAC_PROTOCOL_3 )
            return UACK_Invalid;

        if( size < 1 )
            return UACK_Undefined;

        switch( payload[ 0 ] )
        {
        case FORMAT_TYPE_I:
        case FORMAT_TYPE_III:
            return protocol == UAC_PROTOCOL_1 ? UACK_FormatTypeI1 : UACK_FormatTypeI2;
        case FORMAT_TYPE_II:
            return protocol == UAC_PROTOCOL_1 ? UACK_FormatTypeII1 : UACK_FormatTypeII2;
        case FORMAT_TYPE_IV:
            return protocol == UAC_PROTOCOL_2 ? UACK_FormatTypeIV2 : UACK_Undefined;
        }
        return UACK_Undefined;

    case UACS_FormatSpecific:
        if( protocol == UAC_PROTOCOL_3 )
            return UACK_Invalid;

        if( size < 2 )
            return UACK_Undefined;

        switch( payload[ 0 ] | ( payload[ 1 ] << 8 ) )
        {
        case FORMAT_TAG_MPEG:
            return UACK_FormatSpecificMPEG;
        case FORMAT_TAG_AC3:
            return UACK_FormatSpecificAC3;
        }
        return UACK_FormatSpecific;
    }

    return UACK_Undefined;
}

UACDescriptorKind GetUACDescriptorKind( UACDescriptorContext context, U8 subtype, UACProtocol protocol, const U8* payload,
                                        size_t size )
{
    if( protocol == UAC_PROTOCOL_Unknown )
        return UACK_Invalid;

    switch( context )
    {
    case UACC_AudioControl:
        return GetControlKind( GetUACInterface( subtype, protocol ), protocol );

    case UACC_AudioStreaming:
        return GetStreamingKind( subtype, protocol, payload, size );

    case UACC_AudioStreamingEndpoint:
        if( subtype != UACE_General )
            return UACK_Undefined;

        return protocol == UAC_PROTOCOL_1   ? UACK_DataStreamingEndpoint1
               : protocol == UAC_PROTOCOL_2 ? UACK_DataStreamingEndpoint2
                                            : UACK_DataStreamingEndpoint3;
    }

    return UACK_Undefined;
}

static UACEntity* CreateUACEntity( UACDescriptorKind kind )
{
    switch( kind )
    {
    case UACK_Undefined:
    case UACK_Invalid:
        return new UACRawEntity( kind );

    case UACK_Header1:
        return new UACHeader1;
    case UACK_Header2:
        return new UACHeader2;
    case UACK_Header3:
        return new UACHeader3;
    case UACK_InputTerminal1:
        return new UACInputTerminal1;
    case UACK_InputTerminal2:
        return new UACInputTerminal2;
    case UACK_InputTerminal3:
        return new UACInputTerminal3;
    case UACK_OutputTerminal1:
        return new UACOutputTerminal1;
    case UACK_OutputTerminal2:
        return new UACOutputTerminal2;
    case UACK_OutputTerminal3:
        return new UACOutputTerminal3;
    case UACK_ExtendedTerminalHeader:
        return new UACExtendedTerminalHeader;
    case UACK_MixerUnit1:
        return new UACMixerUnit1;
    case UACK_MixerUnit2:
        return new UACMixerUnit2;
    case UACK_MixerUnit3:
        return new UACMixerUnit3;
    case UACK_SelectorUnit1:
        return new UACSelectorUnit1;
    case UACK_SelectorUnit2:
        return new UACSelectorUnit2;
    case UACK_SelectorUnit3:
        return new UACSelectorUnit3;
    case UACK_FeatureUnit1:
        return new UACFeatureUnit1;
    case UACK_FeatureUnit2:
        return new UACFeatureUnit2;
    case UACK_FeatureUnit3:
        return new UACFeatureUnit3;
    case UACK_EffectUnit2:
        return new UACEffectUnit2;
    case UACK_EffectUnit3:
        return new UACEffectUnit3;
    case UACK_ProcessingUnit1:
        return new UACProcessingUnit1;
    case UACK_ProcessingUnit2:
        return new UACProcessingUnit2;
    case UACK_ProcessingUnit3:
        return new UACProcessingUnit3;
    case UACK_ExtensionUnit1:
        return new UACExtensionUnit1;
    case UACK_ExtensionUnit2:
        return new UACExtensionUnit2;
    case UACK_ExtensionUnit3:
        return new UACExtensionUnit3;
    case UACK_ClockSource2:
        return new UACClockSource2;
    case UACK_ClockSource3:
        return new UACClockSource3;
    case UACK_ClockSelector2:
        return new UACClockSelector2;
    case UACK_ClockSelector3:
        return new UACClockSelector3;
    case UACK_ClockMultiplier2:
        return new UACClockMultiplier2;
    case UACK_ClockMultiplier3:
        return new UACClockMultiplier3;
    case UACK_SampleRateConverter2:
        return new UACSampleRateConverter2;
    case UACK_SampleRateConverter3:
        return new UACSampleRateConverter3;
    case UACK_PowerDomain:
        return new UACPowerDomain;

    case UACK_StreamingInterface1:
        return new UACStreamingInterface1;
    case UACK_StreamingInterface2:
        return new UACStreamingInterface2;
    case UACK_StreamingInterface3:
        return new UACStreamingInterface3;
    case UACK_FormatTypeI1:
        return new UACFormatTypeI1;
    case UACK_FormatTypeII1:
        return new UACFormatTypeII1;
    case UACK_FormatTypeI2:
        return new UACFormatTypeI2;
    case UACK_FormatTypeII2:
        return new UACFormatTypeII2;
    case UACK_FormatTypeIV2:
        return new UACFormatTypeIV2;
    case UACK_FormatSpecific:
        return new UACFormatSpecific;
    case UACK_FormatSpecificMPEG:
        return new UACFormatSpecificMPEG;
    case UACK_FormatSpecificAC3:
        return new UACFormatSpecificAC3;

    case UACK_DataStreamingEndpoint1:
        return new UACDataStreamingEndpoint1;
    case UACK_DataStreamingEndpoint2:
        return new UACDataStreamingEndpoint2;
    case UACK_DataStreamingEndpoint3:
        return new UACDataStreamingEndpoint3;
    }

    return new UACRawEntity( UACK_Undefined );
}

std::unique_ptr<UACEntity> DecodeUACEntity( UACDescriptorContext context, U8 subtype, UACProtocol protocol, const U8* payload,
                                            size_t size, size_t base, USBDecodeError& error )
{
    UACDescriptorKind kind = GetUACDescriptorKind( context, subtype, protocol, payload, size );
    std::unique_ptr<UACEntity> entity( CreateUACEntity( kind ) );

    USBDescriptorReader reader( payload, size, base );
    if( !entity->Decode( reader ) )
    {
        error = reader.GetError();
        entity.reset();
    }

    return entity;
}

bool UACDescriptor::Decode( USBDescriptorReader& reader, UACDescriptorContext context, U8 protocol )
{
    if( reader.GetRemaining() < 3 )
        return reader.Fail( ERR_InvalidArg, "Audio class descriptor too short, must be at least 3 bytes" );

    size_t available = reader.GetRemaining();
    if( !reader.Read( mLength, "bLength" ) || !reader.Read( mDescriptorType, "bDescriptorType" ) ||
        !reader.Read( mDescriptorSubtype, "bDescriptorSubtype" ) )
        return false;

    if( mLength < 3 )
        return reader.Fail( ERR_InvalidArg, "bLength " + int2str( mLength ) + " is below the 3 byte header", "bLength" );

    if( mLength > available )
        return reader.Fail( ERR_InvalidArg,
                            "bLength " + int2str( mLength ) + " exceeds the " + int2str( available ) + " bytes available",
                            "bLength" );

    mContext = context;
    mProtocol = GetUACProtocol( protocol );
    if( mProtocol == UAC_PROTOCOL_Unknown )
        spdlog::debug( "audio interface protocol 0x{:02x} is not a UAC version", protocol );

    size_t base = reader.GetOffset();
    // the body ends at bLength, anything after it is the next descriptor
    std::vector<U8> body;
    if( !reader.ReadArray( body, mLength - 3, "bDescriptorSubtype" ) )
        return false;

    mError.Clear();
    mEntity = DecodeUACEntity( mContext, mDescriptorSubtype, mProtocol, body.empty() ? NULL : &body.front(), body.size(),
                               base, mError );

    if( !mEntity )
    {
        spdlog::warn( "{} audio descriptor subtype 0x{:02x} kept raw: {}", GetUACProtocolName( mProtocol ),
                      mDescriptorSubtype, mError.GetText() );

        std::unique_ptr<UACRawEntity> raw( new UACRawEntity( UACK_Invalid ) );
        raw->mData = body;
        mEntity.reset( raw.release() );
    }

    return true;
}

void UACDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    writer.Write( mLength );
    writer.Write( mDescriptorType );
    writer.Write( mDescriptorSubtype );

    if( mEntity )
        mEntity->Encode( writer );
}

std::unique_ptr<UACDescriptor> UACDescriptorDecode( const U8* data, size_t size, UACDescriptorContext context, U8 protocol,
                                                    USBDecodeError& error )
{
    std::unique_ptr<UACDescriptor> desc( new UACDescriptor );
    USBDescriptorReader reader( data, size );
    if( !desc->Decode( reader, context, protocol ) )
    {
        error = reader.GetError();
        desc.reset();
    }

    return desc;
}
