#include "test.hpp"

#include "USBAudioDescriptors.h"
#include "USBLookupTables.h"

static std::unique_ptr<UACDescriptor> DecodeStreaming( const std::vector<U8>& bytes, UACDescriptorContext context,
                                                       U8 protocol )
{
    USBDecodeError error;
    std::unique_ptr<UACDescriptor> desc = UACDescriptorDecode( &bytes.front(), bytes.size(), context, protocol, error );
    ASSERT( desc );

    std::vector<U8> out;
    desc->Encode( out );
    ASSERT( out == bytes );
    return desc;
}

void test_uac_streaming_interface()
{
    const U8 general1[] = { 0x07, 0x24, 0x01, 0x01, 0x01, 0x01, 0x00 };
    std::unique_ptr<UACDescriptor> desc = DecodeStreaming( Bytes( general1 ), UACC_AudioStreaming, 0x00 );
    ASSERT( desc->GetKind() == UACK_StreamingInterface1 );
    const UACStreamingInterface1& si1 = static_cast<const UACStreamingInterface1&>( *desc->mEntity );
    ASSERT( si1.mTerminalLink == 1 && si1.mDelay == 1 );
    ASSERT( std::string( GetUACFormatTagName( si1.mFormatTag ) ) == "PCM" );

    const U8 general2[] = { 0x10, 0x24, 0x01, 0x01, 0x05, 0x01, 0x01, 0x00,
                            0x00, 0x00, 0x02, 0x03, 0x00, 0x00, 0x00, 0x00 };
    desc = DecodeStreaming( Bytes( general2 ), UACC_AudioStreaming, 0x20 );
    ASSERT( desc->GetKind() == UACK_StreamingInterface2 );
    const UACStreamingInterface2& si2 = static_cast<const UACStreamingInterface2&>( *desc->mEntity );
    ASSERT( si2.mFormats == 1 );
    ASSERT( si2.mNrChannels == 2 && si2.mChannelConfig == 3 );
    std::vector<UACControlEntry> controls = si2.GetControls();
    ASSERT( controls.size() == 2 );
    ASSERT( controls[ 0 ].mLabel == "Active Alternate Setting" && controls[ 0 ].mSetting == CS_ReadOnly );

    const U8 general3[] = { 0x17, 0x24, 0x01, 0x01, 0x00, 0x00, 0x00, 0x00, 0x02, 0x00, 0x01, 0x00,
                            0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x02, 0x10, 0x00, 0x00, 0x00 };
    desc = DecodeStreaming( Bytes( general3 ), UACC_AudioStreaming, 0x30 );
    ASSERT( desc->GetKind() == UACK_StreamingInterface3 );
    const UACStreamingInterface3& si3 = static_cast<const UACStreamingInterface3&>( *desc->mEntity );
    ASSERT( si3.mClusterDescrID == 2 );
    ASSERT( si3.mFormats == 1 );
    ASSERT( si3.mSubslotSize == 2 && si3.mBitResolution == 16 );

    // short AS_GENERAL keeps its bytes
    const U8 shortGeneral[] = { 0x05, 0x24, 0x01, 0x01, 0x01 };
    desc = DecodeStreaming( Bytes( shortGeneral ), UACC_AudioStreaming, 0x00 );
    ASSERT( !desc->IsDecoded() );
    ASSERT( desc->mError.mKind == ERR_Truncated && desc->mError.mField == "wFormatTag" );
}

void test_uac_format_type()
{
    const U8 discrete[] = { 0x0e, 0x24, 0x02, 0x01, 0x02, 0x02, 0x10, 0x02, 0x44, 0xac, 0x00, 0x80, 0xbb, 0x00 };
    std::unique_ptr<UACDescriptor> desc = DecodeStreaming( Bytes( discrete ), UACC_AudioStreaming, 0x00 );
    ASSERT( desc->GetKind() == UACK_FormatTypeI1 );
    const UACFormatTypeI1& typeI = static_cast<const UACFormatTypeI1&>( *desc->mEntity );
    ASSERT( typeI.mNrChannels == 2 && typeI.mBitResolution == 16 );
    ASSERT( !typeI.mFrequencies.IsContinuous() );
    ASSERT( typeI.mFrequencies.mSamFreqs.size() == 2 );
    ASSERT( typeI.mFrequencies.mSamFreqs[ 0 ] == 44100 && typeI.mFrequencies.mSamFreqs[ 1 ] == 48000 );

    const U8 continuous[] = { 0x0e, 0x24, 0x02, 0x01, 0x02, 0x02, 0x10, 0x00, 0x40, 0x1f, 0x00, 0x80, 0xbb, 0x00 };
    desc = DecodeStreaming( Bytes( continuous ), UACC_AudioStreaming, 0x00 );
    const UACFormatTypeI1& range = static_cast<const UACFormatTypeI1&>( *desc->mEntity );
    ASSERT( range.mFrequencies.IsContinuous() );
    ASSERT( range.mFrequencies.mLowerSamFreq == 8000 && range.mFrequencies.mUpperSamFreq == 48000 );

    // two rates announced, one present
    const U8 cut[] = { 0x0b, 0x24, 0x02, 0x01, 0x02, 0x02, 0x10, 0x02, 0x44, 0xac, 0x00 };
    desc = DecodeStreaming( Bytes( cut ), UACC_AudioStreaming, 0x00 );
    ASSERT( desc->GetKind() == UACK_Invalid );
    ASSERT( desc->mError.mKind == ERR_Truncated && desc->mError.mField == "tSamFreq" );

    const U8 typeII[] = { 0x0c, 0x24, 0x02, 0x02, 0x40, 0x00, 0x00, 0x04, 0x01, 0x44, 0xac, 0x00 };
    desc = DecodeStreaming( Bytes( typeII ), UACC_AudioStreaming, 0x00 );
    ASSERT( desc->GetKind() == UACK_FormatTypeII1 );
    const UACFormatTypeII1& ii = static_cast<const UACFormatTypeII1&>( *desc->mEntity );
    ASSERT( ii.mMaxBitRate == 0x40 && ii.mSamplesPerFrame == 0x400 );
    ASSERT( ii.mFrequencies.mSamFreqs.size() == 1 );

    const U8 typeI2[] = { 0x06, 0x24, 0x02, 0x01, 0x02, 0x10 };
    desc = DecodeStreaming( Bytes( typeI2 ), UACC_AudioStreaming, 0x20 );
    ASSERT( desc->GetKind() == UACK_FormatTypeI2 );
    ASSERT( static_cast<const UACFormatTypeI2&>( *desc->mEntity ).mSubslotSize == 2 );

    const U8 typeIV[] = { 0x04, 0x24, 0x02, 0x04 };
    desc = DecodeStreaming( Bytes( typeIV ), UACC_AudioStreaming, 0x20 );
    ASSERT( desc->GetKind() == UACK_FormatTypeIV2 );
    desc = DecodeStreaming( Bytes( typeIV ), UACC_AudioStreaming, 0x00 );
    ASSERT( desc->GetKind() == UACK_Undefined );

    // UAC3 carries formats in the cluster, not in format type descriptors
    desc = DecodeStreaming( Bytes( typeI2 ), UACC_AudioStreaming, 0x30 );
    ASSERT( desc->GetKind() == UACK_Invalid );
    ASSERT( desc->IsDecoded() );

    const U8 empty[] = { 0x03, 0x24, 0x02 };
    desc = DecodeStreaming( Bytes( empty ), UACC_AudioStreaming, 0x00 );
    ASSERT( desc->GetKind() == UACK_Undefined );
}

void test_uac_format_specific()
{
    const U8 mpeg[] = { 0x08, 0x24, 0x03, 0x01, 0x10, 0x07, 0x01, 0x20 };
    std::unique_ptr<UACDescriptor> desc = DecodeStreaming( Bytes( mpeg ), UACC_AudioStreaming, 0x00 );
    ASSERT( desc->GetKind() == UACK_FormatSpecificMPEG );
    const UACFormatSpecificMPEG& m = static_cast<const UACFormatSpecificMPEG&>( *desc->mEntity );
    std::vector<std::string> caps = m.GetCapabilities();
    ASSERT( caps.size() == 3 && caps[ 2 ] == "Layer III" );
    ASSERT( std::string( m.GetMultilingual() ) == "Supported at Fs" );
    ASSERT( std::string( m.GetDynamicRangeControl() ) == "scalable, common boost and cut scaling value" );

    const U8 ac3[] = { 0x0a, 0x24, 0x03, 0x02, 0x10, 0x09, 0x00, 0x00, 0x00, 0x03 };
    desc = DecodeStreaming( Bytes( ac3 ), UACC_AudioStreaming, 0x00 );
    ASSERT( desc->GetKind() == UACK_FormatSpecificAC3 );
    const UACFormatSpecificAC3& a = static_cast<const UACFormatSpecificAC3&>( *desc->mEntity );
    ASSERT( a.mBSID == 9 );
    ASSERT( a.GetFeatures().size() == 2 && a.GetFeatures()[ 1 ] == "Line mode" );
    ASSERT( std::string( a.GetDynamicRangeControl() ) == "not supported" );

    const U8 other[] = { 0x07, 0x24, 0x03, 0x03, 0x10, 0xaa, 0xbb };
    desc = DecodeStreaming( Bytes( other ), UACC_AudioStreaming, 0x00 );
    ASSERT( desc->GetKind() == UACK_FormatSpecific );
    const UACFormatSpecific& f = static_cast<const UACFormatSpecific&>( *desc->mEntity );
    ASSERT( f.mFormatTag == 0x1003 );
    ASSERT( f.mData.size() == 2 && f.mData[ 1 ] == 0xbb );
}

void test_uac_streaming_endpoint()
{
    const U8 ep1[] = { 0x07, 0x25, 0x01, 0x01, 0x02, 0x00, 0x00 };
    std::unique_ptr<UACDescriptor> desc = DecodeStreaming( Bytes( ep1 ), UACC_AudioStreamingEndpoint, 0x00 );
    ASSERT( desc->GetKind() == UACK_DataStreamingEndpoint1 );
    const UACDataStreamingEndpoint1& e1 = static_cast<const UACDataStreamingEndpoint1&>( *desc->mEntity );
    ASSERT( e1.GetAttributes().size() == 1 && e1.GetAttributes()[ 0 ] == "Sampling Frequency" );
    ASSERT( std::string( GetUACLockDelayUnitsName( e1.mLockDelayUnits ) ) == "Decoded PCM samples" );

    const U8 ep2[] = { 0x08, 0x25, 0x01, 0x80, 0x06, 0x01, 0x02, 0x00 };
    desc = DecodeStreaming( Bytes( ep2 ), UACC_AudioStreamingEndpoint, 0x20 );
    ASSERT( desc->GetKind() == UACK_DataStreamingEndpoint2 );
    const UACDataStreamingEndpoint2& e2 = static_cast<const UACDataStreamingEndpoint2&>( *desc->mEntity );
    ASSERT( e2.GetAttributes().size() == 1 && e2.GetAttributes()[ 0 ] == "MaxPacketsOnly" );
    std::vector<UACControlEntry> controls = e2.GetControls();
    ASSERT( controls.size() == 2 );
    ASSERT( controls[ 0 ].mLabel == "Pitch" && controls[ 0 ].mSetting == CS_IllegalValue );
    ASSERT( controls[ 1 ].mLabel == "Data Overrun" && controls[ 1 ].mSetting == CS_ReadOnly );
    ASSERT( e2.mLockDelay == 2 );

    const U8 ep3[] = { 0x0a, 0x25, 0x01, 0x0c, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 };
    desc = DecodeStreaming( Bytes( ep3 ), UACC_AudioStreamingEndpoint, 0x30 );
    ASSERT( desc->GetKind() == UACK_DataStreamingEndpoint3 );
    controls = static_cast<const UACDataStreamingEndpoint3&>( *desc->mEntity ).GetControls();
    ASSERT( controls.size() == 1 && controls[ 0 ].mSetting == CS_ReadWrite );

    const U8 other[] = { 0x05, 0x25, 0x02, 0x12, 0x34 };
    desc = DecodeStreaming( Bytes( other ), UACC_AudioStreamingEndpoint, 0x20 );
    ASSERT( desc->GetKind() == UACK_Undefined );
    ASSERT( static_cast<const UACRawEntity&>( *desc->mEntity ).mData.size() == 2 );
}

void test_uac_channel_names()
{
    std::vector<std::string> names = GetUACChannelNames( UAC_PROTOCOL_1, 0x0003 );
    ASSERT( names.size() == 2 );
    ASSERT( names[ 0 ] == "Left Front (L)" && names[ 1 ] == "Right Front (R)" );

    // bits past the UAC1 table are not channels
    ASSERT( GetUACChannelNames( UAC_PROTOCOL_1, 0xf000 ).empty() );

    names = GetUACChannelNames( UAC_PROTOCOL_2, 0x80000001 );
    ASSERT( names.size() == 2 );
    ASSERT( names[ 0 ] == "Front Left (FL)" && names[ 1 ] == "Raw Data (RD)" );

    names = GetUACChannelNames( UAC_PROTOCOL_3, 0x00000030 );
    ASSERT( names.size() == 2 && names[ 0 ] == "Back Left (BL)" );

    ASSERT( GetUACChannelNames( UAC_PROTOCOL_2, 0 ).empty() );
}
