#include "USBAudioDescriptors.h"
#include "USBLookupTables.h"

static const char* const DYNAMIC_RANGE_CONTROL[ 4 ] = {
    "not supported",
    "supported but not scalable",
    "scalable, common boost and cut scaling value",
    "scalable, separate boost and cut scaling value",
};

bool UACStreamingInterface1::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mTerminalLink, "bTerminalLink" ) || !reader.Read( mDelay, "bDelay" ) ||
        !reader.Read( mFormatTag, "wFormatTag" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACStreamingInterface1::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mTerminalLink );
    writer.Write( mDelay );
    writer.Write( mFormatTag );
    writer.WriteArray( mJunk );
}

bool UACStreamingInterface2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mTerminalLink, "bTerminalLink" ) || !reader.Read( mControls, "bmControls" ) ||
        !reader.Read( mFormatType, "bFormatType" ) || !reader.Read( mFormats, "bmFormats" ) ||
        !reader.Read( mNrChannels, "bNrChannels" ) || !reader.Read( mChannelConfig, "bmChannelConfig" ) ||
        !reader.ReadString( mChannelNames, "iChannelNames" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACStreamingInterface2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mTerminalLink );
    writer.Write( mControls );
    writer.Write( mFormatType );
    writer.Write( mFormats );
    writer.Write( mNrChannels );
    writer.Write( mChannelConfig );
    writer.Write( mChannelNames );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACStreamingInterface2::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_AS_INTERFACE_BMCONTROLS, CountOf( UAC2_AS_INTERFACE_BMCONTROLS ), CT_BmControl2 );
}

bool UACStreamingInterface3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mTerminalLink, "bTerminalLink" ) || !reader.Read( mControls, "bmControls" ) ||
        !reader.Read( mClusterDescrID, "wClusterDescrID" ) || !reader.Read( mFormats, "bmFormats" ) ||
        !reader.Read( mSubslotSize, "bSubslotSize" ) || !reader.Read( mBitResolution, "bBitResolution" ) ||
        !reader.Read( mAuxProtocols, "bmAuxProtocols" ) || !reader.Read( mControlSize, "bControlSize" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACStreamingInterface3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mTerminalLink );
    writer.Write( mControls );
    writer.Write( mClusterDescrID );
    writer.Write( mFormats );
    writer.Write( mSubslotSize );
    writer.Write( mBitResolution );
    writer.Write( mAuxProtocols );
    writer.Write( mControlSize );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACStreamingInterface3::GetControls() const
{
    return GetBitmapControls( mControls, UAC3_AS_INTERFACE_BMCONTROLS, CountOf( UAC3_AS_INTERFACE_BMCONTROLS ), CT_BmControl2 );
}

bool UACSampleFrequencies::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mSamFreqType, "bSamFreqType" ) )
        return false;

    if( IsContinuous() )
        return reader.Read24( mLowerSamFreq, "tLowerSamFreq" ) && reader.Read24( mUpperSamFreq, "tUpperSamFreq" );

    return reader.ReadArray24( mSamFreqs, mSamFreqType, "tSamFreq" );
}

void UACSampleFrequencies::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mSamFreqType );
    if( IsContinuous() )
    {
        writer.Write24( mLowerSamFreq );
        writer.Write24( mUpperSamFreq );
    }
    else
    {
        writer.WriteArray24( mSamFreqs );
    }
}

bool UACFormatTypeI1::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mFormatType, "bFormatType" ) || !reader.Read( mNrChannels, "bNrChannels" ) ||
        !reader.Read( mSubframeSize, "bSubframeSize" ) || !reader.Read( mBitResolution, "bBitResolution" ) ||
        !mFrequencies.Decode( reader ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACFormatTypeI1::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mFormatType );
    writer.Write( mNrChannels );
    writer.Write( mSubframeSize );
    writer.Write( mBitResolution );
    mFrequencies.Encode( writer );
    writer.WriteArray( mJunk );
}

bool UACFormatTypeII1::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mFormatType, "bFormatType" ) || !reader.Read( mMaxBitRate, "wMaxBitRate" ) ||
        !reader.Read( mSamplesPerFrame, "wSamplesPerFrame" ) || !mFrequencies.Decode( reader ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACFormatTypeII1::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mFormatType );
    writer.Write( mMaxBitRate );
    writer.Write( mSamplesPerFrame );
    mFrequencies.Encode( writer );
    writer.WriteArray( mJunk );
}

bool UACFormatTypeI2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mFormatType, "bFormatType" ) || !reader.Read( mSubslotSize, "bSubslotSize" ) ||
        !reader.Read( mBitResolution, "bBitResolution" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACFormatTypeI2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mFormatType );
    writer.Write( mSubslotSize );
    writer.Write( mBitResolution );
    writer.WriteArray( mJunk );
}

bool UACFormatTypeII2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mFormatType, "bFormatType" ) || !reader.Read( mMaxBitRate, "wMaxBitRate" ) ||
        !reader.Read( mSlotsPerFrame, "wSlotsPerFrame" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACFormatTypeII2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mFormatType );
    writer.Write( mMaxBitRate );
    writer.Write( mSlotsPerFrame );
    writer.WriteArray( mJunk );
}

bool UACFormatTypeIV2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mFormatType, "bFormatType" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACFormatTypeIV2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mFormatType );
    writer.WriteArray( mJunk );
}

bool UACFormatSpecific::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mFormatTag, "wFormatTag" ) )
        return false;

    reader.ReadRemaining( mData );
    return true;
}

void UACFormatSpecific::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mFormatTag );
    writer.WriteArray( mData );
    writer.WriteArray( mJunk );
}

bool UACFormatSpecificMPEG::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mFormatTag, "wFormatTag" ) || !reader.Read( mMPEGCapabilities, "bmMPEGCapabilities" ) ||
        !reader.Read( mMPEGFeatures, "bmMPEGFeatures" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACFormatSpecificMPEG::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mFormatTag );
    writer.Write( mMPEGCapabilities );
    writer.Write( mMPEGFeatures );
    writer.WriteArray( mJunk );
}

std::vector<std::string> UACFormatSpecificMPEG::GetCapabilities() const
{
    return GetBitmapStrings( mMPEGCapabilities & 0xff, UAC_MPEG_CAPABILITIES, CountOf( UAC_MPEG_CAPABILITIES ) );
}

const char* UACFormatSpecificMPEG::GetMultilingual() const
{
    switch( ( mMPEGCapabilities >> 8 ) & 3 )
    {
    case 0:
        return "Not supported";
    case 1:
        return "Supported at Fs";
    case 2:
        return "Reserved";
    }

    return "Supported at Fs and 1/2Fs";
}

const char* UACFormatSpecificMPEG::GetDynamicRangeControl() const
{
    return DYNAMIC_RANGE_CONTROL[ ( mMPEGFeatures >> 4 ) & 3 ];
}

bool UACFormatSpecificAC3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mFormatTag, "wFormatTag" ) || !reader.Read( mBSID, "bmBSID" ) ||
        !reader.Read( mAC3Features, "bmAC3Features" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACFormatSpecificAC3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mFormatTag );
    writer.Write( mBSID );
    writer.Write( mAC3Features );
    writer.WriteArray( mJunk );
}

std::vector<std::string> UACFormatSpecificAC3::GetFeatures() const
{
    return GetBitmapStrings( mAC3Features, UAC_AC3_FEATURES, CountOf( UAC_AC3_FEATURES ) );
}

const char* UACFormatSpecificAC3::GetDynamicRangeControl() const
{
    return DYNAMIC_RANGE_CONTROL[ ( mAC3Features >> 4 ) & 3 ];
}

bool UACDataStreamingEndpoint1::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mAttributes, "bmAttributes" ) || !reader.Read( mLockDelayUnits, "bLockDelayUnits" ) ||
        !reader.Read( mLockDelay, "wLockDelay" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACDataStreamingEndpoint1::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mAttributes );
    writer.Write( mLockDelayUnits );
    writer.Write( mLockDelay );
    writer.WriteArray( mJunk );
}

std::vector<std::string> UACDataStreamingEndpoint1::GetAttributes() const
{
    return GetBitmapStrings( mAttributes, UAC1_ENDPOINT_ATTRIBUTES, CountOf( UAC1_ENDPOINT_ATTRIBUTES ) );
}

bool UACDataStreamingEndpoint2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mAttributes, "bmAttributes" ) || !reader.Read( mControls, "bmControls" ) ||
        !reader.Read( mLockDelayUnits, "bLockDelayUnits" ) || !reader.Read( mLockDelay, "wLockDelay" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACDataStreamingEndpoint2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mAttributes );
    writer.Write( mControls );
    writer.Write( mLockDelayUnits );
    writer.Write( mLockDelay );
    writer.WriteArray( mJunk );
}

std::vector<std::string> UACDataStreamingEndpoint2::GetAttributes() const
{
    return GetBitmapStrings( mAttributes, UAC2_ENDPOINT_ATTRIBUTES, CountOf( UAC2_ENDPOINT_ATTRIBUTES ) );
}

std::vector<UACControlEntry> UACDataStreamingEndpoint2::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_AS_ISO_ENDPOINT_BMCONTROLS, CountOf( UAC2_AS_ISO_ENDPOINT_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACDataStreamingEndpoint3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mControls, "bmControls" ) || !reader.Read( mLockDelayUnits, "bLockDelayUnits" ) ||
        !reader.Read( mLockDelay, "wLockDelay" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACDataStreamingEndpoint3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mControls );
    writer.Write( mLockDelayUnits );
    writer.Write( mLockDelay );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACDataStreamingEndpoint3::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_AS_ISO_ENDPOINT_BMCONTROLS, CountOf( UAC2_AS_ISO_ENDPOINT_BMCONTROLS ),
                              CT_BmControl2 );
}
