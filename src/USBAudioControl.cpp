#include "USBAudioDescriptors.h"
#include "USBLookupTables.h"

// bNrInPins followed by that many source IDs
static bool ReadSourceIDs( USBDescriptorReader& reader, U8& count, std::vector<U8>& ids, const char* countField,
                           const char* field )
{
    return reader.Read( count, countField ) && reader.ReadArray( ids, count, field );
}

// the remaining bytes minus the fixed fields that follow a variable-size field
static bool GetTrailingSize( USBDescriptorReader& reader, size_t fixedAfter, size_t& size, const char* field )
{
    if( reader.GetRemaining() < fixedAfter )
        return reader.Fail( ERR_Truncated,
                            std::string( field ) + " needs " + int2str( fixedAfter ) + " trailing bytes, " +
                                int2str( reader.GetRemaining() ) + " left",
                            field );

    size = reader.GetRemaining() - fixedAfter;
    return true;
}

static bool ReadControlArray( USBDescriptorReader& reader, std::vector<U32>& controls, size_t fixedAfter, const char* field )
{
    size_t size;
    if( !GetTrailingSize( reader, fixedAfter, size, field ) )
        return false;

    return reader.ReadArray( controls, size / 4, field );
}

bool UACRawEntity::Decode( USBDescriptorReader& reader )
{
    reader.ReadRemaining( mData );
    return true;
}

void UACRawEntity::Encode( USBDescriptorWriter& writer ) const
{
    writer.WriteArray( mData );
    writer.WriteArray( mJunk );
}

////////////////////////////////////////////////////////////////////////////////
// UAC1

bool UACHeader1::Decode( USBDescriptorReader& reader )
{
    if( !reader.ReadBCD( mBcdADC, "bcdADC" ) || !reader.Read( mTotalLength, "wTotalLength" ) ||
        !ReadSourceIDs( reader, mInCollection, mInterfaceNr, "bInCollection", "baInterfaceNr" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACHeader1::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mBcdADC );
    writer.Write( mTotalLength );
    writer.Write( mInCollection );
    writer.WriteArray( mInterfaceNr );
    writer.WriteArray( mJunk );
}

bool UACInputTerminal1::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mTerminalID, "bTerminalID" ) || !reader.Read( mTerminalType, "wTerminalType" ) ||
        !reader.Read( mAssocTerminal, "bAssocTerminal" ) || !reader.Read( mNrChannels, "bNrChannels" ) ||
        !reader.Read( mChannelConfig, "wChannelConfig" ) || !reader.ReadString( mChannelNames, "iChannelNames" ) ||
        !reader.ReadString( mTerminal, "iTerminal" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACInputTerminal1::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mTerminalID );
    writer.Write( mTerminalType );
    writer.Write( mAssocTerminal );
    writer.Write( mNrChannels );
    writer.Write( mChannelConfig );
    writer.Write( mChannelNames );
    writer.Write( mTerminal );
    writer.WriteArray( mJunk );
}

bool UACOutputTerminal1::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mTerminalID, "bTerminalID" ) || !reader.Read( mTerminalType, "wTerminalType" ) ||
        !reader.Read( mAssocTerminal, "bAssocTerminal" ) || !reader.Read( mSourceID, "bSourceID" ) ||
        !reader.ReadString( mTerminal, "iTerminal" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACOutputTerminal1::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mTerminalID );
    writer.Write( mTerminalType );
    writer.Write( mAssocTerminal );
    writer.Write( mSourceID );
    writer.Write( mTerminal );
    writer.WriteArray( mJunk );
}

bool UACMixerUnit1::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !ReadSourceIDs( reader, mNrInPins, mSourceIDs, "bNrInPins", "baSourceID" ) )
        return false;

    // bmControls fills what is left between iChannelNames and iMixer
    size_t size;
    if( !GetTrailingSize( reader, 5, size, "bmControls" ) )
        return false;

    if( !reader.Read( mNrChannels, "bNrChannels" ) || !reader.Read( mChannelConfig, "wChannelConfig" ) ||
        !reader.ReadString( mChannelNames, "iChannelNames" ) || !reader.ReadArray( mControls, size, "bmControls" ) ||
        !reader.ReadString( mMixer, "iMixer" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACMixerUnit1::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mNrInPins );
    writer.WriteArray( mSourceIDs );
    writer.Write( mNrChannels );
    writer.Write( mChannelConfig );
    writer.Write( mChannelNames );
    writer.WriteArray( mControls );
    writer.Write( mMixer );
    writer.WriteArray( mJunk );
}

bool UACSelectorUnit1::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !ReadSourceIDs( reader, mNrInPins, mSourceIDs, "bNrInPins", "baSourceID" ) ||
        !reader.ReadString( mSelector, "iSelector" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACSelectorUnit1::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mNrInPins );
    writer.WriteArray( mSourceIDs );
    writer.Write( mSelector );
    writer.WriteArray( mJunk );
}

bool UACFeatureUnit1::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !reader.Read( mSourceID, "bSourceID" ) ||
        !reader.Read( mControlSize, "bControlSize" ) )
        return false;

    if( mControlSize == 0 )
        return reader.Fail( ERR_InvalidArg, "bControlSize can not be 0", "bControlSize" );

    size_t size;
    if( !GetTrailingSize( reader, 1, size, "bmaControls" ) )
        return false;

    mControls.clear();
    for( size_t cnt = 0; cnt < size / mControlSize; ++cnt )
    {
        U32 controls;
        if( !reader.ReadSized( controls, mControlSize, "bmaControls" ) )
            return false;

        mControls.push_back( controls );
    }

    // a partial control entry is kept aside to reach iFeature
    if( !reader.ReadArray( mPartial, size % mControlSize, "bmaControls" ) || !reader.ReadString( mFeature, "iFeature" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACFeatureUnit1::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mSourceID );
    writer.Write( mControlSize );
    for( std::vector<U32>::const_iterator i( mControls.begin() ); i != mControls.end(); ++i )
        writer.WriteSized( *i, mControlSize );

    writer.WriteArray( mPartial );
    writer.Write( mFeature );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACFeatureUnit1::GetControls( size_t channel ) const
{
    if( channel >= mControls.size() )
        return std::vector<UACControlEntry>();

    return GetBitmapControls( mControls[ channel ], UAC1_FEATURE_UNIT_BMCONTROLS, CountOf( UAC1_FEATURE_UNIT_BMCONTROLS ),
                              CT_BmControl1 );
}

UACProcessLayout GetUACProcessLayout( UACProtocol protocol, U16 processType )
{
    if( protocol == UAC_PROTOCOL_1 )
    {
        switch( processType )
        {
        case UAC1_PROCESS_UP_DOWNMIX:
        case UAC1_PROCESS_DOLBY_PROLOGIC:
            return UACPL_Modes;
        case UAC1_PROCESS_3D_STEREO_EXTENDER:
        case UAC1_PROCESS_REVERBERATION:
        case UAC1_PROCESS_CHORUS:
        case UAC1_PROCESS_DYN_RANGE_COMP:
            return UACPL_None;
        }
    }
    else if( protocol == UAC_PROTOCOL_2 )
    {
        switch( processType )
        {
        case UAC2_PROCESS_UP_DOWNMIX:
        case UAC2_PROCESS_DOLBY_PROLOGIC:
            return UACPL_Modes;
        case UAC2_PROCESS_STEREO_EXTENDER:
            return UACPL_None;
        }
    }

    return UACPL_Undefined;
}

bool UACProcessingUnit1::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !reader.Read( mProcessType, "wProcessType" ) ||
        !ReadSourceIDs( reader, mNrInPins, mSourceIDs, "bNrInPins", "baSourceID" ) ||
        !reader.Read( mNrChannels, "bNrChannels" ) || !reader.Read( mChannelConfig, "wChannelConfig" ) ||
        !reader.ReadString( mChannelNames, "iChannelNames" ) || !reader.Read( mControlSize, "bControlSize" ) ||
        !reader.ReadArray( mControls, mControlSize, "bmControls" ) || !reader.ReadString( mProcessing, "iProcessing" ) )
        return false;

    mLayout = GetUACProcessLayout( UAC_PROTOCOL_1, mProcessType );
    switch( mLayout )
    {
    case UACPL_Modes:
        if( !reader.Read( mNrModes, "bNrModes" ) || !reader.ReadArray( mModes, mNrModes, "waModes" ) )
            return false;
        break;
    case UACPL_Undefined:
        reader.ReadRemaining( mSpecific );
        break;
    case UACPL_None:
        break;
    }

    reader.ReadRemaining( mJunk );
    return true;
}

void UACProcessingUnit1::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mProcessType );
    writer.Write( mNrInPins );
    writer.WriteArray( mSourceIDs );
    writer.Write( mNrChannels );
    writer.Write( mChannelConfig );
    writer.Write( mChannelNames );
    writer.Write( mControlSize );
    writer.WriteArray( mControls );
    writer.Write( mProcessing );

    if( mLayout == UACPL_Modes )
    {
        writer.Write( mNrModes );
        writer.WriteArray( mModes );
    }
    else if( mLayout == UACPL_Undefined )
    {
        writer.WriteArray( mSpecific );
    }

    writer.WriteArray( mJunk );
}

bool UACExtensionUnit1::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !reader.Read( mExtensionCode, "wExtensionCode" ) ||
        !ReadSourceIDs( reader, mNrInPins, mSourceIDs, "bNrInPins", "baSourceID" ) ||
        !reader.Read( mNrChannels, "bNrChannels" ) || !reader.Read( mChannelConfig, "wChannelConfig" ) ||
        !reader.ReadString( mChannelNames, "iChannelNames" ) || !reader.Read( mControlSize, "bControlSize" ) ||
        !reader.ReadArray( mControls, mControlSize, "bmControls" ) || !reader.ReadString( mExtension, "iExtension" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACExtensionUnit1::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mExtensionCode );
    writer.Write( mNrInPins );
    writer.WriteArray( mSourceIDs );
    writer.Write( mNrChannels );
    writer.Write( mChannelConfig );
    writer.Write( mChannelNames );
    writer.Write( mControlSize );
    writer.WriteArray( mControls );
    writer.Write( mExtension );
    writer.WriteArray( mJunk );
}

////////////////////////////////////////////////////////////////////////////////
// UAC2

bool UACHeader2::Decode( USBDescriptorReader& reader )
{
    if( !reader.ReadBCD( mBcdADC, "bcdADC" ) || !reader.Read( mCategory, "bCategory" ) ||
        !reader.Read( mTotalLength, "wTotalLength" ) || !reader.Read( mControls, "bmControls" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACHeader2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mBcdADC );
    writer.Write( mCategory );
    writer.Write( mTotalLength );
    writer.Write( mControls );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACHeader2::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_INTERFACE_HEADER_BMCONTROLS, CountOf( UAC2_INTERFACE_HEADER_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACInputTerminal2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mTerminalID, "bTerminalID" ) || !reader.Read( mTerminalType, "wTerminalType" ) ||
        !reader.Read( mAssocTerminal, "bAssocTerminal" ) || !reader.Read( mCSourceID, "bCSourceID" ) ||
        !reader.Read( mNrChannels, "bNrChannels" ) || !reader.Read( mChannelConfig, "bmChannelConfig" ) ||
        !reader.ReadString( mChannelNames, "iChannelNames" ) || !reader.Read( mControls, "bmControls" ) ||
        !reader.ReadString( mTerminal, "iTerminal" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACInputTerminal2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mTerminalID );
    writer.Write( mTerminalType );
    writer.Write( mAssocTerminal );
    writer.Write( mCSourceID );
    writer.Write( mNrChannels );
    writer.Write( mChannelConfig );
    writer.Write( mChannelNames );
    writer.Write( mControls );
    writer.Write( mTerminal );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACInputTerminal2::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_INPUT_TERMINAL_BMCONTROLS, CountOf( UAC2_INPUT_TERMINAL_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACOutputTerminal2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mTerminalID, "bTerminalID" ) || !reader.Read( mTerminalType, "wTerminalType" ) ||
        !reader.Read( mAssocTerminal, "bAssocTerminal" ) || !reader.Read( mSourceID, "bSourceID" ) ||
        !reader.Read( mCSourceID, "bCSourceID" ) || !reader.Read( mControls, "bmControls" ) ||
        !reader.ReadString( mTerminal, "iTerminal" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACOutputTerminal2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mTerminalID );
    writer.Write( mTerminalType );
    writer.Write( mAssocTerminal );
    writer.Write( mSourceID );
    writer.Write( mCSourceID );
    writer.Write( mControls );
    writer.Write( mTerminal );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACOutputTerminal2::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_OUTPUT_TERMINAL_BMCONTROLS, CountOf( UAC2_OUTPUT_TERMINAL_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACMixerUnit2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !ReadSourceIDs( reader, mNrInPins, mSourceIDs, "bNrInPins", "baSourceID" ) )
        return false;

    size_t size;
    if( !GetTrailingSize( reader, 8, size, "bmMixerControls" ) )
        return false;

    if( !reader.Read( mNrChannels, "bNrChannels" ) || !reader.Read( mChannelConfig, "bmChannelConfig" ) ||
        !reader.ReadString( mChannelNames, "iChannelNames" ) || !reader.ReadArray( mMixerControls, size, "bmMixerControls" ) ||
        !reader.Read( mControls, "bmControls" ) || !reader.ReadString( mMixer, "iMixer" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACMixerUnit2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mNrInPins );
    writer.WriteArray( mSourceIDs );
    writer.Write( mNrChannels );
    writer.Write( mChannelConfig );
    writer.Write( mChannelNames );
    writer.WriteArray( mMixerControls );
    writer.Write( mControls );
    writer.Write( mMixer );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACMixerUnit2::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_MIXER_UNIT_BMCONTROLS, CountOf( UAC2_MIXER_UNIT_BMCONTROLS ), CT_BmControl2 );
}

bool UACSelectorUnit2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !ReadSourceIDs( reader, mNrInPins, mSourceIDs, "bNrInPins", "baSourceID" ) ||
        !reader.Read( mControls, "bmControls" ) || !reader.ReadString( mSelector, "iSelector" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACSelectorUnit2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mNrInPins );
    writer.WriteArray( mSourceIDs );
    writer.Write( mControls );
    writer.Write( mSelector );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACSelectorUnit2::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_SELECTOR_UNIT_BMCONTROLS, CountOf( UAC2_SELECTOR_UNIT_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACFeatureUnit2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !reader.Read( mSourceID, "bSourceID" ) ||
        !ReadControlArray( reader, mControls, 1, "bmaControls" ) )
        return false;

    size_t partial = ( reader.GetRemaining() - 1 ) % 4;
    if( !reader.ReadArray( mPartial, partial, "bmaControls" ) || !reader.ReadString( mFeature, "iFeature" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACFeatureUnit2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mSourceID );
    writer.WriteArray( mControls );
    writer.WriteArray( mPartial );
    writer.Write( mFeature );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACFeatureUnit2::GetControls( size_t channel ) const
{
    if( channel >= mControls.size() )
        return std::vector<UACControlEntry>();

    return GetBitmapControls( mControls[ channel ], UAC2_FEATURE_UNIT_BMCONTROLS, CountOf( UAC2_FEATURE_UNIT_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACEffectUnit2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !reader.Read( mEffectType, "wEffectType" ) ||
        !reader.Read( mSourceID, "bSourceID" ) || !ReadControlArray( reader, mControls, 1, "bmaControls" ) )
        return false;

    size_t partial = ( reader.GetRemaining() - 1 ) % 4;
    if( !reader.ReadArray( mPartial, partial, "bmaControls" ) || !reader.ReadString( mEffects, "iEffects" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACEffectUnit2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mEffectType );
    writer.Write( mSourceID );
    writer.WriteArray( mControls );
    writer.WriteArray( mPartial );
    writer.Write( mEffects );
    writer.WriteArray( mJunk );
}

bool UACProcessingUnit2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !reader.Read( mProcessType, "wProcessType" ) ||
        !ReadSourceIDs( reader, mNrInPins, mSourceIDs, "bNrInPins", "baSourceID" ) ||
        !reader.Read( mNrChannels, "bNrChannels" ) || !reader.Read( mChannelConfig, "bmChannelConfig" ) ||
        !reader.ReadString( mChannelNames, "iChannelNames" ) || !reader.Read( mControls, "bmControls" ) ||
        !reader.ReadString( mProcessing, "iProcessing" ) )
        return false;

    mLayout = GetUACProcessLayout( UAC_PROTOCOL_2, mProcessType );
    switch( mLayout )
    {
    case UACPL_Modes:
        if( !reader.Read( mNrModes, "bNrModes" ) || !reader.ReadArray( mModes, mNrModes, "daModes" ) )
            return false;
        break;
    case UACPL_Undefined:
        reader.ReadRemaining( mSpecific );
        break;
    case UACPL_None:
        break;
    }

    reader.ReadRemaining( mJunk );
    return true;
}

void UACProcessingUnit2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mProcessType );
    writer.Write( mNrInPins );
    writer.WriteArray( mSourceIDs );
    writer.Write( mNrChannels );
    writer.Write( mChannelConfig );
    writer.Write( mChannelNames );
    writer.Write( mControls );
    writer.Write( mProcessing );

    if( mLayout == UACPL_Modes )
    {
        writer.Write( mNrModes );
        writer.WriteArray( mModes );
    }
    else if( mLayout == UACPL_Undefined )
    {
        writer.WriteArray( mSpecific );
    }

    writer.WriteArray( mJunk );
}

bool UACExtensionUnit2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !reader.Read( mExtensionCode, "wExtensionCode" ) ||
        !ReadSourceIDs( reader, mNrInPins, mSourceIDs, "bNrInPins", "baSourceID" ) ||
        !reader.Read( mNrChannels, "bNrChannels" ) || !reader.Read( mChannelConfig, "bmChannelConfig" ) ||
        !reader.ReadString( mChannelNames, "iChannelNames" ) || !reader.Read( mControls, "bmControls" ) ||
        !reader.ReadString( mExtension, "iExtension" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACExtensionUnit2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mExtensionCode );
    writer.Write( mNrInPins );
    writer.WriteArray( mSourceIDs );
    writer.Write( mNrChannels );
    writer.Write( mChannelConfig );
    writer.Write( mChannelNames );
    writer.Write( mControls );
    writer.Write( mExtension );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACExtensionUnit2::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_EXTENSION_UNIT_BMCONTROLS, CountOf( UAC2_EXTENSION_UNIT_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACClockSource2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mClockID, "bClockID" ) || !reader.Read( mAttributes, "bmAttributes" ) ||
        !reader.Read( mControls, "bmControls" ) || !reader.Read( mAssocTerminal, "bAssocTerminal" ) ||
        !reader.ReadString( mClockSource, "iClockSource" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACClockSource2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mClockID );
    writer.Write( mAttributes );
    writer.Write( mControls );
    writer.Write( mAssocTerminal );
    writer.Write( mClockSource );
    writer.WriteArray( mJunk );
}

std::vector<std::string> UACClockSource2::GetAttributes() const
{
    return GetBitmapStrings( mAttributes, UAC2_CLOCK_SOURCE_ATTRIBUTES, CountOf( UAC2_CLOCK_SOURCE_ATTRIBUTES ) );
}

std::vector<UACControlEntry> UACClockSource2::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_CLOCK_SOURCE_BMCONTROLS, CountOf( UAC2_CLOCK_SOURCE_BMCONTROLS ), CT_BmControl2 );
}

bool UACClockSelector2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mClockID, "bClockID" ) ||
        !ReadSourceIDs( reader, mNrInPins, mCSourceIDs, "bNrInPins", "baCSourceID" ) ||
        !reader.Read( mControls, "bmControls" ) || !reader.ReadString( mClockSelector, "iClockSelector" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACClockSelector2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mClockID );
    writer.Write( mNrInPins );
    writer.WriteArray( mCSourceIDs );
    writer.Write( mControls );
    writer.Write( mClockSelector );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACClockSelector2::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_CLOCK_SELECTOR_BMCONTROLS, CountOf( UAC2_CLOCK_SELECTOR_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACClockMultiplier2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mClockID, "bClockID" ) || !reader.Read( mCSourceID, "bCSourceID" ) ||
        !reader.Read( mControls, "bmControls" ) || !reader.ReadString( mClockMultiplier, "iClockMultiplier" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACClockMultiplier2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mClockID );
    writer.Write( mCSourceID );
    writer.Write( mControls );
    writer.Write( mClockMultiplier );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACClockMultiplier2::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_CLOCK_MULTIPLIER_BMCONTROLS, CountOf( UAC2_CLOCK_MULTIPLIER_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACSampleRateConverter2::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !reader.Read( mSourceID, "bSourceID" ) ||
        !reader.Read( mCSourceInID, "bCSourceInID" ) || !reader.Read( mCSourceOutID, "bCSourceOutID" ) ||
        !reader.ReadString( mSRC, "iSRC" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACSampleRateConverter2::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mSourceID );
    writer.Write( mCSourceInID );
    writer.Write( mCSourceOutID );
    writer.Write( mSRC );
    writer.WriteArray( mJunk );
}

////////////////////////////////////////////////////////////////////////////////
// UAC3

bool UACHeader3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mCategory, "bCategory" ) || !reader.Read( mTotalLength, "wTotalLength" ) ||
        !reader.Read( mControls, "bmControls" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACHeader3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mCategory );
    writer.Write( mTotalLength );
    writer.Write( mControls );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACHeader3::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_INTERFACE_HEADER_BMCONTROLS, CountOf( UAC2_INTERFACE_HEADER_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACInputTerminal3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mTerminalID, "bTerminalID" ) || !reader.Read( mTerminalType, "wTerminalType" ) ||
        !reader.Read( mAssocTerminal, "bAssocTerminal" ) || !reader.Read( mCSourceID, "bCSourceID" ) ||
        !reader.Read( mControls, "bmControls" ) || !reader.Read( mClusterDescrID, "wClusterDescrID" ) ||
        !reader.Read( mExTerminalDescrID, "wExTerminalDescrID" ) ||
        !reader.Read( mConnectorsDescrID, "wConnectorsDescrID" ) || !reader.Read( mTerminalDescrStr, "wTerminalDescrStr" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACInputTerminal3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mTerminalID );
    writer.Write( mTerminalType );
    writer.Write( mAssocTerminal );
    writer.Write( mCSourceID );
    writer.Write( mControls );
    writer.Write( mClusterDescrID );
    writer.Write( mExTerminalDescrID );
    writer.Write( mConnectorsDescrID );
    writer.Write( mTerminalDescrStr );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACInputTerminal3::GetControls() const
{
    return GetBitmapControls( mControls, UAC3_INPUT_TERMINAL_BMCONTROLS, CountOf( UAC3_INPUT_TERMINAL_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACOutputTerminal3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mTerminalID, "bTerminalID" ) || !reader.Read( mTerminalType, "wTerminalType" ) ||
        !reader.Read( mAssocTerminal, "bAssocTerminal" ) || !reader.Read( mSourceID, "bSourceID" ) ||
        !reader.Read( mCSourceID, "bCSourceID" ) || !reader.Read( mControls, "bmControls" ) ||
        !reader.Read( mExTerminalDescrID, "wExTerminalDescrID" ) ||
        !reader.Read( mConnectorsDescrID, "wConnectorsDescrID" ) || !reader.Read( mTerminalDescrStr, "wTerminalDescrStr" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACOutputTerminal3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mTerminalID );
    writer.Write( mTerminalType );
    writer.Write( mAssocTerminal );
    writer.Write( mSourceID );
    writer.Write( mCSourceID );
    writer.Write( mControls );
    writer.Write( mExTerminalDescrID );
    writer.Write( mConnectorsDescrID );
    writer.Write( mTerminalDescrStr );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACOutputTerminal3::GetControls() const
{
    return GetBitmapControls( mControls, UAC3_OUTPUT_TERMINAL_BMCONTROLS, CountOf( UAC3_OUTPUT_TERMINAL_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACExtendedTerminalHeader::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mDescriptorID, "wDescriptorID" ) || !reader.Read( mNrChannels, "bNrChannels" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACExtendedTerminalHeader::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mDescriptorID );
    writer.Write( mNrChannels );
    writer.WriteArray( mJunk );
}

bool UACMixerUnit3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !ReadSourceIDs( reader, mNrInPins, mSourceIDs, "bNrInPins", "baSourceID" ) )
        return false;

    size_t size;
    if( !GetTrailingSize( reader, 8, size, "bmMixerControls" ) )
        return false;

    if( !reader.Read( mClusterDescrID, "wClusterDescrID" ) || !reader.ReadArray( mMixerControls, size, "bmMixerControls" ) ||
        !reader.Read( mControls, "bmControls" ) || !reader.Read( mMixerDescrStr, "wMixerDescrStr" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACMixerUnit3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mNrInPins );
    writer.WriteArray( mSourceIDs );
    writer.Write( mClusterDescrID );
    writer.WriteArray( mMixerControls );
    writer.Write( mControls );
    writer.Write( mMixerDescrStr );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACMixerUnit3::GetControls() const
{
    return GetBitmapControls( mControls, UAC3_MIXER_UNIT_BMCONTROLS, CountOf( UAC3_MIXER_UNIT_BMCONTROLS ), CT_BmControl2 );
}

bool UACSelectorUnit3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !ReadSourceIDs( reader, mNrInPins, mSourceIDs, "bNrInPins", "baSourceID" ) ||
        !reader.Read( mControls, "bmControls" ) || !reader.Read( mSelectorDescrStr, "wSelectorDescrStr" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACSelectorUnit3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mNrInPins );
    writer.WriteArray( mSourceIDs );
    writer.Write( mControls );
    writer.Write( mSelectorDescrStr );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACSelectorUnit3::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_SELECTOR_UNIT_BMCONTROLS, CountOf( UAC2_SELECTOR_UNIT_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACFeatureUnit3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !reader.Read( mSourceID, "bSourceID" ) ||
        !ReadControlArray( reader, mControls, 2, "bmaControls" ) )
        return false;

    size_t partial = ( reader.GetRemaining() - 2 ) % 4;
    if( !reader.ReadArray( mPartial, partial, "bmaControls" ) || !reader.Read( mFeatureDescrStr, "wFeatureDescrStr" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACFeatureUnit3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mSourceID );
    writer.WriteArray( mControls );
    writer.WriteArray( mPartial );
    writer.Write( mFeatureDescrStr );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACFeatureUnit3::GetControls( size_t channel ) const
{
    if( channel >= mControls.size() )
        return std::vector<UACControlEntry>();

    return GetBitmapControls( mControls[ channel ], UAC2_FEATURE_UNIT_BMCONTROLS, CountOf( UAC2_FEATURE_UNIT_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACEffectUnit3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !reader.Read( mEffectType, "wEffectType" ) ||
        !reader.Read( mSourceID, "bSourceID" ) || !ReadControlArray( reader, mControls, 2, "bmaControls" ) )
        return false;

    size_t partial = ( reader.GetRemaining() - 2 ) % 4;
    if( !reader.ReadArray( mPartial, partial, "bmaControls" ) || !reader.Read( mEffectsDescrStr, "wEffectsDescrStr" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACEffectUnit3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mEffectType );
    writer.Write( mSourceID );
    writer.WriteArray( mControls );
    writer.WriteArray( mPartial );
    writer.Write( mEffectsDescrStr );
    writer.WriteArray( mJunk );
}

bool UACProcessingUnit3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !reader.Read( mProcessType, "wProcessType" ) ||
        !ReadSourceIDs( reader, mNrInPins, mSourceIDs, "bNrInPins", "baSourceID" ) ||
        !reader.Read( mProcessingDescrStr, "wProcessingDescrStr" ) )
        return false;

    bool ok = true;
    switch( mProcessType )
    {
    case UAC3_PROCESS_UP_DOWNMIX:
        ok = reader.Read( mControls, "bmControls" ) && reader.Read( mNrModes, "bNrModes" ) &&
             reader.ReadArray( mClusterDescrIDs, mNrModes, "waClusterDescrID" );
        mHasSpecific = true;
        break;
    case UAC3_PROCESS_STEREO_EXTENDER:
        ok = reader.Read( mControls, "bmControls" );
        mHasSpecific = true;
        break;
    case UAC3_PROCESS_MULTI_FUNCTION:
        ok = reader.Read( mControls, "bmControls" ) && reader.Read( mClusterDescrID, "wClusterDescrID" ) &&
             reader.Read( mAlgorithms, "bmAlgorithms" );
        mHasSpecific = true;
        break;
    default:
        mHasSpecific = false;
        break;
    }

    if( !ok )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACProcessingUnit3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mProcessType );
    writer.Write( mNrInPins );
    writer.WriteArray( mSourceIDs );
    writer.Write( mProcessingDescrStr );

    if( mHasSpecific )
    {
        writer.Write( mControls );
        if( mProcessType == UAC3_PROCESS_UP_DOWNMIX )
        {
            writer.Write( mNrModes );
            writer.WriteArray( mClusterDescrIDs );
        }
        else if( mProcessType == UAC3_PROCESS_MULTI_FUNCTION )
        {
            writer.Write( mClusterDescrID );
            writer.Write( mAlgorithms );
        }
    }

    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACProcessingUnit3::GetControls() const
{
    switch( mProcessType )
    {
    case UAC3_PROCESS_UP_DOWNMIX:
        return GetBitmapControls( mControls, UAC3_PROCESSING_UNIT_UP_DOWN_BMCONTROLS,
                                  CountOf( UAC3_PROCESSING_UNIT_UP_DOWN_BMCONTROLS ), CT_BmControl2 );
    case UAC3_PROCESS_STEREO_EXTENDER:
        return GetBitmapControls( mControls, UAC3_PROCESSING_UNIT_STEREO_EXTENDER_BMCONTROLS,
                                  CountOf( UAC3_PROCESSING_UNIT_STEREO_EXTENDER_BMCONTROLS ), CT_BmControl2 );
    case UAC3_PROCESS_MULTI_FUNCTION:
        return GetBitmapControls( mControls, UAC3_PROCESSING_UNIT_MULTI_FUNC_BMCONTROLS,
                                  CountOf( UAC3_PROCESSING_UNIT_MULTI_FUNC_BMCONTROLS ), CT_BmControl2 );
    }

    return std::vector<UACControlEntry>();
}

std::vector<std::string> UACProcessingUnit3::GetAlgorithms() const
{
    return GetBitmapStrings( mAlgorithms, UAC3_MULTI_FUNCTION_ALGORITHMS, CountOf( UAC3_MULTI_FUNCTION_ALGORITHMS ) );
}

bool UACExtensionUnit3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !reader.Read( mExtensionCode, "wExtensionCode" ) ||
        !ReadSourceIDs( reader, mNrInPins, mSourceIDs, "bNrInPins", "baSourceID" ) ||
        !reader.Read( mExtensionDescrStr, "wExtensionDescrStr" ) || !reader.Read( mControls, "bmControls" ) ||
        !reader.Read( mClusterDescrID, "wClusterDescrID" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACExtensionUnit3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mExtensionCode );
    writer.Write( mNrInPins );
    writer.WriteArray( mSourceIDs );
    writer.Write( mExtensionDescrStr );
    writer.Write( mControls );
    writer.Write( mClusterDescrID );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACExtensionUnit3::GetControls() const
{
    return GetBitmapControls( mControls, UAC3_EXTENSION_UNIT_BMCONTROLS, CountOf( UAC3_EXTENSION_UNIT_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACClockSource3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mClockID, "bClockID" ) || !reader.Read( mAttributes, "bmAttributes" ) ||
        !reader.Read( mControls, "bmControls" ) || !reader.Read( mReferenceTerminal, "bReferenceTerminal" ) ||
        !reader.Read( mClockSourceStr, "wClockSourceStr" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACClockSource3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mClockID );
    writer.Write( mAttributes );
    writer.Write( mControls );
    writer.Write( mReferenceTerminal );
    writer.Write( mClockSourceStr );
    writer.WriteArray( mJunk );
}

std::vector<std::string> UACClockSource3::GetAttributes() const
{
    return GetBitmapStrings( mAttributes, UAC3_CLOCK_SOURCE_ATTRIBUTES, CountOf( UAC3_CLOCK_SOURCE_ATTRIBUTES ) );
}

std::vector<UACControlEntry> UACClockSource3::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_CLOCK_SOURCE_BMCONTROLS, CountOf( UAC2_CLOCK_SOURCE_BMCONTROLS ), CT_BmControl2 );
}

bool UACClockSelector3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mClockID, "bClockID" ) ||
        !ReadSourceIDs( reader, mNrInPins, mCSourceIDs, "bNrInPins", "baCSourceID" ) ||
        !reader.Read( mControls, "bmControls" ) || !reader.Read( mCSelectorDescrStr, "wCSelectorDescrStr" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACClockSelector3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mClockID );
    writer.Write( mNrInPins );
    writer.WriteArray( mCSourceIDs );
    writer.Write( mControls );
    writer.Write( mCSelectorDescrStr );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACClockSelector3::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_CLOCK_SELECTOR_BMCONTROLS, CountOf( UAC2_CLOCK_SELECTOR_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACClockMultiplier3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mClockID, "bClockID" ) || !reader.Read( mCSourceID, "bCSourceID" ) ||
        !reader.Read( mControls, "bmControls" ) || !reader.Read( mCMultiplierDescrStr, "wCMultiplierDescrStr" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACClockMultiplier3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mClockID );
    writer.Write( mCSourceID );
    writer.Write( mControls );
    writer.Write( mCMultiplierDescrStr );
    writer.WriteArray( mJunk );
}

std::vector<UACControlEntry> UACClockMultiplier3::GetControls() const
{
    return GetBitmapControls( mControls, UAC2_CLOCK_MULTIPLIER_BMCONTROLS, CountOf( UAC2_CLOCK_MULTIPLIER_BMCONTROLS ),
                              CT_BmControl2 );
}

bool UACSampleRateConverter3::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mUnitID, "bUnitID" ) || !reader.Read( mSourceID, "bSourceID" ) ||
        !reader.Read( mCSourceInID, "bCSourceInID" ) || !reader.Read( mCSourceOutID, "bCSourceOutID" ) ||
        !reader.Read( mSRCDescrStr, "wSRCDescrStr" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACSampleRateConverter3::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mUnitID );
    writer.Write( mSourceID );
    writer.Write( mCSourceInID );
    writer.Write( mCSourceOutID );
    writer.Write( mSRCDescrStr );
    writer.WriteArray( mJunk );
}

bool UACPowerDomain::Decode( USBDescriptorReader& reader )
{
    if( !reader.Read( mPowerDomainID, "bPowerDomainID" ) || !reader.Read( mRecoveryTime1, "waRecoveryTime(1)" ) ||
        !reader.Read( mRecoveryTime2, "waRecoveryTime(2)" ) ||
        !ReadSourceIDs( reader, mNrEntities, mEntityIDs, "bNrEntities", "baEntityID" ) ||
        !reader.Read( mPDomainDescrStr, "wPDomainDescrStr" ) )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void UACPowerDomain::Encode( USBDescriptorWriter& writer ) const
{
    writer.Write( mPowerDomainID );
    writer.Write( mRecoveryTime1 );
    writer.Write( mRecoveryTime2 );
    writer.Write( mNrEntities );
    writer.WriteArray( mEntityIDs );
    writer.Write( mPDomainDescrStr );
    writer.WriteArray( mJunk );
}
