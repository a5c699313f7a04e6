#ifndef USB_AUDIO_DESCRIPTORS_H
#define USB_AUDIO_DESCRIPTORS_H

#include <memory>
#include <string>
#include <vector>

#include <LogicPublicTypes.h>

#include "USBEnums.h"
#include "USBTypes.h"

// Decoded body of an audio class specific descriptor, the bytes after bDescriptorSubtype.
// Which class is used depends on the descriptor context, the subtype and the UAC protocol.
class UACEntity
{
  public:
    explicit UACEntity( UACDescriptorKind kind ) : mKind( kind )
    {
    }

    virtual ~UACEntity()
    {
    }

    UACDescriptorKind GetKind() const
    {
        return mKind;
    }

    virtual bool Decode( USBDescriptorReader& reader ) = 0;
    virtual void Encode( USBDescriptorWriter& writer ) const = 0;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
    }

    std::vector<U8> mJunk;    // bytes past the decoded layout
    std::vector<U8> mPartial; // incomplete last bmaControls entry, kept for Encode

  private:
    UACDescriptorKind mKind;
};

// UACK_Undefined and UACK_Invalid, the body is kept as received
class UACRawEntity : public UACEntity
{
  public:
    std::vector<U8> mData;

    explicit UACRawEntity( UACDescriptorKind kind ) : UACEntity( kind )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;
};

////////////////////////////////////////////////////////////////////////////////
// audio control, UAC1

class UACHeader1 : public UACEntity
{
  public:
    USBVersion mBcdADC;
    U16 mTotalLength;
    U8 mInCollection;
    std::vector<U8> mInterfaceNr;

    UACHeader1() : UACEntity( UACK_Header1 ), mTotalLength( 0 ), mInCollection( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;
};

class UACInputTerminal1 : public UACEntity
{
  public:
    U8 mTerminalID;
    U16 mTerminalType;
    U8 mAssocTerminal;
    U8 mNrChannels;
    U16 mChannelConfig;
    USBStringRef mChannelNames;
    USBStringRef mTerminal;

    UACInputTerminal1()
        : UACEntity( UACK_InputTerminal1 ), mTerminalID( 0 ), mTerminalType( 0 ), mAssocTerminal( 0 ), mNrChannels( 0 ),
          mChannelConfig( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mChannelNames );
        refs.push_back( &mTerminal );
    }
};

class UACOutputTerminal1 : public UACEntity
{
  public:
    U8 mTerminalID;
    U16 mTerminalType;
    U8 mAssocTerminal;
    U8 mSourceID;
    USBStringRef mTerminal;

    UACOutputTerminal1()
        : UACEntity( UACK_OutputTerminal1 ), mTerminalID( 0 ), mTerminalType( 0 ), mAssocTerminal( 0 ), mSourceID( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mTerminal );
    }
};

class UACMixerUnit1 : public UACEntity
{
  public:
    U8 mUnitID;
    U8 mNrInPins;
    std::vector<U8> mSourceIDs;
    U8 mNrChannels;
    U16 mChannelConfig;
    USBStringRef mChannelNames;
    std::vector<U8> mControls; // programmable mixer controls, one bit per input/output channel pair
    USBStringRef mMixer;

    UACMixerUnit1() : UACEntity( UACK_MixerUnit1 ), mUnitID( 0 ), mNrInPins( 0 ), mNrChannels( 0 ), mChannelConfig( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mChannelNames );
        refs.push_back( &mMixer );
    }
};

class UACSelectorUnit1 : public UACEntity
{
  public:
    U8 mUnitID;
    U8 mNrInPins;
    std::vector<U8> mSourceIDs;
    USBStringRef mSelector;

    UACSelectorUnit1() : UACEntity( UACK_SelectorUnit1 ), mUnitID( 0 ), mNrInPins( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mSelector );
    }
};

class UACFeatureUnit1 : public UACEntity
{
  public:
    U8 mUnitID;
    U8 mSourceID;
    U8 mControlSize;
    std::vector<U32> mControls; // bmaControls, entry 0 is the master channel
    USBStringRef mFeature;

    UACFeatureUnit1() : UACEntity( UACK_FeatureUnit1 ), mUnitID( 0 ), mSourceID( 0 ), mControlSize( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mFeature );
    }

    std::vector<UACControlEntry> GetControls( size_t channel ) const;
};

enum UAC1ProcessType
{
    UAC1_PROCESS_UNDEFINED = 0x00,
    UAC1_PROCESS_UP_DOWNMIX = 0x01,
    UAC1_PROCESS_DOLBY_PROLOGIC = 0x02,
    UAC1_PROCESS_3D_STEREO_EXTENDER = 0x03,
    UAC1_PROCESS_REVERBERATION = 0x04,
    UAC1_PROCESS_CHORUS = 0x05,
    UAC1_PROCESS_DYN_RANGE_COMP = 0x06,
};

enum UAC2ProcessType
{
    UAC2_PROCESS_UNDEFINED = 0x00,
    UAC2_PROCESS_UP_DOWNMIX = 0x01,
    UAC2_PROCESS_DOLBY_PROLOGIC = 0x02,
    UAC2_PROCESS_STEREO_EXTENDER = 0x03,
};

// what follows iProcessing in a UAC1 or UAC2 processing unit
enum UACProcessLayout
{
    UACPL_None,      // the process type defines nothing more
    UACPL_Modes,     // bNrModes and the mode list
    UACPL_Undefined, // undefined or reserved process type, kept undecoded in mSpecific
};

UACProcessLayout GetUACProcessLayout( UACProtocol protocol, U16 processType );

class UACProcessingUnit1 : public UACEntity
{
  public:
    U8 mUnitID;
    U16 mProcessType;
    U8 mNrInPins;
    std::vector<U8> mSourceIDs;
    U8 mNrChannels;
    U16 mChannelConfig;
    USBStringRef mChannelNames;
    U8 mControlSize;
    std::vector<U8> mControls;
    USBStringRef mProcessing;

    UACProcessLayout mLayout;
    U8 mNrModes;              // UACPL_Modes
    std::vector<U16> mModes;  // UACPL_Modes
    std::vector<U8> mSpecific; // UACPL_Undefined

    UACProcessingUnit1()
        : UACEntity( UACK_ProcessingUnit1 ), mUnitID( 0 ), mProcessType( 0 ), mNrInPins( 0 ), mNrChannels( 0 ),
          mChannelConfig( 0 ), mControlSize( 0 ), mLayout( UACPL_None ), mNrModes( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mChannelNames );
        refs.push_back( &mProcessing );
    }
};

class UACExtensionUnit1 : public UACEntity
{
  public:
    U8 mUnitID;
    U16 mExtensionCode;
    U8 mNrInPins;
    std::vector<U8> mSourceIDs;
    U8 mNrChannels;
    U16 mChannelConfig;
    USBStringRef mChannelNames;
    U8 mControlSize;
    std::vector<U8> mControls;
    USBStringRef mExtension;

    UACExtensionUnit1()
        : UACEntity( UACK_ExtensionUnit1 ), mUnitID( 0 ), mExtensionCode( 0 ), mNrInPins( 0 ), mNrChannels( 0 ),
          mChannelConfig( 0 ), mControlSize( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mChannelNames );
        refs.push_back( &mExtension );
    }
};

////////////////////////////////////////////////////////////////////////////////
// audio control, UAC2

class UACHeader2 : public UACEntity
{
  public:
    USBVersion mBcdADC;
    U8 mCategory;
    U16 mTotalLength;
    U8 mControls;

    UACHeader2() : UACEntity( UACK_Header2 ), mCategory( 0 ), mTotalLength( 0 ), mControls( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<UACControlEntry> GetControls() const;
};

class UACInputTerminal2 : public UACEntity
{
  public:
    U8 mTerminalID;
    U16 mTerminalType;
    U8 mAssocTerminal;
    U8 mCSourceID;
    U8 mNrChannels;
    U32 mChannelConfig;
    USBStringRef mChannelNames;
    U16 mControls;
    USBStringRef mTerminal;

    UACInputTerminal2()
        : UACEntity( UACK_InputTerminal2 ), mTerminalID( 0 ), mTerminalType( 0 ), mAssocTerminal( 0 ), mCSourceID( 0 ),
          mNrChannels( 0 ), mChannelConfig( 0 ), mControls( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mChannelNames );
        refs.push_back( &mTerminal );
    }

    std::vector<UACControlEntry> GetControls() const;
};

class UACOutputTerminal2 : public UACEntity
{
  public:
    U8 mTerminalID;
    U16 mTerminalType;
    U8 mAssocTerminal;
    U8 mSourceID;
    U8 mCSourceID;
    U16 mControls;
    USBStringRef mTerminal;

    UACOutputTerminal2()
        : UACEntity( UACK_OutputTerminal2 ), mTerminalID( 0 ), mTerminalType( 0 ), mAssocTerminal( 0 ), mSourceID( 0 ),
          mCSourceID( 0 ), mControls( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mTerminal );
    }

    std::vector<UACControlEntry> GetControls() const;
};

class UACMixerUnit2 : public UACEntity
{
  public:
    U8 mUnitID;
    U8 mNrInPins;
    std::vector<U8> mSourceIDs;
    U8 mNrChannels;
    U32 mChannelConfig;
    USBStringRef mChannelNames;
    std::vector<U8> mMixerControls;
    U8 mControls;
    USBStringRef mMixer;

    UACMixerUnit2()
        : UACEntity( UACK_MixerUnit2 ), mUnitID( 0 ), mNrInPins( 0 ), mNrChannels( 0 ), mChannelConfig( 0 ), mControls( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mChannelNames );
        refs.push_back( &mMixer );
    }

    std::vector<UACControlEntry> GetControls() const;
};

class UACSelectorUnit2 : public UACEntity
{
  public:
    U8 mUnitID;
    U8 mNrInPins;
    std::vector<U8> mSourceIDs;
    U8 mControls;
    USBStringRef mSelector;

    UACSelectorUnit2() : UACEntity( UACK_SelectorUnit2 ), mUnitID( 0 ), mNrInPins( 0 ), mControls( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mSelector );
    }

    std::vector<UACControlEntry> GetControls() const;
};

class UACFeatureUnit2 : public UACEntity
{
  public:
    U8 mUnitID;
    U8 mSourceID;
    std::vector<U32> mControls; // bmaControls, entry 0 is the master channel
    USBStringRef mFeature;

    UACFeatureUnit2() : UACEntity( UACK_FeatureUnit2 ), mUnitID( 0 ), mSourceID( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mFeature );
    }

    std::vector<UACControlEntry> GetControls( size_t channel ) const;
};

class UACEffectUnit2 : public UACEntity
{
  public:
    U8 mUnitID;
    U16 mEffectType;
    U8 mSourceID;
    std::vector<U32> mControls;
    USBStringRef mEffects;

    UACEffectUnit2() : UACEntity( UACK_EffectUnit2 ), mUnitID( 0 ), mEffectType( 0 ), mSourceID( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mEffects );
    }
};

class UACProcessingUnit2 : public UACEntity
{
  public:
    U8 mUnitID;
    U16 mProcessType;
    U8 mNrInPins;
    std::vector<U8> mSourceIDs;
    U8 mNrChannels;
    U32 mChannelConfig;
    USBStringRef mChannelNames;
    U16 mControls;
    USBStringRef mProcessing;

    UACProcessLayout mLayout;
    U8 mNrModes;              // UACPL_Modes
    std::vector<U32> mModes;  // UACPL_Modes
    std::vector<U8> mSpecific; // UACPL_Undefined

    UACProcessingUnit2()
        : UACEntity( UACK_ProcessingUnit2 ), mUnitID( 0 ), mProcessType( 0 ), mNrInPins( 0 ), mNrChannels( 0 ),
          mChannelConfig( 0 ), mControls( 0 ), mLayout( UACPL_None ), mNrModes( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mChannelNames );
        refs.push_back( &mProcessing );
    }
};

class UACExtensionUnit2 : public UACEntity
{
  public:
    U8 mUnitID;
    U16 mExtensionCode;
    U8 mNrInPins;
    std::vector<U8> mSourceIDs;
    U8 mNrChannels;
    U32 mChannelConfig;
    USBStringRef mChannelNames;
    U8 mControls;
    USBStringRef mExtension;

    UACExtensionUnit2()
        : UACEntity( UACK_ExtensionUnit2 ), mUnitID( 0 ), mExtensionCode( 0 ), mNrInPins( 0 ), mNrChannels( 0 ),
          mChannelConfig( 0 ), mControls( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mChannelNames );
        refs.push_back( &mExtension );
    }

    std::vector<UACControlEntry> GetControls() const;
};

class UACClockSource2 : public UACEntity
{
  public:
    U8 mClockID;
    U8 mAttributes;
    U8 mControls;
    U8 mAssocTerminal;
    USBStringRef mClockSource;

    UACClockSource2() : UACEntity( UACK_ClockSource2 ), mClockID( 0 ), mAttributes( 0 ), mControls( 0 ), mAssocTerminal( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mClockSource );
    }

    std::vector<std::string> GetAttributes() const;
    std::vector<UACControlEntry> GetControls() const;
};

class UACClockSelector2 : public UACEntity
{
  public:
    U8 mClockID;
    U8 mNrInPins;
    std::vector<U8> mCSourceIDs;
    U8 mControls;
    USBStringRef mClockSelector;

    UACClockSelector2() : UACEntity( UACK_ClockSelector2 ), mClockID( 0 ), mNrInPins( 0 ), mControls( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mClockSelector );
    }

    std::vector<UACControlEntry> GetControls() const;
};

class UACClockMultiplier2 : public UACEntity
{
  public:
    U8 mClockID;
    U8 mCSourceID;
    U8 mControls;
    USBStringRef mClockMultiplier;

    UACClockMultiplier2() : UACEntity( UACK_ClockMultiplier2 ), mClockID( 0 ), mCSourceID( 0 ), mControls( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mClockMultiplier );
    }

    std::vector<UACControlEntry> GetControls() const;
};

class UACSampleRateConverter2 : public UACEntity
{
  public:
    U8 mUnitID;
    U8 mSourceID;
    U8 mCSourceInID;
    U8 mCSourceOutID;
    USBStringRef mSRC;

    UACSampleRateConverter2()
        : UACEntity( UACK_SampleRateConverter2 ), mUnitID( 0 ), mSourceID( 0 ), mCSourceInID( 0 ), mCSourceOutID( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mSRC );
    }
};

////////////////////////////////////////////////////////////////////////////////
// audio control, UAC3. Strings are class specific string descriptor IDs (wXxxDescrStr).

class UACHeader3 : public UACEntity
{
  public:
    U8 mCategory;
    U16 mTotalLength;
    U32 mControls;

    UACHeader3() : UACEntity( UACK_Header3 ), mCategory( 0 ), mTotalLength( 0 ), mControls( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<UACControlEntry> GetControls() const;
};

class UACInputTerminal3 : public UACEntity
{
  public:
    U8 mTerminalID;
    U16 mTerminalType;
    U8 mAssocTerminal;
    U8 mCSourceID;
    U32 mControls;
    U16 mClusterDescrID;
    U16 mExTerminalDescrID;
    U16 mConnectorsDescrID;
    U16 mTerminalDescrStr;

    UACInputTerminal3()
        : UACEntity( UACK_InputTerminal3 ), mTerminalID( 0 ), mTerminalType( 0 ), mAssocTerminal( 0 ), mCSourceID( 0 ),
          mControls( 0 ), mClusterDescrID( 0 ), mExTerminalDescrID( 0 ), mConnectorsDescrID( 0 ), mTerminalDescrStr( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<UACControlEntry> GetControls() const;
};

class UACOutputTerminal3 : public UACEntity
{
  public:
    U8 mTerminalID;
    U16 mTerminalType;
    U8 mAssocTerminal;
    U8 mSourceID;
    U8 mCSourceID;
    U32 mControls;
    U16 mExTerminalDescrID;
    U16 mConnectorsDescrID;
    U16 mTerminalDescrStr;

    UACOutputTerminal3()
        : UACEntity( UACK_OutputTerminal3 ), mTerminalID( 0 ), mTerminalType( 0 ), mAssocTerminal( 0 ), mSourceID( 0 ),
          mCSourceID( 0 ), mControls( 0 ), mExTerminalDescrID( 0 ), mConnectorsDescrID( 0 ), mTerminalDescrStr( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<UACControlEntry> GetControls() const;
};

class UACExtendedTerminalHeader : public UACEntity
{
  public:
    U16 mDescriptorID;
    U8 mNrChannels;

    UACExtendedTerminalHeader() : UACEntity( UACK_ExtendedTerminalHeader ), mDescriptorID( 0 ), mNrChannels( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;
};

class UACMixerUnit3 : public UACEntity
{
  public:
    U8 mUnitID;
    U8 mNrInPins;
    std::vector<U8> mSourceIDs;
    U16 mClusterDescrID;
    std::vector<U8> mMixerControls;
    U32 mControls;
    U16 mMixerDescrStr;

    UACMixerUnit3()
        : UACEntity( UACK_MixerUnit3 ), mUnitID( 0 ), mNrInPins( 0 ), mClusterDescrID( 0 ), mControls( 0 ), mMixerDescrStr( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<UACControlEntry> GetControls() const;
};

class UACSelectorUnit3 : public UACEntity
{
  public:
    U8 mUnitID;
    U8 mNrInPins;
    std::vector<U8> mSourceIDs;
    U32 mControls;
    U16 mSelectorDescrStr;

    UACSelectorUnit3() : UACEntity( UACK_SelectorUnit3 ), mUnitID( 0 ), mNrInPins( 0 ), mControls( 0 ), mSelectorDescrStr( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<UACControlEntry> GetControls() const;
};

class UACFeatureUnit3 : public UACEntity
{
  public:
    U8 mUnitID;
    U8 mSourceID;
    std::vector<U32> mControls;
    U16 mFeatureDescrStr;

    UACFeatureUnit3() : UACEntity( UACK_FeatureUnit3 ), mUnitID( 0 ), mSourceID( 0 ), mFeatureDescrStr( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<UACControlEntry> GetControls( size_t channel ) const;
};

class UACEffectUnit3 : public UACEntity
{
  public:
    U8 mUnitID;
    U16 mEffectType;
    U8 mSourceID;
    std::vector<U32> mControls;
    U16 mEffectsDescrStr;

    UACEffectUnit3() : UACEntity( UACK_EffectUnit3 ), mUnitID( 0 ), mEffectType( 0 ), mSourceID( 0 ), mEffectsDescrStr( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;
};

enum UAC3ProcessType
{
    UAC3_PROCESS_UNDEFINED = 0x00,
    UAC3_PROCESS_UP_DOWNMIX = 0x01,
    UAC3_PROCESS_STEREO_EXTENDER = 0x02,
    UAC3_PROCESS_MULTI_FUNCTION = 0x03,
};

class UACProcessingUnit3 : public UACEntity
{
  public:
    U8 mUnitID;
    U16 mProcessType;
    U8 mNrInPins;
    std::vector<U8> mSourceIDs;
    U16 mProcessingDescrStr;

    // process type specific part, not present for undefined process types
    bool mHasSpecific;
    U32 mControls;
    U8 mNrModes;                        // up/down-mix
    std::vector<U16> mClusterDescrIDs;  // up/down-mix
    U16 mClusterDescrID;                // multi-function
    U32 mAlgorithms;                    // multi-function

    UACProcessingUnit3()
        : UACEntity( UACK_ProcessingUnit3 ), mUnitID( 0 ), mProcessType( 0 ), mNrInPins( 0 ), mProcessingDescrStr( 0 ),
          mHasSpecific( false ), mControls( 0 ), mNrModes( 0 ), mClusterDescrID( 0 ), mAlgorithms( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<UACControlEntry> GetControls() const;
    std::vector<std::string> GetAlgorithms() const;
};

class UACExtensionUnit3 : public UACEntity
{
  public:
    U8 mUnitID;
    U16 mExtensionCode;
    U8 mNrInPins;
    std::vector<U8> mSourceIDs;
    U16 mExtensionDescrStr;
    U32 mControls;
    U16 mClusterDescrID;

    UACExtensionUnit3()
        : UACEntity( UACK_ExtensionUnit3 ), mUnitID( 0 ), mExtensionCode( 0 ), mNrInPins( 0 ), mExtensionDescrStr( 0 ),
          mControls( 0 ), mClusterDescrID( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<UACControlEntry> GetControls() const;
};

class UACClockSource3 : public UACEntity
{
  public:
    U8 mClockID;
    U8 mAttributes;
    U32 mControls;
    U8 mReferenceTerminal;
    U16 mClockSourceStr;

    UACClockSource3()
        : UACEntity( UACK_ClockSource3 ), mClockID( 0 ), mAttributes( 0 ), mControls( 0 ), mReferenceTerminal( 0 ),
          mClockSourceStr( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<std::string> GetAttributes() const;
    std::vector<UACControlEntry> GetControls() const;
};

class UACClockSelector3 : public UACEntity
{
  public:
    U8 mClockID;
    U8 mNrInPins;
    std::vector<U8> mCSourceIDs;
    U32 mControls;
    U16 mCSelectorDescrStr;

    UACClockSelector3() : UACEntity( UACK_ClockSelector3 ), mClockID( 0 ), mNrInPins( 0 ), mControls( 0 ), mCSelectorDescrStr( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<UACControlEntry> GetControls() const;
};

class UACClockMultiplier3 : public UACEntity
{
  public:
    U8 mClockID;
    U8 mCSourceID;
    U32 mControls;
    U16 mCMultiplierDescrStr;

    UACClockMultiplier3()
        : UACEntity( UACK_ClockMultiplier3 ), mClockID( 0 ), mCSourceID( 0 ), mControls( 0 ), mCMultiplierDescrStr( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<UACControlEntry> GetControls() const;
};

class UACSampleRateConverter3 : public UACEntity
{
  public:
    U8 mUnitID;
    U8 mSourceID;
    U8 mCSourceInID;
    U8 mCSourceOutID;
    U16 mSRCDescrStr;

    UACSampleRateConverter3()
        : UACEntity( UACK_SampleRateConverter3 ), mUnitID( 0 ), mSourceID( 0 ), mCSourceInID( 0 ), mCSourceOutID( 0 ),
          mSRCDescrStr( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;
};

class UACPowerDomain : public UACEntity
{
  public:
    U8 mPowerDomainID;
    U16 mRecoveryTime1;
    U16 mRecoveryTime2;
    U8 mNrEntities;
    std::vector<U8> mEntityIDs;
    U16 mPDomainDescrStr;

    UACPowerDomain()
        : UACEntity( UACK_PowerDomain ), mPowerDomainID( 0 ), mRecoveryTime1( 0 ), mRecoveryTime2( 0 ), mNrEntities( 0 ),
          mPDomainDescrStr( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;
};

////////////////////////////////////////////////////////////////////////////////
// audio streaming interface

class UACStreamingInterface1 : public UACEntity
{
  public:
    U8 mTerminalLink;
    U8 mDelay;
    U16 mFormatTag;

    UACStreamingInterface1() : UACEntity( UACK_StreamingInterface1 ), mTerminalLink( 0 ), mDelay( 0 ), mFormatTag( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;
};

class UACStreamingInterface2 : public UACEntity
{
  public:
    U8 mTerminalLink;
    U8 mControls;
    U8 mFormatType;
    U32 mFormats;
    U8 mNrChannels;
    U32 mChannelConfig;
    USBStringRef mChannelNames;

    UACStreamingInterface2()
        : UACEntity( UACK_StreamingInterface2 ), mTerminalLink( 0 ), mControls( 0 ), mFormatType( 0 ), mFormats( 0 ),
          mNrChannels( 0 ), mChannelConfig( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mChannelNames );
    }

    std::vector<UACControlEntry> GetControls() const;
};

class UACStreamingInterface3 : public UACEntity
{
  public:
    U8 mTerminalLink;
    U32 mControls;
    U16 mClusterDescrID;
    U64 mFormats;
    U8 mSubslotSize;
    U8 mBitResolution;
    U16 mAuxProtocols;
    U8 mControlSize;

    UACStreamingInterface3()
        : UACEntity( UACK_StreamingInterface3 ), mTerminalLink( 0 ), mControls( 0 ), mClusterDescrID( 0 ), mFormats( 0 ),
          mSubslotSize( 0 ), mBitResolution( 0 ), mAuxProtocols( 0 ), mControlSize( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<UACControlEntry> GetControls() const;
};

// bSamFreqType and the rates that follow it in UAC1 format type descriptors
struct UACSampleFrequencies
{
    U8 mSamFreqType; // 0 for a continuous range, else the number of discrete rates
    U32 mLowerSamFreq;
    U32 mUpperSamFreq;
    std::vector<U32> mSamFreqs;

    UACSampleFrequencies() : mSamFreqType( 0 ), mLowerSamFreq( 0 ), mUpperSamFreq( 0 )
    {
    }

    bool IsContinuous() const
    {
        return mSamFreqType == 0;
    }

    bool Decode( USBDescriptorReader& reader );
    void Encode( USBDescriptorWriter& writer ) const;
};

// UAC1 type I and type III
class UACFormatTypeI1 : public UACEntity
{
  public:
    U8 mFormatType;
    U8 mNrChannels;
    U8 mSubframeSize;
    U8 mBitResolution;
    UACSampleFrequencies mFrequencies;

    UACFormatTypeI1() : UACEntity( UACK_FormatTypeI1 ), mFormatType( 0 ), mNrChannels( 0 ), mSubframeSize( 0 ), mBitResolution( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;
};

class UACFormatTypeII1 : public UACEntity
{
  public:
    U8 mFormatType;
    U16 mMaxBitRate;
    U16 mSamplesPerFrame;
    UACSampleFrequencies mFrequencies;

    UACFormatTypeII1() : UACEntity( UACK_FormatTypeII1 ), mFormatType( 0 ), mMaxBitRate( 0 ), mSamplesPerFrame( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;
};

// UAC2 type I and type III
class UACFormatTypeI2 : public UACEntity
{
  public:
    U8 mFormatType;
    U8 mSubslotSize;
    U8 mBitResolution;

    UACFormatTypeI2() : UACEntity( UACK_FormatTypeI2 ), mFormatType( 0 ), mSubslotSize( 0 ), mBitResolution( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;
};

class UACFormatTypeII2 : public UACEntity
{
  public:
    U8 mFormatType;
    U16 mMaxBitRate;
    U16 mSlotsPerFrame;

    UACFormatTypeII2() : UACEntity( UACK_FormatTypeII2 ), mFormatType( 0 ), mMaxBitRate( 0 ), mSlotsPerFrame( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;
};

class UACFormatTypeIV2 : public UACEntity
{
  public:
    U8 mFormatType;

    UACFormatTypeIV2() : UACEntity( UACK_FormatTypeIV2 ), mFormatType( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;
};

// format specific descriptor of a tag without a decoded layout
class UACFormatSpecific : public UACEntity
{
  public:
    U16 mFormatTag;
    std::vector<U8> mData;

    UACFormatSpecific() : UACEntity( UACK_FormatSpecific ), mFormatTag( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;
};

class UACFormatSpecificMPEG : public UACEntity
{
  public:
    U16 mFormatTag;
    U16 mMPEGCapabilities;
    U8 mMPEGFeatures;

    UACFormatSpecificMPEG() : UACEntity( UACK_FormatSpecificMPEG ), mFormatTag( 0 ), mMPEGCapabilities( 0 ), mMPEGFeatures( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<std::string> GetCapabilities() const;
    const char* GetMultilingual() const;
    const char* GetDynamicRangeControl() const;
};

class UACFormatSpecificAC3 : public UACEntity
{
  public:
    U16 mFormatTag;
    U32 mBSID;
    U8 mAC3Features;

    UACFormatSpecificAC3() : UACEntity( UACK_FormatSpecificAC3 ), mFormatTag( 0 ), mBSID( 0 ), mAC3Features( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<std::string> GetFeatures() const;
    const char* GetDynamicRangeControl() const;
};

////////////////////////////////////////////////////////////////////////////////
// audio streaming isochronous endpoint

class UACDataStreamingEndpoint1 : public UACEntity
{
  public:
    U8 mAttributes;
    U8 mLockDelayUnits;
    U16 mLockDelay;

    UACDataStreamingEndpoint1()
        : UACEntity( UACK_DataStreamingEndpoint1 ), mAttributes( 0 ), mLockDelayUnits( 0 ), mLockDelay( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<std::string> GetAttributes() const;
};

class UACDataStreamingEndpoint2 : public UACEntity
{
  public:
    U8 mAttributes;
    U8 mControls;
    U8 mLockDelayUnits;
    U16 mLockDelay;

    UACDataStreamingEndpoint2()
        : UACEntity( UACK_DataStreamingEndpoint2 ), mAttributes( 0 ), mControls( 0 ), mLockDelayUnits( 0 ), mLockDelay( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<std::string> GetAttributes() const;
    std::vector<UACControlEntry> GetControls() const;
};

class UACDataStreamingEndpoint3 : public UACEntity
{
  public:
    U32 mControls;
    U8 mLockDelayUnits;
    U16 mLockDelay;

    UACDataStreamingEndpoint3() : UACEntity( UACK_DataStreamingEndpoint3 ), mControls( 0 ), mLockDelayUnits( 0 ), mLockDelay( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    std::vector<UACControlEntry> GetControls() const;
};

////////////////////////////////////////////////////////////////////////////////

// wire subtype to canonical audio control entity for the given protocol
UACInterface GetUACInterface( U8 subtype, UACProtocol protocol );

// UACK_Undefined or UACK_Invalid when the subtype has no layout in this context and protocol,
// otherwise the kind DecodeUACEntity builds
UACDescriptorKind GetUACDescriptorKind( UACDescriptorContext context, U8 subtype, UACProtocol protocol, const U8* payload,
                                        size_t size );

// Decodes the body of an audio class specific descriptor. Returns null and fills error when the
// body does not fit the layout; base is the offset of payload inside the descriptor.
std::unique_ptr<UACEntity> DecodeUACEntity( UACDescriptorContext context, U8 subtype, UACProtocol protocol, const U8* payload,
                                            size_t size, size_t base, USBDecodeError& error );

// an audio class specific descriptor: envelope plus typed body
class UACDescriptor
{
  public:
    U8 mLength;
    U8 mDescriptorType;
    U8 mDescriptorSubtype;
    UACDescriptorContext mContext;
    UACProtocol mProtocol;

    // never null after a successful Decode; a raw UACK_Invalid body when mError is set
    std::unique_ptr<UACEntity> mEntity;
    USBDecodeError mError; // why the body could not be decoded

    UACDescriptor()
        : mLength( 0 ), mDescriptorType( 0 ), mDescriptorSubtype( 0 ), mContext( UACC_AudioControl ),
          mProtocol( UAC_PROTOCOL_Unknown )
    {
    }

    // fails only when the envelope is unusable; body failures are kept in mError
    bool Decode( USBDescriptorReader& reader, UACDescriptorContext context, U8 protocol );
    void Encode( std::vector<U8>& out ) const;

    UACDescriptorKind GetKind() const
    {
        return mEntity ? mEntity->GetKind() : UACK_Invalid;
    }

    bool IsDecoded() const
    {
        return !mError.IsSet();
    }

    void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        if( mEntity )
            mEntity->GetStringRefs( refs );
    }
};

std::unique_ptr<UACDescriptor> UACDescriptorDecode( const U8* data, size_t size, UACDescriptorContext context, U8 protocol,
                                                    USBDecodeError& error );

#endif // USB_AUDIO_DESCRIPTORS_H
