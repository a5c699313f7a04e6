#ifndef USB_CLASS_DESCRIPTORS_H
#define USB_CLASS_DESCRIPTORS_H

#include <memory>
#include <vector>

#include <LogicPublicTypes.h>

#include "USBDescriptors.h"
#include "USBMidiDescriptors.h"

// (bInterfaceClass, bInterfaceSubClass, bInterfaceProtocol) of the enclosing interface
struct USBClassTriplet
{
    U8 mClass;
    U8 mSubClass;
    U8 mProtocol;

    USBClassTriplet() : mClass( 0 ), mSubClass( 0 ), mProtocol( 0 )
    {
    }

    USBClassTriplet( U8 cls, U8 subClass, U8 protocol ) : mClass( cls ), mSubClass( subClass ), mProtocol( protocol )
    {
    }
};

// Device, configuration, interface, endpoint and class specific descriptors.
// A class descriptor starts out generic; class context turns it into one of the specialized kinds.
class USBClassDescriptor : public USBDescriptor
{
  public:
    virtual USBDescriptorKind GetKind() const
    {
        return DK_Class;
    }

    virtual USBClassDescriptorKind GetClassKind() const = 0;
};

class USBGenericDescriptor : public USBClassDescriptor
{
  public:
    U8 mLength;
    U8 mDescriptorType;
    U8 mDescriptorSubtype;
    std::vector<U8> mData; // everything after the subtype byte

    bool mHasTriplet; // set once class context was applied without a matching specialization
    USBClassTriplet mTriplet;

    USBGenericDescriptor() : mLength( 0 ), mDescriptorType( 0 ), mDescriptorSubtype( 0 ), mHasTriplet( false )
    {
    }

    bool Decode( USBDescriptorReader& reader );

    // bLength minus the three header bytes
    size_t GetExpectedDataLength() const
    {
        return mLength < 3 ? 0 : mLength - 3;
    }

    virtual USBClassDescriptorKind GetClassKind() const
    {
        return CDK_Generic;
    }

    virtual U8 GetDescriptorType() const
    {
        return mDescriptorType;
    }

    virtual void Encode( std::vector<U8>& out ) const;
};

class USBHIDDescriptor : public USBClassDescriptor
{
  public:
    U8 mLength;
    U8 mDescriptorType;
    USBVersion mBcdHID;
    U8 mCountryCode;
    U8 mNumDescriptors;
    std::vector<USBHIDReportDescriptor> mDescriptors;
    std::vector<U8> mJunk;

    USBHIDDescriptor() : mLength( 0 ), mDescriptorType( DT_HID ), mCountryCode( 0 ), mNumDescriptors( 0 )
    {
    }

    bool Decode( USBDescriptorReader& reader );

    virtual USBClassDescriptorKind GetClassKind() const
    {
        return CDK_HID;
    }

    virtual U8 GetDescriptorType() const
    {
        return mDescriptorType;
    }

    virtual void Encode( std::vector<U8>& out ) const;
};

// smart card class functional descriptor
class USBCCIDDescriptor : public USBClassDescriptor
{
  public:
    U8 mLength;
    U8 mDescriptorType;
    USBVersion mBcdCCID;
    U8 mMaxSlotIndex;
    U8 mVoltageSupport;
    U32 mProtocols;
    U32 mDefaultClock;
    U32 mMaximumClock;
    U8 mNumClockSupported;
    U32 mDataRate;
    U32 mMaxDataRate;
    U8 mNumDataRatesSupported;
    U32 mMaxIFSD;
    U32 mSynchProtocols;
    U32 mMechanical;
    U32 mFeatures;
    U32 mMaxCCIDMessageLength;
    U8 mClassGetResponse;
    U8 mClassEnvelope;
    U8 mLcdLayoutLines;
    U8 mLcdLayoutChars;
    U8 mPINSupport;
    U8 mMaxCCIDBusySlots;
    std::vector<U8> mJunk;

    USBCCIDDescriptor();

    bool Decode( USBDescriptorReader& reader );

    virtual USBClassDescriptorKind GetClassKind() const
    {
        return CDK_CCID;
    }

    virtual U8 GetDescriptorType() const
    {
        return mDescriptorType;
    }

    virtual void Encode( std::vector<U8>& out ) const;
};

struct USBPrinterReportDescriptor
{
    U8 mDescriptorType;
    U8 mLength; // bytes after this field
    U16 mCapabilities;
    U8 mVersionsSupported;
    USBStringRef mUUID;
    std::vector<U8> mData;

    USBPrinterReportDescriptor() : mDescriptorType( 0 ), mLength( 0 ), mCapabilities( 0 ), mVersionsSupported( 0 )
    {
    }

    bool Decode( USBDescriptorReader& reader );
    void Encode( std::vector<U8>& out ) const;
};

class USBPrinterDescriptor : public USBClassDescriptor
{
  public:
    U8 mLength;
    U8 mDescriptorType;
    U8 mReleaseNumber;
    U8 mNumDescriptors;
    std::vector<USBPrinterReportDescriptor> mDescriptors;
    std::vector<U8> mJunk;

    USBPrinterDescriptor() : mLength( 0 ), mDescriptorType( 0 ), mReleaseNumber( 0 ), mNumDescriptors( 0 )
    {
    }

    bool Decode( USBDescriptorReader& reader );

    virtual USBClassDescriptorKind GetClassKind() const
    {
        return CDK_Printer;
    }

    virtual U8 GetDescriptorType() const
    {
        return mDescriptorType;
    }

    virtual void Encode( std::vector<U8>& out ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs );
};

// CDC functional descriptor, used by the communications and the data class
class USBCommunicationDescriptor : public USBClassDescriptor
{
  public:
    U8 mLength;
    U8 mDescriptorType;
    U8 mDescriptorSubtype; // USBCDCDescriptorSubtype
    bool mHasString;
    USBStringRef mString;
    std::vector<U8> mData; // everything after the subtype byte

    USBCommunicationDescriptor() : mLength( 0 ), mDescriptorType( 0 ), mDescriptorSubtype( 0 ), mHasString( false )
    {
    }

    bool Decode( USBDescriptorReader& reader );

    USBCDCDescriptorSubtype GetSubtype() const
    {
        return mDescriptorSubtype <= DST_MBIM_EXTENDED ? USBCDCDescriptorSubtype( mDescriptorSubtype ) : DST_Undefined;
    }

    virtual USBClassDescriptorKind GetClassKind() const
    {
        return CDK_Communication;
    }

    virtual U8 GetDescriptorType() const
    {
        return mDescriptorType;
    }

    virtual void Encode( std::vector<U8>& out ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        if( mHasString )
            refs.push_back( &mString );
    }
};

// UVC video control descriptor
class USBVideoDescriptor : public USBClassDescriptor
{
  public:
    U8 mLength;
    U8 mDescriptorType;
    U8 mDescriptorSubtype; // UVCInterfaceSubtype
    U8 mProtocol;
    bool mHasString;
    USBStringRef mString;
    std::vector<U8> mData;

    USBVideoDescriptor() : mLength( 0 ), mDescriptorType( 0 ), mDescriptorSubtype( 0 ), mProtocol( 0 ), mHasString( false )
    {
    }

    bool Decode( USBDescriptorReader& reader );

    virtual USBClassDescriptorKind GetClassKind() const
    {
        return CDK_Video;
    }

    virtual U8 GetDescriptorType() const
    {
        return mDescriptorType;
    }

    virtual void Encode( std::vector<U8>& out ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        if( mHasString )
            refs.push_back( &mString );
    }
};

// MIDI streaming interface descriptor; the typed body is decoded when the layout allows
class USBMidiDescriptor : public USBClassDescriptor
{
  public:
    U8 mLength;
    U8 mDescriptorType;
    U8 mDescriptorSubtype; // MIDIInterfaceSubtype
    U8 mProtocol;
    bool mHasString;
    USBStringRef mString;
    std::vector<U8> mData;

    std::unique_ptr<MIDIEntity> mBody; // null when the subtype is undefined or the body is malformed
    USBDecodeError mBodyError;

    USBMidiDescriptor() : mLength( 0 ), mDescriptorType( 0 ), mDescriptorSubtype( 0 ), mProtocol( 0 ), mHasString( false )
    {
    }

    bool Decode( USBDescriptorReader& reader );

    MIDIInterfaceSubtype GetSubtype() const
    {
        return mDescriptorSubtype <= MS_ELEMENT ? MIDIInterfaceSubtype( mDescriptorSubtype ) : MS_UNDEFINED;
    }

    virtual USBClassDescriptorKind GetClassKind() const
    {
        return CDK_MIDI;
    }

    virtual U8 GetDescriptorType() const
    {
        return mDescriptorType;
    }

    virtual void Encode( std::vector<U8>& out ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs );
};

// Generic class descriptor, at least the three header bytes
std::unique_ptr<USBGenericDescriptor> USBGenericDescriptorDecode( const U8* data, size_t size, USBDecodeError& error );

// Builds the specialized descriptor the triplet selects from the generic one. Audio control and
// audio streaming descriptors stay generic, tagged with the triplet; their UAC body is decoded by
// the configuration walker. Returns null and fills error when the specialized decoder rejects the bytes.
std::unique_ptr<USBClassDescriptor> SpecializeClassDescriptor( const USBGenericDescriptor& generic,
                                                               const USBClassTriplet& triplet, USBDecodeError& error );

// Replaces a generic class descriptor with its specialization. Any other descriptor is left alone
// and true is returned. On failure the descriptor is unchanged.
bool ApplyClassContext( std::unique_ptr<USBDescriptor>& descriptor, const USBClassTriplet& triplet, USBDecodeError& error );

#endif // USB_CLASS_DESCRIPTORS_H
