#ifndef USB_MIDI_DESCRIPTORS_H
#define USB_MIDI_DESCRIPTORS_H

#include <memory>
#include <vector>

#include <LogicPublicTypes.h>

#include "USBEnums.h"
#include "USBTypes.h"

// body of a MIDI streaming interface descriptor, the bytes after bDescriptorSubtype
class MIDIEntity
{
  public:
    explicit MIDIEntity( MIDIInterfaceSubtype subtype ) : mSubtype( subtype )
    {
    }

    virtual ~MIDIEntity()
    {
    }

    MIDIInterfaceSubtype GetSubtype() const
    {
        return mSubtype;
    }

    virtual bool Decode( USBDescriptorReader& reader ) = 0;
    virtual void Encode( USBDescriptorWriter& writer ) const = 0;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
    }

    std::vector<U8> mJunk; // bytes past the decoded layout

  private:
    MIDIInterfaceSubtype mSubtype;
};

class MIDIHeader : public MIDIEntity
{
  public:
    USBVersion mBcdMSC;
    U16 mTotalLength;

    MIDIHeader() : MIDIEntity( MS_HEADER ), mTotalLength( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;
};

class MIDIInputJack : public MIDIEntity
{
  public:
    U8 mJackType;
    U8 mJackID;
    USBStringRef mJack;

    MIDIInputJack() : MIDIEntity( MS_MIDI_IN_JACK ), mJackType( 0 ), mJackID( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mJack );
    }
};

// baSourceID and baSourcePin are interleaved on the wire
struct MIDISourcePin
{
    U8 mSourceID;
    U8 mSourcePin;
};

class MIDIOutputJack : public MIDIEntity
{
  public:
    U8 mJackType;
    U8 mJackID;
    U8 mNrInputPins;
    std::vector<MIDISourcePin> mSources;
    USBStringRef mJack;

    MIDIOutputJack() : MIDIEntity( MS_MIDI_OUT_JACK ), mJackType( 0 ), mJackID( 0 ), mNrInputPins( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mJack );
    }
};

class MIDIElement : public MIDIEntity
{
  public:
    U8 mElementID;
    U8 mNrInputPins;
    std::vector<MIDISourcePin> mSources;
    U8 mNrOutputPins;
    U8 mInTerminalLink;
    U8 mOutTerminalLink;
    U8 mElCapsSize;
    std::vector<U8> mElementCaps; // bElCapsSize bytes, little-endian bitmap
    USBStringRef mElement;

    MIDIElement()
        : MIDIEntity( MS_ELEMENT ), mElementID( 0 ), mNrInputPins( 0 ), mNrOutputPins( 0 ), mInTerminalLink( 0 ),
          mOutTerminalLink( 0 ), mElCapsSize( 0 )
    {
    }

    virtual bool Decode( USBDescriptorReader& reader );
    virtual void Encode( USBDescriptorWriter& writer ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mElement );
    }

    // the low 64 bits of bmElementCaps
    U64 GetCapabilities() const;
};

// Decodes the body of a MIDI streaming interface descriptor. Returns null with no error
// for undefined subtypes, null with the error set for malformed bodies.
std::unique_ptr<MIDIEntity> MIDIEntityDecode( U8 subtype, const U8* data, size_t size, size_t base, USBDecodeError& error );

// class specific endpoint descriptor of a MIDI streaming interface
struct MIDIEndpointDescriptor
{
    U8 mLength;
    U8 mDescriptorType;
    U8 mDescriptorSubtype; // MIDIEndpointSubtype
    U8 mNumEmbMIDIJack;
    std::vector<U8> mAssocJackIDs;
    std::vector<U8> mJunk;

    MIDIEndpointDescriptor() : mLength( 0 ), mDescriptorType( DT_CS_ENDPOINT ), mDescriptorSubtype( 0 ), mNumEmbMIDIJack( 0 )
    {
    }

    bool IsGeneral() const
    {
        return mDescriptorSubtype == MS_EP_GENERAL || mDescriptorSubtype == MS_EP_GENERAL_2_0;
    }

    bool Decode( USBDescriptorReader& reader );
    void Encode( std::vector<U8>& out ) const;
};

#endif // USB_MIDI_DESCRIPTORS_H
