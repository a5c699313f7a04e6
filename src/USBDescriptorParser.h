#ifndef USB_DESCRIPTOR_PARSER_H
#define USB_DESCRIPTOR_PARSER_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <LogicPublicTypes.h>

#include "USBAudioDescriptors.h"
#include "USBClassDescriptors.h"
#include "USBDescriptors.h"
#include "USBMidiDescriptors.h"

// one descriptor of a configuration blob together with the context it was decoded in
struct USBParsedDescriptor
{
    size_t mOffset;        // position of bLength inside the blob
    std::vector<U8> mBytes; // as received

    // exactly one of these is set when the descriptor could be decoded
    std::unique_ptr<USBDescriptor> mDescriptor;
    std::unique_ptr<UACDescriptor> mAudio;
    std::unique_ptr<MIDIEndpointDescriptor> mMidiEndpoint;

    // decode or class context failure; the walk continues with the next descriptor
    USBDecodeError mError;

    bool mInInterface;
    U8 mInterfaceNumber;
    USBClassTriplet mTriplet;

    USBParsedDescriptor() : mOffset( 0 ), mInInterface( false ), mInterfaceNumber( 0 )
    {
    }

    U8 GetDescriptorType() const
    {
        return mBytes.size() > 1 ? mBytes[ 1 ] : DT_Undefined;
    }

    bool IsDecoded() const
    {
        return mDescriptor || mAudio || mMidiEndpoint;
    }

    void GetStringRefs( std::vector<USBStringRef*>& refs );

    // the wire form of whatever was decoded, the received bytes otherwise
    void Encode( std::vector<U8>& out ) const;
};

// string descriptors of a device by index
class USBStringTable
{
  private:
    typedef std::map<U8, std::string> USBStringContainer;

    USBStringContainer mStrings;

  public:
    void SetString( U8 index, const std::string& value )
    {
        mStrings[ index ] = value;
    }

    void AddStringDescriptor( U8 index, const USBStringDescriptor& desc )
    {
        SetString( index, desc.mValue );
    }

    bool GetString( U8 index, std::string& value ) const;

    size_t GetCount() const
    {
        return mStrings.size();
    }

    void Clear()
    {
        mStrings.clear();
    }
};

// Fills every unresolved reference the table has a string for. Index 0 means "no string"
// and is never looked up. Returns the number of references filled.
size_t ResolveStrings( const std::vector<USBStringRef*>& refs, const USBStringTable& table );

// Splits a configuration descriptor blob into descriptors and decodes each one in the
// context of the interface it belongs to.
class USBDescriptorParser
{
  private:
    // we store the class triplet of every interface seen so far
    typedef std::map<U8, USBClassTriplet> USBInterfaceClassesContainer;

    USBInterfaceClassesContainer mInterfaceClasses;

    bool mInInterface;
    U8 mInterfaceNumber; // the last parsed interface number

    bool mHasAudioControl;
    U8 mAudioControlProtocol; // bInterfaceProtocol of the last AudioControl interface

    std::vector<USBParsedDescriptor> mDescriptors;
    USBDecodeError mError; // why the walk stopped early

    void ParseInterface( USBParsedDescriptor& entry );
    void ParseClassSpecific( USBParsedDescriptor& entry );

    U8 GetAudioProtocol( const USBClassTriplet& triplet ) const;

  public:
    USBDescriptorParser()
    {
        ResetParser();
    }

    void ResetParser();

    // Returns false when the walk had to stop before the end of the blob (junk or a
    // bLength past the end). Descriptors decoded up to that point are kept.
    bool Parse( const U8* data, size_t size );

    bool Parse( const std::vector<U8>& data )
    {
        return Parse( data.empty() ? NULL : &data.front(), data.size() );
    }

    const std::vector<USBParsedDescriptor>& GetDescriptors() const
    {
        return mDescriptors;
    }

    std::vector<USBParsedDescriptor>& GetDescriptors()
    {
        return mDescriptors;
    }

    const USBDecodeError& GetError() const
    {
        return mError;
    }

    bool GetClassForInterface( U8 iface, USBClassTriplet& triplet ) const
    {
        USBInterfaceClassesContainer::const_iterator srch( mInterfaceClasses.find( iface ) );
        if( srch == mInterfaceClasses.end() )
            return false;

        triplet = srch->second;
        return true;
    }

    size_t ResolveStrings( const USBStringTable& table );

    void Encode( std::vector<U8>& out ) const;
};

#endif // USB_DESCRIPTOR_PARSER_H
