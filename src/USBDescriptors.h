#ifndef USB_DESCRIPTORS_H
#define USB_DESCRIPTORS_H

#include <memory>
#include <string>
#include <vector>

#include <LogicPublicTypes.h>

#include "USBEnums.h"
#include "USBTypes.h"

// one decoded entry of a standard descriptor stream
class USBDescriptor
{
  public:
    virtual ~USBDescriptor()
    {
    }

    virtual USBDescriptorKind GetKind() const = 0;
    virtual U8 GetDescriptorType() const = 0;

    // appends the wire form
    virtual void Encode( std::vector<U8>& out ) const = 0;

    // string fields that can be filled from the device string table
    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
    }

    std::vector<U8> ToBytes() const
    {
        std::vector<U8> ret_val;
        Encode( ret_val );
        return ret_val;
    }
};

// markers, unknown type codes and junk; the bytes are kept as received
class USBRawDescriptor : public USBDescriptor
{
  public:
    USBDescriptorKind mKind;
    std::vector<U8> mData; // including bLength and bDescriptorType

    USBRawDescriptor( USBDescriptorKind kind, const U8* data, size_t size ) : mKind( kind ), mData( data, data + size )
    {
    }

    virtual USBDescriptorKind GetKind() const
    {
        return mKind;
    }

    virtual U8 GetDescriptorType() const
    {
        return mData.size() > 1 ? mData[ 1 ] : DT_Undefined;
    }

    virtual void Encode( std::vector<U8>& out ) const;
};

class USBStringDescriptor : public USBDescriptor
{
  public:
    U8 mLength;
    U8 mDescriptorType;
    std::vector<U8> mData; // UTF-16LE code units, or the LANGID list of string 0
    std::string mValue;    // mData as UTF-8

    USBStringDescriptor() : mLength( 0 ), mDescriptorType( DT_STRING )
    {
    }

    bool Decode( USBDescriptorReader& reader );

    virtual USBDescriptorKind GetKind() const
    {
        return DK_String;
    }

    virtual U8 GetDescriptorType() const
    {
        return mDescriptorType;
    }

    virtual void Encode( std::vector<U8>& out ) const;
};

class USBInterfaceAssociationDescriptor : public USBDescriptor
{
  public:
    U8 mLength;
    U8 mDescriptorType;
    U8 mFirstInterface;
    U8 mInterfaceCount;
    U8 mFunctionClass;
    U8 mFunctionSubClass;
    U8 mFunctionProtocol;
    USBStringRef mFunction;
    std::vector<U8> mJunk;

    USBInterfaceAssociationDescriptor()
        : mLength( 0 ), mDescriptorType( DT_INTERFACE_ASSOCIATION ), mFirstInterface( 0 ), mInterfaceCount( 0 ),
          mFunctionClass( 0 ), mFunctionSubClass( 0 ), mFunctionProtocol( 0 )
    {
    }

    bool Decode( USBDescriptorReader& reader );

    virtual USBDescriptorKind GetKind() const
    {
        return DK_InterfaceAssociation;
    }

    virtual U8 GetDescriptorType() const
    {
        return mDescriptorType;
    }

    virtual void Encode( std::vector<U8>& out ) const;

    virtual void GetStringRefs( std::vector<USBStringRef*>& refs )
    {
        refs.push_back( &mFunction );
    }
};

class USBSecurityDescriptor : public USBDescriptor
{
  public:
    U8 mLength;
    U8 mDescriptorType;
    U16 mTotalLength;
    U8 mNumEncryptionTypes;
    std::vector<U8> mJunk;

    USBSecurityDescriptor() : mLength( 0 ), mDescriptorType( DT_SECURITY ), mTotalLength( 0 ), mNumEncryptionTypes( 0 )
    {
    }

    bool Decode( USBDescriptorReader& reader );

    virtual USBDescriptorKind GetKind() const
    {
        return DK_Security;
    }

    virtual U8 GetDescriptorType() const
    {
        return mDescriptorType;
    }

    virtual void Encode( std::vector<U8>& out ) const;
};

class USBEncryptionDescriptor : public USBDescriptor
{
  public:
    U8 mLength;
    U8 mDescriptorType;
    U8 mEncryptionType; // USBEncryptionType, values above ET_Rsa1 are reserved
    U8 mEncryptionValue;
    U8 mAuthKeyIndex;
    std::vector<U8> mJunk;

    USBEncryptionDescriptor()
        : mLength( 0 ), mDescriptorType( DT_ENCRYPTION_TYPE ), mEncryptionType( ET_Unsecure ), mEncryptionValue( 0 ),
          mAuthKeyIndex( 0 )
    {
    }

    bool Decode( USBDescriptorReader& reader );

    USBEncryptionType GetEncryptionType() const
    {
        return mEncryptionType <= ET_Rsa1 ? USBEncryptionType( mEncryptionType ) : ET_Reserved;
    }

    virtual USBDescriptorKind GetKind() const
    {
        return DK_Encryption;
    }

    virtual U8 GetDescriptorType() const
    {
        return mDescriptorType;
    }

    virtual void Encode( std::vector<U8>& out ) const;
};

class USBSSEndpointCompanionDescriptor : public USBDescriptor
{
  public:
    U8 mLength;
    U8 mDescriptorType;
    U8 mMaxBurst;
    U8 mAttributes;
    U16 mBytesPerInterval;
    std::vector<U8> mJunk;

    USBSSEndpointCompanionDescriptor()
        : mLength( 0 ), mDescriptorType( DT_SS_ENDPOINT_COMPANION ), mMaxBurst( 0 ), mAttributes( 0 ), mBytesPerInterval( 0 )
    {
    }

    bool Decode( USBDescriptorReader& reader );

    virtual USBDescriptorKind GetKind() const
    {
        return DK_SSEndpointCompanion;
    }

    virtual U8 GetDescriptorType() const
    {
        return mDescriptorType;
    }

    virtual void Encode( std::vector<U8>& out ) const;
};

// HID class descriptor reference: bDescriptorType and wDescriptorLength, no bLength or subtype.
// In a standard stream the envelope is preceded by bLength, which is kept for the round trip.
class USBHIDReportDescriptor : public USBDescriptor
{
  public:
    bool mHasLengthPrefix;
    U8 mBLength;
    U8 mDescriptorType;
    U16 mLength; // wDescriptorLength, the size of the report descriptor itself
    std::vector<U8> mData;

    USBHIDReportDescriptor() : mHasLengthPrefix( false ), mBLength( 0 ), mDescriptorType( DT_HID_REPORT ), mLength( 0 )
    {
    }

    bool Decode( USBDescriptorReader& reader );

    virtual USBDescriptorKind GetKind() const
    {
        return DK_HIDReport;
    }

    virtual U8 GetDescriptorType() const
    {
        return mDescriptorType;
    }

    virtual void Encode( std::vector<U8>& out ) const;
};

// the fields the configuration walker needs from an interface descriptor
struct USBInterfaceDescriptor
{
    U8 mLength;
    U8 mDescriptorType;
    U8 mInterfaceNumber;
    U8 mAlternateSetting;
    U8 mNumEndpoints;
    U8 mInterfaceClass;
    U8 mInterfaceSubClass;
    U8 mInterfaceProtocol;
    USBStringRef mInterface;
    std::vector<U8> mJunk; // bytes bLength declares past iInterface

    USBInterfaceDescriptor()
        : mLength( 0 ), mDescriptorType( DT_INTERFACE ), mInterfaceNumber( 0 ), mAlternateSetting( 0 ), mNumEndpoints( 0 ),
          mInterfaceClass( 0 ), mInterfaceSubClass( 0 ), mInterfaceProtocol( 0 )
    {
    }

    bool Decode( USBDescriptorReader& reader );
    void Encode( std::vector<U8>& out ) const;
};

// Decodes one descriptor of a standard stream. Device, configuration, interface and endpoint
// descriptors come back as generic class descriptors (DK_Class) waiting for class context.
// Returns a null pointer and fills error when the bytes can not be decoded.
std::unique_ptr<USBDescriptor> USBDescriptorDecode( const U8* data, size_t size, USBDecodeError& error );

inline std::unique_ptr<USBDescriptor> USBDescriptorDecode( const std::vector<U8>& data, USBDecodeError& error )
{
    return USBDescriptorDecode( data.empty() ? NULL : &data.front(), data.size(), error );
}

#endif // USB_DESCRIPTORS_H
