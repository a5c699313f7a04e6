#ifndef USB_TYPES_H
#define USB_TYPES_H

#include <string>
#include <vector>

#include <LogicPublicTypes.h>
#include <AnalyzerHelpers.h>

#include "USBEnums.h"

enum USBErrorKind
{
    ERR_None,
    ERR_InvalidArg, // below a decoder's minimum layout or bad entry conditions
    ERR_Truncated,  // a length or count points past the end of the data
};

// describes why a decode failed; the first failure wins
struct USBDecodeError
{
    USBErrorKind mKind;
    std::string mMessage;
    std::string mField;
    size_t mOffset;

    USBDecodeError()
    {
        Clear();
    }

    void Clear()
    {
        mKind = ERR_None;
        mMessage.clear();
        mField.clear();
        mOffset = 0;
    }

    bool IsSet() const
    {
        return mKind != ERR_None;
    }

    // always returns false so decoders can "return error.Set( ... );"
    bool Set( USBErrorKind kind, const std::string& message, const char* field = "", size_t offset = 0 );

    std::string GetText() const;
};

// string field referenced by index; the value is filled at most once from the device string table
struct USBStringRef
{
    U8 mIndex;
    std::string mValue;
    bool mResolved;

    USBStringRef() : mIndex( 0 ), mResolved( false )
    {
    }

    explicit USBStringRef( U8 index ) : mIndex( index ), mResolved( false )
    {
    }

    bool IsResolved() const
    {
        return mResolved;
    }

    // returns false if the value was already set
    bool Resolve( const std::string& value );
};

// BCD coded version, e.g. bcdUSB, bcdADC, bcdHID
struct USBVersion
{
    U16 mBCD;

    USBVersion() : mBCD( 0 )
    {
    }

    explicit USBVersion( U16 bcd ) : mBCD( bcd )
    {
    }

    U8 GetMajor() const
    {
        return ( ( mBCD >> 12 ) & 0x0f ) * 10 + ( ( mBCD >> 8 ) & 0x0f );
    }

    U8 GetMinor() const
    {
        return ( mBCD >> 4 ) & 0x0f;
    }

    U8 GetSubMinor() const
    {
        return mBCD & 0x0f;
    }

    std::string ToString() const;
};

// bounds checked little-endian cursor over one descriptor
class USBDescriptorReader
{
  private:
    const U8* mData;
    size_t mSize;
    size_t mOffset;
    size_t mBase; // offset of mData inside the enclosing descriptor, used in error reports

    USBDecodeError mError;

    bool Need( size_t numBytes, const char* field );
    bool NeedElements( size_t count, size_t elementSize, const char* field );
    U32 GetLE( size_t numBytes );

  public:
    USBDescriptorReader( const U8* data, size_t size, size_t base = 0 );
    explicit USBDescriptorReader( const std::vector<U8>& data, size_t base = 0 );

    bool Read( U8& val, const char* field );
    bool Read( U16& val, const char* field );
    bool Read( U32& val, const char* field );
    bool Read( U64& val, const char* field );
    bool Read24( U32& val, const char* field );
    bool ReadBCD( USBVersion& val, const char* field );
    bool ReadString( USBStringRef& val, const char* field );

    // count-driven arrays, checked as a whole before any element is read
    bool ReadArray( std::vector<U8>& vals, size_t count, const char* field );
    bool ReadArray( std::vector<U16>& vals, size_t count, const char* field );
    bool ReadArray( std::vector<U32>& vals, size_t count, const char* field );
    bool ReadArray24( std::vector<U32>& vals, size_t count, const char* field );

    // little-endian value of a run-time width (1 to 4 bytes), as in bControlSize driven bitmaps
    bool ReadSized( U32& val, size_t numBytes, const char* field );

    void ReadRemaining( std::vector<U8>& vals );
    bool Skip( size_t numBytes, const char* field );

    // look ahead relative to the current position without consuming
    bool Peek( size_t ahead, U8& val ) const;

    size_t GetOffset() const
    {
        return mOffset;
    }

    size_t GetRemaining() const
    {
        return mSize - mOffset;
    }

    bool AtEnd() const
    {
        return mOffset >= mSize;
    }

    const USBDecodeError& GetError() const
    {
        return mError;
    }

    bool Fail( USBErrorKind kind, const std::string& message, const char* field = "" );
};

// appends little-endian fields when encoding a decoded descriptor back to bytes
class USBDescriptorWriter
{
  private:
    std::vector<U8>& mOut;

    void PutLE( U32 val, size_t numBytes );

  public:
    explicit USBDescriptorWriter( std::vector<U8>& out ) : mOut( out )
    {
    }

    void Write( U8 val );
    void Write( U16 val );
    void Write( U32 val );
    void Write( U64 val );
    void Write24( U32 val );
    void Write( const USBVersion& val );
    void Write( const USBStringRef& val );
    void WriteArray( const std::vector<U8>& vals );
    void WriteArray( const std::vector<U16>& vals );
    void WriteArray( const std::vector<U32>& vals );
    void WriteArray24( const std::vector<U32>& vals );
    void WriteSized( U32 val, size_t numBytes );

    size_t GetSize() const
    {
        return mOut.size();
    }
};

// labels for each set bit of a bitmap, in bit order; bits without a label are skipped
std::vector<std::string> GetBitmapStrings( U64 bitmap, const char* const* labels, size_t numLabels );

// one entry of a bmControls interpretation
struct UACControlEntry
{
    std::string mLabel;
    UACControlSetting mSetting; // CS_Present for 1 bit per control fields
};

// interprets a control bitmap with 1 or 2 bits per control; the label table length is the control count
std::vector<UACControlEntry> GetBitmapControls( U32 controls, const char* const* labels, size_t numLabels, UACControlType type );

std::string int2str_sal( const U64 i, DisplayBase base, const int max_bits = 8 );

inline std::string int2str( const U64 i )
{
    return int2str_sal( i, Decimal, 64 );
}

std::string hex2str( const std::vector<U8>& data, const char* separator = " " );

#endif // USB_TYPES_H
