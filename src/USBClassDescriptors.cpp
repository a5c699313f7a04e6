#include <spdlog/spdlog.h>
#include <utility>

#include "USBClassDescriptors.h"
#include "USBLookupTables.h"

static bool ReadClassHeader( USBDescriptorReader& reader, U8& length, U8& descriptorType, U8& descriptorSubtype )
{
    return reader.Read( length, "bLength" ) && reader.Read( descriptorType, "bDescriptorType" ) &&
           reader.Read( descriptorSubtype, "bDescriptorSubtype" );
}

static void WriteClassHeader( USBDescriptorWriter& writer, U8 length, U8 descriptorType, U8 descriptorSubtype )
{
    writer.Write( length );
    writer.Write( descriptorType );
    writer.Write( descriptorSubtype );
}

// Moves a scratch cursor over the variable parts that precede an embedded string index.
// After fixedPrefix bytes, each region skips counts[n] fixed bytes, reads a count byte and skips
// that many elements (elementSize bytes for the first region, single bytes after that).
// Returns false when the descriptor ends before the index.
static bool LocateStringIndex( const std::vector<U8>& bytes, size_t fixedPrefix, const size_t* counts, size_t numCounts,
                               size_t elementSize, U8& index )
{
    USBDescriptorReader reader( bytes );
    if( !reader.Skip( fixedPrefix, "prefix" ) )
        return false;

    for( size_t cnt = 0; cnt < numCounts; ++cnt )
    {
        U8 count;
        if( !reader.Skip( counts[ cnt ], "fixed" ) || !reader.Read( count, "count" ) ||
            !reader.Skip( size_t( count ) * ( cnt == 0 ? elementSize : 1 ), "elements" ) )
            return false;
    }

    return reader.Read( index, "string index" );
}

// generic

bool USBGenericDescriptor::Decode( USBDescriptorReader& reader )
{
    if( reader.GetRemaining() < 3 )
        return reader.Fail( ERR_InvalidArg, "Class descriptor too short, must be at least 3 bytes" );

    size_t available = reader.GetRemaining();
    if( !ReadClassHeader( reader, mLength, mDescriptorType, mDescriptorSubtype ) )
        return false;

    if( mLength > available )
        return reader.Fail( ERR_InvalidArg,
                            "bLength " + int2str( mLength ) + " exceeds the " + int2str( available ) + " bytes available",
                            "bLength" );

    reader.ReadRemaining( mData );
    return true;
}

void USBGenericDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    WriteClassHeader( writer, mLength, mDescriptorType, mDescriptorSubtype );
    writer.WriteArray( mData );
}

std::unique_ptr<USBGenericDescriptor> USBGenericDescriptorDecode( const U8* data, size_t size, USBDecodeError& error )
{
    std::unique_ptr<USBGenericDescriptor> desc( new USBGenericDescriptor );
    USBDescriptorReader reader( data, size );
    if( !desc->Decode( reader ) )
    {
        error = reader.GetError();
        desc.reset();
    }

    return desc;
}

// HID

bool USBHIDDescriptor::Decode( USBDescriptorReader& reader )
{
    if( reader.GetRemaining() < 6 )
        return reader.Fail( ERR_InvalidArg, "HID descriptor too short" );

    if( !reader.Read( mLength, "bLength" ) || !reader.Read( mDescriptorType, "bDescriptorType" ) ||
        !reader.ReadBCD( mBcdHID, "bcdHID" ) || !reader.Read( mCountryCode, "bCountryCode" ) ||
        !reader.Read( mNumDescriptors, "bNumDescriptors" ) )
        return false;

    mDescriptors.clear();
    for( U8 cnt = 0; cnt < mNumDescriptors; ++cnt )
    {
        if( reader.GetRemaining() < 3 )
            return reader.Fail( ERR_InvalidArg, "HID class descriptor " + int2str( cnt ) + " runs past the end", "bDescriptorType" );

        std::vector<U8> record;
        if( !reader.ReadArray( record, 3, "bDescriptorType" ) )
            return false;

        USBHIDReportDescriptor report;
        USBDescriptorReader sub( record, reader.GetOffset() - 3 );
        if( !report.Decode( sub ) )
            return reader.Fail( sub.GetError().mKind, sub.GetError().mMessage, "bDescriptorType" );

        mDescriptors.push_back( report );
    }

    reader.ReadRemaining( mJunk );
    return true;
}

void USBHIDDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    writer.Write( mLength );
    writer.Write( mDescriptorType );
    writer.Write( mBcdHID );
    writer.Write( mCountryCode );
    writer.Write( mNumDescriptors );

    for( std::vector<USBHIDReportDescriptor>::const_iterator i( mDescriptors.begin() ); i != mDescriptors.end(); ++i )
        i->Encode( out );

    writer.WriteArray( mJunk );
}

// CCID

USBCCIDDescriptor::USBCCIDDescriptor()
    : mLength( 0 ), mDescriptorType( 0 ), mMaxSlotIndex( 0 ), mVoltageSupport( 0 ), mProtocols( 0 ), mDefaultClock( 0 ),
      mMaximumClock( 0 ), mNumClockSupported( 0 ), mDataRate( 0 ), mMaxDataRate( 0 ), mNumDataRatesSupported( 0 ),
      mMaxIFSD( 0 ), mSynchProtocols( 0 ), mMechanical( 0 ), mFeatures( 0 ), mMaxCCIDMessageLength( 0 ),
      mClassGetResponse( 0 ), mClassEnvelope( 0 ), mLcdLayoutLines( 0 ), mLcdLayoutChars( 0 ), mPINSupport( 0 ),
      mMaxCCIDBusySlots( 0 )
{
}

bool USBCCIDDescriptor::Decode( USBDescriptorReader& reader )
{
    if( reader.GetRemaining() < 54 )
        return reader.Fail( ERR_InvalidArg, "Smart card device class descriptor too short, must be 54 bytes" );

    bool ok = reader.Read( mLength, "bLength" ) && reader.Read( mDescriptorType, "bDescriptorType" ) &&
              reader.ReadBCD( mBcdCCID, "bcdCCID" ) && reader.Read( mMaxSlotIndex, "bMaxSlotIndex" ) &&
              reader.Read( mVoltageSupport, "bVoltageSupport" ) && reader.Read( mProtocols, "dwProtocols" ) &&
              reader.Read( mDefaultClock, "dwDefaultClock" ) && reader.Read( mMaximumClock, "dwMaximumClock" ) &&
              reader.Read( mNumClockSupported, "bNumClockSupported" ) && reader.Read( mDataRate, "dwDataRate" ) &&
              reader.Read( mMaxDataRate, "dwMaxDataRate" ) &&
              reader.Read( mNumDataRatesSupported, "bNumDataRatesSupported" ) && reader.Read( mMaxIFSD, "dwMaxIFSD" ) &&
              reader.Read( mSynchProtocols, "dwSynchProtocols" ) && reader.Read( mMechanical, "dwMechanical" ) &&
              reader.Read( mFeatures, "dwFeatures" ) && reader.Read( mMaxCCIDMessageLength, "dwMaxCCIDMessageLength" ) &&
              reader.Read( mClassGetResponse, "bClassGetResponse" ) && reader.Read( mClassEnvelope, "bClassEnvelope" ) &&
              reader.Read( mLcdLayoutLines, "wLcdLayout" ) && reader.Read( mLcdLayoutChars, "wLcdLayout" ) &&
              reader.Read( mPINSupport, "bPINSupport" ) && reader.Read( mMaxCCIDBusySlots, "bMaxCCIDBusySlots" );

    if( !ok )
        return false;

    reader.ReadRemaining( mJunk );
    return true;
}

void USBCCIDDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    writer.Write( mLength );
    writer.Write( mDescriptorType );
    writer.Write( mBcdCCID );
    writer.Write( mMaxSlotIndex );
    writer.Write( mVoltageSupport );
    writer.Write( mProtocols );
    writer.Write( mDefaultClock );
    writer.Write( mMaximumClock );
    writer.Write( mNumClockSupported );
    writer.Write( mDataRate );
    writer.Write( mMaxDataRate );
    writer.Write( mNumDataRatesSupported );
    writer.Write( mMaxIFSD );
    writer.Write( mSynchProtocols );
    writer.Write( mMechanical );
    writer.Write( mFeatures );
    writer.Write( mMaxCCIDMessageLength );
    writer.Write( mClassGetResponse );
    writer.Write( mClassEnvelope );
    writer.Write( mLcdLayoutLines );
    writer.Write( mLcdLayoutChars );
    writer.Write( mPINSupport );
    writer.Write( mMaxCCIDBusySlots );
    writer.WriteArray( mJunk );
}

// Printer

bool USBPrinterReportDescriptor::Decode( USBDescriptorReader& reader )
{
    if( reader.GetRemaining() < 6 )
        return reader.Fail( ERR_InvalidArg, "Printer descriptor record too short, must be at least 6 bytes" );

    if( !reader.Read( mDescriptorType, "bDescriptorType" ) || !reader.Read( mLength, "bLength" ) ||
        !reader.Read( mCapabilities, "wCapabilities" ) || !reader.Read( mVersionsSupported, "bVersionsSupported" ) ||
        !reader.ReadString( mUUID, "iUUID" ) )
        return false;

    reader.ReadRemaining( mData );
    return true;
}

void USBPrinterReportDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    writer.Write( mDescriptorType );
    writer.Write( mLength );
    writer.Write( mCapabilities );
    writer.Write( mVersionsSupported );
    writer.Write( mUUID );
    writer.WriteArray( mData );
}

bool USBPrinterDescriptor::Decode( USBDescriptorReader& reader )
{
    if( reader.GetRemaining() < 4 )
        return reader.Fail( ERR_InvalidArg, "Printer descriptor too short" );

    if( !reader.Read( mLength, "bLength" ) || !reader.Read( mDescriptorType, "bDescriptorType" ) ||
        !reader.Read( mReleaseNumber, "bcdReleaseNumber" ) || !reader.Read( mNumDescriptors, "bcdNumDescriptors" ) )
        return false;

    mDescriptors.clear();
    for( U8 cnt = 0; cnt < mNumDescriptors; ++cnt )
    {
        // the record length byte counts the bytes after itself
        U8 claimed = 0;
        if( !reader.Peek( 1, claimed ) )
            return reader.Fail( ERR_InvalidArg, "Printer descriptor record " + int2str( cnt ) + " is missing", "bLength" );

        size_t recordLength = size_t( claimed ) + 2;
        if( recordLength < 6 || recordLength > reader.GetRemaining() )
            return reader.Fail( ERR_InvalidArg,
                                "Printer descriptor record " + int2str( cnt ) + " claims " + int2str( recordLength ) +
                                    " bytes, " + int2str( reader.GetRemaining() ) + " left",
                                "bLength" );

        size_t base = reader.GetOffset();
        std::vector<U8> record;
        if( !reader.ReadArray( record, recordLength, "record" ) )
            return false;

        USBPrinterReportDescriptor report;
        USBDescriptorReader sub( record, base );
        if( !report.Decode( sub ) )
            return reader.Fail( sub.GetError().mKind, sub.GetError().mMessage, "record" );

        mDescriptors.push_back( report );
    }

    reader.ReadRemaining( mJunk );
    return true;
}

void USBPrinterDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    writer.Write( mLength );
    writer.Write( mDescriptorType );
    writer.Write( mReleaseNumber );
    writer.Write( mNumDescriptors );

    for( std::vector<USBPrinterReportDescriptor>::const_iterator i( mDescriptors.begin() ); i != mDescriptors.end(); ++i )
        i->Encode( out );

    writer.WriteArray( mJunk );
}

void USBPrinterDescriptor::GetStringRefs( std::vector<USBStringRef*>& refs )
{
    for( std::vector<USBPrinterReportDescriptor>::iterator i( mDescriptors.begin() ); i != mDescriptors.end(); ++i )
        refs.push_back( &i->mUUID );
}

// CDC

bool USBCommunicationDescriptor::Decode( USBDescriptorReader& reader )
{
    if( reader.GetRemaining() < 4 )
        return reader.Fail( ERR_InvalidArg, "Communication descriptor too short" );

    if( !ReadClassHeader( reader, mLength, mDescriptorType, mDescriptorSubtype ) )
        return false;

    reader.ReadRemaining( mData );

    size_t position = 0;
    switch( mDescriptorSubtype )
    {
    case DST_COUNTRY_SELECTION: // iCountryCodeRelDate
    case DST_ETHERNET_NETWORKING: // iMACAddress
        position = 3;
        break;
    case DST_NETWORK_CHANNEL_TERMINAL: // iChannelName
        position = 4;
        break;
    case DST_COMMAND_SET: // iCommandSet
        position = 5;
        break;
    }

    mHasString = position != 0 && position - 3 < mData.size();
    if( mHasString )
        mString = USBStringRef( mData[ position - 3 ] );

    return true;
}

void USBCommunicationDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    WriteClassHeader( writer, mLength, mDescriptorType, mDescriptorSubtype );
    writer.WriteArray( mData );
}

// UVC

bool USBVideoDescriptor::Decode( USBDescriptorReader& reader )
{
    if( reader.GetRemaining() < 4 )
        return reader.Fail( ERR_InvalidArg, "Video control descriptor too short" );

    if( !ReadClassHeader( reader, mLength, mDescriptorType, mDescriptorSubtype ) )
        return false;

    reader.ReadRemaining( mData );

    std::vector<U8> bytes;
    Encode( bytes );

    U8 index = 0;
    switch( mDescriptorSubtype )
    {
    case VC_INPUT_TERMINAL: // iTerminal
        mHasString = LocateStringIndex( bytes, 7, NULL, 0, 1, index );
        break;
    case VC_OUTPUT_TERMINAL: // iTerminal
        mHasString = LocateStringIndex( bytes, 8, NULL, 0, 1, index );
        break;
    case VC_SELECTOR_UNIT: // iSelector after baSourceID
    {
        const size_t counts[] = { 0 };
        mHasString = LocateStringIndex( bytes, 4, counts, 1, 1, index );
        break;
    }
    case VC_PROCESSING_UNIT: // iProcessing after bmControls
    {
        const size_t counts[] = { 0 };
        mHasString = LocateStringIndex( bytes, 7, counts, 1, 1, index );
        break;
    }
    case VC_EXTENSION_UNIT: // iExtension after baSourceID and bmControls
    {
        const size_t counts[] = { 0, 0 };
        mHasString = LocateStringIndex( bytes, 21, counts, 2, 1, index );
        break;
    }
    case VC_ENCODING_UNIT: // iEncoding
        mHasString = LocateStringIndex( bytes, 5, NULL, 0, 1, index );
        break;
    default:
        mHasString = false;
        break;
    }

    if( mHasString )
        mString = USBStringRef( index );

    return true;
}

void USBVideoDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    WriteClassHeader( writer, mLength, mDescriptorType, mDescriptorSubtype );
    writer.WriteArray( mData );
}

// MIDI streaming

bool USBMidiDescriptor::Decode( USBDescriptorReader& reader )
{
    if( reader.GetRemaining() < 4 )
        return reader.Fail( ERR_InvalidArg, "MIDI streaming descriptor too short" );

    size_t base = reader.GetOffset();
    if( !ReadClassHeader( reader, mLength, mDescriptorType, mDescriptorSubtype ) )
        return false;

    reader.ReadRemaining( mData );

    std::vector<U8> bytes;
    Encode( bytes );

    U8 index = 0;
    switch( mDescriptorSubtype )
    {
    case MS_MIDI_IN_JACK: // iJack
        mHasString = LocateStringIndex( bytes, 5, NULL, 0, 1, index );
        break;
    case MS_MIDI_OUT_JACK: // iJack after the source pin pairs
    {
        const size_t counts[] = { 0 };
        mHasString = LocateStringIndex( bytes, 5, counts, 1, 2, index );
        break;
    }
    case MS_ELEMENT: // iElement after the source pin pairs and bmElementCaps
    {
        const size_t counts[] = { 0, 3 };
        mHasString = LocateStringIndex( bytes, 4, counts, 2, 2, index );
        break;
    }
    default:
        mHasString = false;
        break;
    }

    if( mHasString )
        mString = USBStringRef( index );

    mBodyError.Clear();
    mBody = MIDIEntityDecode( mDescriptorSubtype, mData.empty() ? NULL : &mData.front(), mData.size(), base + 3, mBodyError );

    return true;
}

void USBMidiDescriptor::Encode( std::vector<U8>& out ) const
{
    USBDescriptorWriter writer( out );
    WriteClassHeader( writer, mLength, mDescriptorType, mDescriptorSubtype );
    writer.WriteArray( mData );
}

void USBMidiDescriptor::GetStringRefs( std::vector<USBStringRef*>& refs )
{
    if( mBody )
        mBody->GetStringRefs( refs );
    else if( mHasString )
        refs.push_back( &mString );
}

// class context

template <class T>
static std::unique_ptr<USBClassDescriptor> DecodeSpecialized( std::unique_ptr<T> owner, const std::vector<U8>& bytes,
                                                             USBDecodeError& error )
{
    USBDescriptorReader reader( bytes );
    if( !owner->Decode( reader ) )
    {
        error = reader.GetError();
        if( error.mKind == ERR_Truncated )
            error.mKind = ERR_InvalidArg;

        return std::unique_ptr<USBClassDescriptor>();
    }

    return std::unique_ptr<USBClassDescriptor>( owner.release() );
}

std::unique_ptr<USBClassDescriptor> SpecializeClassDescriptor( const USBGenericDescriptor& generic,
                                                               const USBClassTriplet& triplet, USBDecodeError& error )
{
    std::vector<U8> bytes = generic.ToBytes();

    switch( triplet.mClass )
    {
    case CC_HID:
        spdlog::debug( "class descriptor 0x{:02x} specialized as HID", generic.mDescriptorType );
        return DecodeSpecialized( std::unique_ptr<USBHIDDescriptor>( new USBHIDDescriptor ), bytes, error );

    case CC_SmartCard:
        spdlog::debug( "class descriptor 0x{:02x} specialized as CCID", generic.mDescriptorType );
        return DecodeSpecialized( std::unique_ptr<USBCCIDDescriptor>( new USBCCIDDescriptor ), bytes, error );

    case CC_Printer:
        spdlog::debug( "class descriptor 0x{:02x} specialized as printer", generic.mDescriptorType );
        return DecodeSpecialized( std::unique_ptr<USBPrinterDescriptor>( new USBPrinterDescriptor ), bytes, error );

    case CC_CommunicationsAndCDCControl:
    case CC_CDCData:
        spdlog::debug( "class descriptor 0x{:02x} specialized as CDC {}", generic.mDescriptorType,
                       GetCDCDescriptorSubtypeName( generic.mDescriptorSubtype ) );
        return DecodeSpecialized( std::unique_ptr<USBCommunicationDescriptor>( new USBCommunicationDescriptor ), bytes, error );

    case CC_Audio:
        if( triplet.mSubClass == UAC_SUBCLASS_MIDISTREAMING )
        {
            std::unique_ptr<USBMidiDescriptor> midi( new USBMidiDescriptor );
            midi->mProtocol = triplet.mProtocol;
            spdlog::debug( "class descriptor 0x{:02x} specialized as MIDI {}", generic.mDescriptorType,
                           GetMIDIInterfaceSubtypeName( generic.mDescriptorSubtype ) );
            return DecodeSpecialized( std::move( midi ), bytes, error );
        }
        break;

    case CC_Video:
        if( triplet.mSubClass == 1 )
        {
            std::unique_ptr<USBVideoDescriptor> video( new USBVideoDescriptor );
            video->mProtocol = triplet.mProtocol;
            spdlog::debug( "class descriptor 0x{:02x} specialized as UVC {}", generic.mDescriptorType,
                           GetUVCInterfaceSubtypeName( generic.mDescriptorSubtype ) );
            return DecodeSpecialized( std::move( video ), bytes, error );
        }
        break;
    }

    std::unique_ptr<USBGenericDescriptor> tagged( new USBGenericDescriptor( generic ) );
    tagged->mHasTriplet = true;
    tagged->mTriplet = triplet;
    return std::unique_ptr<USBClassDescriptor>( tagged.release() );
}

bool ApplyClassContext( std::unique_ptr<USBDescriptor>& descriptor, const USBClassTriplet& triplet, USBDecodeError& error )
{
    if( !descriptor || descriptor->GetKind() != DK_Class )
        return true;

    const USBClassDescriptor* cls = static_cast<const USBClassDescriptor*>( descriptor.get() );
    if( cls->GetClassKind() != CDK_Generic )
        return true;

    const USBGenericDescriptor* generic = static_cast<const USBGenericDescriptor*>( cls );
    if( generic->mHasTriplet )
        return true;

    std::unique_ptr<USBClassDescriptor> specialized = SpecializeClassDescriptor( *generic, triplet, error );
    if( !specialized )
    {
        spdlog::warn( "class descriptor 0x{:02x} not specialized for class {}: {}", generic->mDescriptorType,
                      GetUSBClassName( triplet.mClass ), error.GetText() );
        return false;
    }

    descriptor.reset( specialized.release() );
    return true;
}
