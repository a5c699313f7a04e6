#ifndef USB_LOOKUP_TABLES_H
#define USB_LOOKUP_TABLES_H

#include <string>
#include <vector>

#include <LogicPublicTypes.h>

#include "USBEnums.h"

template <size_t N>
inline size_t CountOf( const char* const ( & )[ N ] )
{
    return N;
}

const char* GetDescriptorName( U8 descriptor );
const char* GetUSBClassName( U8 classCode );
const char* GetCDCDescriptorSubtypeName( U8 subtype );
const char* GetEncryptionTypeName( U8 encryptionType );
const char* GetUVCInterfaceSubtypeName( U8 subtype );
const char* GetMIDIInterfaceSubtypeName( U8 subtype );
const char* GetMIDIEndpointSubtypeName( U8 subtype );
const char* GetMIDIJackTypeName( U8 jackType );

UACProtocol GetUACProtocol( U8 protocol );
const char* GetUACProtocolName( UACProtocol protocol );

// upper selects the UPPER_CASE form
const char* GetUACInterfaceName( UACInterface iface, bool upper );
const char* GetUACStreamingSubtypeName( U8 subtype, bool upper );

const char* GetUACTerminalTypeName( U16 terminalType );
const char* GetUACProcessTypeName( UACProtocol protocol, U16 processType );
const char* GetUACEffectTypeName( U16 effectType );
const char* GetUACFormatTypeName( U8 formatType );
const char* GetUACFormatTagName( U16 formatTag );
const char* GetUACLockDelayUnitsName( U8 units );
const char* GetUACControlSettingName( UACControlSetting setting );

// names of the channels set in a wChannelConfig (UAC1) or bmChannelConfig (UAC2 and later) bitmap
std::vector<std::string> GetUACChannelNames( UACProtocol protocol, U32 channelConfig );

// bit labels
extern const char* const UAC1_CHANNEL_NAMES[ 12 ];
extern const char* const UAC2_CHANNEL_NAMES[ 27 ];
extern const char* const UAC2_CLOCK_SOURCE_ATTRIBUTES[ 4 ];
extern const char* const UAC3_CLOCK_SOURCE_ATTRIBUTES[ 4 ];
extern const char* const UAC1_ENDPOINT_ATTRIBUTES[ 8 ];
extern const char* const UAC2_ENDPOINT_ATTRIBUTES[ 8 ];
extern const char* const UAC_MPEG_CAPABILITIES[ 8 ];
extern const char* const UAC_AC3_FEATURES[ 4 ];
extern const char* const UAC3_MULTI_FUNCTION_ALGORITHMS[ 6 ];
extern const char* const MIDI_ELEMENT_CAPABILITIES[ 12 ];

// control labels, one entry per logical control of the bmControls field
extern const char* const UAC2_INTERFACE_HEADER_BMCONTROLS[ 1 ];
extern const char* const UAC2_INPUT_TERMINAL_BMCONTROLS[ 6 ];
extern const char* const UAC3_INPUT_TERMINAL_BMCONTROLS[ 5 ];
extern const char* const UAC2_OUTPUT_TERMINAL_BMCONTROLS[ 5 ];
extern const char* const UAC3_OUTPUT_TERMINAL_BMCONTROLS[ 4 ];
extern const char* const UAC2_AS_INTERFACE_BMCONTROLS[ 2 ];
extern const char* const UAC3_AS_INTERFACE_BMCONTROLS[ 3 ];
extern const char* const UAC2_AS_ISO_ENDPOINT_BMCONTROLS[ 3 ];
extern const char* const UAC2_MIXER_UNIT_BMCONTROLS[ 4 ];
extern const char* const UAC3_MIXER_UNIT_BMCONTROLS[ 2 ];
extern const char* const UAC2_SELECTOR_UNIT_BMCONTROLS[ 1 ];
extern const char* const UAC1_FEATURE_UNIT_BMCONTROLS[ 13 ];
extern const char* const UAC2_FEATURE_UNIT_BMCONTROLS[ 15 ];
extern const char* const UAC2_EXTENSION_UNIT_BMCONTROLS[ 4 ];
extern const char* const UAC3_EXTENSION_UNIT_BMCONTROLS[ 2 ];
extern const char* const UAC2_CLOCK_SOURCE_BMCONTROLS[ 2 ];
extern const char* const UAC2_CLOCK_SELECTOR_BMCONTROLS[ 1 ];
extern const char* const UAC2_CLOCK_MULTIPLIER_BMCONTROLS[ 2 ];
extern const char* const UAC3_PROCESSING_UNIT_UP_DOWN_BMCONTROLS[ 3 ];
extern const char* const UAC3_PROCESSING_UNIT_STEREO_EXTENDER_BMCONTROLS[ 3 ];
extern const char* const UAC3_PROCESSING_UNIT_MULTI_FUNC_BMCONTROLS[ 2 ];

#endif // USB_LOOKUP_TABLES_H
