#include "USBLookupTables.h"

const char* GetDescriptorName( U8 descriptor )
{
	switch (descriptor)
	{
	case DT_DEVICE:							return "DEVICE";
	case DT_CONFIGURATION:					return "CONFIGURATION";
	case DT_STRING:							return "STRING";
	case DT_INTERFACE:						return "INTERFACE";
	case DT_ENDPOINT:						return "ENDPOINT";
	case DT_DEVICE_QUALIFIER:				return "DEVICE_QUALIFIER";
	case DT_OTHER_SPEED_CONFIGURATION:		return "OTHER_SPEED_CONFIGURATION";
	case DT_INTERFACE_POWER:				return "INTERFACE_POWER";
	case DT_OTG:							return "OTG";
	case DT_DEBUG:							return "DEBUG";
	case DT_INTERFACE_ASSOCIATION:			return "INTERFACE_ASSOCIATION";
	case DT_SECURITY:						return "SECURITY";
	case DT_KEY:							return "KEY";
	case DT_ENCRYPTION_TYPE:				return "ENCRYPTION_TYPE";
	case DT_BOS:							return "BOS";
	case DT_DEVICE_CAPABILITY:				return "DEVICE_CAPABILITY";
	case DT_WIRELESS_ENDPOINT_COMPANION:	return "WIRELESS_ENDPOINT_COMPANION";
	case DT_HID:							return "HID";
	case DT_HID_REPORT:						return "HID_REPORT";
	case DT_HID_PHYS:						return "HID_PHYSICAL";
	case DT_CS_INTERFACE:					return "CS_INTERFACE";
	case DT_CS_ENDPOINT:					return "CS_ENDPOINT";
	case DT_HUB:							return "HUB";
	case DT_SUPERSPEED_HUB:					return "SUPERSPEED_HUB";
	case DT_SS_ENDPOINT_COMPANION:			return "SS_ENDPOINT_COMPANION";
	case DT_SSP_ISOC_ENDPOINT_COMPANION:	return "SSP_ISOC_ENDPOINT_COMPANION";
	}

	return "<unknown>";
}

const char* GetUSBClassName( U8 classCode )
{
	switch (classCode)
	{
	case CC_DeferredToInterface:			return "Use class code info from Interface Descriptors";
	case CC_Audio:							return "Audio";
	case CC_CommunicationsAndCDCControl:	return "Communications and CDC Control";
	case CC_HID:							return "Human Interface Device";
	case CC_Physical:						return "Physical";
	case CC_Image:							return "Image";
	case CC_Printer:						return "Printer";
	case CC_MassStorage:					return "Mass Storage";
	case CC_Hub:							return "Hub";
	case CC_CDCData:						return "CDC-Data";
	case CC_SmartCard:						return "Smart Card";
	case CC_ContentSecurity:				return "Content Security";
	case CC_Video:							return "Video";
	case CC_PersonalHealthcare:				return "Personal Healthcare";
	case CC_AudioVideo:						return "Audio/Video Devices";
	case CC_Billboard:						return "Billboard Device";
	case CC_USBTypeCBridge:					return "USB Type-C Bridge";
	case CC_Diagnostic:						return "Diagnostic Device";
	case CC_WirelessController:				return "Wireless Controller";
	case CC_Miscellaneous:					return "Miscellaneous";
	case CC_ApplicationSpecific:			return "Application Specific";
	case CC_VendorSpecific:					return "Vendor Specific";
	}

	return "<unknown>";
}

const char* GetCDCDescriptorSubtypeName( U8 subtype )
{
	switch (subtype)
	{
	case DST_HEADER:								return "Header";
	case DST_CALL_MANAGEMENT:						return "Call Management";
	case DST_ABSTRACT_CONTROL_MANAGEMENT:			return "Abstract Control Management";
	case DST_DIRECT_LINE_MANAGEMENT:				return "Direct Line Management";
	case DST_TELEPHONE_RINGER:						return "Telephone Ringer";
	case DST_TELEPHONE_CALL_AND_LINE_STATE:			return "Telephone Call and Line State Reporting Capabilities";
	case DST_UNION:									return "Union";
	case DST_COUNTRY_SELECTION:						return "Country Selection";
	case DST_TELEPHONE_OPERATIONAL_MODES:			return "Telephone Operational Modes";
	case DST_USB_TERMINAL:							return "USB Terminal";
	case DST_NETWORK_CHANNEL_TERMINAL:				return "Network Channel Terminal";
	case DST_PROTOCOL_UNIT:							return "Protocol Unit";
	case DST_EXTENSION_UNIT:						return "Extension Unit";
	case DST_MULTI_CHANNEL_MANAGEMENT:				return "Multi-Channel Management";
	case DST_CAPI_CONTROL_MANAGEMENT:				return "CAPI Control Management";
	case DST_ETHERNET_NETWORKING:					return "Ethernet Networking";
	case DST_ATM_NETWORKING:						return "ATM Networking";
	case DST_WIRELESS_HANDSET_CONTROL_MODEL:		return "Wireless Handset Control Model";
	case DST_MOBILE_DIRECT_LINE_MODEL_FUNCTIONAL:	return "Mobile Direct Line Model Functional";
	case DST_MOBILE_DIRECT_LINE_MODEL_DETAIL:		return "MDLM Detail";
	case DST_DEVICE_MANAGEMENT_MODEL:				return "Device Management Model";
	case DST_OBEX:									return "OBEX";
	case DST_COMMAND_SET:							return "Command Set";
	case DST_COMMAND_SET_DETAIL:					return "Command Set Detail";
	case DST_TELEPHONE_CONTROL_MODEL:				return "Telephone Control Model";
	case DST_OBEX_SERVICE_IDENTIFIER:				return "OBEX Service Identifier";
	case DST_NCM:									return "NCM";
	case DST_MBIM:									return "MBIM";
	case DST_MBIM_EXTENDED:							return "MBIM Extended";
	}

	return "<unknown>";
}

const char* GetEncryptionTypeName( U8 encryptionType )
{
	switch (encryptionType)
	{
	case ET_Unsecure:	return "Unsecure";
	case ET_Wired:		return "Wired";
	case ET_Ccm1:		return "CCM_1";
	case ET_Rsa1:		return "RSA_1";
	}

	return "Reserved";
}

const char* GetUVCInterfaceSubtypeName( U8 subtype )
{
	switch (subtype)
	{
	case VC_HEADER:				return "VC_HEADER";
	case VC_INPUT_TERMINAL:		return "VC_INPUT_TERMINAL";
	case VC_OUTPUT_TERMINAL:	return "VC_OUTPUT_TERMINAL";
	case VC_SELECTOR_UNIT:		return "VC_SELECTOR_UNIT";
	case VC_PROCESSING_UNIT:	return "VC_PROCESSING_UNIT";
	case VC_EXTENSION_UNIT:		return "VC_EXTENSION_UNIT";
	case VC_ENCODING_UNIT:		return "VC_ENCODING_UNIT";
	}

	return "VC_DESCRIPTOR_UNDEFINED";
}

const char* GetMIDIInterfaceSubtypeName( U8 subtype )
{
	switch (subtype)
	{
	case MS_HEADER:			return "HEADER";
	case MS_MIDI_IN_JACK:	return "MIDI_IN_JACK";
	case MS_MIDI_OUT_JACK:	return "MIDI_OUT_JACK";
	case MS_ELEMENT:		return "ELEMENT";
	}

	return "UNDEFINED";
}

const char* GetMIDIEndpointSubtypeName( U8 subtype )
{
	switch (subtype)
	{
	case MS_EP_GENERAL:		return "GENERAL";
	case MS_EP_GENERAL_2_0:	return "GENERAL_2.0";
	}

	return "Invalid";
}

const char* GetMIDIJackTypeName( U8 jackType )
{
	switch (jackType)
	{
	case JT_UNDEFINED:	return "Undefined";
	case JT_EMBEDDED:	return "Embedded";
	case JT_EXTERNAL:	return "External";
	}

	return "Invalid";
}

UACProtocol GetUACProtocol( U8 protocol )
{
	switch (protocol)
	{
	case UAC_PROTOCOL_1:	return UAC_PROTOCOL_1;
	case UAC_PROTOCOL_2:	return UAC_PROTOCOL_2;
	case UAC_PROTOCOL_3:	return UAC_PROTOCOL_3;
	}

	return UAC_PROTOCOL_Unknown;
}

const char* GetUACProtocolName( UACProtocol protocol )
{
	switch (protocol)
	{
	case UAC_PROTOCOL_1:	return "UAC1";
	case UAC_PROTOCOL_2:	return "UAC2";
	case UAC_PROTOCOL_3:	return "UAC3";
	default:				break;
	}

	return "Unknown";
}

const char* GetUACInterfaceName( UACInterface iface, bool upper )
{
	switch (iface)
	{
	case UACI_Undefined:			return upper ? "UNDEFINED" : "Undefined";
	case UACI_Header:				return upper ? "HEADER" : "Header";
	case UACI_InputTerminal:		return upper ? "INPUT_TERMINAL" : "Input Terminal";
	case UACI_OutputTerminal:		return upper ? "OUTPUT_TERMINAL" : "Output Terminal";
	case UACI_ExtendedTerminal:		return upper ? "EXTENDED_TERMINAL" : "Extended Terminal";
	case UACI_MixerUnit:			return upper ? "MIXER_UNIT" : "Mixer Unit";
	case UACI_SelectorUnit:			return upper ? "SELECTOR_UNIT" : "Selector Unit";
	case UACI_FeatureUnit:			return upper ? "FEATURE_UNIT" : "Feature Unit";
	case UACI_EffectUnit:			return upper ? "EFFECT_UNIT" : "Effect Unit";
	case UACI_ProcessingUnit:		return upper ? "PROCESSING_UNIT" : "Processing Unit";
	case UACI_ExtensionUnit:		return upper ? "EXTENSION_UNIT" : "Extension Unit";
	case UACI_ClockSource:			return upper ? "CLOCK_SOURCE" : "Clock Source";
	case UACI_ClockSelector:		return upper ? "CLOCK_SELECTOR" : "Clock Selector";
	case UACI_ClockMultiplier:		return upper ? "CLOCK_MULTIPLIER" : "Clock Multiplier";
	case UACI_SampleRateConverter:	return upper ? "SAMPLE_RATE_CONVERTER" : "Sample Rate Converter";
	case UACI_Connectors:			return upper ? "CONNECTORS" : "Connectors";
	case UACI_PowerDomain:			return upper ? "POWER_DOMAIN" : "Power Domain";
	}

	return upper ? "UNDEFINED" : "Undefined";
}

const char* GetUACStreamingSubtypeName( U8 subtype, bool upper )
{
	switch (subtype)
	{
	case UACS_General:			return upper ? "AS_GENERAL" : "General";
	case UACS_FormatType:		return upper ? "FORMAT_TYPE" : "Format Type";
	case UACS_FormatSpecific:	return upper ? "FORMAT_SPECIFIC" : "Format Specific";
	}

	return upper ? "UNDEFINED" : "Undefined";
}

const char* GetUACTerminalTypeName( U16 terminalType )
{
	switch (terminalType)
	{
	case 0x0100:	return "USB Undefined";
	case 0x0101:	return "USB Streaming";
	case 0x01ff:	return "USB Vendor Specific";
	case 0x0200:	return "Input Undefined";
	case 0x0201:	return "Microphone";
	case 0x0202:	return "Desktop Microphone";
	case 0x0203:	return "Personal Microphone";
	case 0x0204:	return "Omni-directional Microphone";
	case 0x0205:	return "Microphone Array";
	case 0x0206:	return "Processing Microphone Array";
	case 0x0300:	return "Output Undefined";
	case 0x0301:	return "Speaker";
	case 0x0302:	return "Headphones";
	case 0x0303:	return "Head Mounted Display Audio";
	case 0x0304:	return "Desktop Speaker";
	case 0x0305:	return "Room Speaker";
	case 0x0306:	return "Communication Speaker";
	case 0x0307:	return "Low Frequency Effects Speaker";
	case 0x0400:	return "Bidirectional Undefined";
	case 0x0401:	return "Handset";
	case 0x0402:	return "Headset";
	case 0x0403:	return "Speakerphone, no echo reduction";
	case 0x0404:	return "Echo-suppressing speakerphone";
	case 0x0405:	return "Echo-canceling speakerphone";
	case 0x0500:	return "Telephony Undefined";
	case 0x0501:	return "Phone line";
	case 0x0502:	return "Telephone";
	case 0x0503:	return "Down Line Phone";
	case 0x0600:	return "External Undefined";
	case 0x0601:	return "Analog Connector";
	case 0x0602:	return "Digital Audio Interface";
	case 0x0603:	return "Line Connector";
	case 0x0604:	return "Legacy Audio Connector";
	case 0x0605:	return "SPDIF interface";
	case 0x0606:	return "1394 DA Stream";
	case 0x0607:	return "1394 DV Stream Soundtrack";
	case 0x0700:	return "Embedded Undefined";
	case 0x0701:	return "Level Calibration Noise Source";
	case 0x0702:	return "Equalization Noise";
	case 0x0703:	return "CD Player";
	case 0x0704:	return "DAT";
	case 0x0705:	return "DCC";
	case 0x0706:	return "MiniDisk";
	case 0x0707:	return "Analog Tape";
	case 0x0708:	return "Phonograph";
	case 0x0709:	return "VCR Audio";
	case 0x070a:	return "Video Disc Audio";
	case 0x070b:	return "DVD Audio";
	case 0x070c:	return "TV Tuner Audio";
	case 0x070d:	return "Satellite Receiver Audio";
	case 0x070e:	return "Cable Tuner Audio";
	case 0x070f:	return "DSS Audio";
	case 0x0710:	return "Radio Receiver";
	case 0x0711:	return "Radio Transmitter";
	case 0x0712:	return "Multitrack Recorder";
	case 0x0713:	return "Synthesizer";
	}

	return "";
}

const char* GetUACProcessTypeName( UACProtocol protocol, U16 processType )
{
	if (protocol == UAC_PROTOCOL_1)
	{
		switch (processType)
		{
		case 1:		return "Up/Down-mix";
		case 2:		return "Dolby Prologic";
		case 3:		return "3D-Stereo Extender";
		case 4:		return "Reverberation";
		case 5:		return "Chorus";
		case 6:		return "Dyn Range Comp";
		}
	} else if (protocol == UAC_PROTOCOL_2) {
		switch (processType)
		{
		case 1:		return "Up/Down-mix";
		case 2:		return "Dolby Prologic";
		case 3:		return "Stereo Extender";
		}
	} else if (protocol == UAC_PROTOCOL_3) {
		switch (processType)
		{
		case 1:		return "Up/Down-mix";
		case 2:		return "Stereo Extender";
		case 3:		return "Multi-Function";
		}
	}

	return "Undefined";
}

const char* GetUACEffectTypeName( U16 effectType )
{
	switch (effectType)
	{
	case 1:		return "Parametric Equalizer Section";
	case 2:		return "Reverberation";
	case 3:		return "Modulation Delay";
	case 4:		return "Dynamic Range Compressor";
	}

	return "Undefined";
}

const char* GetUACFormatTypeName( U8 formatType )
{
	switch (formatType)
	{
	case FORMAT_TYPE_I:		return "FORMAT_TYPE_I";
	case FORMAT_TYPE_II:	return "FORMAT_TYPE_II";
	case FORMAT_TYPE_III:	return "FORMAT_TYPE_III";
	case FORMAT_TYPE_IV:	return "FORMAT_TYPE_IV";
	}

	return "FORMAT_TYPE_UNDEFINED";
}

const char* GetUACFormatTagName( U16 formatTag )
{
	static const char* const type_i_tags[] = { "TYPE_I_UNDEFINED", "PCM", "PCM8", "IEEE_FLOAT", "ALAW", "MULAW" };
	static const char* const type_ii_tags[] = { "TYPE_II_UNDEFINED", "MPEG", "AC-3" };
	static const char* const type_iii_tags[] = {
		"TYPE_III_UNDEFINED",
		"IEC1937_AC-3",
		"IEC1937_MPEG-1_Layer1",
		"IEC1937_MPEG-Layer2/3/NOEXT",
		"IEC1937_MPEG-2_EXT",
		"IEC1937_MPEG-2_Layer1_LS",
		"IEC1937_MPEG-2_Layer2/3_LS",
	};

	if (formatTag <= 0x0005)
		return type_i_tags[formatTag];

	if (formatTag >= 0x1000  &&  formatTag <= 0x1002)
		return type_ii_tags[formatTag & 0xfff];

	if (formatTag >= 0x2000  &&  formatTag <= 0x2006)
		return type_iii_tags[formatTag & 0xfff];

	return "undefined";
}

const char* GetUACLockDelayUnitsName( U8 units )
{
	switch (units)
	{
	case 1:		return "Milliseconds";
	case 2:		return "Decoded PCM samples";
	}

	return "Undefined";
}

const char* GetUACControlSettingName( UACControlSetting setting )
{
	switch (setting)
	{
	case CS_Present:		return "present";
	case CS_ReadOnly:		return "read-only";
	case CS_IllegalValue:	return "ILLEGAL VALUE (0b10)";
	case CS_ReadWrite:		return "read/write";
	}

	return "ILLEGAL VALUE (0b10)";
}

const char* const UAC1_CHANNEL_NAMES[12] = {
	"Left Front (L)",
	"Right Front (R)",
	"Center Front (C)",
	"Low Frequency Enhancement (LFE)",
	"Left Surround (LS)",
	"Right Surround (RS)",
	"Left of Center (LC)",
	"Right of Center (RC)",
	"Surround (S)",
	"Side Left (SL)",
	"Side Right (SR)",
	"Top (T)",
};

const char* const UAC2_CHANNEL_NAMES[27] = {
	"Front Left (FL)",
	"Front Right (FR)",
	"Front Center (FC)",
	"Low Frequency Effects (LFE)",
	"Back Left (BL)",
	"Back Right (BR)",
	"Front Left of Center (FLC)",
	"Front Right of Center (FRC)",
	"Back Center (BC)",
	"Side Left (SL)",
	"Side Right (SR)",
	"Top Center (TC)",
	"Top Front Left (TFL)",
	"Top Front Center (TFC)",
	"Top Front Right (TFR)",
	"Top Back Left (TBL)",
	"Top Back Center (TBC)",
	"Top Back Right (TBR)",
	"Top Front Left of Center (TFLC)",
	"Top Front Right of Center (TFRC)",
	"Left Low Frequency Effects (LLFE)",
	"Right Low Frequency Effects (RLFE)",
	"Top Side Left (TSL)",
	"Top Side Right (TSR)",
	"Bottom Center (BC)",
	"Back Left of Center (BLC)",
	"Back Right of Center (BRC)",
};

const char* const UAC2_CLOCK_SOURCE_ATTRIBUTES[4] = { "External", "Internal fixed", "Internal variable", "Internal programmable" };
const char* const UAC3_CLOCK_SOURCE_ATTRIBUTES[4] = { "External", "Internal", "(asynchronous)", "(synchronized to SOF)" };

const char* const UAC1_ENDPOINT_ATTRIBUTES[8] = {
	"Sampling Frequency", "Pitch", "Audio Data Format Control", NULL, NULL, NULL, NULL, "MaxPacketsOnly" };
const char* const UAC2_ENDPOINT_ATTRIBUTES[8] = { NULL, NULL, NULL, NULL, NULL, NULL, NULL, "MaxPacketsOnly" };

const char* const UAC_MPEG_CAPABILITIES[8] = {
	"Layer I",
	"Layer II",
	"Layer III",
	"MPEG-1 only",
	"MPEG-1 dual-channel",
	"MPEG-2 second stereo",
	"MPEG-2 7.1 channel augmentation",
	"Adaptive multi-channel prediction",
};

const char* const UAC_AC3_FEATURES[4] = { "RF mode", "Line mode", "Custom0 mode", "Custom1 mode" };

const char* const UAC3_MULTI_FUNCTION_ALGORITHMS[6] = {
	"Algorithm Undefined",
	"Beam Forming",
	"Acoustic Echo Cancellation",
	"Active Noise Cancellation",
	"Blind Source Separation",
	"Noise Suppression/Reduction",
};

const char* const MIDI_ELEMENT_CAPABILITIES[12] = {
	"Undefined",
	"MIDI Clock",
	"MTC (MIDI Time Code)",
	"MMC (MIDI Machine Control)",
	"GM1 (General MIDI v.1)",
	"GM2 (General MIDI v.2)",
	"GS MIDI Extension",
	"XG MIDI Extension",
	"EFX",
	"MIDI Patch Bay",
	"DLS1 (Downloadable Sounds Level 1)",
	"DLS2 (Downloadable Sounds Level 2)",
};

const char* const UAC2_INTERFACE_HEADER_BMCONTROLS[1] = { "Legacy" };
const char* const UAC2_INPUT_TERMINAL_BMCONTROLS[6] = { "Copy Protect", "Connector", "Overload", "Cluster", "Underflow", "Overflow" };
const char* const UAC3_INPUT_TERMINAL_BMCONTROLS[5] = { "Insertion", "Overload", "Underflow", "Overflow", "Underflow" };
const char* const UAC2_OUTPUT_TERMINAL_BMCONTROLS[5] = { "Copy Protect", "Connector", "Overload", "Underflow", "Overflow" };
const char* const UAC3_OUTPUT_TERMINAL_BMCONTROLS[4] = { "Insertion", "Overload", "Underflow", "Overflow" };
const char* const UAC2_AS_INTERFACE_BMCONTROLS[2] = { "Active Alternate Setting", "Valid Alternate Setting" };
const char* const UAC3_AS_INTERFACE_BMCONTROLS[3] = { "Active Alternate Setting", "Valid Alternate Setting", "Audio Data Format Control" };
const char* const UAC2_AS_ISO_ENDPOINT_BMCONTROLS[3] = { "Pitch", "Data Overrun", "Data Underrun" };
const char* const UAC2_MIXER_UNIT_BMCONTROLS[4] = { "Cluster", "Underflow", "Overflow", "Overflow" };
const char* const UAC3_MIXER_UNIT_BMCONTROLS[2] = { "Underflow", "Overflow" };
const char* const UAC2_SELECTOR_UNIT_BMCONTROLS[1] = { "Selector" };

const char* const UAC1_FEATURE_UNIT_BMCONTROLS[13] = {
	"Mute",
	"Volume",
	"Bass",
	"Mid",
	"Treble",
	"Graphic Equalizer",
	"Automatic Gain",
	"Delay",
	"Bass Boost",
	"Loudness",
	"Input gain",
	"Input gain pad",
	"Phase invert",
};

const char* const UAC2_FEATURE_UNIT_BMCONTROLS[15] = {
	"Mute",
	"Volume",
	"Bass",
	"Mid",
	"Treble",
	"Graphic Equalizer",
	"Automatic Gain",
	"Delay",
	"Bass Boost",
	"Loudness",
	"Input gain",
	"Input gain pad",
	"Phase invert",
	"Underflow",
	"Overflow",
};

const char* const UAC2_EXTENSION_UNIT_BMCONTROLS[4] = { "Enable", "Cluster", "Underflow", "Overflow" };
const char* const UAC3_EXTENSION_UNIT_BMCONTROLS[2] = { "Underflow", "Overflow" };
const char* const UAC2_CLOCK_SOURCE_BMCONTROLS[2] = { "Clock Frequency", "Clock Validity" };
const char* const UAC2_CLOCK_SELECTOR_BMCONTROLS[1] = { "Clock Selector" };
const char* const UAC2_CLOCK_MULTIPLIER_BMCONTROLS[2] = { "Clock Numerator", "Clock Denominator" };
const char* const UAC3_PROCESSING_UNIT_UP_DOWN_BMCONTROLS[3] = { "Mode Select", "Underflow", "Overflow" };
const char* const UAC3_PROCESSING_UNIT_STEREO_EXTENDER_BMCONTROLS[3] = { "Width", "Underflow", "Overflow" };
const char* const UAC3_PROCESSING_UNIT_MULTI_FUNC_BMCONTROLS[2] = { "Underflow", "Overflow" };

std::vector<std::string> GetUACChannelNames( UACProtocol protocol, U32 channelConfig )
{
	if (protocol == UAC_PROTOCOL_1)
		return GetBitmapStrings(channelConfig, UAC1_CHANNEL_NAMES, CountOf(UAC1_CHANNEL_NAMES));

	std::vector<std::string> names = GetBitmapStrings(channelConfig, UAC2_CHANNEL_NAMES, CountOf(UAC2_CHANNEL_NAMES));
	if (channelConfig & 0x80000000)
		names.push_back("Raw Data (RD)");

	return names;
}
