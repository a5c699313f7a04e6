#ifndef USB_ENUMS_H
#define USB_ENUMS_H

enum USBDescriptorType
{
	DT_Undefined					= 0x00,

	// standard
	DT_DEVICE						= 0x01,
	DT_CONFIGURATION				= 0x02,
	DT_STRING						= 0x03,
	DT_INTERFACE					= 0x04,
	DT_ENDPOINT						= 0x05,
	DT_DEVICE_QUALIFIER				= 0x06,
	DT_OTHER_SPEED_CONFIGURATION	= 0x07,
	DT_INTERFACE_POWER				= 0x08,
	DT_OTG							= 0x09,
	DT_DEBUG						= 0x0A,
	DT_INTERFACE_ASSOCIATION		= 0x0B,
	DT_SECURITY						= 0x0C,
	DT_KEY							= 0x0D,
	DT_ENCRYPTION_TYPE				= 0x0E,
	DT_BOS							= 0x0F,
	DT_DEVICE_CAPABILITY			= 0x10,
	DT_WIRELESS_ENDPOINT_COMPANION	= 0x11,

	// HID (0x21 is the wire adaptor descriptor outside of HID interfaces)
	DT_HID				= 0x21,
	DT_HID_REPORT		= 0x22,
	DT_HID_PHYS			= 0x23,

	// class specific (0x24 is the pipe descriptor in the standard stream)
	DT_CS_INTERFACE		= 0x24,
	DT_CS_ENDPOINT		= 0x25,

	DT_HUB							= 0x29,
	DT_SUPERSPEED_HUB				= 0x2A,
	DT_SS_ENDPOINT_COMPANION		= 0x30,
	DT_SSP_ISOC_ENDPOINT_COMPANION	= 0x31,
};

// which member of the decoded descriptor family a USBDescriptor holds
enum USBDescriptorKind
{
	DK_Class,					// device, configuration, interface, endpoint and class specific
	DK_String,
	DK_InterfaceAssociation,
	DK_Security,
	DK_Encryption,
	DK_HIDReport,
	DK_SSEndpointCompanion,
	DK_Marker,					// known type code without a decoded layout, raw bytes kept
	DK_Unknown,					// unknown type code, raw bytes kept
	DK_Junk,					// bLength < 2, raw bytes kept
};

enum USBClassDescriptorKind
{
	CDK_Generic,
	CDK_HID,
	CDK_CCID,
	CDK_Printer,
	CDK_Communication,
	CDK_MIDI,
	CDK_Video,
};

enum USBEncryptionType
{
	ET_Unsecure		= 0x00,
	ET_Wired		= 0x01,
	ET_Ccm1			= 0x02,
	ET_Rsa1			= 0x03,
	ET_Reserved,
};

enum USBCDCDescriptorSubtype
{
	DST_HEADER				= 0x00,
	DST_CALL_MANAGEMENT,
	DST_ABSTRACT_CONTROL_MANAGEMENT,
	DST_DIRECT_LINE_MANAGEMENT,
	DST_TELEPHONE_RINGER,
	DST_TELEPHONE_CALL_AND_LINE_STATE,
	DST_UNION,
	DST_COUNTRY_SELECTION,
	DST_TELEPHONE_OPERATIONAL_MODES,
	DST_USB_TERMINAL,
	DST_NETWORK_CHANNEL_TERMINAL,
	DST_PROTOCOL_UNIT,
	DST_EXTENSION_UNIT,
	DST_MULTI_CHANNEL_MANAGEMENT,
	DST_CAPI_CONTROL_MANAGEMENT,
	DST_ETHERNET_NETWORKING,
	DST_ATM_NETWORKING,
	DST_WIRELESS_HANDSET_CONTROL_MODEL,
	DST_MOBILE_DIRECT_LINE_MODEL_FUNCTIONAL,
	DST_MOBILE_DIRECT_LINE_MODEL_DETAIL,
	DST_DEVICE_MANAGEMENT_MODEL,
	DST_OBEX,
	DST_COMMAND_SET,
	DST_COMMAND_SET_DETAIL,
	DST_TELEPHONE_CONTROL_MODEL,
	DST_OBEX_SERVICE_IDENTIFIER,
	DST_NCM,
	DST_MBIM,
	DST_MBIM_EXTENDED,

	DST_Undefined					= 0xff,
};

enum UVCInterfaceSubtype
{
	VC_UNDEFINED			= 0x00,
	VC_HEADER				= 0x01,
	VC_INPUT_TERMINAL		= 0x02,
	VC_OUTPUT_TERMINAL		= 0x03,
	VC_SELECTOR_UNIT		= 0x04,
	VC_PROCESSING_UNIT		= 0x05,
	VC_EXTENSION_UNIT		= 0x06,
	VC_ENCODING_UNIT		= 0x07,
};

enum MIDIInterfaceSubtype
{
	MS_UNDEFINED		= 0x00,
	MS_HEADER			= 0x01,
	MS_MIDI_IN_JACK		= 0x02,
	MS_MIDI_OUT_JACK	= 0x03,
	MS_ELEMENT			= 0x04,
};

enum MIDIEndpointSubtype
{
	MS_EP_UNDEFINED		= 0x00,
	MS_EP_GENERAL		= 0x01,
	MS_EP_GENERAL_2_0	= 0x02,
};

enum MIDIJackType
{
	JT_UNDEFINED	= 0x00,
	JT_EMBEDDED		= 0x01,
	JT_EXTERNAL		= 0x02,
};

// the bInterfaceProtocol of audio interfaces
enum UACProtocol
{
	UAC_PROTOCOL_1			= 0x00,
	UAC_PROTOCOL_2			= 0x20,
	UAC_PROTOCOL_3			= 0x30,
	UAC_PROTOCOL_Unknown	= 0xff,
};

enum UACSubclass
{
	UAC_SUBCLASS_UNDEFINED			= 0x00,
	UAC_SUBCLASS_AUDIOCONTROL		= 0x01,
	UAC_SUBCLASS_AUDIOSTREAMING		= 0x02,
	UAC_SUBCLASS_MIDISTREAMING		= 0x03,
};

// canonical audio control entity; the wire subtype is remapped per protocol onto these
enum UACInterface
{
	UACI_Undefined				= 0x00,
	UACI_Header					= 0x01,
	UACI_InputTerminal			= 0x02,
	UACI_OutputTerminal			= 0x03,
	UACI_ExtendedTerminal		= 0x04,
	UACI_MixerUnit				= 0x05,
	UACI_SelectorUnit			= 0x06,
	UACI_FeatureUnit			= 0x07,
	UACI_EffectUnit				= 0x08,
	UACI_ProcessingUnit			= 0x09,
	UACI_ExtensionUnit			= 0x0A,
	UACI_ClockSource			= 0x0B,
	UACI_ClockSelector			= 0x0C,
	UACI_ClockMultiplier		= 0x0D,
	UACI_SampleRateConverter	= 0x0E,
	UACI_Connectors				= 0x0F,
	UACI_PowerDomain			= 0x10,
};

enum UACStreamingSubtype
{
	UACS_Undefined		= 0x00,
	UACS_General		= 0x01,
	UACS_FormatType		= 0x02,
	UACS_FormatSpecific	= 0x03,
};

enum UACEndpointSubtype
{
	UACE_Undefined	= 0x00,
	UACE_General	= 0x01,
};

enum UACFormatType
{
	FORMAT_TYPE_UNDEFINED	= 0x00,
	FORMAT_TYPE_I			= 0x01,
	FORMAT_TYPE_II			= 0x02,
	FORMAT_TYPE_III			= 0x03,
	FORMAT_TYPE_IV			= 0x04,
};

enum UACFormatTag
{
	FORMAT_TAG_MPEG		= 0x1001,
	FORMAT_TAG_AC3		= 0x1002,
};

// interpretation of one control in a bmControls field
enum UACControlSetting
{
	CS_Present		= 0x00,		// 1 bit per control fields
	CS_ReadOnly		= 0x01,
	CS_IllegalValue	= 0x02,
	CS_ReadWrite	= 0x03,
};

enum UACControlType
{
	CT_BmControl1,		// 1 bit per control, present or not
	CT_BmControl2,		// 2 bits per control, see UACControlSetting
};

// which decoded audio sub-descriptor a UACEntity holds
enum UACDescriptorKind
{
	UACK_Undefined,
	UACK_Invalid,

	UACK_Header1,
	UACK_Header2,
	UACK_Header3,
	UACK_InputTerminal1,
	UACK_InputTerminal2,
	UACK_InputTerminal3,
	UACK_OutputTerminal1,
	UACK_OutputTerminal2,
	UACK_OutputTerminal3,
	UACK_ExtendedTerminalHeader,
	UACK_MixerUnit1,
	UACK_MixerUnit2,
	UACK_MixerUnit3,
	UACK_SelectorUnit1,
	UACK_SelectorUnit2,
	UACK_SelectorUnit3,
	UACK_FeatureUnit1,
	UACK_FeatureUnit2,
	UACK_FeatureUnit3,
	UACK_EffectUnit2,
	UACK_EffectUnit3,
	UACK_ProcessingUnit1,
	UACK_ProcessingUnit2,
	UACK_ProcessingUnit3,
	UACK_ExtensionUnit1,
	UACK_ExtensionUnit2,
	UACK_ExtensionUnit3,
	UACK_ClockSource2,
	UACK_ClockSource3,
	UACK_ClockSelector2,
	UACK_ClockSelector3,
	UACK_ClockMultiplier2,
	UACK_ClockMultiplier3,
	UACK_SampleRateConverter2,
	UACK_SampleRateConverter3,
	UACK_PowerDomain,

	UACK_StreamingInterface1,
	UACK_StreamingInterface2,
	UACK_StreamingInterface3,
	UACK_FormatTypeI1,			// UAC1 type I and type III
	UACK_FormatTypeII1,
	UACK_FormatTypeI2,			// UAC2 type I and type III
	UACK_FormatTypeII2,
	UACK_FormatTypeIV2,
	UACK_FormatSpecific,
	UACK_FormatSpecificMPEG,
	UACK_FormatSpecificAC3,

	UACK_DataStreamingEndpoint1,
	UACK_DataStreamingEndpoint2,
	UACK_DataStreamingEndpoint3,
};

// what an audio class specific descriptor belongs to
enum UACDescriptorContext
{
	UACC_AudioControl,
	UACC_AudioStreaming,
	UACC_AudioStreamingEndpoint,
};

enum USBClassCodes
{
	CC_DeferredToInterface			= 0x00,
	CC_Audio						= 0x01,
	CC_CommunicationsAndCDCControl	= 0x02,
	CC_HID							= 0x03,
	CC_Physical						= 0x05,
	CC_Image						= 0x06,
	CC_Printer						= 0x07,
	CC_MassStorage					= 0x08,
	CC_Hub							= 0x09,
	CC_CDCData						= 0x0A,
	CC_SmartCard					= 0x0B,
	CC_ContentSecurity				= 0x0D,
	CC_Video						= 0x0E,
	CC_PersonalHealthcare			= 0x0F,
	CC_AudioVideo					= 0x10,
	CC_Billboard					= 0x11,
	CC_USBTypeCBridge				= 0x12,
	CC_Diagnostic					= 0xDC,
	CC_WirelessController			= 0xE0,
	CC_Miscellaneous				= 0xEF,
	CC_ApplicationSpecific			= 0xFE,
	CC_VendorSpecific				= 0xFF,
};

#endif	// USB_ENUMS_H
