#ifndef USB_DESCRIPTOR_DUMP_H
#define USB_DESCRIPTOR_DUMP_H

#include <ostream>
#include <string>
#include <vector>

#include <LogicPublicTypes.h>

#include "USBAudioDescriptors.h"
#include "USBClassDescriptors.h"
#include "USBDescriptorParser.h"
#include "USBDescriptors.h"
#include "USBDumpSettings.h"
#include "USBMidiDescriptors.h"

enum USBDumpFieldType
{
	Fld_None,
	Fld_Hex,
	Fld_BCD,
	Fld_ClassCode,
	Fld_String,
	Fld_bmAttributes_Config,
	Fld_bMaxPower,
	Fld_bEndpointAddress,
	Fld_bmAttributes_Endpoint,
};

// describes the fixed layout of the standard descriptors
struct USBDumpField
{
	const char* name;
	int numBytes;
	USBDumpFieldType formatter;
};

// writes decoded descriptors as indented "name value description" lines
class USBDescriptorDump
{
public:
	USBDescriptorDump(std::ostream& out, const USBDumpSettings& settings);

	void DumpConfiguration(const USBDescriptorParser& parser);
	void DumpParsedDescriptor(const USBParsedDescriptor& entry, int level);

	void DumpDescriptor(const USBDescriptor& desc, int level);
	void DumpAudio(const UACDescriptor& desc, int level);
	void DumpMidiEndpoint(const MIDIEndpointDescriptor& desc, int level);

protected:
	std::ostream&			mOut;
	const USBDumpSettings&	mSettings;

	// line helpers
	void DumpLine(int level, const std::string& text);
	void DumpField(int level, const std::string& name, const std::string& value, const std::string& desc = "");
	void DumpValue(int level, const char* name, U64 value, int bits = 8, const std::string& desc = "");
	void DumpHex(int level, const char* name, U64 value, int bits = 8, const std::string& desc = "");
	void DumpVersion(int level, const char* name, const USBVersion& version);
	void DumpStringRef(int level, const char* name, const USBStringRef& ref);
	void DumpArray(int level, const char* name, const std::vector<U8>& vals);
	void DumpArray(int level, const char* name, const std::vector<U16>& vals);
	void DumpHexArray(int level, const char* name, const std::vector<U8>& vals);
	void DumpHexArray(int level, const char* name, const std::vector<U32>& vals, int bits);
	void DumpBitmapStrings(int level, const std::vector<std::string>& strings);
	void DumpControls(int level, const std::vector<UACControlEntry>& controls);
	void DumpChannelNames(int level, UACProtocol protocol, U32 channelConfig);
	void DumpBytes(int level, const std::string& title, const std::vector<U8>& data, const char* separator = " ");
	void DumpJunk(int level, const std::vector<U8>& junk);
	void DumpHeader(int level, U8 length, U8 descriptorType);

	std::string FormatValue(U64 value, int bits) const;
	std::string GetFieldDescription(U32 value, USBDumpFieldType formatter) const;

	// standard and class descriptors
	void DumpStructure(const std::vector<U8>& bytes, const USBDumpField* fields, int level);
	void DumpClassDescriptor(const USBClassDescriptor& desc, int level);
	void DumpGeneric(const USBGenericDescriptor& desc, int level);
	void DumpHID(const USBHIDDescriptor& desc, int level);
	void DumpCCID(const USBCCIDDescriptor& desc, int level);
	void DumpPrinter(const USBPrinterDescriptor& desc, int level);
	void DumpCommunication(const USBCommunicationDescriptor& desc, int level);
	void DumpVideo(const USBVideoDescriptor& desc, int level);
	void DumpMidi(const USBMidiDescriptor& desc, int level);

	// audio bodies
	void DumpUACEntity(const UACEntity& entity, UACProtocol protocol, int level);
	void DumpUACControl1(const UACEntity& entity, int level);
	void DumpUACControl2(const UACEntity& entity, int level);
	void DumpUACControl3(const UACEntity& entity, int level);
	void DumpUACStreaming(const UACEntity& entity, UACProtocol protocol, int level);
	void DumpUACEndpoint(const UACEntity& entity, int level);
	void DumpSampleFrequencies(const UACSampleFrequencies& freqs, int level);
	void DumpUACRaw(const UACDescriptor& desc, const UACRawEntity& raw, int level);
};

#endif	// USB_DESCRIPTOR_DUMP_H
