#include <stdio.h>

#include <AnalyzerHelpers.h>

#include "USBDescriptorDump.h"
#include "USBLookupTables.h"

USBDumpField DeviceDescriptorFields[] = {
	//{"bLength",				1, Fld_None},
	//{"bDescriptorType",		1, Fld_None},
	{"bcdUSB",				2, Fld_BCD},
	{"bDeviceClass",		1, Fld_ClassCode},
	{"bDeviceSubClass",		1, Fld_None},
	{"bDeviceProtocol",		1, Fld_None},
	{"bMaxPacketSize0",		1, Fld_None},
	{"idVendor",			2, Fld_Hex},
	{"idProduct",			2, Fld_Hex},
	{"bcdDevice",			2, Fld_BCD},
	{"iManufacturer",		1, Fld_String},
	{"iProduct",			1, Fld_String},
	{"iSerialNumber",		1, Fld_String},
	{"bNumConfigurations",	1, Fld_None},

	{NULL, 0, Fld_None},
};

USBDumpField DeviceQualifierDescriptorFields[] = {
	{"bcdUSB",				2, Fld_BCD},
	{"bDeviceClass",		1, Fld_ClassCode},
	{"bDeviceSubClass",		1, Fld_None},
	{"bDeviceProtocol",		1, Fld_None},
	{"bMaxPacketSize0",		1, Fld_None},
	{"bNumConfigurations",	1, Fld_None},
	{"bReserved",			1, Fld_None},

	{NULL, 0, Fld_None},
};

USBDumpField ConfigurationDescriptorFields[] = {
	{"wTotalLength",		2, Fld_Hex},
	{"bNumInterfaces",		1, Fld_None},
	{"bConfigurationValue",	1, Fld_None},
	{"iConfiguration",		1, Fld_String},
	{"bmAttributes",		1, Fld_bmAttributes_Config},
	{"MaxPower",			1, Fld_bMaxPower},

	{NULL, 0, Fld_None},
};

USBDumpField InterfaceDescriptorFields[] = {
	{"bInterfaceNumber",	1, Fld_None},
	{"bAlternateSetting",	1, Fld_None},
	{"bNumEndpoints",		1, Fld_None},
	{"bInterfaceClass",		1, Fld_ClassCode},
	{"bInterfaceSubClass",	1, Fld_None},
	{"bInterfaceProtocol",	1, Fld_None},
	{"iInterface",			1, Fld_String},

	{NULL, 0, Fld_None},
};

USBDumpField EndpointDescriptorFields[] = {
	{"bEndpointAddress",	1, Fld_bEndpointAddress},
	{"bmAttributes",		1, Fld_bmAttributes_Endpoint},
	{"wMaxPacketSize",		2, Fld_Hex},
	{"bInterval",			1, Fld_None},

	{NULL, 0, Fld_None},
};

// audio class endpoints carry two more bytes
USBDumpField AudioEndpointDescriptorFields[] = {
	{"bEndpointAddress",	1, Fld_bEndpointAddress},
	{"bmAttributes",		1, Fld_bmAttributes_Endpoint},
	{"wMaxPacketSize",		2, Fld_Hex},
	{"bInterval",			1, Fld_None},
	{"bRefresh",			1, Fld_None},
	{"bSynchAddress",		1, Fld_None},

	{NULL, 0, Fld_None},
};

static const char* const CCID_VOLTAGES[] = {"5.0V", "3.0V", "1.8V"};
static const char* const CCID_PROTOCOLS[] = {"T=0", "T=1"};
static const char* const CCID_PIN_SUPPORT[] = {"verification", "modification"};

static std::string GetArrayFieldName(const char* name, size_t index)
{
	char buff[64];
	snprintf(buff, sizeof(buff), "%s(%2u)", name, unsigned(index));
	return buff;
}

USBDescriptorDump::USBDescriptorDump(std::ostream& out, const USBDumpSettings& settings)
:	mOut(out),
	mSettings(settings)
{}

////////////////////////////////////////////////////////////////////////////////
// line helpers

void USBDescriptorDump::DumpLine(int level, const std::string& text)
{
	mOut << std::string(level * mSettings.mIndent, ' ') << text << std::endl;
}

void USBDescriptorDump::DumpField(int level, const std::string& name, const std::string& value, const std::string& desc)
{
	std::string line(name);
	if (line.size() < mSettings.mFieldWidth)
		line.append(mSettings.mFieldWidth - line.size(), ' ');
	line += ' ';

	// values are right aligned in a 5 character column
	if (value.size() < 5)
		line.append(5 - value.size(), ' ');
	line += value;

	if (!desc.empty())
		line += " " + desc;

	DumpLine(level, line);
}

std::string USBDescriptorDump::FormatValue(U64 value, int bits) const
{
	return int2str_sal(value, mSettings.mDisplayBase, bits);
}

void USBDescriptorDump::DumpValue(int level, const char* name, U64 value, int bits, const std::string& desc)
{
	DumpField(level, name, FormatValue(value, bits), desc);
}

void USBDescriptorDump::DumpHex(int level, const char* name, U64 value, int bits, const std::string& desc)
{
	DumpField(level, name, int2str_sal(value, Hexadecimal, bits), desc);
}

void USBDescriptorDump::DumpVersion(int level, const char* name, const USBVersion& version)
{
	DumpField(level, name, version.ToString());
}

void USBDescriptorDump::DumpStringRef(int level, const char* name, const USBStringRef& ref)
{
	std::string desc;
	if (mSettings.mResolveStrings && ref.IsResolved())
		desc = ref.mValue;

	DumpValue(level, name, ref.mIndex, 8, desc);
}

void USBDescriptorDump::DumpArray(int level, const char* name, const std::vector<U8>& vals)
{
	for (size_t i = 0; i < vals.size(); ++i)
		DumpField(level, GetArrayFieldName(name, i), FormatValue(vals[i], 8));
}

void USBDescriptorDump::DumpArray(int level, const char* name, const std::vector<U16>& vals)
{
	for (size_t i = 0; i < vals.size(); ++i)
		DumpField(level, GetArrayFieldName(name, i), FormatValue(vals[i], 16));
}

void USBDescriptorDump::DumpHexArray(int level, const char* name, const std::vector<U8>& vals)
{
	for (size_t i = 0; i < vals.size(); ++i)
		DumpField(level, GetArrayFieldName(name, i), int2str_sal(vals[i], Hexadecimal, 8));
}

void USBDescriptorDump::DumpHexArray(int level, const char* name, const std::vector<U32>& vals, int bits)
{
	for (size_t i = 0; i < vals.size(); ++i)
		DumpField(level, GetArrayFieldName(name, i), int2str_sal(vals[i], Hexadecimal, bits));
}

void USBDescriptorDump::DumpBitmapStrings(int level, const std::vector<std::string>& strings)
{
	for (std::vector<std::string>::const_iterator i(strings.begin()); i != strings.end(); ++i)
		DumpLine(level, *i);
}

void USBDescriptorDump::DumpControls(int level, const std::vector<UACControlEntry>& controls)
{
	for (std::vector<UACControlEntry>::const_iterator i(controls.begin()); i != controls.end(); ++i)
	{
		std::string line = i->mLabel + " Control";
		if (i->mSetting != CS_Present)
			line += std::string(" (") + GetUACControlSettingName(i->mSetting) + ")";

		DumpLine(level, line);
	}
}

void USBDescriptorDump::DumpChannelNames(int level, UACProtocol protocol, U32 channelConfig)
{
	DumpBitmapStrings(level, GetUACChannelNames(protocol, channelConfig));
}

void USBDescriptorDump::DumpBytes(int level, const std::string& title, const std::vector<U8>& data, const char* separator)
{
	DumpLine(level, title + hex2str(data, separator));
}

void USBDescriptorDump::DumpJunk(int level, const std::vector<U8>& junk)
{
	if (mSettings.mShowJunk && !junk.empty())
		DumpBytes(level, "junk at descriptor end: ", junk);
}

void USBDescriptorDump::DumpHeader(int level, U8 length, U8 descriptorType)
{
	DumpValue(level, "bLength", length);
	DumpValue(level, "bDescriptorType", descriptorType);
}

////////////////////////////////////////////////////////////////////////////////
// walk

void USBDescriptorDump::DumpConfiguration(const USBDescriptorParser& parser)
{
	const std::vector<USBParsedDescriptor>& descriptors = parser.GetDescriptors();
	for (std::vector<USBParsedDescriptor>::const_iterator i(descriptors.begin()); i != descriptors.end(); ++i)
	{
		U8 descType = i->GetDescriptorType();

		int level;
		if (descType == DT_DEVICE || descType == DT_CONFIGURATION || descType == DT_OTHER_SPEED_CONFIGURATION)
			level = 0;
		else if (descType == DT_INTERFACE || !i->mInInterface)
			level = 1;
		else
			level = 2;

		DumpParsedDescriptor(*i, level);
	}

	if (parser.GetError().IsSet())
		DumpLine(0, "Warning: " + parser.GetError().GetText());
}

void USBDescriptorDump::DumpParsedDescriptor(const USBParsedDescriptor& entry, int level)
{
	if (entry.mAudio)
		DumpAudio(*entry.mAudio, level);
	else if (entry.mMidiEndpoint)
		DumpMidiEndpoint(*entry.mMidiEndpoint, level);
	else if (entry.mDescriptor)
		DumpDescriptor(*entry.mDescriptor, level);
	else
	{
		DumpLine(level, std::string(GetDescriptorName(entry.GetDescriptorType())) + " Descriptor:");
		DumpLine(level + 1, "Warning: Descriptor too short");
		DumpBytes(level + 1, "data: ", entry.mBytes);
	}

	// decoded, but the class context could not be applied
	if (entry.IsDecoded() && entry.mError.IsSet())
		DumpLine(level + 1, "Warning: " + entry.mError.GetText());
	else if (!entry.IsDecoded() && entry.mError.IsSet())
		DumpLine(level + 1, entry.mError.GetText());
}

////////////////////////////////////////////////////////////////////////////////
// standard descriptors

std::string USBDescriptorDump::GetFieldDescription(U32 val, USBDumpFieldType formatter) const
{
	std::string desc;

	if (formatter == Fld_ClassCode) {

		desc = GetUSBClassName((U8)val);

	} else if (formatter == Fld_bMaxPower) {

		desc = int2str(val * 2) + "mA";

	} else if (formatter == Fld_bmAttributes_Config) {

		desc  = (val & 0x40) ? "Self powered" : "Bus powered";
		desc += ", Remote wakeup ";
		desc += (val & 0x20) ? "supported" : "unsupported";

	} else if (formatter == Fld_bEndpointAddress) {

		desc = "EP " + int2str(val & 0x0F);
		desc += (val & 0x80) == 0 ? " OUT" : " IN";

	} else if (formatter == Fld_bmAttributes_Endpoint) {

		switch (val & 0x03)
		{
		case 0:		desc += "Control"; break;
		case 1:		desc += "Isochronous"; break;
		case 2:		desc += "Bulk"; break;
		case 3:		desc += "Interrupt"; break;
		}

		if ((val & 0x03) == 1)		// if isochronous
		{
			desc += ", ";
			switch ((val >> 2) & 0x03)
			{
			case 0:		desc += "No Synchronization"; break;
			case 1:		desc += "Asynchronous"; break;
			case 2:		desc += "Adaptive"; break;
			case 3:		desc += "Synchronous"; break;
			}

			desc += ", ";
			switch ((val >> 4) & 0x03)
			{
			case 0:		desc += "Data endpoint"; break;
			case 1:		desc += "Feedback endpoint"; break;
			case 2:		desc += "Implicit feedback Data endpoint"; break;
			case 3:		desc += "Reserved"; break;
			}
		}
	}

	return desc;
}

void USBDescriptorDump::DumpStructure(const std::vector<U8>& bytes, const USBDumpField* fields, int level)
{
	size_t offset = 2;
	for (const USBDumpField* fld = fields; fld->name != NULL; ++fld)
	{
		if (offset + fld->numBytes > bytes.size())
		{
			DumpLine(level, "Warning: Descriptor too short");
			return;
		}

		U32 val = 0;
		for (int b = 0; b < fld->numBytes; ++b)
			val |= U32(bytes[offset + b]) << (8 * b);

		offset += fld->numBytes;

		int bits = fld->numBytes * 8;
		if (fld->formatter == Fld_BCD)
			DumpVersion(level, fld->name, USBVersion(U16(val)));
		else if (fld->formatter == Fld_Hex || fld->formatter == Fld_bEndpointAddress ||
				fld->formatter == Fld_bmAttributes_Config || fld->formatter == Fld_bmAttributes_Endpoint)
			DumpHex(level, fld->name, val, bits, GetFieldDescription(val, fld->formatter));
		else
			DumpValue(level, fld->name, val, bits, GetFieldDescription(val, fld->formatter));
	}

	if (offset < bytes.size())
		DumpJunk(level, std::vector<U8>(bytes.begin() + offset, bytes.end()));
}

void USBDescriptorDump::DumpDescriptor(const USBDescriptor& desc, int level)
{
	switch (desc.GetKind())
	{
	case DK_Class:
		DumpClassDescriptor(static_cast<const USBClassDescriptor&>(desc), level);
		break;

	case DK_String:
	{
		const USBStringDescriptor& str = static_cast<const USBStringDescriptor&>(desc);
		DumpLine(level, "String Descriptor:");
		DumpHeader(level + 1, str.mLength, str.mDescriptorType);
		DumpField(level + 1, "bString", "", str.mValue);
		break;
	}

	case DK_InterfaceAssociation:
	{
		const USBInterfaceAssociationDescriptor& iad = static_cast<const USBInterfaceAssociationDescriptor&>(desc);
		DumpLine(level, "Interface Association:");
		DumpHeader(level + 1, iad.mLength, iad.mDescriptorType);
		DumpValue(level + 1, "bFirstInterface", iad.mFirstInterface);
		DumpValue(level + 1, "bInterfaceCount", iad.mInterfaceCount);
		DumpValue(level + 1, "bFunctionClass", iad.mFunctionClass, 8, GetUSBClassName(iad.mFunctionClass));
		DumpValue(level + 1, "bFunctionSubClass", iad.mFunctionSubClass);
		DumpValue(level + 1, "bFunctionProtocol", iad.mFunctionProtocol);
		DumpStringRef(level + 1, "iFunction", iad.mFunction);
		DumpJunk(level + 1, iad.mJunk);
		break;
	}

	case DK_Security:
	{
		const USBSecurityDescriptor& sec = static_cast<const USBSecurityDescriptor&>(desc);
		DumpLine(level, "Security Descriptor:");
		DumpHeader(level + 1, sec.mLength, sec.mDescriptorType);
		DumpHex(level + 1, "wTotalLength", sec.mTotalLength, 16);
		DumpValue(level + 1, "bNumEncryptionTypes", sec.mNumEncryptionTypes);
		DumpJunk(level + 1, sec.mJunk);
		break;
	}

	case DK_Encryption:
	{
		const USBEncryptionDescriptor& enc = static_cast<const USBEncryptionDescriptor&>(desc);
		DumpLine(level, "Encryption Type:");
		DumpHeader(level + 1, enc.mLength, enc.mDescriptorType);
		DumpValue(level + 1, "bEncryptionType", enc.mEncryptionType, 8, GetEncryptionTypeName(enc.mEncryptionType));
		DumpValue(level + 1, "bEncryptionValue", enc.mEncryptionValue);
		DumpValue(level + 1, "bAuthKeyIndex", enc.mAuthKeyIndex);
		DumpJunk(level + 1, enc.mJunk);
		break;
	}

	case DK_HIDReport:
	{
		const USBHIDReportDescriptor& rep = static_cast<const USBHIDReportDescriptor&>(desc);
		DumpLine(level, "HID Class Descriptor Reference:");
		if (rep.mHasLengthPrefix)
			DumpValue(level + 1, "bLength", rep.mBLength);
		DumpValue(level + 1, "bDescriptorType", rep.mDescriptorType, 8, GetDescriptorName(rep.mDescriptorType));
		DumpValue(level + 1, "wDescriptorLength", rep.mLength, 16);
		if (!rep.mData.empty())
			DumpBytes(level + 1, "data: ", rep.mData);
		break;
	}

	case DK_SSEndpointCompanion:
	{
		const USBSSEndpointCompanionDescriptor& ss = static_cast<const USBSSEndpointCompanionDescriptor&>(desc);
		DumpLine(level, "SuperSpeed Endpoint Companion Descriptor:");
		DumpHeader(level + 1, ss.mLength, ss.mDescriptorType);
		DumpValue(level + 1, "bMaxBurst", ss.mMaxBurst);
		DumpHex(level + 1, "bmAttributes", ss.mAttributes);
		DumpValue(level + 1, "wBytesPerInterval", ss.mBytesPerInterval, 16);
		DumpJunk(level + 1, ss.mJunk);
		break;
	}

	case DK_Junk:
		DumpBytes(level, "Junk: ", static_cast<const USBRawDescriptor&>(desc).mData);
		break;

	case DK_Marker:
	case DK_Unknown:
	{
		const USBRawDescriptor& raw = static_cast<const USBRawDescriptor&>(desc);
		DumpLine(level, std::string(GetDescriptorName(raw.GetDescriptorType())) + " Descriptor:");
		DumpBytes(level + 1, "data: ", raw.mData);
		break;
	}
	}
}

////////////////////////////////////////////////////////////////////////////////
// class descriptors

void USBDescriptorDump::DumpClassDescriptor(const USBClassDescriptor& desc, int level)
{
	switch (desc.GetClassKind())
	{
	case CDK_Generic:		DumpGeneric(static_cast<const USBGenericDescriptor&>(desc), level); break;
	case CDK_HID:			DumpHID(static_cast<const USBHIDDescriptor&>(desc), level); break;
	case CDK_CCID:			DumpCCID(static_cast<const USBCCIDDescriptor&>(desc), level); break;
	case CDK_Printer:		DumpPrinter(static_cast<const USBPrinterDescriptor&>(desc), level); break;
	case CDK_Communication:	DumpCommunication(static_cast<const USBCommunicationDescriptor&>(desc), level); break;
	case CDK_Video:			DumpVideo(static_cast<const USBVideoDescriptor&>(desc), level); break;
	case CDK_MIDI:			DumpMidi(static_cast<const USBMidiDescriptor&>(desc), level); break;
	}
}

void USBDescriptorDump::DumpGeneric(const USBGenericDescriptor& desc, int level)
{
	const USBDumpField* fields = NULL;
	const char* title = NULL;

	if (!desc.mHasTriplet)
	{
		switch (desc.mDescriptorType)
		{
		case DT_DEVICE:
			fields = DeviceDescriptorFields;
			title = "Device Descriptor:";
			break;
		case DT_DEVICE_QUALIFIER:
			fields = DeviceQualifierDescriptorFields;
			title = "Device Qualifier:";
			break;
		case DT_CONFIGURATION:
			fields = ConfigurationDescriptorFields;
			title = "Configuration Descriptor:";
			break;
		case DT_OTHER_SPEED_CONFIGURATION:
			fields = ConfigurationDescriptorFields;
			title = "Other Speed Configuration Descriptor:";
			break;
		case DT_INTERFACE:
			fields = InterfaceDescriptorFields;
			title = "Interface Descriptor:";
			break;
		case DT_ENDPOINT:
			fields = desc.mLength >= 9 ? AudioEndpointDescriptorFields : EndpointDescriptorFields;
			title = "Endpoint Descriptor:";
			break;
		}
	}

	if (fields != NULL)
	{
		DumpLine(level, title);
		DumpHeader(level + 1, desc.mLength, desc.mDescriptorType);
		DumpStructure(desc.ToBytes(), fields, level + 1);
		return;
	}

	if (desc.mHasTriplet)
		DumpLine(level, std::string(GetUSBClassName(desc.mTriplet.mClass)) + " Class Specific Descriptor:");
	else
		DumpLine(level, std::string(GetDescriptorName(desc.mDescriptorType)) + " Descriptor:");

	DumpHeader(level + 1, desc.mLength, desc.mDescriptorType);
	DumpValue(level + 1, "bDescriptorSubtype", desc.mDescriptorSubtype);
	if (!desc.mData.empty())
		DumpBytes(level + 1, "data: ", desc.mData);
}

void USBDescriptorDump::DumpHID(const USBHIDDescriptor& desc, int level)
{
	DumpLine(level, "HID Device Descriptor:");
	DumpHeader(level + 1, desc.mLength, desc.mDescriptorType);
	DumpVersion(level + 1, "bcdHID", desc.mBcdHID);
	DumpValue(level + 1, "bCountryCode", desc.mCountryCode);
	DumpValue(level + 1, "bNumDescriptors", desc.mNumDescriptors);

	for (std::vector<USBHIDReportDescriptor>::const_iterator i(desc.mDescriptors.begin()); i != desc.mDescriptors.end(); ++i)
	{
		DumpValue(level + 1, "bDescriptorType", i->mDescriptorType, 8, GetDescriptorName(i->mDescriptorType));
		DumpValue(level + 1, "wDescriptorLength", i->mLength, 16);
	}

	DumpJunk(level + 1, desc.mJunk);
}

void USBDescriptorDump::DumpCCID(const USBCCIDDescriptor& desc, int level)
{
	int lvl = level + 1;

	DumpLine(level, "ChipCard Interface Descriptor:");
	DumpHeader(lvl, desc.mLength, desc.mDescriptorType);
	DumpVersion(lvl, "bcdCCID", desc.mBcdCCID);
	DumpValue(lvl, "nMaxSlotIndex", desc.mMaxSlotIndex);

	std::vector<std::string> voltages = GetBitmapStrings(desc.mVoltageSupport, CCID_VOLTAGES, CountOf(CCID_VOLTAGES));
	std::string voltageText;
	for (std::vector<std::string>::const_iterator i(voltages.begin()); i != voltages.end(); ++i)
		voltageText += (i == voltages.begin() ? "" : " ") + *i;
	DumpHex(lvl, "bVoltageSupport", desc.mVoltageSupport, 8, voltageText);

	std::vector<std::string> protocols = GetBitmapStrings(desc.mProtocols, CCID_PROTOCOLS, CountOf(CCID_PROTOCOLS));
	std::string protocolText;
	for (std::vector<std::string>::const_iterator i(protocols.begin()); i != protocols.end(); ++i)
		protocolText += (i == protocols.begin() ? "" : " ") + *i;
	DumpHex(lvl, "dwProtocols", desc.mProtocols, 32, protocolText);

	DumpValue(lvl, "dwDefaultClock", desc.mDefaultClock, 32, "kHz");
	DumpValue(lvl, "dwMaximumClock", desc.mMaximumClock, 32, "kHz");
	DumpValue(lvl, "bNumClockSupported", desc.mNumClockSupported);
	DumpValue(lvl, "dwDataRate", desc.mDataRate, 32, "bps");
	DumpValue(lvl, "dwMaxDataRate", desc.mMaxDataRate, 32, "bps");
	DumpValue(lvl, "bNumDataRatesSupp.", desc.mNumDataRatesSupported);
	DumpValue(lvl, "dwMaxIFSD", desc.mMaxIFSD, 32);
	DumpHex(lvl, "dwSyncProtocols", desc.mSynchProtocols, 32);
	DumpHex(lvl, "dwMechanical", desc.mMechanical, 32);
	DumpHex(lvl, "dwFeatures", desc.mFeatures, 32);
	DumpValue(lvl, "dwMaxCCIDMsgLen", desc.mMaxCCIDMessageLength, 32);

	DumpHex(lvl, "bClassGetResponse", desc.mClassGetResponse, 8, desc.mClassGetResponse == 0xff ? "echo" : "");
	DumpHex(lvl, "bClassEnvelope", desc.mClassEnvelope, 8, desc.mClassEnvelope == 0xff ? "echo" : "");

	if (desc.mLcdLayoutLines == 0 && desc.mLcdLayoutChars == 0)
		DumpField(lvl, "wlcdLayout", "none");
	else
		DumpField(lvl, "wlcdLayout", int2str(desc.mLcdLayoutLines) + " lines, " + int2str(desc.mLcdLayoutChars) + " chars");

	std::vector<std::string> pin = GetBitmapStrings(desc.mPINSupport, CCID_PIN_SUPPORT, CountOf(CCID_PIN_SUPPORT));
	std::string pinText;
	for (std::vector<std::string>::const_iterator i(pin.begin()); i != pin.end(); ++i)
		pinText += (i == pin.begin() ? "" : " ") + *i;
	DumpHex(lvl, "bPINSupport", desc.mPINSupport, 8, pinText);

	DumpValue(lvl, "bMaxCCIDBusySlots", desc.mMaxCCIDBusySlots);
	DumpJunk(lvl, desc.mJunk);
}

void USBDescriptorDump::DumpPrinter(const USBPrinterDescriptor& desc, int level)
{
	DumpLine(level, "Printer Descriptor:");
	DumpHeader(level + 1, desc.mLength, desc.mDescriptorType);
	DumpValue(level + 1, "bReleaseNumber", desc.mReleaseNumber);
	DumpValue(level + 1, "bNumDescriptors", desc.mNumDescriptors);

	for (std::vector<USBPrinterReportDescriptor>::const_iterator i(desc.mDescriptors.begin()); i != desc.mDescriptors.end(); ++i)
	{
		DumpLine(level + 1, "Printer Capability Descriptor:");
		DumpValue(level + 2, "bDescriptorType", i->mDescriptorType);
		DumpValue(level + 2, "bLength", i->mLength);
		DumpHex(level + 2, "wCapabilities", i->mCapabilities, 16);
		DumpValue(level + 2, "bVersionsSupported", i->mVersionsSupported);
		DumpStringRef(level + 2, "iUUID", i->mUUID);
		if (!i->mData.empty())
			DumpBytes(level + 2, "data: ", i->mData);
	}

	DumpJunk(level + 1, desc.mJunk);
}

static const char* GetCDCStringFieldName(U8 subtype)
{
	switch (subtype)
	{
	case DST_COUNTRY_SELECTION:			return "iCountryCodeRelDate";
	case DST_ETHERNET_NETWORKING:		return "iMACAddress";
	case DST_NETWORK_CHANNEL_TERMINAL:	return "iChannelName";
	case DST_COMMAND_SET:				return "iCommandSet";
	}

	return "iString";
}

void USBDescriptorDump::DumpCommunication(const USBCommunicationDescriptor& desc, int level)
{
	DumpLine(level, std::string("CDC ") + GetCDCDescriptorSubtypeName(desc.mDescriptorSubtype) + ":");
	DumpHeader(level + 1, desc.mLength, desc.mDescriptorType);
	DumpHex(level + 1, "bDescriptorSubtype", desc.mDescriptorSubtype);
	if (!desc.mData.empty())
		DumpBytes(level + 1, "data: ", desc.mData);
	if (desc.mHasString)
		DumpStringRef(level + 1, GetCDCStringFieldName(desc.mDescriptorSubtype), desc.mString);
}

static const char* GetUVCStringFieldName(U8 subtype)
{
	switch (subtype)
	{
	case VC_INPUT_TERMINAL:
	case VC_OUTPUT_TERMINAL:	return "iTerminal";
	case VC_SELECTOR_UNIT:		return "iSelector";
	case VC_PROCESSING_UNIT:	return "iProcessing";
	case VC_EXTENSION_UNIT:		return "iExtension";
	case VC_ENCODING_UNIT:		return "iEncoding";
	}

	return "iString";
}

void USBDescriptorDump::DumpVideo(const USBVideoDescriptor& desc, int level)
{
	DumpLine(level, "VideoControl Interface Descriptor:");
	DumpHeader(level + 1, desc.mLength, desc.mDescriptorType);
	DumpValue(level + 1, "bDescriptorSubtype", desc.mDescriptorSubtype, 8,
				std::string("(") + GetUVCInterfaceSubtypeName(desc.mDescriptorSubtype) + ")");
	if (!desc.mData.empty())
		DumpBytes(level + 1, "data: ", desc.mData);
	if (desc.mHasString)
		DumpStringRef(level + 1, GetUVCStringFieldName(desc.mDescriptorSubtype), desc.mString);
}

void USBDescriptorDump::DumpMidi(const USBMidiDescriptor& desc, int level)
{
	int lvl = level + 1;

	DumpLine(level, "MIDIStreaming Interface Descriptor:");
	DumpHeader(lvl, desc.mLength, desc.mDescriptorType);
	DumpValue(lvl, "bDescriptorSubtype", desc.mDescriptorSubtype, 8,
				std::string("(") + GetMIDIInterfaceSubtypeName(desc.mDescriptorSubtype) + ")");

	if (!desc.mBody)
	{
		if (desc.GetSubtype() == MS_UNDEFINED)
		{
			DumpBytes(lvl, "Invalid desc subtype: ", desc.mData);
		}
		else
		{
			DumpLine(lvl, "Warning: Descriptor too short");
			if (desc.mBodyError.IsSet())
				DumpLine(lvl, desc.mBodyError.GetText());
			DumpBytes(lvl, "data: ", desc.mData);
		}
		return;
	}

	const MIDIEntity& body = *desc.mBody;
	switch (body.GetSubtype())
	{
	case MS_HEADER:
	{
		const MIDIHeader& header = static_cast<const MIDIHeader&>(body);
		DumpVersion(lvl, "bcdADC", header.mBcdMSC);
		DumpValue(lvl, "wTotalLength", header.mTotalLength, 16);
		break;
	}

	case MS_MIDI_IN_JACK:
	{
		const MIDIInputJack& jack = static_cast<const MIDIInputJack&>(body);
		DumpValue(lvl, "bJackType", jack.mJackType, 8, GetMIDIJackTypeName(jack.mJackType));
		DumpValue(lvl, "bJackID", jack.mJackID);
		DumpStringRef(lvl, "iJack", jack.mJack);
		break;
	}

	case MS_MIDI_OUT_JACK:
	{
		const MIDIOutputJack& jack = static_cast<const MIDIOutputJack&>(body);
		DumpValue(lvl, "bJackType", jack.mJackType, 8, GetMIDIJackTypeName(jack.mJackType));
		DumpValue(lvl, "bJackID", jack.mJackID);
		DumpValue(lvl, "bNrInputPins", jack.mNrInputPins);
		for (size_t i = 0; i < jack.mSources.size(); ++i)
		{
			DumpField(lvl, GetArrayFieldName("baSourceID", i), FormatValue(jack.mSources[i].mSourceID, 8));
			DumpField(lvl, GetArrayFieldName("BaSourcePin", i), FormatValue(jack.mSources[i].mSourcePin, 8));
		}
		DumpStringRef(lvl, "iJack", jack.mJack);
		break;
	}

	case MS_ELEMENT:
	{
		const MIDIElement& element = static_cast<const MIDIElement&>(body);
		DumpValue(lvl, "bElementID", element.mElementID);
		DumpValue(lvl, "bNrInputPins", element.mNrInputPins);
		for (size_t i = 0; i < element.mSources.size(); ++i)
		{
			DumpField(lvl, GetArrayFieldName("baSourceID", i), FormatValue(element.mSources[i].mSourceID, 8));
			DumpField(lvl, GetArrayFieldName("BaSourcePin", i), FormatValue(element.mSources[i].mSourcePin, 8));
		}
		DumpValue(lvl, "bNrOutputPins", element.mNrOutputPins);
		DumpValue(lvl, "bInTerminalLink", element.mInTerminalLink);
		DumpValue(lvl, "bOutTerminalLink", element.mOutTerminalLink);
		DumpValue(lvl, "bElCapsSize", element.mElCapsSize);

		int bits = element.mElCapsSize == 0 ? 8 : element.mElCapsSize > 8 ? 64 : element.mElCapsSize * 8;
		DumpHex(lvl, "bmElementCaps", element.GetCapabilities(), bits);
		DumpBitmapStrings(lvl + 1, GetBitmapStrings(element.GetCapabilities(), MIDI_ELEMENT_CAPABILITIES,
													CountOf(MIDI_ELEMENT_CAPABILITIES)));
		DumpStringRef(lvl, "iElement", element.mElement);
		break;
	}

	case MS_UNDEFINED:
		break;
	}

	DumpJunk(lvl, body.mJunk);
}

void USBDescriptorDump::DumpMidiEndpoint(const MIDIEndpointDescriptor& desc, int level)
{
	DumpLine(level, "MIDIStreaming Endpoint Descriptor:");
	DumpHeader(level + 1, desc.mLength, desc.mDescriptorType);
	DumpValue(level + 1, "bDescriptorSubtype", desc.mDescriptorSubtype, 8,
				std::string("(") + GetMIDIEndpointSubtypeName(desc.mDescriptorSubtype) + ")");
	DumpValue(level + 1, "bNumEmbMIDIJack", desc.mNumEmbMIDIJack);
	DumpArray(level + 1, "baAssocJackID", desc.mAssocJackIDs);
	DumpJunk(level + 1, desc.mJunk);
}

////////////////////////////////////////////////////////////////////////////////
// audio

static const char* GetUACSubtypeName(const UACDescriptor& desc)
{
	switch (desc.mContext)
	{
	case UACC_AudioControl:
	{
		// subtypes of an unknown protocol are named after the newest numbering
		UACProtocol protocol = desc.mProtocol == UAC_PROTOCOL_Unknown ? UAC_PROTOCOL_3 : desc.mProtocol;
		return GetUACInterfaceName(GetUACInterface(desc.mDescriptorSubtype, protocol), true);
	}
	case UACC_AudioStreaming:
		return GetUACStreamingSubtypeName(desc.mDescriptorSubtype, true);
	case UACC_AudioStreamingEndpoint:
		return desc.mDescriptorSubtype == UACE_General ? "EP_GENERAL" : "invalid";
	}

	return "UNDEFINED";
}

void USBDescriptorDump::DumpAudio(const UACDescriptor& desc, int level)
{
	switch (desc.mContext)
	{
	case UACC_AudioControl:				DumpLine(level, "AudioControl Interface Descriptor:"); break;
	case UACC_AudioStreaming:			DumpLine(level, "AudioStreaming Interface Descriptor:"); break;
	case UACC_AudioStreamingEndpoint:	DumpLine(level, "AudioStreaming Endpoint Descriptor:"); break;
	}

	int lvl = level + 1;
	DumpHeader(lvl, desc.mLength, desc.mDescriptorType);
	DumpValue(lvl, "bDescriptorSubtype", desc.mDescriptorSubtype, 8, std::string("(") + GetUACSubtypeName(desc) + ")");

	if (!desc.mEntity)
		return;

	UACDescriptorKind kind = desc.mEntity->GetKind();
	if (kind == UACK_Undefined || kind == UACK_Invalid)
		DumpUACRaw(desc, static_cast<const UACRawEntity&>(*desc.mEntity), lvl);
	else
		DumpUACEntity(*desc.mEntity, desc.mProtocol, lvl);
}

void USBDescriptorDump::DumpUACRaw(const UACDescriptor& desc, const UACRawEntity& raw, int level)
{
	if (desc.mError.IsSet())
	{
		DumpLine(level, "Warning: Descriptor too short");
		DumpLine(level, desc.mError.GetText());
		DumpBytes(level, "data: ", raw.mData);
		return;
	}

	if (raw.GetKind() == UACK_Invalid)
	{
		DumpLine(level, std::string("Warning: ") + GetUACSubtypeName(desc) + " descriptors are illegal for " +
						GetUACProtocolName(desc.mProtocol));
		return;
	}

	if (desc.mContext == UACC_AudioStreaming && desc.mDescriptorSubtype == UACS_FormatType)
	{
		if (raw.mData.empty())
			DumpLine(level, "Warning: Descriptor too short");
		else
			DumpBytes(level, "Invalid desc format type: ", raw.mData, "");
		return;
	}

	if (desc.mContext == UACC_AudioStreaming && desc.mDescriptorSubtype == UACS_FormatSpecific)
	{
		DumpLine(level, "Warning: Descriptor too short");
		return;
	}

	std::vector<U8> bytes;
	bytes.push_back(desc.mLength);
	bytes.push_back(desc.mDescriptorType);
	bytes.push_back(desc.mDescriptorSubtype);
	bytes.insert(bytes.end(), raw.mData.begin(), raw.mData.end());
	DumpBytes(level, "Invalid desc subtype: ", bytes);
}

void USBDescriptorDump::DumpUACEntity(const UACEntity& entity, UACProtocol protocol, int level)
{
	switch (entity.GetKind())
	{
	case UACK_Header1:
	case UACK_InputTerminal1:
	case UACK_OutputTerminal1:
	case UACK_MixerUnit1:
	case UACK_SelectorUnit1:
	case UACK_FeatureUnit1:
	case UACK_ProcessingUnit1:
	case UACK_ExtensionUnit1:
		DumpUACControl1(entity, level);
		break;

	case UACK_Header2:
	case UACK_InputTerminal2:
	case UACK_OutputTerminal2:
	case UACK_MixerUnit2:
	case UACK_SelectorUnit2:
	case UACK_FeatureUnit2:
	case UACK_EffectUnit2:
	case UACK_ProcessingUnit2:
	case UACK_ExtensionUnit2:
	case UACK_ClockSource2:
	case UACK_ClockSelector2:
	case UACK_ClockMultiplier2:
	case UACK_SampleRateConverter2:
		DumpUACControl2(entity, level);
		break;

	case UACK_Header3:
	case UACK_InputTerminal3:
	case UACK_OutputTerminal3:
	case UACK_ExtendedTerminalHeader:
	case UACK_MixerUnit3:
	case UACK_SelectorUnit3:
	case UACK_FeatureUnit3:
	case UACK_EffectUnit3:
	case UACK_ProcessingUnit3:
	case UACK_ExtensionUnit3:
	case UACK_ClockSource3:
	case UACK_ClockSelector3:
	case UACK_ClockMultiplier3:
	case UACK_SampleRateConverter3:
	case UACK_PowerDomain:
		DumpUACControl3(entity, level);
		break;

	case UACK_StreamingInterface1:
	case UACK_StreamingInterface2:
	case UACK_StreamingInterface3:
	case UACK_FormatTypeI1:
	case UACK_FormatTypeII1:
	case UACK_FormatTypeI2:
	case UACK_FormatTypeII2:
	case UACK_FormatTypeIV2:
	case UACK_FormatSpecific:
	case UACK_FormatSpecificMPEG:
	case UACK_FormatSpecificAC3:
		DumpUACStreaming(entity, protocol, level);
		break;

	case UACK_DataStreamingEndpoint1:
	case UACK_DataStreamingEndpoint2:
	case UACK_DataStreamingEndpoint3:
		DumpUACEndpoint(entity, level);
		break;

	case UACK_Undefined:
	case UACK_Invalid:
		break;
	}

	DumpJunk(level, entity.mJunk);
}

void USBDescriptorDump::DumpUACControl1(const UACEntity& entity, int level)
{
	switch (entity.GetKind())
	{
	case UACK_Header1:
	{
		const UACHeader1& e = static_cast<const UACHeader1&>(entity);
		DumpVersion(level, "bcdADC", e.mBcdADC);
		DumpValue(level, "wTotalLength", e.mTotalLength, 16);
		DumpValue(level, "bInCollection", e.mInCollection);
		DumpArray(level, "baInterfaceNr", e.mInterfaceNr);
		break;
	}

	case UACK_InputTerminal1:
	{
		const UACInputTerminal1& e = static_cast<const UACInputTerminal1&>(entity);
		DumpValue(level, "bTerminalID", e.mTerminalID);
		DumpHex(level, "wTerminalType", e.mTerminalType, 16, GetUACTerminalTypeName(e.mTerminalType));
		DumpValue(level, "bAssocTerminal", e.mAssocTerminal);
		DumpValue(level, "bNrChannels", e.mNrChannels);
		DumpHex(level, "wChannelConfig", e.mChannelConfig, 16);
		DumpChannelNames(level + 1, UAC_PROTOCOL_1, e.mChannelConfig);
		DumpStringRef(level, "iChannelNames", e.mChannelNames);
		DumpStringRef(level, "iTerminal", e.mTerminal);
		break;
	}

	case UACK_OutputTerminal1:
	{
		const UACOutputTerminal1& e = static_cast<const UACOutputTerminal1&>(entity);
		DumpValue(level, "bTerminalID", e.mTerminalID);
		DumpHex(level, "wTerminalType", e.mTerminalType, 16, GetUACTerminalTypeName(e.mTerminalType));
		DumpValue(level, "bAssocTerminal", e.mAssocTerminal);
		DumpValue(level, "bSourceID", e.mSourceID);
		DumpStringRef(level, "iTerminal", e.mTerminal);
		break;
	}

	case UACK_MixerUnit1:
	{
		const UACMixerUnit1& e = static_cast<const UACMixerUnit1&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpValue(level, "bNrInPins", e.mNrInPins);
		DumpArray(level, "baSourceID", e.mSourceIDs);
		DumpValue(level, "bNrChannels", e.mNrChannels);
		DumpHex(level, "wChannelConfig", e.mChannelConfig, 16);
		DumpChannelNames(level + 1, UAC_PROTOCOL_1, e.mChannelConfig);
		DumpStringRef(level, "iChannelNames", e.mChannelNames);
		DumpHexArray(level, "bmControls", e.mControls);
		DumpStringRef(level, "iMixer", e.mMixer);
		break;
	}

	case UACK_SelectorUnit1:
	{
		const UACSelectorUnit1& e = static_cast<const UACSelectorUnit1&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpValue(level, "bNrInPins", e.mNrInPins);
		DumpArray(level, "baSourceID", e.mSourceIDs);
		DumpStringRef(level, "iSelector", e.mSelector);
		break;
	}

	case UACK_FeatureUnit1:
	{
		const UACFeatureUnit1& e = static_cast<const UACFeatureUnit1&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpValue(level, "bSourceID", e.mSourceID);
		DumpValue(level, "bControlSize", e.mControlSize);

		int bits = e.mControlSize == 0 ? 8 : e.mControlSize > 4 ? 32 : e.mControlSize * 8;
		for (size_t ch = 0; ch < e.mControls.size(); ++ch)
		{
			DumpField(level, GetArrayFieldName("bmaControls", ch), int2str_sal(e.mControls[ch], Hexadecimal, bits));
			DumpControls(level + 1, e.GetControls(ch));
		}
		DumpStringRef(level, "iFeature", e.mFeature);
		break;
	}

	case UACK_ProcessingUnit1:
	{
		const UACProcessingUnit1& e = static_cast<const UACProcessingUnit1&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpHex(level, "wProcessType", e.mProcessType, 16, GetUACProcessTypeName(UAC_PROTOCOL_1, e.mProcessType));
		DumpValue(level, "bNrInPins", e.mNrInPins);
		DumpArray(level, "baSourceID", e.mSourceIDs);
		DumpValue(level, "bNrChannels", e.mNrChannels);
		DumpHex(level, "wChannelConfig", e.mChannelConfig, 16);
		DumpChannelNames(level + 1, UAC_PROTOCOL_1, e.mChannelConfig);
		DumpStringRef(level, "iChannelNames", e.mChannelNames);
		DumpValue(level, "bControlSize", e.mControlSize);
		DumpHexArray(level, "bmControls", e.mControls);
		DumpStringRef(level, "iProcessing", e.mProcessing);
		if (e.mLayout == UACPL_Modes)
		{
			DumpValue(level, "bNrModes", e.mNrModes);
			for (size_t i = 0; i < e.mModes.size(); ++i)
				DumpField(level, GetArrayFieldName("waModes", i), int2str_sal(e.mModes[i], Hexadecimal, 16));
		}
		else if (e.mLayout == UACPL_Undefined && !e.mSpecific.empty())
		{
			DumpBytes(level, "process specific data: ", e.mSpecific);
		}
		break;
	}

	case UACK_ExtensionUnit1:
	{
		const UACExtensionUnit1& e = static_cast<const UACExtensionUnit1&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpHex(level, "wExtensionCode", e.mExtensionCode, 16);
		DumpValue(level, "bNrInPins", e.mNrInPins);
		DumpArray(level, "baSourceID", e.mSourceIDs);
		DumpValue(level, "bNrChannels", e.mNrChannels);
		DumpHex(level, "wChannelConfig", e.mChannelConfig, 16);
		DumpChannelNames(level + 1, UAC_PROTOCOL_1, e.mChannelConfig);
		DumpStringRef(level, "iChannelNames", e.mChannelNames);
		DumpValue(level, "bControlSize", e.mControlSize);
		DumpHexArray(level, "bmControls", e.mControls);
		DumpStringRef(level, "iExtension", e.mExtension);
		break;
	}

	default:
		break;
	}
}

void USBDescriptorDump::DumpUACControl2(const UACEntity& entity, int level)
{
	switch (entity.GetKind())
	{
	case UACK_Header2:
	{
		const UACHeader2& e = static_cast<const UACHeader2&>(entity);
		DumpVersion(level, "bcdADC", e.mBcdADC);
		DumpHex(level, "bCategory", e.mCategory);
		DumpValue(level, "wTotalLength", e.mTotalLength, 16);
		DumpHex(level, "bmControls", e.mControls);
		DumpControls(level + 1, e.GetControls());
		break;
	}

	case UACK_InputTerminal2:
	{
		const UACInputTerminal2& e = static_cast<const UACInputTerminal2&>(entity);
		DumpValue(level, "bTerminalID", e.mTerminalID);
		DumpHex(level, "wTerminalType", e.mTerminalType, 16, GetUACTerminalTypeName(e.mTerminalType));
		DumpValue(level, "bAssocTerminal", e.mAssocTerminal);
		DumpValue(level, "bCSourceID", e.mCSourceID);
		DumpValue(level, "bNrChannels", e.mNrChannels);
		DumpHex(level, "bmChannelConfig", e.mChannelConfig, 32);
		DumpChannelNames(level + 1, UAC_PROTOCOL_2, e.mChannelConfig);
		DumpStringRef(level, "iChannelNames", e.mChannelNames);
		DumpHex(level, "bmControls", e.mControls, 16);
		DumpControls(level + 1, e.GetControls());
		DumpStringRef(level, "iTerminal", e.mTerminal);
		break;
	}

	case UACK_OutputTerminal2:
	{
		const UACOutputTerminal2& e = static_cast<const UACOutputTerminal2&>(entity);
		DumpValue(level, "bTerminalID", e.mTerminalID);
		DumpHex(level, "wTerminalType", e.mTerminalType, 16, GetUACTerminalTypeName(e.mTerminalType));
		DumpValue(level, "bAssocTerminal", e.mAssocTerminal);
		DumpValue(level, "bSourceID", e.mSourceID);
		DumpValue(level, "bCSourceID", e.mCSourceID);
		DumpHex(level, "bmControls", e.mControls, 16);
		DumpControls(level + 1, e.GetControls());
		DumpStringRef(level, "iTerminal", e.mTerminal);
		break;
	}

	case UACK_MixerUnit2:
	{
		const UACMixerUnit2& e = static_cast<const UACMixerUnit2&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpValue(level, "bNrInPins", e.mNrInPins);
		DumpArray(level, "baSourceID", e.mSourceIDs);
		DumpValue(level, "bNrChannels", e.mNrChannels);
		DumpHex(level, "bmChannelConfig", e.mChannelConfig, 32);
		DumpChannelNames(level + 1, UAC_PROTOCOL_2, e.mChannelConfig);
		DumpStringRef(level, "iChannelNames", e.mChannelNames);
		DumpHexArray(level, "bmMixerControls", e.mMixerControls);
		DumpHex(level, "bmControls", e.mControls);
		DumpControls(level + 1, e.GetControls());
		DumpStringRef(level, "iMixer", e.mMixer);
		break;
	}

	case UACK_SelectorUnit2:
	{
		const UACSelectorUnit2& e = static_cast<const UACSelectorUnit2&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpValue(level, "bNrInPins", e.mNrInPins);
		DumpArray(level, "baSourceID", e.mSourceIDs);
		DumpHex(level, "bmControls", e.mControls);
		DumpControls(level + 1, e.GetControls());
		DumpStringRef(level, "iSelector", e.mSelector);
		break;
	}

	case UACK_FeatureUnit2:
	{
		const UACFeatureUnit2& e = static_cast<const UACFeatureUnit2&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpValue(level, "bSourceID", e.mSourceID);
		for (size_t ch = 0; ch < e.mControls.size(); ++ch)
		{
			DumpField(level, GetArrayFieldName("bmaControls", ch), int2str_sal(e.mControls[ch], Hexadecimal, 32));
			DumpControls(level + 1, e.GetControls(ch));
		}
		DumpStringRef(level, "iFeature", e.mFeature);
		break;
	}

	case UACK_EffectUnit2:
	{
		const UACEffectUnit2& e = static_cast<const UACEffectUnit2&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpHex(level, "wEffectType", e.mEffectType, 16, GetUACEffectTypeName(e.mEffectType));
		DumpValue(level, "bSourceID", e.mSourceID);
		DumpHexArray(level, "bmaControls", e.mControls, 32);
		DumpStringRef(level, "iEffects", e.mEffects);
		break;
	}

	case UACK_ProcessingUnit2:
	{
		const UACProcessingUnit2& e = static_cast<const UACProcessingUnit2&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpHex(level, "wProcessType", e.mProcessType, 16, GetUACProcessTypeName(UAC_PROTOCOL_2, e.mProcessType));
		DumpValue(level, "bNrInPins", e.mNrInPins);
		DumpArray(level, "baSourceID", e.mSourceIDs);
		DumpValue(level, "bNrChannels", e.mNrChannels);
		DumpHex(level, "bmChannelConfig", e.mChannelConfig, 32);
		DumpChannelNames(level + 1, UAC_PROTOCOL_2, e.mChannelConfig);
		DumpStringRef(level, "iChannelNames", e.mChannelNames);
		DumpHex(level, "bmControls", e.mControls, 16);
		DumpStringRef(level, "iProcessing", e.mProcessing);
		if (e.mLayout == UACPL_Modes)
		{
			DumpValue(level, "bNrModes", e.mNrModes);
			DumpHexArray(level, "daModes", e.mModes, 32);
		}
		else if (e.mLayout == UACPL_Undefined && !e.mSpecific.empty())
		{
			DumpBytes(level, "process specific data: ", e.mSpecific);
		}
		break;
	}

	case UACK_ExtensionUnit2:
	{
		const UACExtensionUnit2& e = static_cast<const UACExtensionUnit2&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpHex(level, "wExtensionCode", e.mExtensionCode, 16);
		DumpValue(level, "bNrInPins", e.mNrInPins);
		DumpArray(level, "baSourceID", e.mSourceIDs);
		DumpValue(level, "bNrChannels", e.mNrChannels);
		DumpHex(level, "bmChannelConfig", e.mChannelConfig, 32);
		DumpChannelNames(level + 1, UAC_PROTOCOL_2, e.mChannelConfig);
		DumpStringRef(level, "iChannelNames", e.mChannelNames);
		DumpHex(level, "bmControls", e.mControls);
		DumpControls(level + 1, e.GetControls());
		DumpStringRef(level, "iExtension", e.mExtension);
		break;
	}

	case UACK_ClockSource2:
	{
		const UACClockSource2& e = static_cast<const UACClockSource2&>(entity);
		DumpValue(level, "bClockID", e.mClockID);
		DumpHex(level, "bmAttributes", e.mAttributes);
		DumpBitmapStrings(level + 1, e.GetAttributes());
		DumpHex(level, "bmControls", e.mControls);
		DumpControls(level + 1, e.GetControls());
		DumpValue(level, "bAssocTerminal", e.mAssocTerminal);
		DumpStringRef(level, "iClockSource", e.mClockSource);
		break;
	}

	case UACK_ClockSelector2:
	{
		const UACClockSelector2& e = static_cast<const UACClockSelector2&>(entity);
		DumpValue(level, "bClockID", e.mClockID);
		DumpValue(level, "bNrInPins", e.mNrInPins);
		DumpArray(level, "baCSourceID", e.mCSourceIDs);
		DumpHex(level, "bmControls", e.mControls);
		DumpControls(level + 1, e.GetControls());
		DumpStringRef(level, "iClockSelector", e.mClockSelector);
		break;
	}

	case UACK_ClockMultiplier2:
	{
		const UACClockMultiplier2& e = static_cast<const UACClockMultiplier2&>(entity);
		DumpValue(level, "bClockID", e.mClockID);
		DumpValue(level, "bCSourceID", e.mCSourceID);
		DumpHex(level, "bmControls", e.mControls);
		DumpControls(level + 1, e.GetControls());
		DumpStringRef(level, "iClockMultiplier", e.mClockMultiplier);
		break;
	}

	case UACK_SampleRateConverter2:
	{
		const UACSampleRateConverter2& e = static_cast<const UACSampleRateConverter2&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpValue(level, "bSourceID", e.mSourceID);
		DumpValue(level, "bCSourceInID", e.mCSourceInID);
		DumpValue(level, "bCSourceOutID", e.mCSourceOutID);
		DumpStringRef(level, "iSRC", e.mSRC);
		break;
	}

	default:
		break;
	}
}

void USBDescriptorDump::DumpUACControl3(const UACEntity& entity, int level)
{
	switch (entity.GetKind())
	{
	case UACK_Header3:
	{
		const UACHeader3& e = static_cast<const UACHeader3&>(entity);
		DumpHex(level, "bCategory", e.mCategory);
		DumpValue(level, "wTotalLength", e.mTotalLength, 16);
		DumpHex(level, "bmControls", e.mControls, 32);
		DumpControls(level + 1, e.GetControls());
		break;
	}

	case UACK_InputTerminal3:
	{
		const UACInputTerminal3& e = static_cast<const UACInputTerminal3&>(entity);
		DumpValue(level, "bTerminalID", e.mTerminalID);
		DumpHex(level, "wTerminalType", e.mTerminalType, 16, GetUACTerminalTypeName(e.mTerminalType));
		DumpValue(level, "bAssocTerminal", e.mAssocTerminal);
		DumpValue(level, "bCSourceID", e.mCSourceID);
		DumpHex(level, "bmControls", e.mControls, 32);
		DumpControls(level + 1, e.GetControls());
		DumpValue(level, "wClusterDescrID", e.mClusterDescrID, 16);
		DumpValue(level, "wExTerminalDescrID", e.mExTerminalDescrID, 16);
		DumpValue(level, "wConnectorsDescrID", e.mConnectorsDescrID, 16);
		DumpValue(level, "wTerminalDescrStr", e.mTerminalDescrStr, 16);
		break;
	}

	case UACK_OutputTerminal3:
	{
		const UACOutputTerminal3& e = static_cast<const UACOutputTerminal3&>(entity);
		DumpValue(level, "bTerminalID", e.mTerminalID);
		DumpHex(level, "wTerminalType", e.mTerminalType, 16, GetUACTerminalTypeName(e.mTerminalType));
		DumpValue(level, "bAssocTerminal", e.mAssocTerminal);
		DumpValue(level, "bSourceID", e.mSourceID);
		DumpValue(level, "bCSourceID", e.mCSourceID);
		DumpHex(level, "bmControls", e.mControls, 32);
		DumpControls(level + 1, e.GetControls());
		DumpValue(level, "wExTerminalDescrID", e.mExTerminalDescrID, 16);
		DumpValue(level, "wConnectorsDescrID", e.mConnectorsDescrID, 16);
		DumpValue(level, "wTerminalDescrStr", e.mTerminalDescrStr, 16);
		break;
	}

	case UACK_ExtendedTerminalHeader:
	{
		const UACExtendedTerminalHeader& e = static_cast<const UACExtendedTerminalHeader&>(entity);
		DumpValue(level, "wDescriptorID", e.mDescriptorID, 16);
		DumpValue(level, "bNrChannels", e.mNrChannels);
		break;
	}

	case UACK_MixerUnit3:
	{
		const UACMixerUnit3& e = static_cast<const UACMixerUnit3&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpValue(level, "bNrInPins", e.mNrInPins);
		DumpArray(level, "baSourceID", e.mSourceIDs);
		DumpValue(level, "wClusterDescrID", e.mClusterDescrID, 16);
		DumpHexArray(level, "bmMixerControls", e.mMixerControls);
		DumpHex(level, "bmControls", e.mControls, 32);
		DumpControls(level + 1, e.GetControls());
		DumpValue(level, "wMixerDescrStr", e.mMixerDescrStr, 16);
		break;
	}

	case UACK_SelectorUnit3:
	{
		const UACSelectorUnit3& e = static_cast<const UACSelectorUnit3&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpValue(level, "bNrInPins", e.mNrInPins);
		DumpArray(level, "baSourceID", e.mSourceIDs);
		DumpHex(level, "bmControls", e.mControls, 32);
		DumpControls(level + 1, e.GetControls());
		DumpValue(level, "wSelectorDescrStr", e.mSelectorDescrStr, 16);
		break;
	}

	case UACK_FeatureUnit3:
	{
		const UACFeatureUnit3& e = static_cast<const UACFeatureUnit3&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpValue(level, "bSourceID", e.mSourceID);
		for (size_t ch = 0; ch < e.mControls.size(); ++ch)
		{
			DumpField(level, GetArrayFieldName("bmaControls", ch), int2str_sal(e.mControls[ch], Hexadecimal, 32));
			DumpControls(level + 1, e.GetControls(ch));
		}
		DumpValue(level, "wFeatureDescrStr", e.mFeatureDescrStr, 16);
		break;
	}

	case UACK_EffectUnit3:
	{
		const UACEffectUnit3& e = static_cast<const UACEffectUnit3&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpHex(level, "wEffectType", e.mEffectType, 16, GetUACEffectTypeName(e.mEffectType));
		DumpValue(level, "bSourceID", e.mSourceID);
		DumpHexArray(level, "bmaControls", e.mControls, 32);
		DumpValue(level, "wEffectsDescrStr", e.mEffectsDescrStr, 16);
		break;
	}

	case UACK_ProcessingUnit3:
	{
		const UACProcessingUnit3& e = static_cast<const UACProcessingUnit3&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpHex(level, "wProcessType", e.mProcessType, 16, GetUACProcessTypeName(UAC_PROTOCOL_3, e.mProcessType));
		DumpValue(level, "bNrInPins", e.mNrInPins);
		DumpArray(level, "baSourceID", e.mSourceIDs);
		DumpValue(level, "wProcessingDescrStr", e.mProcessingDescrStr, 16);

		if (!e.mHasSpecific)
			break;

		DumpHex(level, "bmControls", e.mControls, 32);
		DumpControls(level + 1, e.GetControls());

		if (e.mProcessType == UAC3_PROCESS_UP_DOWNMIX)
		{
			DumpValue(level, "bNrModes", e.mNrModes);
			DumpArray(level, "waClusterDescrID", e.mClusterDescrIDs);
		}
		else if (e.mProcessType == UAC3_PROCESS_MULTI_FUNCTION)
		{
			DumpValue(level, "wClusterDescrID", e.mClusterDescrID, 16);
			DumpHex(level, "bmAlgorithms", e.mAlgorithms, 32);
			DumpBitmapStrings(level + 1, e.GetAlgorithms());
		}
		break;
	}

	case UACK_ExtensionUnit3:
	{
		const UACExtensionUnit3& e = static_cast<const UACExtensionUnit3&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpHex(level, "wExtensionCode", e.mExtensionCode, 16);
		DumpValue(level, "bNrInPins", e.mNrInPins);
		DumpArray(level, "baSourceID", e.mSourceIDs);
		DumpValue(level, "wExtensionDescrStr", e.mExtensionDescrStr, 16);
		DumpHex(level, "bmControls", e.mControls, 32);
		DumpControls(level + 1, e.GetControls());
		DumpValue(level, "wClusterDescrID", e.mClusterDescrID, 16);
		break;
	}

	case UACK_ClockSource3:
	{
		const UACClockSource3& e = static_cast<const UACClockSource3&>(entity);
		DumpValue(level, "bClockID", e.mClockID);
		DumpHex(level, "bmAttributes", e.mAttributes);
		DumpBitmapStrings(level + 1, e.GetAttributes());
		DumpHex(level, "bmControls", e.mControls, 32);
		DumpControls(level + 1, e.GetControls());
		DumpValue(level, "bReferenceTerminal", e.mReferenceTerminal);
		DumpValue(level, "wClockSourceStr", e.mClockSourceStr, 16);
		break;
	}

	case UACK_ClockSelector3:
	{
		const UACClockSelector3& e = static_cast<const UACClockSelector3&>(entity);
		DumpValue(level, "bClockID", e.mClockID);
		DumpValue(level, "bNrInPins", e.mNrInPins);
		DumpArray(level, "baCSourceID", e.mCSourceIDs);
		DumpHex(level, "bmControls", e.mControls, 32);
		DumpControls(level + 1, e.GetControls());
		DumpValue(level, "wCSelectorDescrStr", e.mCSelectorDescrStr, 16);
		break;
	}

	case UACK_ClockMultiplier3:
	{
		const UACClockMultiplier3& e = static_cast<const UACClockMultiplier3&>(entity);
		DumpValue(level, "bClockID", e.mClockID);
		DumpValue(level, "bCSourceID", e.mCSourceID);
		DumpHex(level, "bmControls", e.mControls, 32);
		DumpControls(level + 1, e.GetControls());
		DumpValue(level, "wCMultiplierDescrStr", e.mCMultiplierDescrStr, 16);
		break;
	}

	case UACK_SampleRateConverter3:
	{
		const UACSampleRateConverter3& e = static_cast<const UACSampleRateConverter3&>(entity);
		DumpValue(level, "bUnitID", e.mUnitID);
		DumpValue(level, "bSourceID", e.mSourceID);
		DumpValue(level, "bCSourceInID", e.mCSourceInID);
		DumpValue(level, "bCSourceOutID", e.mCSourceOutID);
		DumpValue(level, "wSRCDescrStr", e.mSRCDescrStr, 16);
		break;
	}

	case UACK_PowerDomain:
	{
		const UACPowerDomain& e = static_cast<const UACPowerDomain&>(entity);
		DumpValue(level, "bPowerDomainID", e.mPowerDomainID);
		DumpValue(level, "waRecoveryTime(1)", e.mRecoveryTime1, 16);
		DumpValue(level, "waRecoveryTime(2)", e.mRecoveryTime2, 16);
		DumpValue(level, "bNrEntities", e.mNrEntities);
		DumpArray(level, "baEntityID", e.mEntityIDs);
		DumpValue(level, "wPDomainDescrStr", e.mPDomainDescrStr, 16);
		break;
	}

	default:
		break;
	}
}

void USBDescriptorDump::DumpSampleFrequencies(const UACSampleFrequencies& freqs, int level)
{
	DumpValue(level, "bSamFreqType", freqs.mSamFreqType, 8, freqs.IsContinuous() ? "Continuous" : "Discrete");

	if (freqs.IsContinuous())
	{
		DumpValue(level, "tLowerSamFreq", freqs.mLowerSamFreq, 24);
		DumpValue(level, "tUpperSamFreq", freqs.mUpperSamFreq, 24);
		return;
	}

	for (size_t i = 0; i < freqs.mSamFreqs.size(); ++i)
	{
		char name[32];
		snprintf(name, sizeof(name), "tSamFreq[%2u]", unsigned(i));
		DumpValue(level, name, freqs.mSamFreqs[i], 24);
	}
}

void USBDescriptorDump::DumpUACStreaming(const UACEntity& entity, UACProtocol protocol, int level)
{
	switch (entity.GetKind())
	{
	case UACK_StreamingInterface1:
	{
		const UACStreamingInterface1& e = static_cast<const UACStreamingInterface1&>(entity);
		DumpValue(level, "bTerminalLink", e.mTerminalLink);
		DumpValue(level, "bDelay", e.mDelay, 8, "frames");
		DumpHex(level, "wFormatTag", e.mFormatTag, 16, GetUACFormatTagName(e.mFormatTag));
		break;
	}

	case UACK_StreamingInterface2:
	{
		const UACStreamingInterface2& e = static_cast<const UACStreamingInterface2&>(entity);
		DumpValue(level, "bTerminalLink", e.mTerminalLink);
		DumpHex(level, "bmControls", e.mControls);
		DumpControls(level + 1, e.GetControls());
		DumpValue(level, "bFormatType", e.mFormatType, 8, GetUACFormatTypeName(e.mFormatType));
		DumpHex(level, "bmFormats", e.mFormats, 32);
		DumpValue(level, "bNrChannels", e.mNrChannels);
		DumpHex(level, "bmChannelConfig", e.mChannelConfig, 32);
		DumpChannelNames(level + 1, protocol, e.mChannelConfig);
		DumpStringRef(level, "iChannelNames", e.mChannelNames);
		break;
	}

	case UACK_StreamingInterface3:
	{
		const UACStreamingInterface3& e = static_cast<const UACStreamingInterface3&>(entity);
		DumpValue(level, "bTerminalLink", e.mTerminalLink);
		DumpHex(level, "bmControls", e.mControls, 32);
		DumpControls(level + 1, e.GetControls());
		DumpValue(level, "wClusterDescrID", e.mClusterDescrID, 16);
		DumpHex(level, "bmFormats", e.mFormats, 64);
		DumpValue(level, "bSubslotSize", e.mSubslotSize);
		DumpValue(level, "bBitResolution", e.mBitResolution);
		DumpHex(level, "bmAuxProtocols", e.mAuxProtocols, 16);
		DumpValue(level, "bControlSize", e.mControlSize);
		break;
	}

	case UACK_FormatTypeI1:
	{
		const UACFormatTypeI1& e = static_cast<const UACFormatTypeI1&>(entity);
		DumpValue(level, "bFormatType", e.mFormatType, 8, GetUACFormatTypeName(e.mFormatType));
		DumpValue(level, "bNrChannels", e.mNrChannels);
		DumpValue(level, "bSubframeSize", e.mSubframeSize);
		DumpValue(level, "bBitResolution", e.mBitResolution);
		DumpSampleFrequencies(e.mFrequencies, level);
		break;
	}

	case UACK_FormatTypeII1:
	{
		const UACFormatTypeII1& e = static_cast<const UACFormatTypeII1&>(entity);
		DumpValue(level, "bFormatType", e.mFormatType, 8, GetUACFormatTypeName(e.mFormatType));
		DumpValue(level, "wMaxBitRate", e.mMaxBitRate, 16);
		DumpValue(level, "wSamplesPerFrame", e.mSamplesPerFrame, 16);
		DumpSampleFrequencies(e.mFrequencies, level);
		break;
	}

	case UACK_FormatTypeI2:
	{
		const UACFormatTypeI2& e = static_cast<const UACFormatTypeI2&>(entity);
		DumpValue(level, "bFormatType", e.mFormatType, 8, GetUACFormatTypeName(e.mFormatType));
		DumpValue(level, "bSubslotSize", e.mSubslotSize);
		DumpValue(level, "bBitResolution", e.mBitResolution);
		break;
	}

	case UACK_FormatTypeII2:
	{
		const UACFormatTypeII2& e = static_cast<const UACFormatTypeII2&>(entity);
		DumpValue(level, "bFormatType", e.mFormatType, 8, GetUACFormatTypeName(e.mFormatType));
		DumpValue(level, "wMaxBitRate", e.mMaxBitRate, 16);
		DumpValue(level, "wSlotsPerFrame", e.mSlotsPerFrame, 16);
		break;
	}

	case UACK_FormatTypeIV2:
	{
		const UACFormatTypeIV2& e = static_cast<const UACFormatTypeIV2&>(entity);
		DumpValue(level, "bFormatType", e.mFormatType, 8, GetUACFormatTypeName(e.mFormatType));
		break;
	}

	case UACK_FormatSpecific:
	{
		const UACFormatSpecific& e = static_cast<const UACFormatSpecific&>(entity);
		DumpHex(level, "wFormatTag", e.mFormatTag, 16, GetUACFormatTagName(e.mFormatTag));
		DumpBytes(level, "Invalid desc format type: ", e.mData, "");
		break;
	}

	case UACK_FormatSpecificMPEG:
	{
		const UACFormatSpecificMPEG& e = static_cast<const UACFormatSpecificMPEG&>(entity);
		DumpHex(level, "wFormatTag", e.mFormatTag, 16, GetUACFormatTagName(e.mFormatTag));
		DumpHex(level, "bmMPEGCapabilities", e.mMPEGCapabilities, 16);
		DumpBitmapStrings(level + 1, e.GetCapabilities());
		DumpLine(level + 1, std::string("MPEG-2 multilingual support: ") + e.GetMultilingual());
		DumpHex(level, "bmMPEGFeatures", e.mMPEGFeatures);
		DumpLine(level + 1, std::string("Internal Dynamic Range Control: ") + e.GetDynamicRangeControl());
		break;
	}

	case UACK_FormatSpecificAC3:
	{
		const UACFormatSpecificAC3& e = static_cast<const UACFormatSpecificAC3&>(entity);
		DumpHex(level, "wFormatTag", e.mFormatTag, 16, GetUACFormatTagName(e.mFormatTag));
		DumpHex(level, "bmBSID", e.mBSID, 32);
		DumpHex(level, "bmAC3Features", e.mAC3Features);
		DumpBitmapStrings(level + 1, e.GetFeatures());
		DumpLine(level + 1, std::string("Internal Dynamic Range Control: ") + e.GetDynamicRangeControl());
		break;
	}

	default:
		break;
	}
}

void USBDescriptorDump::DumpUACEndpoint(const UACEntity& entity, int level)
{
	switch (entity.GetKind())
	{
	case UACK_DataStreamingEndpoint1:
	{
		const UACDataStreamingEndpoint1& e = static_cast<const UACDataStreamingEndpoint1&>(entity);
		DumpHex(level, "bmAttributes", e.mAttributes);
		DumpBitmapStrings(level + 1, e.GetAttributes());
		DumpValue(level, "bLockDelayUnits", e.mLockDelayUnits, 8, GetUACLockDelayUnitsName(e.mLockDelayUnits));
		DumpValue(level, "wLockDelay", e.mLockDelay, 16);
		break;
	}

	case UACK_DataStreamingEndpoint2:
	{
		const UACDataStreamingEndpoint2& e = static_cast<const UACDataStreamingEndpoint2&>(entity);
		DumpHex(level, "bmAttributes", e.mAttributes);
		DumpBitmapStrings(level + 1, e.GetAttributes());
		DumpHex(level, "bmControls", e.mControls);
		DumpControls(level + 1, e.GetControls());
		DumpValue(level, "bLockDelayUnits", e.mLockDelayUnits, 8, GetUACLockDelayUnitsName(e.mLockDelayUnits));
		DumpValue(level, "wLockDelay", e.mLockDelay, 16);
		break;
	}

	case UACK_DataStreamingEndpoint3:
	{
		const UACDataStreamingEndpoint3& e = static_cast<const UACDataStreamingEndpoint3&>(entity);
		DumpHex(level, "bmControls", e.mControls, 32);
		DumpControls(level + 1, e.GetControls());
		DumpValue(level, "bLockDelayUnits", e.mLockDelayUnits, 8, GetUACLockDelayUnitsName(e.mLockDelayUnits));
		DumpValue(level, "wLockDelay", e.mLockDelay, 16);
		break;
	}

	default:
		break;
	}
}
