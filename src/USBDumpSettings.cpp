#include <AnalyzerHelpers.h>

#include <spdlog/spdlog.h>

#include "USBDumpSettings.h"

const U32 MAX_INDENT = 16;
const U32 MIN_FIELD_WIDTH = 8;
const U32 MAX_FIELD_WIDTH = 64;

USBDumpSettings::USBDumpSettings()
:	mDisplayBase(Decimal),
	mIndent(2),
	mFieldWidth(24),
	mResolveStrings(true),
	mShowJunk(true),
	mLogLevel(spdlog::level::warn)
{
	// init the interface
	mDisplayBaseInterface.SetTitleAndTooltip("Number format", "Display base of the numeric descriptor fields");
	mDisplayBaseInterface.AddNumber(Decimal, "Decimal", "Numbers in decimal, bitmaps in hex");
	mDisplayBaseInterface.AddNumber(Hexadecimal, "Hexadecimal", "All numbers in hex");
	mDisplayBaseInterface.AddNumber(Binary, "Binary", "All numbers in binary");

	mDisplayBaseInterface.SetNumber(mDisplayBase);

	mIndentInterface.SetTitleAndTooltip("Indent", "Spaces per nesting level");
	mIndentInterface.SetMin(0);
	mIndentInterface.SetMax(MAX_INDENT);
	mIndentInterface.SetInteger(mIndent);

	mFieldWidthInterface.SetTitleAndTooltip("Field width", "Width of the field name column");
	mFieldWidthInterface.SetMin(MIN_FIELD_WIDTH);
	mFieldWidthInterface.SetMax(MAX_FIELD_WIDTH);
	mFieldWidthInterface.SetInteger(mFieldWidth);

	mResolveStringsInterface.SetTitleAndTooltip("Strings", "Print string descriptors next to their index");
	mResolveStringsInterface.SetCheckBoxText("Resolve string indexes");
	mResolveStringsInterface.SetValue(mResolveStrings);

	mShowJunkInterface.SetTitleAndTooltip("Junk", "Print bytes past the end of the decoded layout");
	mShowJunkInterface.SetCheckBoxText("Show junk bytes");
	mShowJunkInterface.SetValue(mShowJunk);

	mLogLevelInterface.SetTitleAndTooltip("Log level", "Diagnostics written while decoding");
	mLogLevelInterface.AddNumber(spdlog::level::trace, "Trace", "Everything");
	mLogLevelInterface.AddNumber(spdlog::level::debug, "Debug", "Decode decisions");
	mLogLevelInterface.AddNumber(spdlog::level::info, "Info", "Informational messages");
	mLogLevelInterface.AddNumber(spdlog::level::warn, "Warning", "Descriptors that could not be fully decoded");
	mLogLevelInterface.AddNumber(spdlog::level::err, "Error", "Errors only");
	mLogLevelInterface.AddNumber(spdlog::level::off, "Off", "No diagnostics");

	mLogLevelInterface.SetNumber(mLogLevel);

	// add the interface
	AddInterface(&mDisplayBaseInterface);
	AddInterface(&mIndentInterface);
	AddInterface(&mFieldWidthInterface);
	AddInterface(&mResolveStringsInterface);
	AddInterface(&mShowJunkInterface);
	AddInterface(&mLogLevelInterface);
}

USBDumpSettings::~USBDumpSettings()
{}

bool USBDumpSettings::Validate(std::string& error) const
{
	if (mDisplayBase != Decimal && mDisplayBase != Hexadecimal && mDisplayBase != Binary)
	{
		error = "Please select decimal, hexadecimal or binary numbers.";
		return false;
	}

	if (mIndent > MAX_INDENT)
	{
		error = "The indent can not be more than " + int2str(MAX_INDENT) + " spaces.";
		return false;
	}

	if (mFieldWidth < MIN_FIELD_WIDTH || mFieldWidth > MAX_FIELD_WIDTH)
	{
		error = "The field width must be between " + int2str(MIN_FIELD_WIDTH) + " and " + int2str(MAX_FIELD_WIDTH) + ".";
		return false;
	}

	if (mLogLevel < spdlog::level::trace || mLogLevel > spdlog::level::off)
	{
		error = "Unknown log level " + int2str(mLogLevel) + ".";
		return false;
	}

	return true;
}

bool USBDumpSettings::SetSettingsFromInterfaces()
{
	DisplayBase displayBase = DisplayBase(int(mDisplayBaseInterface.GetNumber()));
	U32 indent = U32(mIndentInterface.GetInteger());
	U32 fieldWidth = U32(mFieldWidthInterface.GetInteger());
	int logLevel = int(mLogLevelInterface.GetNumber());

	// validate a copy so a rejected edit leaves the current settings alone
	USBDumpSettings candidate;
	candidate.mDisplayBase = displayBase;
	candidate.mIndent = indent;
	candidate.mFieldWidth = fieldWidth;
	candidate.mLogLevel = logLevel;

	std::string error;
	if (!candidate.Validate(error))
	{
		SetErrorText(error.c_str());
		return false;
	}

	mDisplayBase = displayBase;
	mIndent = indent;
	mFieldWidth = fieldWidth;
	mResolveStrings = mResolveStringsInterface.GetValue();
	mShowJunk = mShowJunkInterface.GetValue();
	mLogLevel = logLevel;

	return true;
}

void USBDumpSettings::UpdateInterfacesFromSettings()
{
	mDisplayBaseInterface.SetNumber(mDisplayBase);
	mIndentInterface.SetInteger(mIndent);
	mFieldWidthInterface.SetInteger(mFieldWidth);
	mResolveStringsInterface.SetValue(mResolveStrings);
	mShowJunkInterface.SetValue(mShowJunk);
	mLogLevelInterface.SetNumber(mLogLevel);
}

void USBDumpSettings::ApplyLogLevel() const
{
	spdlog::set_level(spdlog::level::level_enum(mLogLevel));
}

void USBDumpSettings::LoadSettings(const char* settings)
{
	SimpleArchive text_archive;
	text_archive.SetString(settings);

	int base;
	U32 indent;
	U32 fieldWidth;
	bool resolveStrings;
	bool showJunk;
	int logLevel;

	if (!(text_archive >> base) || !(text_archive >> indent) || !(text_archive >> fieldWidth) ||
		!(text_archive >> resolveStrings) || !(text_archive >> showJunk) || !(text_archive >> logLevel))
	{
		spdlog::warn("dump settings could not be read, keeping the defaults");
		return;
	}

	USBDumpSettings candidate;
	candidate.mDisplayBase = DisplayBase(base);
	candidate.mIndent = indent;
	candidate.mFieldWidth = fieldWidth;
	candidate.mLogLevel = logLevel;

	std::string error;
	if (!candidate.Validate(error))
	{
		spdlog::warn("stored dump settings rejected, keeping the defaults: {}", error);
		return;
	}

	mDisplayBase = DisplayBase(base);
	mIndent = indent;
	mFieldWidth = fieldWidth;
	mResolveStrings = resolveStrings;
	mShowJunk = showJunk;
	mLogLevel = logLevel;

	UpdateInterfacesFromSettings();
}

const char* USBDumpSettings::SaveSettings()
{
	SimpleArchive text_archive;

	text_archive << int(mDisplayBase);
	text_archive << mIndent;
	text_archive << mFieldWidth;
	text_archive << mResolveStrings;
	text_archive << mShowJunk;
	text_archive << mLogLevel;

	return SetReturnString(text_archive.GetString());
}
