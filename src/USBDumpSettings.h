#ifndef USB_DUMP_SETTINGS_H
#define USB_DUMP_SETTINGS_H

#include <string>

#include <AnalyzerSettings.h>
#include <AnalyzerTypes.h>

#include "USBTypes.h"

// how descriptor dumps are rendered
class USBDumpSettings : public AnalyzerSettings
{
public:
	USBDumpSettings();
	virtual ~USBDumpSettings();

	virtual bool SetSettingsFromInterfaces();
	virtual void LoadSettings(const char* settings);
	virtual const char* SaveSettings();

	void UpdateInterfacesFromSettings();

	bool Validate(std::string& error) const;

	// sets the level of the default spdlog logger
	void ApplyLogLevel() const;

	DisplayBase		mDisplayBase;		// plain numeric fields; bitmaps are always hex
	U32				mIndent;			// spaces per nesting level
	U32				mFieldWidth;		// column of the field values
	bool			mResolveStrings;	// print resolved strings next to string indexes
	bool			mShowJunk;			// print bytes past the decoded layout
	int				mLogLevel;			// spdlog::level::level_enum

protected:
	AnalyzerSettingInterfaceNumberList	mDisplayBaseInterface;
	AnalyzerSettingInterfaceInteger		mIndentInterface;
	AnalyzerSettingInterfaceInteger		mFieldWidthInterface;
	AnalyzerSettingInterfaceBool		mResolveStringsInterface;
	AnalyzerSettingInterfaceBool		mShowJunkInterface;
	AnalyzerSettingInterfaceNumberList	mLogLevelInterface;
};

#endif	// USB_DUMP_SETTINGS_H
