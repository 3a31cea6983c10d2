#pragma once

enum class Language {
  kGerman,
  kEnglish,
};

enum class TextId {
  kControlPanel,
  kLanguage,
  kDemoMode,
  kCurrent,
  kAirspeed,
  kRpm,
  kAltitude,
  kAltitudeRate,
  kBarometer,
  kHeading,
  kRoll,
  kRollRate,
  kPitch,
  kYaw,
  kYawRate,
  kIndicatedAltitude,
  kTabToHide,
  kControlsHint,
};

/// German when `LANGUAGE` or `LANG` starts with "de", otherwise English.
Language GetSystemLanguageOrEnglish();

Language GetCurrentLanguage();
void SetCurrentLanguage(Language lang);

const char* GetText(TextId id);

const char* GetTextInLang(TextId id, Language lang);
