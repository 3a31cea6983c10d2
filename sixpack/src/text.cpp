// TU header --------------------------------------------
#include "text.h"

// c++ headers ------------------------------------------
#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <array>
#include <unordered_map>

constexpr uint32_t kLanguageCount = 2;

namespace {

#define MAKE_TEXT(id, de, en) std::make_pair(TextId::id, std::array<const char*, kLanguageCount>{{ de, en }})

std::unordered_map<TextId, std::array<const char*, kLanguageCount>> const kTextMap = {
  MAKE_TEXT(kControlPanel,      "Steuerung",            "Controls"),
  MAKE_TEXT(kLanguage,          "Sprache",              "Language"),
  MAKE_TEXT(kDemoMode,          "Demomodus",            "Demo mode"),
  MAKE_TEXT(kCurrent,           "aktuell",              "current"),
  MAKE_TEXT(kAirspeed,          "Fahrt (kt)",           "Airspeed (kt)"),
  MAKE_TEXT(kRpm,               "Drehzahl (U/min)",     "RPM"),
  MAKE_TEXT(kAltitude,          "Höhe (ft)",            "Altitude (ft)"),
  MAKE_TEXT(kAltitudeRate,      "Steigrate (ft/min)",   "Vertical speed (ft/min)"),
  MAKE_TEXT(kBarometer,         "Luftdruck (inHg)",     "Barometer (inHg)"),
  MAKE_TEXT(kHeading,           "Steuerkurs (°)",       "Heading (deg)"),
  MAKE_TEXT(kRoll,              "Querlage (°)",         "Roll (deg)"),
  MAKE_TEXT(kRollRate,          "Rollrate (°/s)",       "Roll rate (deg/s)"),
  MAKE_TEXT(kPitch,             "Längsneigung (°)",     "Pitch (deg)"),
  MAKE_TEXT(kYaw,               "Schiebewinkel (°)",    "Yaw (deg)"),
  MAKE_TEXT(kYawRate,           "Gierrate (°/s)",       "Yaw rate (deg/s)"),
  MAKE_TEXT(kIndicatedAltitude, "Angezeigte Höhe",      "Indicated altitude"),
  MAKE_TEXT(kTabToHide,         "Tab: ausblenden",      "Tab to hide"),
  MAKE_TEXT(kControlsHint,      "Knöpfe mit der Maus drehen", "Drag the knobs to turn them"),
};

Language current_language = Language::kEnglish;

bool IsGerman(char const* locale) {
  return locale != nullptr && strncmp(locale, "de", 2) == 0;
}

} // namespace

Language GetSystemLanguageOrEnglish() {
  char const* locale = std::getenv("LANGUAGE");
  if (locale == nullptr || *locale == '\0') {
    locale = std::getenv("LANG");
  }
  return IsGerman(locale) ? Language::kGerman : Language::kEnglish;
}

Language GetCurrentLanguage() {
  return current_language;
}

void SetCurrentLanguage(Language lang) {
  current_language = lang;
}

const char* GetText(TextId id) {
  return GetTextInLang(id, current_language);
}

const char* GetTextInLang(TextId id, Language lang) {
  auto it = kTextMap.find(id);
  if (it == kTextMap.end()) {
    return "???";
  }
  uint32_t lang_index = static_cast<uint32_t>(lang);
  if (lang_index >= kLanguageCount) {
    lang_index = 1; // default to English
  }
  return it->second[lang_index];
}
