#pragma once

// Build/version info.
//
// CMake defines SIGNALVAULT_VERSION from the project version.
// Builds without CMake report "dev".

#ifndef SIGNALVAULT_VERSION
#define SIGNALVAULT_VERSION "dev"
#endif

#ifndef SIGNALVAULT_APPNAME
#define SIGNALVAULT_APPNAME "SignalVault"
#endif
