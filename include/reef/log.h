#pragma once

#include "config.h"

namespace Reef {

// Print a formatted line to the standard output. Not synchronized
void print(const char* msgFormat, ...);

// Thread safe version of print
void tsPrint(const char* msgFormat, ...);

// Thread safe, prints to the standard error
void tsPrintError(const char* msgFormat, ...);

} // namespace Reef

#define RF_LOG_ERROR(...) ::Reef::tsPrintError(__VA_ARGS__)

#if RF_LOG_LEVEL > 0
#define RF_LOG_INFO(...) ::Reef::tsPrint(__VA_ARGS__)
#else
#define RF_LOG_INFO(...) ((void)0)
#endif

#if RF_LOG_LEVEL > 1
#define RF_LOG_VERBOSE(...) ::Reef::tsPrint(__VA_ARGS__)
#else
#define RF_LOG_VERBOSE(...) ((void)0)
#endif
