/*
 * Version macros for dapwire.
 *
 * The build system passes DAPWIRE_VERSION_* as compile definitions; the defaults below keep
 * the header usable without them.
 */

#pragma once

#ifndef DAPWIRE_VERSION_MAJOR
#define DAPWIRE_VERSION_MAJOR 0
#endif

#ifndef DAPWIRE_VERSION_MINOR
#define DAPWIRE_VERSION_MINOR 0
#endif

#ifndef DAPWIRE_VERSION_PATCH
#define DAPWIRE_VERSION_PATCH 0
#endif

#ifndef DAPWIRE_VERSION_STRING
#define DAPWIRE_VERSION_STRING "0.0.0+dev"
#endif

#if defined(__cplusplus)
namespace dapwire {
namespace version {
constexpr int major_v = DAPWIRE_VERSION_MAJOR;
constexpr int minor_v = DAPWIRE_VERSION_MINOR;
constexpr int patch_v = DAPWIRE_VERSION_PATCH;
constexpr const char* string_v = DAPWIRE_VERSION_STRING;
} // namespace version
} // namespace dapwire
#endif
