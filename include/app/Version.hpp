#pragma once

// Set by the build; the fallback keeps ad-hoc builds working.
#ifndef SKYNODE_VERSION
#define SKYNODE_VERSION "0.1.0"
#endif

namespace skynode::app {

inline constexpr const char* kVersion = SKYNODE_VERSION;

} // namespace skynode::app
