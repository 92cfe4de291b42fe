#pragma once

#ifndef ZF_BUILD_VERSION
#define ZF_BUILD_VERSION "0.0.0"
#endif

namespace zf::version
{

// Compile-time strings derived from ZF_BUILD_VERSION so both executables
// report the same thing.
inline constexpr char const kWriterDisplayVersion[] =
    "zenflow-writer " ZF_BUILD_VERSION;
inline constexpr char const kWidgetDisplayVersion[] =
    "zenflow-widget " ZF_BUILD_VERSION;

} // namespace zf::version
