#ifndef TFB_TOOLSET_VERSION_HPP
#define TFB_TOOLSET_VERSION_HPP

namespace tfb_toolset {

#ifndef TFB_TOOLSET_VERSION
#define TFB_TOOLSET_VERSION "0.1.0"
#endif

constexpr const char* VERSION = TFB_TOOLSET_VERSION;
constexpr const char* PROGRAM_NAME = "tfb-toolset";

} // namespace tfb_toolset

#endif // TFB_TOOLSET_VERSION_HPP
