#ifndef WEBLESS_CORE_CONFIG_H
#define WEBLESS_CORE_CONFIG_H

#include <cstddef>

namespace webless::core::config {

inline constexpr std::size_t kDefaultMaxInputSize = 64u * 1024u * 1024u;
inline constexpr std::size_t kDefaultMaxNestingDepth = 512;
inline constexpr const char kProgramName[] = "webless_parse";
inline constexpr const char kVersionString[] = "webless_parse 0.1.0";

}  // namespace webless::core::config

#endif  // WEBLESS_CORE_CONFIG_H
