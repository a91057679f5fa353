#pragma once

#include <string>

#include "config/config.pb.h"

namespace ito::config {

inline constexpr const char* kDefaultStateDir        = ".ito";
inline constexpr const char* kDefaultLogRelativePath = ".state/audit/events.jsonl";
inline constexpr uint32_t    kDefaultPollIntervalMs  = 500;
inline constexpr uint32_t    kDefaultStreamLast      = 10;

// Fills every unset field with its default. Explicit values are kept.
void ApplyDefaults(ito::runtime::config::RuntimeConfig* config);

ito::runtime::config::RuntimeConfig DefaultConfig();

} // namespace ito::config
