#pragma once

#include "capsule/engine.h"

#include <string>

namespace capsule {

enum class Profile { DEV, PROD };

// From CAPSULE_PROFILE ("prod" or "production", any case). Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Sets profile env vars that are not already set.
// DEV:  seccomp off, isolation auto
// PROD: seccomp on, isolation process (no in-process fallback)
void apply_profile_defaults(Profile p);

// Builds an EngineConfig from CAPSULE_* variables. Missing or malformed
// values keep the built-in defaults.
EngineConfig load_engine_config();

} // namespace capsule
