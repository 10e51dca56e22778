// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "version.hpp"

// Set by the build system from the project version
#ifndef MESHPROBE_VERSION_STRING
#define MESHPROBE_VERSION_STRING "0.0.0-unknown"
#endif

namespace meshprobe {

std::string GetFullVersionString() {
  return std::string("meshprobe v") + MESHPROBE_VERSION_STRING;
}

std::string GetCopyrightString() {
  return "Copyright (c) 2025 The meshprobe developers\n"
         "Distributed under the MIT software license";
}

}  // namespace meshprobe
