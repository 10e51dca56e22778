// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace meshprobe {

// "meshprobe v0.3.0"
std::string GetFullVersionString();
std::string GetCopyrightString();

}  // namespace meshprobe
