//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version reported as clientInfo and by the operator console.
//==========================================================================================================
#pragma once

#include <string>

namespace toolclient {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Version as "MAJOR.MINOR.PATCH", sent in the initialize request and printed by `help`.
//==========================================================================================================
std::string getVersionString();

} // namespace toolclient
