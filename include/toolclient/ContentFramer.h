//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for message framing on a tool-server byte stream
//========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <memory>

namespace toolclient {

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        EmptyFrame,     // blank separator line; drop bytesConsumed and continue
        FrameTooLarge   // frame exceeds the configured maximum
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // bytes to drop from the front of the buffer
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

//========================================================================================================
// MakeNewlineFramer
// Purpose: One JSON document per line ("<json>\n"). A trailing '\r' before the newline is stripped.
// Args:
//   maxFrameBytes: Largest accepted line, excluding the terminator.
//========================================================================================================
std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxFrameBytes = 16 * 1024 * 1024);

} // namespace toolclient
