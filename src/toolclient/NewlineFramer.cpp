//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NewlineFramer.cpp
// Purpose: Newline-delimited JSON framer used by the process transport
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "toolclient/ContentFramer.h"

namespace toolclient {

namespace {
class NewlineFramer : public IContentFramer {
public:
    explicit NewlineFramer(std::size_t maxLen) : maxFrameBytes(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame; frame.reserve(payload.size() + 1);
        for (char c : payload) {
            // Serialized JSON never carries raw newlines; guard against hand-built payloads.
            if (c != '\n' && c != '\r') {
                frame.push_back(c);
            }
        }
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t eol = buffer.find('\n');
        if (eol == std::string::npos) {
            if (buffer.size() > maxFrameBytes) {
                LOG_WARN("Unterminated frame of {} bytes exceeds limit (max={})", buffer.size(), maxFrameBytes);
                return { DecodeStatus::FrameTooLarge, std::nullopt, buffer.size() };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        std::size_t len = eol;
        if (len > 0 && buffer[len - 1] == '\r') {
            --len;
        }
        if (len > maxFrameBytes) {
            LOG_WARN("Frame of {} bytes exceeds limit (max={})", len, maxFrameBytes);
            return { DecodeStatus::FrameTooLarge, std::nullopt, eol + 1 };
        }
        std::size_t start = 0;
        while (start < len && (buffer[start] == ' ' || buffer[start] == '\t')) {
            ++start;
        }
        if (start == len) {
            return { DecodeStatus::EmptyFrame, std::nullopt, eol + 1 };
        }
        return { DecodeStatus::Ok, std::make_optional(buffer.substr(start, len - start)), eol + 1 };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        while (true) {
            DecodeResult r = tryDecodeEx(buffer);
            if (r.status == DecodeStatus::EmptyFrame) {
                buffer.erase(0, r.bytesConsumed);
                continue;
            }
            if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
                buffer.erase(0, r.bytesConsumed);
                return r.payload;
            }
            return std::nullopt;
        }
    }

private:
    std::size_t maxFrameBytes;
};
} // namespace

std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxFrameBytes) {
    return std::make_unique<NewlineFramer>(maxFrameBytes);
}

} // namespace toolclient
