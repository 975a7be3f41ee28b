#pragma once
#include <cstdint>
#include <string>

#include "errors.hpp"
#include "types.hpp"

// Wire format version written into every encoded frame. Decoding rejects any other value.
constexpr int kFrameFormatVersion = 1;

// Frame <-> MessagePack map {"v", "src", "seq", "ts", "img"}. Pure, no I/O.
Bytes encode_frame(const Frame& frame);
// Throws DecodeError on truncated, malformed or version-mismatched input.
Frame decode_frame(const Bytes& bytes);

// Detection <-> JSON text for the detections channel.
std::string encode_detection(const Detection& detection);
Detection decode_detection(const std::string& text);

int64_t to_unix_ns(WallTime t);
WallTime from_unix_ns(int64_t ns);
