#pragma once

#include <string>

enum class TimestampStyle { Srt, Vtt };

// HH:MM:SS,mmm (Srt) or HH:MM:SS.mmm (Vtt). Milliseconds are truncated, the
// hour field grows past two digits instead of wrapping. Negative and
// non-finite input is clamped to zero, input above 9e15 s saturates there.
std::string format_timestamp(double seconds, TimestampStyle style);

// Shortest round-trip decimal form of a raw second value, always carrying a
// fractional part for integral values ("4.0", "8.5", "0.0").
std::string format_seconds(double seconds);
