#pragma once

#include <string>

// One timed span of recognized speech, times in seconds.
struct Segment {
    double start = 0.0;
    double end = 0.0;
    std::string text;

    bool operator==(const Segment&) const = default;
};
