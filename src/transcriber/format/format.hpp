#pragma once

#include "segment.hpp"
#include "strings.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

enum class Format { Srt, Tsv, Txt, Vtt, Json };

// Canonical identifier, also used as the file extension.
std::string_view format_name(Format format);

// Exact identifier match after trimming surrounding whitespace.
std::optional<Format> parse_format(std::string_view id);

// All formats in their canonical listing order.
std::span<const Format> supported_formats();

// "srt, tsv, txt, vtt, json"
std::string supported_formats_list();

struct FormatSelection {
    std::vector<Format> formats;        // recognized, duplicates removed, request order
    std::vector<std::string> rejected;  // identifiers that matched no format
};

FormatSelection select_formats(const std::vector<std::string>& ids);

// Render a whole segment sequence as one format's file content.
std::string encode(Format format, std::span<const Segment> segments);

std::string encode_srt(std::span<const Segment> segments);
std::string encode_vtt(std::span<const Segment> segments);
std::string encode_tsv(std::span<const Segment> segments);
std::string encode_json(std::span<const Segment> segments);
std::string encode_txt(std::span<const Segment> segments);
