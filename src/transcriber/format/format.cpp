#include "format/format.hpp"

#include "format/time_codec.hpp"

#include <algorithm>
#include <array>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

using EncodeFn = std::string (*)(std::span<const Segment>);

struct FormatEntry {
    Format format;
    std::string_view name;
    EncodeFn encode;
};

constexpr std::array<FormatEntry, 5> kFormats = {{
    {Format::Srt, "srt", encode_srt},
    {Format::Tsv, "tsv", encode_tsv},
    {Format::Txt, "txt", encode_txt},
    {Format::Vtt, "vtt", encode_vtt},
    {Format::Json, "json", encode_json},
}};

constexpr std::array<Format, 5> kFormatOrder = {
    Format::Srt, Format::Tsv, Format::Txt, Format::Vtt, Format::Json,
};

const FormatEntry& entry_for(Format format) {
    return *std::find_if(kFormats.begin(), kFormats.end(),
                         [format](const FormatEntry& e) { return e.format == format; });
}

std::string cue_timing(const Segment& seg, TimestampStyle style) {
    return format_timestamp(seg.start, style) + " --> " + format_timestamp(seg.end, style);
}

} // namespace

std::string_view format_name(Format format) {
    return entry_for(format).name;
}

std::optional<Format> parse_format(std::string_view id) {
    auto name = trim(id);
    for (const auto& e : kFormats) {
        if (e.name == name) return e.format;
    }
    return std::nullopt;
}

std::span<const Format> supported_formats() {
    return kFormatOrder;
}

std::string supported_formats_list() {
    std::string out;
    for (auto f : kFormatOrder) {
        if (!out.empty()) out += ", ";
        out += format_name(f);
    }
    return out;
}

FormatSelection select_formats(const std::vector<std::string>& ids) {
    FormatSelection sel;
    for (const auto& id : ids) {
        auto f = parse_format(id);
        if (!f) {
            sel.rejected.push_back(id);
            continue;
        }
        if (std::find(sel.formats.begin(), sel.formats.end(), *f) == sel.formats.end()) {
            sel.formats.push_back(*f);
        }
    }
    return sel;
}

std::string encode(Format format, std::span<const Segment> segments) {
    return entry_for(format).encode(segments);
}

std::string encode_srt(std::span<const Segment> segments) {
    std::string out;
    size_t index = 1;
    for (const auto& seg : segments) {
        out += std::to_string(index++);
        out += '\n';
        out += cue_timing(seg, TimestampStyle::Srt);
        out += '\n';
        out += trim(seg.text);
        out += "\n\n";
    }
    return out;
}

std::string encode_vtt(std::span<const Segment> segments) {
    std::string out = "WEBVTT\n\n";
    for (const auto& seg : segments) {
        out += cue_timing(seg, TimestampStyle::Vtt);
        out += '\n';
        out += trim(seg.text);
        out += "\n\n";
    }
    return out;
}

std::string encode_tsv(std::span<const Segment> segments) {
    // Speaker column is always empty: there is no diarization.
    std::string out = "start\tend\tspeaker\ttext\n";
    for (const auto& seg : segments) {
        out += format_seconds(seg.start);
        out += '\t';
        out += format_seconds(seg.end);
        out += "\t\t";
        out += trim(seg.text);
        out += '\n';
    }
    return out;
}

std::string encode_json(std::span<const Segment> segments) {
    json arr = json::array();
    for (const auto& seg : segments) {
        arr.push_back({
            {"start", seg.start},
            {"end", seg.end},
            {"text", trim(seg.text)},
        });
    }
    // Invalid UTF-8 from the model is replaced rather than aborting the write.
    return arr.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

std::string encode_txt(std::span<const Segment> segments) {
    std::string out;
    for (const auto& seg : segments) {
        out += trim(seg.text);
        out += '\n';
    }
    return out;
}
