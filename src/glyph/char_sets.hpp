#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <optional>

namespace asciicam {

enum class CharSetId {
    Dense,
    Simple,
    Blocks,
    Minimal
};

// Glyphs are ordered by ink coverage, lightest first. Index 0 is drawn for the
// darkest pixels, the last index for the brightest.
struct CharacterSet {
    CharSetId id = CharSetId::Dense;
    std::string_view name;
    std::vector<uint32_t> glyphs;

    int size() const { return static_cast<int>(glyphs.size()); }
};

namespace CharSet {

const std::string DENSE = " .,:;+*?%S#@";
const std::string SIMPLE = " .-+*#@";
const std::string BLOCKS = " \xE2\x96\x8F\xE2\x96\x8E\xE2\x96\x8D\xE2\x96\x8C\xE2\x96\x8B\xE2\x96\x8A\xE2\x96\x89\xE2\x96\x88";
const std::string MINIMAL = " \xE2\x96\x91\xE2\x96\x92\xE2\x96\x93\xE2\x96\x88";

inline bool is_valid_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

inline std::vector<uint32_t> to_codepoints(const std::string& s) {
    std::vector<uint32_t> result;
    size_t i = 0;
    while (i < s.size()) {
        uint32_t cp = 0;
        unsigned char c = static_cast<unsigned char>(s[i]);

        if (c < 0x80) {
            cp = c;
            ++i;
        } else if ((c & 0xE0) == 0xC0) {
            if (i + 1 >= s.size() || !is_valid_continuation_byte(s[i+1])) {
                ++i;
                continue;
            }
            cp = ((c & 0x1F) << 6) | (static_cast<unsigned char>(s[i+1]) & 0x3F);
            i += 2;
        } else if ((c & 0xF0) == 0xE0) {
            if (i + 2 >= s.size() ||
                !is_valid_continuation_byte(s[i+1]) ||
                !is_valid_continuation_byte(s[i+2])) {
                ++i;
                continue;
            }
            cp = ((c & 0x0F) << 12) |
                 ((static_cast<unsigned char>(s[i+1]) & 0x3F) << 6) |
                 (static_cast<unsigned char>(s[i+2]) & 0x3F);
            i += 3;
        } else {
            ++i;
            continue;
        }

        if (cp >= 0xD800 && cp <= 0xDFFF) {
            continue;
        }

        result.push_back(cp);
    }
    return result;
}

inline const CharacterSet& get(CharSetId id) {
    static const CharacterSet dense{CharSetId::Dense, "Dense", to_codepoints(DENSE)};
    static const CharacterSet simple{CharSetId::Simple, "Simple", to_codepoints(SIMPLE)};
    static const CharacterSet blocks{CharSetId::Blocks, "Blocks", to_codepoints(BLOCKS)};
    static const CharacterSet minimal{CharSetId::Minimal, "Minimal", to_codepoints(MINIMAL)};
    switch (id) {
        case CharSetId::Dense: return dense;
        case CharSetId::Simple: return simple;
        case CharSetId::Blocks: return blocks;
        case CharSetId::Minimal: return minimal;
    }
    return dense;
}

inline CharSetId next(CharSetId id) {
    switch (id) {
        case CharSetId::Dense: return CharSetId::Simple;
        case CharSetId::Simple: return CharSetId::Blocks;
        case CharSetId::Blocks: return CharSetId::Minimal;
        case CharSetId::Minimal: return CharSetId::Dense;
    }
    return CharSetId::Dense;
}

inline CharSetId previous(CharSetId id) {
    switch (id) {
        case CharSetId::Dense: return CharSetId::Minimal;
        case CharSetId::Simple: return CharSetId::Dense;
        case CharSetId::Blocks: return CharSetId::Simple;
        case CharSetId::Minimal: return CharSetId::Blocks;
    }
    return CharSetId::Dense;
}

inline std::optional<CharSetId> parse(const std::string& name) {
    if (name == "dense") return CharSetId::Dense;
    if (name == "simple") return CharSetId::Simple;
    if (name == "blocks") return CharSetId::Blocks;
    if (name == "minimal") return CharSetId::Minimal;
    return std::nullopt;
}

}

}
