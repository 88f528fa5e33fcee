#include <mise/normalize.hpp>

#include <cstdint>

namespace mise::internal {

namespace {

// Multi-byte UTF-8 sequences that fold to one ASCII byte.
// Format: { src_bytes, src_len, dst }
struct FoldMapping {
    uint8_t src[3];
    uint8_t src_len;
    char dst;
};

constexpr FoldMapping kFoldMappings[] = {
    // Spaces that recipe sites use between a number and its unit
    {{0xC2, 0xA0, 0}, 2, ' '},       // no-break space U+00A0
    {{0xE2, 0x80, 0x89}, 3, ' '},    // thin space U+2009
    {{0xE2, 0x80, 0xAF}, 3, ' '},    // narrow no-break space U+202F

    // Dashes used in ranges such as "4-6 servings" on many recipe sites
    {{0xE2, 0x80, 0x90}, 3, '-'},    // hyphen U+2010
    {{0xE2, 0x80, 0x91}, 3, '-'},    // non-breaking hyphen U+2011
    {{0xE2, 0x80, 0x92}, 3, '-'},    // figure dash U+2012
    {{0xE2, 0x80, 0x93}, 3, '-'},    // en dash U+2013
    {{0xE2, 0x80, 0x94}, 3, '-'},    // em dash U+2014
    {{0xE2, 0x88, 0x92}, 3, '-'},    // minus sign U+2212
};

constexpr size_t kFoldMappingsCount = sizeof(kFoldMappings) / sizeof(kFoldMappings[0]);

inline bool IsWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
           c == '\v' || c == '\f';
}

inline char AsciiLower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

inline int UTF8ByteLength(uint8_t first_byte) {
    if ((first_byte & 0x80) == 0) return 1;      // 0xxxxxxx
    if ((first_byte & 0xE0) == 0xC0) return 2;   // 110xxxxx
    if ((first_byte & 0xF0) == 0xE0) return 3;   // 1110xxxx
    if ((first_byte & 0xF8) == 0xF0) return 4;   // 11110xxx
    return 1;  // Invalid, treat as single byte
}

const FoldMapping* FindFoldMapping(const uint8_t* src, size_t max_len) {
    for (size_t i = 0; i < kFoldMappingsCount; ++i) {
        const auto& m = kFoldMappings[i];
        if (max_len < m.src_len) continue;
        bool match = true;
        for (size_t j = 0; j < m.src_len && match; ++j) {
            if (src[j] != m.src[j]) match = false;
        }
        if (match) return &m;
    }
    return nullptr;
}

// Fullwidth ASCII U+FF01-FF5E is encoded as EF BC 81..BF and EF BD 80..9E.
// Returns the ASCII equivalent, or 0 if src is not a fullwidth form.
char FoldFullwidth(const uint8_t* src, size_t max_len) {
    if (max_len < 3 || src[0] != 0xEF) return 0;
    if (src[1] == 0xBC && src[2] >= 0x81 && src[2] <= 0xBF) {
        return static_cast<char>(src[2] - 0x60);
    }
    if (src[1] == 0xBD && src[2] >= 0x80 && src[2] <= 0x9E) {
        return static_cast<char>(src[2] - 0x20);
    }
    return 0;
}

}  // namespace

std::string FoldText(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    bool in_whitespace = true;  // Start true to trim leading whitespace
    auto emit_space = [&]() {
        if (!in_whitespace) {
            result += ' ';
            in_whitespace = true;
        }
    };

    size_t i = 0;
    while (i < input.size()) {
        uint8_t c = static_cast<uint8_t>(input[i]);

        if (IsWhitespace(static_cast<char>(c))) {
            emit_space();
            ++i;
            continue;
        }

        // ASCII fast path
        if (c < 0x80) {
            in_whitespace = false;
            result += AsciiLower(static_cast<char>(c));
            ++i;
            continue;
        }

        const uint8_t* p = reinterpret_cast<const uint8_t*>(input.data() + i);
        const size_t remaining = input.size() - i;

        if (const FoldMapping* mapping = FindFoldMapping(p, remaining)) {
            if (mapping->dst == ' ') {
                emit_space();
            } else {
                in_whitespace = false;
                result += mapping->dst;
            }
            i += mapping->src_len;
            continue;
        }

        if (char ascii = FoldFullwidth(p, remaining)) {
            in_whitespace = false;
            result += AsciiLower(ascii);
            i += 3;
            continue;
        }

        // Pass through unrecognized UTF-8 sequences unchanged
        in_whitespace = false;
        int byte_len = UTF8ByteLength(c);
        for (int j = 0; j < byte_len && i < input.size(); ++j) {
            result += input[i++];
        }
    }

    // Trim trailing whitespace
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }

    return result;
}

std::string ReplaceCommas(std::string text) {
    for (char& c : text) {
        if (c == ',') c = ' ';
    }
    return text;
}

}  // namespace mise::internal
