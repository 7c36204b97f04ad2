#include "uldas/hallucination_filter.h"
#include "string_utils.h"
#include <zlib.h>
#include <set>
#include <unordered_set>

namespace uldas {

namespace {

// Phrases Whisper emits on silent gaming/streaming audio
const char* const STOCK_PHRASES[] = {
    "okay up here we go",
    "i'm going to go get some water",
    "let's go",
    "here we go",
    "okay let's go",
    "alright let's go",
    "come on let's go",
    "okay here we go",
    "let me get some water",
    "i'm going to get some water",
    "i need to get some water",
    "hold on let me",
    "wait let me",
    "okay wait",
    "hold on",
    "one second",
    "just a second",
    "give me a second",
    "let me just",
};

// Patterns run on cleaned text, so apostrophes are already gone
const char* const GENERIC_PATTERNS[] = {
    R"(\b(okay|ok|alright|lets|here we go|come on)\b.*\b(go|water|get|just|wait)\b)",
    R"(\bim (going to|gonna) (go|get))",
    R"(\b(hold on|wait|give me|let me) (a |just |)?(second|minute|moment)\b)",
};

bool is_hallucination_prone_script(char32_t cp) {
    return (cp >= 0x1780 && cp <= 0x17FF) ||   // Khmer
           (cp >= 0x0E00 && cp <= 0x0E7F) ||   // Thai
           (cp >= 0x1000 && cp <= 0x109F) ||   // Myanmar
           (cp >= 0x0980 && cp <= 0x09FF) ||   // Bengali
           (cp >= 0x10A0 && cp <= 0x10FF);     // Georgian
}

size_t distinct_chars(const std::u32string& text, const std::u32string& ignore) {
    std::set<char32_t> seen;
    for (char32_t cp : text) {
        if (ignore.find(cp) == std::u32string::npos) {
            seen.insert(cp);
        }
    }
    return seen.size();
}

/**
 * @brief Find a block of block_min..block_max code points (no newlines)
 *        occurring at least min_occurrences times back to back
 */
bool has_repeated_block(const std::u32string& text, size_t block_min, size_t block_max,
                        size_t min_occurrences) {
    for (size_t len = block_min; len <= block_max; ++len) {
        if (len * min_occurrences > text.size()) break;

        for (size_t start = 0; start + len * min_occurrences <= text.size(); ++start) {
            bool has_newline = false;
            for (size_t k = 0; k < len; ++k) {
                if (text[start + k] == U'\n') { has_newline = true; break; }
            }
            if (has_newline) continue;

            size_t occurrences = 1;
            size_t pos = start + len;
            while (pos + len <= text.size() &&
                   text.compare(pos, len, text, start, len) == 0) {
                ++occurrences;
                pos += len;
                if (occurrences >= min_occurrences) return true;
            }
        }
    }
    return false;
}

void set_reason(std::string* reason, const std::string& value) {
    if (reason) *reason = value;
}

} // anonymous namespace

HallucinationFilter::HallucinationFilter() {
    for (const char* phrase : STOCK_PHRASES) {
        stock_phrases_.push_back(clean_for_matching(phrase));
    }
    for (const char* pattern : GENERIC_PATTERNS) {
        generic_patterns_.emplace_back(pattern, std::regex::ECMAScript | std::regex::optimize);
    }
}

double HallucinationFilter::compression_ratio(const std::string& text) {
    if (text.empty()) return 1.0;

    uLongf compressed_size = compressBound(static_cast<uLong>(text.size()));
    std::vector<Bytef> buffer(compressed_size);

    int rc = compress2(buffer.data(), &compressed_size,
                       reinterpret_cast<const Bytef*>(text.data()),
                       static_cast<uLong>(text.size()),
                       Z_DEFAULT_COMPRESSION);
    if (rc != Z_OK) {
        return 1.0;  // Cannot judge; treat as incompressible
    }

    return static_cast<double>(compressed_size) / static_cast<double>(text.size());
}

std::string HallucinationFilter::clean_for_matching(const std::string& text) {
    std::string lowered = to_lower(trim(text));
    std::string cleaned;
    cleaned.reserve(lowered.size());

    for (char c : lowered) {
        unsigned char uc = static_cast<unsigned char>(c);
        // Bytes >= 0x80 belong to non-ASCII letters; keep them as word characters
        if (uc >= 0x80 || std::isalnum(uc) || uc == '_' || std::isspace(uc)) {
            cleaned += c;
        }
    }
    return cleaned;
}

bool HallucinationFilter::is_hallucination(const std::string& raw_text, std::string* reason) const {
    std::string text = trim(raw_text);
    if (text.empty()) {
        set_reason(reason, "empty text");
        return true;
    }

    std::u32string cps = utf8_to_codepoints(text);
    size_t length = cps.size();

    if (length < 3) {
        set_reason(reason, "shorter than 3 characters");
        return true;
    }

    // 1. Very low character variety
    if (distinct_chars(cps, U" ") <= 3 && length > 10) {
        set_reason(reason, "fewer than 4 distinct characters");
        return true;
    }
    if (distinct_chars(cps, U" \n") <= 2 && length > 20) {
        set_reason(reason, "fewer than 3 distinct characters");
        return true;
    }

    // 2. Character runs ("rrrrrr") and short repeating blocks ("abababab")
    if (has_repeated_block(cps, 1, 1, 5)) {
        set_reason(reason, "run of 5+ identical characters");
        return true;
    }
    if (has_repeated_block(cps, 1, 3, 4)) {
        set_reason(reason, "short block repeated 4+ times");
        return true;
    }

    // 3. Scripts the model over-produces on silence
    size_t prone_count = 0;
    for (char32_t cp : cps) {
        if (cp > 127 && is_hallucination_prone_script(cp)) {
            ++prone_count;
        }
    }
    if (static_cast<double>(prone_count) / static_cast<double>(length) > 0.7) {
        set_reason(reason, "dominated by Khmer/Thai/Myanmar/Bengali/Georgian script");
        return true;
    }

    // 4. Word-level repetition
    std::vector<std::string> words = split_words(text);
    std::unordered_set<std::string> unique_words(words.begin(), words.end());

    if (words.size() > 3 &&
        static_cast<double>(unique_words.size()) / static_cast<double>(words.size()) < 0.2) {
        set_reason(reason, "fewer than 20% unique words");
        return true;
    }
    if (length > 20 && words.size() > 5 && unique_words.size() <= 2) {
        set_reason(reason, "only 1-2 distinct tokens repeated");
        return true;
    }

    // 5. Highly redundant text compresses very well
    if (compression_ratio(text) < 0.3) {
        set_reason(reason, "compression ratio below 0.3");
        return true;
    }

    // 6. Stock phrases and generic patterns
    std::string clean_text = clean_for_matching(text);

    for (const auto& phrase : stock_phrases_) {
        if (clean_text.find(phrase) != std::string::npos) {
            set_reason(reason, "stock phrase '" + phrase + "'");
            return true;
        }
    }

    if (length < 50) {
        for (const auto& pattern : generic_patterns_) {
            if (std::regex_search(clean_text, pattern)) {
                set_reason(reason, "generic short-utterance pattern");
                return true;
            }
        }
    }

    return false;
}

} // namespace uldas
