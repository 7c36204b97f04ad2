#include "uldas/language_codes.h"
#include "string_utils.h"
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace uldas {

// ═══════════════════════════════════════════════════════════════════════════
// Language Tables
// ═══════════════════════════════════════════════════════════════════════════

// ISO 639-2/B -> ISO 639-1
static const std::unordered_map<std::string, std::string> ISO639_2_TO_1 = {
    {"ger", "de"}, {"eng", "en"}, {"spa", "es"}, {"fre", "fr"}, {"ita", "it"},
    {"por", "pt"}, {"rus", "ru"}, {"jpn", "ja"}, {"kor", "ko"}, {"chi", "zh"},
    {"ara", "ar"}, {"hin", "hi"}, {"dut", "nl"}, {"swe", "sv"}, {"nor", "no"},
    {"dan", "da"}, {"fin", "fi"}, {"pol", "pl"}, {"cze", "cs"}, {"hun", "hu"},
    {"gre", "el"}, {"tur", "tr"}, {"heb", "he"}, {"tha", "th"}, {"vie", "vi"},
    {"ukr", "uk"}, {"bul", "bg"}, {"rum", "ro"}, {"slo", "sk"}, {"slv", "sl"},
    {"srp", "sr"}, {"hrv", "hr"}, {"bos", "bs"}, {"alb", "sq"}, {"mac", "mk"},
    {"lit", "lt"}, {"lav", "lv"}, {"est", "et"}, {"mlt", "mt"}, {"ice", "is"},
    {"gle", "ga"}, {"wel", "cy"}, {"baq", "eu"}, {"cat", "ca"}, {"glg", "gl"},
    {"per", "fa"}, {"urd", "ur"}, {"ben", "bn"}, {"guj", "gu"}, {"pan", "pa"},
    {"tam", "ta"}, {"tel", "te"}, {"kan", "kn"}, {"mal", "ml"}, {"mar", "mr"},
    {"nep", "ne"}, {"sin", "si"}, {"bur", "my"}, {"khm", "km"}, {"lao", "lo"},
    {"tib", "bo"}, {"mon", "mn"}, {"kaz", "kk"}, {"uzb", "uz"}, {"kir", "ky"},
    {"tgk", "tg"}, {"tuk", "tk"}, {"aze", "az"}, {"arm", "hy"}, {"geo", "ka"},
    {"amh", "am"}, {"swa", "sw"}, {"yor", "yo"}, {"ibo", "ig"}, {"hau", "ha"},
    {"som", "so"}, {"afr", "af"}, {"zul", "zu"}, {"xho", "xh"}, {"may", "ms"},
    {"ind", "id"}, {"tgl", "tl"}, {"jav", "jv"}, {"sun", "su"}, {"epo", "eo"},
    {"lat", "la"},
};

// ISO 639-2/T spellings seen in the wild
static const std::unordered_map<std::string, std::string> ISO639_2T_TO_1 = {
    {"deu", "de"}, {"fra", "fr"}, {"nld", "nl"},
    {"ces", "cs"}, {"slk", "sk"}, {"ron", "ro"},
};

// English name -> ISO 639-2/B
static const std::unordered_map<std::string, std::string> NAME_TO_CODE = {
    {"english", "eng"}, {"spanish", "spa"}, {"french", "fre"}, {"german", "ger"},
    {"italian", "ita"}, {"portuguese", "por"}, {"russian", "rus"}, {"japanese", "jpn"},
    {"chinese", "chi"}, {"korean", "kor"}, {"arabic", "ara"}, {"hindi", "hin"},
    {"dutch", "dut"}, {"swedish", "swe"}, {"norwegian", "nor"}, {"danish", "dan"},
    {"finnish", "fin"}, {"polish", "pol"}, {"czech", "cze"}, {"hungarian", "hun"},
    {"greek", "gre"}, {"turkish", "tur"}, {"hebrew", "heb"}, {"thai", "tha"},
    {"vietnamese", "vie"}, {"ukrainian", "ukr"}, {"bulgarian", "bul"}, {"romanian", "rum"},
    {"slovak", "slo"}, {"slovenian", "slv"}, {"serbian", "srp"}, {"croatian", "hrv"},
    {"bosnian", "bos"}, {"albanian", "alb"}, {"macedonian", "mac"}, {"lithuanian", "lit"},
    {"latvian", "lav"}, {"estonian", "est"}, {"maltese", "mlt"}, {"icelandic", "ice"},
    {"irish", "gle"}, {"welsh", "wel"}, {"basque", "baq"}, {"catalan", "cat"},
    {"galician", "glg"}, {"persian", "per"}, {"urdu", "urd"}, {"bengali", "ben"},
    {"gujarati", "guj"}, {"punjabi", "pan"}, {"tamil", "tam"}, {"telugu", "tel"},
    {"kannada", "kan"}, {"malayalam", "mal"}, {"marathi", "mar"}, {"nepali", "nep"},
    {"sinhalese", "sin"}, {"burmese", "bur"}, {"khmer", "khm"}, {"lao", "lao"},
    {"tibetan", "tib"}, {"mongolian", "mon"}, {"kazakh", "kaz"}, {"uzbek", "uzb"},
    {"kyrgyz", "kir"}, {"tajik", "tgk"}, {"turkmen", "tuk"}, {"azerbaijani", "aze"},
    {"armenian", "arm"}, {"georgian", "geo"}, {"amharic", "amh"}, {"swahili", "swa"},
    {"yoruba", "yor"}, {"igbo", "ibo"}, {"hausa", "hau"}, {"somali", "som"},
    {"afrikaans", "afr"}, {"zulu", "zul"}, {"xhosa", "xho"}, {"malay", "may"},
    {"indonesian", "ind"}, {"tagalog", "tgl"}, {"cebuano", "ceb"}, {"javanese", "jav"},
    {"sundanese", "sun"}, {"esperanto", "epo"}, {"latin", "lat"},

    // Aliases
    {"mandarin", "chi"}, {"cantonese", "chi"},
    {"simplified chinese", "chi"}, {"traditional chinese", "chi"},
    {"farsi", "per"}, {"filipino", "tgl"},
    {"bahasa indonesia", "ind"}, {"bahasa malaysia", "may"},
    {"no linguistic content", "zxx"},
};

// ISO 639-2/B -> display name
static const std::unordered_map<std::string, std::string> DISPLAY_NAMES = {
    {"eng", "English"}, {"spa", "Spanish"}, {"fre", "French"}, {"ger", "German"},
    {"ita", "Italian"}, {"por", "Portuguese"}, {"rus", "Russian"}, {"jpn", "Japanese"},
    {"chi", "Chinese"}, {"kor", "Korean"}, {"ara", "Arabic"}, {"hin", "Hindi"},
    {"dut", "Dutch"}, {"swe", "Swedish"}, {"nor", "Norwegian"}, {"dan", "Danish"},
    {"fin", "Finnish"}, {"pol", "Polish"}, {"cze", "Czech"}, {"hun", "Hungarian"},
    {"gre", "Greek"}, {"tur", "Turkish"}, {"heb", "Hebrew"}, {"tha", "Thai"},
    {"vie", "Vietnamese"}, {"ukr", "Ukrainian"}, {"bul", "Bulgarian"}, {"rum", "Romanian"},
    {"slo", "Slovak"}, {"slv", "Slovenian"}, {"srp", "Serbian"}, {"hrv", "Croatian"},
    {"bos", "Bosnian"}, {"zxx", "No Linguistic Content"},
    {"alb", "Albanian"}, {"mac", "Macedonian"}, {"lit", "Lithuanian"}, {"lav", "Latvian"},
    {"est", "Estonian"}, {"mlt", "Maltese"}, {"ice", "Icelandic"}, {"gle", "Irish"},
    {"wel", "Welsh"}, {"baq", "Basque"}, {"cat", "Catalan"}, {"glg", "Galician"},
    {"per", "Persian"}, {"urd", "Urdu"}, {"ben", "Bengali"}, {"guj", "Gujarati"},
    {"pan", "Punjabi"}, {"tam", "Tamil"}, {"tel", "Telugu"}, {"kan", "Kannada"},
    {"mal", "Malayalam"}, {"mar", "Marathi"}, {"nep", "Nepali"}, {"sin", "Sinhalese"},
    {"bur", "Burmese"}, {"khm", "Khmer"}, {"lao", "Lao"}, {"tib", "Tibetan"},
    {"mon", "Mongolian"}, {"kaz", "Kazakh"}, {"uzb", "Uzbek"}, {"kir", "Kyrgyz"},
    {"tgk", "Tajik"}, {"tuk", "Turkmen"}, {"aze", "Azerbaijani"}, {"arm", "Armenian"},
    {"geo", "Georgian"}, {"amh", "Amharic"}, {"swa", "Swahili"}, {"yor", "Yoruba"},
    {"ibo", "Igbo"}, {"hau", "Hausa"}, {"som", "Somali"}, {"afr", "Afrikaans"},
    {"zul", "Zulu"}, {"xho", "Xhosa"}, {"may", "Malay"}, {"ind", "Indonesian"},
    {"tgl", "Tagalog"}, {"jav", "Javanese"}, {"sun", "Sundanese"}, {"epo", "Esperanto"},
    {"lat", "Latin"},
};

static const std::unordered_set<std::string> UNDEFINED_TAGS = {
    "", "und", "unknown", "undefined", "undetermined"
};

// ISO 639-1 -> ISO 639-2/B (reverse mapping) - built once with std::call_once
static std::unordered_map<std::string, std::string> ISO639_1_TO_2;
static std::once_flag reverse_mapping_once;

static void init_reverse_mapping() {
    std::call_once(reverse_mapping_once, []() {
        for (const auto& pair : ISO639_2_TO_1) {
            ISO639_1_TO_2[pair.second] = pair.first;
        }
    });
}

// ═══════════════════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════════════════

bool is_undefined_language(const std::string& tag) {
    return UNDEFINED_TAGS.count(to_lower(trim(tag))) > 0;
}

std::string normalize_language_code(const std::string& code) {
    std::string lang = to_lower(trim(code));

    if (UNDEFINED_TAGS.count(lang)) {
        return "und";
    }
    if (lang == "zxx") {
        return "zxx";
    }

    auto it = ISO639_2_TO_1.find(lang);
    if (it != ISO639_2_TO_1.end()) {
        return it->second;
    }

    auto alt = ISO639_2T_TO_1.find(lang);
    if (alt != ISO639_2T_TO_1.end()) {
        return alt->second;
    }

    // Already 2-letter, or unrecognized: keep it visible to the operator
    return lang;
}

std::string language_name_to_code(const std::string& name) {
    auto it = NAME_TO_CODE.find(to_lower(trim(name)));
    return it != NAME_TO_CODE.end() ? it->second : std::string();
}

std::string iso639_1_to_2(const std::string& code) {
    init_reverse_mapping();

    std::string lang = to_lower(trim(code));
    size_t sep = lang.find_first_of("-_");
    if (sep != std::string::npos) {
        lang = lang.substr(0, sep);
    }

    auto it = ISO639_1_TO_2.find(lang);
    return it != ISO639_1_TO_2.end() ? it->second : code;
}

std::string language_display_name(const std::string& code) {
    std::string lang = to_lower(trim(code));
    if (lang.size() == 2) {
        lang = iso639_1_to_2(lang);
    }

    auto it = DISPLAY_NAMES.find(lang);
    if (it != DISPLAY_NAMES.end()) {
        return it->second;
    }
    return to_upper(code);
}

} // namespace uldas
