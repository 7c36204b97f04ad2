#include "uldas/language_codes.h"
#include "test_common.h"

using namespace uldas;
using uldas_test::check;

int main() {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "ULDAS Language Code Test\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    uldas_test::section("normalize_language_code");
    check(normalize_language_code("fre") == "fr", "fre -> fr");
    check(normalize_language_code("FRA") == "fr", "terminology code FRA -> fr");
    check(normalize_language_code(" ger ") == "de", "whitespace trimmed");
    check(normalize_language_code("en") == "en", "2-letter code kept");
    check(normalize_language_code("") == "und", "empty -> und");
    check(normalize_language_code("Unknown") == "und", "unknown -> und");
    check(normalize_language_code("undetermined") == "und", "undetermined -> und");
    check(normalize_language_code("zxx") == "zxx", "zxx kept");
    check(normalize_language_code("xyz") == "xyz", "unrecognized code passes through");

    uldas_test::section("is_undefined_language");
    check(is_undefined_language(""), "empty tag is undefined");
    check(is_undefined_language("UND"), "UND is undefined");
    check(!is_undefined_language("eng"), "eng is defined");
    check(!is_undefined_language("zxx"), "zxx is defined");

    uldas_test::section("language_name_to_code");
    check(language_name_to_code("French") == "fre", "French -> fre");
    check(language_name_to_code(" mandarin ") == "chi", "mandarin alias -> chi");
    check(language_name_to_code("farsi") == "per", "farsi alias -> per");
    check(language_name_to_code("no linguistic content") == "zxx", "no linguistic content -> zxx");
    check(language_name_to_code("klingon").empty(), "unknown name -> empty");

    uldas_test::section("iso639_1_to_2");
    check(iso639_1_to_2("fr") == "fre", "fr -> fre");
    check(iso639_1_to_2("de") == "ger", "de -> ger");
    check(iso639_1_to_2("pt-BR") == "por", "region subtag dropped");
    check(iso639_1_to_2("eng") == "eng", "3-letter code passes through");
    check(iso639_1_to_2("qq") == "qq", "unknown code unchanged");

    uldas_test::section("language_display_name");
    check(language_display_name("fre") == "French", "fre -> French");
    check(language_display_name("fr") == "French", "2-letter converted first");
    check(language_display_name("zxx") == "No Linguistic Content", "zxx display name");
    check(language_display_name("qaa") == "QAA", "unknown code upper-cased");

    return uldas_test::finish("Language codes");
}
