#include "uldas/hallucination_filter.h"
#include "test_common.h"

using namespace uldas;
using uldas_test::check;

int main() {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "ULDAS Hallucination Filter Test\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    HallucinationFilter filter;
    std::string reason;

    uldas_test::section("Degenerate text");
    check(filter.is_hallucination(""), "empty text");
    check(filter.is_hallucination("  ok "), "under 3 characters after trim");
    check(filter.is_hallucination("aaaaaaaaaaaa"), "few distinct characters");
    check(filter.is_hallucination("Nooooooo way that happened"), "run of identical characters");
    check(filter.is_hallucination("hahahahaha that was great"), "short block repeated");

    uldas_test::section("Word repetition");
    check(filter.is_hallucination("thanks thanks thanks thanks thanks thanks thanks"),
          "one word repeated");
    check(filter.is_hallucination("you you you you you you you you you you you"),
          "under 20% unique words");

    uldas_test::section("Script dominance");
    // "สวัสดีครับ" (Thai)
    check(filter.is_hallucination("\xE0\xB8\xAA\xE0\xB8\xA7\xE0\xB8\xB1\xE0\xB8\xAA\xE0\xB8\x94"
                                  "\xE0\xB8\xB5\xE0\xB8\x84\xE0\xB8\xA3\xE0\xB8\xB1\xE0\xB8\x9A", &reason),
          "Thai-dominated text");

    uldas_test::section("Stock phrases and patterns");
    check(filter.is_hallucination("Okay, let's go!", &reason), "stock phrase 'let's go'");
    check(reason.find("stock phrase") != std::string::npos, "reason names the stock phrase");
    check(filter.is_hallucination("Give me one second."), "stock phrase 'one second'");
    check(filter.is_hallucination("I'm gonna get it"), "generic short pattern");

    uldas_test::section("Real speech");
    check(!filter.is_hallucination("Bonjour, je m'appelle Marie et je travaille à Paris depuis dix ans."),
          "French sentence accepted");
    check(!filter.is_hallucination("The committee will publish its findings early next month, "
                                   "according to a spokesperson."),
          "English sentence accepted");

    uldas_test::section("Compression ratio");
    std::string repetitive;
    for (int i = 0; i < 40; ++i) repetitive += "the same line again ";
    check(HallucinationFilter::compression_ratio(repetitive) < 0.3, "repetitive text compresses below 0.3");
    check(HallucinationFilter::compression_ratio("") == 1.0, "empty text ratio is 1");
    check(filter.is_hallucination(repetitive), "repetitive text rejected");

    uldas_test::section("clean_for_matching");
    check(HallucinationFilter::clean_for_matching("  Let's GO!! ") == "lets go", "lower-cased, punctuation removed");

    return uldas_test::finish("Hallucination filter");
}
