#include "uldas/transcription_evaluator.h"
#include "fakes.h"
#include "test_common.h"

using namespace uldas;
using uldas_test::check;
using uldas_test::near;
using uldas_test::FakeRecognizer;
using uldas_test::speech_result;

namespace {

const char* const FRENCH_TEXT =
    "Bonjour, je m'appelle Marie et je travaille à Paris depuis dix ans.";

TranscriptionEvidence evidence(const std::string& language, float confidence, const std::string& text,
                               int words, const std::string& attempt = "with_vad",
                               bool vad_removed_all = false) {
    TranscriptionEvidence e;
    e.language = language;
    e.confidence = confidence;
    e.text = text;
    e.text_length = static_cast<int>(text.size());
    e.word_count = words;
    e.segments_detected = text.empty() ? 0 : 1;
    e.attempt_name = attempt;
    e.vad_removed_all = vad_removed_all;
    return e;
}

} // anonymous namespace

int main() {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "ULDAS Transcription Evaluator Test\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    uldas_test::section("Language resolution");
    check(TranscriptionEvaluator::resolve_language("French") == "fr", "French -> fr");
    check(TranscriptionEvaluator::resolve_language("fr") == "fr", "fr stays fr");
    check(TranscriptionEvaluator::resolve_language("dutch") == "nl", "dutch -> nl");
    check(TranscriptionEvaluator::resolve_language("NL") == "nl", "NL -> nl");
    check(TranscriptionEvaluator::resolve_language("ger") == "de", "ger -> de");

    uldas_test::section("Segment confidence");
    check(near(TranscriptionEvaluator::segment_confidence(-0.2f), 0.8, 1e-5), "logprob -0.2 -> 0.8");
    check(near(TranscriptionEvaluator::segment_confidence(-3.0f), 0.0), "clamped at 0");
    check(near(TranscriptionEvaluator::segment_confidence(0.5f), 1.0), "clamped at 1");

    uldas_test::section("Hypothesis log-probability");
    {
        // 40 tokens at -0.5 each: length-normalized score -0.5, cumulative -20
        float avg = hypothesis_avg_logprob(-0.5f, 40, 1.0f);
        check(near(avg, -20.0 / 41.0, 1e-5), "cumulative score recovered before averaging");
        check(TranscriptionEvaluator::segment_confidence(avg) < 0.6f,
              "mean token logprob -0.5 stays well below the confidence threshold");
        check(hypothesis_avg_logprob(-0.9f, 40, 1.0f) < -0.8f, "weak hypothesis crosses the -0.8 silence bound");
        check(near(hypothesis_avg_logprob(-20.0f, 40, 0.0f), -20.0 / 41.0, 1e-5),
              "no length penalty: score is already cumulative");
        check(near(hypothesis_avg_logprob(-3.0f, 0, 1.0f), 0.0), "empty hypothesis");
    }

    FakeRecognizer recognizer;
    DetectionOptions options;
    TranscriptionEvaluator evaluator(recognizer, options);

    uldas_test::section("Classification");
    {
        auto e = evidence("fr", 0.8f, FRENCH_TEXT, 12);
        check(evaluator.classify(e) == "fr", "ordinary French speech -> fr");
    }
    {
        std::string stock = "Okay, let's go, here we go, let's go everybody, we are going now";
        auto e = evidence("en", 0.97f, stock, 13);
        check(evaluator.classify(e) == "en", "very high confidence on long text overrides the filter");

        auto lower = evidence("en", 0.9f, stock, 13);
        check(evaluator.classify(lower) == "zxx", "same text at lower confidence is a hallucination");
    }
    {
        auto e = evidence("en", 0.65f, "We should leave soon", 4);
        check(evaluator.classify(e) == "en", "standard speech test passes at 0.65");

        auto strict = evidence("en", 0.65f, "We should leave soon", 4, "without_vad", true);
        check(evaluator.classify(strict) == "zxx", "stricter test after VAD removed all audio");
    }
    {
        auto e = evidence("en", 0.25f, "", 0);
        check(evaluator.classify(e) == "zxx", "no text, low confidence -> zxx");
    }

    uldas_test::section("Attempt sequencing");
    {
        FakeRecognizer rec;
        rec.script = {speech_result("fr", 0.93f, FRENCH_TEXT, -0.1f)};
        TranscriptionEvaluator eval(rec, options);

        auto verdict = eval.detect_with_confidence(std::vector<float>(16000, 0.1f));
        check(verdict.has_value(), "verdict produced");
        check(verdict && verdict->code == "fr", "code fr");
        check(verdict && near(verdict->confidence, 0.93, 1e-5), "model probability kept when higher");
        check(verdict && verdict->attempt_name == "with_vad", "filtered attempt used");
        check(rec.calls.size() == 1, "one recognizer call");
        check(!rec.calls.empty() && rec.calls[0].vad_filter, "VAD requested");
        check(!rec.calls.empty() && near(rec.calls[0].temperature, 0.0), "greedy decoding with VAD");
    }
    {
        FakeRecognizer rec;
        rec.script = {
            speech_result("en", 0.4f, ""),
            speech_result("fr", 0.5f, FRENCH_TEXT, -0.2f),
        };
        TranscriptionEvaluator eval(rec, options);

        auto verdict = eval.detect_with_confidence(std::vector<float>(16000, 0.1f));
        check(rec.calls.size() == 2, "retried without VAD after VAD removed everything");
        check(rec.calls.size() == 2 && !rec.calls[1].vad_filter, "second attempt unfiltered");
        check(rec.calls.size() == 2 && near(rec.calls[1].temperature, 0.2, 1e-6), "temperature 0.2 unfiltered");
        check(verdict && verdict->attempt_name == "without_vad", "unfiltered verdict reported");
        check(verdict && near(verdict->confidence, 0.8, 1e-5), "segment confidence raises the score");
        check(verdict && verdict->code == "fr", "strict test passed by long confident text");
    }
    {
        FakeRecognizer rec;
        rec.vad_supported = false;
        rec.script = {speech_result("fr", 0.9f, FRENCH_TEXT)};
        TranscriptionEvaluator eval(rec, options);

        check(!eval.vad_enabled(), "VAD disabled when unsupported");
        eval.detect_with_confidence(std::vector<float>(16000, 0.1f));
        check(rec.calls.size() == 1 && !rec.calls[0].vad_filter, "single unfiltered attempt");
    }
    {
        FakeRecognizer rec;
        rec.throw_on_call = true;
        TranscriptionEvaluator eval(rec, options);

        auto verdict = eval.detect_with_confidence(std::vector<float>(16000, 0.1f));
        check(!verdict.has_value(), "recognizer errors yield no verdict");
        check(rec.calls.size() == 2, "both attempts tried");
    }

    return uldas_test::finish("Transcription evaluator");
}
