#include "uldas/mel_spectrogram.h"
#include "test_common.h"
#include <algorithm>
#include <cmath>

using namespace uldas;
using uldas_test::check;

namespace {

std::vector<float> sine(double frequency, size_t count) {
    std::vector<float> samples(count);
    for (size_t i = 0; i < count; ++i) {
        samples[i] = 0.5f * static_cast<float>(std::sin(2.0 * 3.14159265358979 * frequency * i / 16000.0));
    }
    return samples;
}

// Mel bin with the most energy, averaged over all frames
int loudest_bin(const std::vector<std::vector<float>>& mel) {
    std::vector<float> totals(mel[0].size(), 0.0f);
    for (const auto& frame : mel) {
        for (size_t m = 0; m < frame.size(); ++m) totals[m] += frame[m];
    }
    return static_cast<int>(std::max_element(totals.begin(), totals.end()) - totals.begin());
}

} // anonymous namespace

int main() {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "ULDAS Mel Spectrogram Test\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    MelSpectrogram spectrogram;
    check(spectrogram.getMelBins() == 80, "80 mel bins by default");
    check(MelSpectrogram(16000, 400, 128).getMelBins() == 128, "128 mel bins for large-v3");

    uldas_test::section("Framing");
    std::vector<std::vector<float>> low;
    {
        int frames = spectrogram.compute(sine(440.0, 16000), low);
        check(frames == 100 && low.size() == 100, "1 second -> 100 frames");
        check(low[0].size() == 80, "80 values per frame");

        std::vector<std::vector<float>> none;
        check(spectrogram.compute(std::vector<float>(100, 0.0f), none) == 0 && none.empty(),
              "less than one hop -> no frames");
    }

    uldas_test::section("Normalization");
    {
        float hi = -1e9f;
        float lo = 1e9f;
        for (const auto& frame : low) {
            for (float v : frame) {
                hi = std::max(hi, v);
                lo = std::min(lo, v);
            }
        }
        check(hi - lo <= 2.0f + 1e-4f, "dynamic range clamped to 8 decades (2.0 after scaling)");
        check(std::isfinite(hi) && std::isfinite(lo), "finite values");

        std::vector<std::vector<float>> high;
        spectrogram.compute(sine(4000.0, 16000), high);
        check(loudest_bin(high) > loudest_bin(low), "4 kHz tone peaks in a higher mel bin than 440 Hz");
    }

    uldas_test::section("Model layout");
    {
        std::vector<float> flat = MelSpectrogram::to_model_layout(low, 3000);
        check(flat.size() == 80u * 3000u, "[n_mels, 3000] buffer");
        check(flat[5 * 3000 + 7] == low[7][5], "row-major mel-by-frame layout");

        float floor = low[0][0];
        for (const auto& frame : low) {
            for (float v : frame) floor = std::min(floor, v);
        }
        check(flat[3000 - 1] == floor, "padding uses the spectrogram floor");
        check(MelSpectrogram::to_model_layout({}, 3000).empty(), "empty spectrogram");
    }

    return uldas_test::finish("Mel spectrogram");
}
