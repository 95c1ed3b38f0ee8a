#include "ringframe/fft_processor.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <iterator>
#include <numbers>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ringframe {
namespace {

class FFTProcessorTest : public ::testing::Test {
protected:
    static constexpr std::size_t kFFTSize = 1024;
    static constexpr float kSampleRate = 48000.0f;

    static std::vector<float> sine(float frequency, std::size_t count, float amplitude = 1.0f) {
        std::vector<float> samples(count);
        const float omega = 2.0f * std::numbers::pi_v<float> * frequency / kSampleRate;
        for (std::size_t i = 0; i < count; ++i) {
            samples[i] = amplitude * std::sin(omega * static_cast<float>(i));
        }
        return samples;
    }

    /// Interleaves two mono signals into a (rows, 2) frame.
    static SampleArray<float> stereo(const std::vector<float>& left,
                                     const std::vector<float>& right) {
        std::vector<float> values;
        values.reserve(left.size() * 2);
        for (std::size_t i = 0; i < left.size(); ++i) {
            values.push_back(left[i]);
            values.push_back(right[i]);
        }
        return SampleArray<float>(std::move(values), 2);
    }

    static std::size_t peak_bin(const std::vector<float>& magnitudes) {
        return static_cast<std::size_t>(
            std::distance(magnitudes.begin(), std::max_element(magnitudes.begin(), magnitudes.end())));
    }

    static FFTConfig linear(WindowFunction window = WindowFunction::Hann) {
        return {.fft_size = kFFTSize, .window = window, .use_magnitude_db = false};
    }
};

TEST_F(FFTProcessorTest, BinCountIsHalfPlusOne) {
    FFTProcessor proc{{.fft_size = 512}};
    EXPECT_EQ(proc.fft_size(), 512);
    EXPECT_EQ(proc.bin_count(), 257);
}

TEST_F(FFTProcessorTest, RejectsSizesThatAreNotPowersOfTwo) {
    EXPECT_THROW(FFTProcessor{{.fft_size = 500}}, std::invalid_argument);
    EXPECT_THROW(FFTProcessor{{.fft_size = 1}}, std::invalid_argument);

    FFTProcessor proc{{.fft_size = 256}};
    EXPECT_THROW(proc.set_config({.fft_size = 300}), std::invalid_argument);
    EXPECT_EQ(proc.fft_size(), 256);
}

TEST_F(FFTProcessorTest, ConvertsBetweenBinsAndFrequencies) {
    FFTProcessor proc{{.fft_size = kFFTSize}};

    EXPECT_FLOAT_EQ(proc.bin_to_frequency(0, kSampleRate), 0.0f);
    EXPECT_FLOAT_EQ(proc.bin_to_frequency(1, kSampleRate), kSampleRate / 1024.0f);
    EXPECT_FLOAT_EQ(proc.bin_to_frequency(512, kSampleRate), 24000.0f);

    EXPECT_EQ(proc.frequency_to_bin(1000.0f, kSampleRate), 21);  // 21.33
    EXPECT_EQ(proc.frequency_to_bin(24000.0f, kSampleRate), 512);
    EXPECT_EQ(proc.frequency_to_bin(96000.0f, kSampleRate), 512);
}

TEST_F(FFTProcessorTest, FindsSinePeak) {
    FFTProcessor proc{linear()};
    std::vector<float> magnitudes(proc.bin_count());

    EXPECT_EQ(proc.compute(sine(1000.0f, kFFTSize), magnitudes), proc.bin_count());

    const float detected = proc.bin_to_frequency(peak_bin(magnitudes), kSampleRate);
    EXPECT_NEAR(detected, 1000.0f, kSampleRate / static_cast<float>(kFFTSize));
}

TEST_F(FFTProcessorTest, SeparatesTwoTones) {
    FFTProcessor proc{{.fft_size = 2048, .use_magnitude_db = false}};
    auto mixed = sine(440.0f, 2048, 0.5f);
    const auto octave = sine(880.0f, 2048, 0.5f);
    std::transform(mixed.begin(), mixed.end(), octave.begin(), mixed.begin(), std::plus<>{});

    std::vector<float> magnitudes(proc.bin_count());
    proc.compute(mixed, magnitudes);

    const float loudest = *std::max_element(magnitudes.begin(), magnitudes.end());
    EXPECT_GT(magnitudes[proc.frequency_to_bin(440.0f, kSampleRate)], loudest * 0.5f);
    EXPECT_GT(magnitudes[proc.frequency_to_bin(880.0f, kSampleRate)], loudest * 0.5f);
}

TEST_F(FFTProcessorTest, FullScaleSineNearsDecibelCeiling) {
    FFTProcessor proc{{.fft_size = kFFTSize,
                       .window = WindowFunction::Rectangular,
                       .use_magnitude_db = true,
                       .db_floor = -60.0f,
                       .db_ceiling = 0.0f}};
    std::vector<float> magnitudes(proc.bin_count());
    proc.compute(sine(1500.0f, kFFTSize), magnitudes);

    EXPECT_GT(magnitudes[peak_bin(magnitudes)], 0.8f);
}

TEST_F(FFTProcessorTest, SilenceSitsOnTheFloor) {
    FFTProcessor proc{{.fft_size = kFFTSize, .db_floor = -80.0f}};
    std::vector<float> magnitudes(proc.bin_count(), 1.0f);

    proc.compute(std::vector<float>(kFFTSize, 0.0f), magnitudes);

    for (const float magnitude : magnitudes) {
        EXPECT_FLOAT_EQ(magnitude, 0.0f);
    }
}

TEST_F(FFTProcessorTest, HannLeaksLessThanRectangular) {
    const auto samples = sine(1000.0f, kFFTSize);
    FFTProcessor rect{linear(WindowFunction::Rectangular)};
    FFTProcessor hann{linear(WindowFunction::Hann)};

    std::vector<float> rect_mags(rect.bin_count());
    std::vector<float> hann_mags(hann.bin_count());
    rect.compute(samples, rect_mags);
    hann.compute(samples, hann_mags);

    const auto peak = peak_bin(rect_mags);
    float rect_leakage = 0.0f;
    float hann_leakage = 0.0f;
    for (std::size_t i = 0; i < rect_mags.size(); ++i) {
        if (i + 3 < peak || i > peak + 3) {
            rect_leakage += rect_mags[i];
            hann_leakage += hann_mags[i];
        }
    }

    EXPECT_LT(hann_leakage, rect_leakage);
}

// Half a bin off-centre: Hann loses about 1.4 dB, flat-top keeps the level
TEST_F(FFTProcessorTest, FlatTopKeepsOffBinAmplitude) {
    const auto samples = sine(21.5f * kSampleRate / static_cast<float>(kFFTSize), kFFTSize);
    FFTProcessor flat{linear(WindowFunction::FlatTop)};
    FFTProcessor hann{linear(WindowFunction::Hann)};

    std::vector<float> flat_mags(flat.bin_count());
    std::vector<float> hann_mags(hann.bin_count());
    flat.compute(samples, flat_mags);
    hann.compute(samples, hann_mags);

    // Coherent gains of the two windows
    const float flat_level = *std::max_element(flat_mags.begin(), flat_mags.end()) / 0.21557895f;
    const float hann_level = *std::max_element(hann_mags.begin(), hann_mags.end()) / 0.5f;
    EXPECT_NEAR(flat_level, 1.0f, 0.02f);
    EXPECT_LT(hann_level, 0.9f);
}

TEST_F(FFTProcessorTest, StereoFrameIsAveragedToMono) {
    FFTProcessor proc{linear()};
    const auto tone = sine(2000.0f, kFFTSize);

    std::vector<float> mono(proc.bin_count());
    std::vector<float> mixed(proc.bin_count());
    proc.compute(tone, mono);
    proc.compute(stereo(tone, tone), mixed);

    for (std::size_t i = 0; i < mono.size(); ++i) {
        EXPECT_NEAR(mixed[i], mono[i], 1e-5f);
    }

    // Opposite phases cancel out
    auto inverted = tone;
    std::transform(inverted.begin(), inverted.end(), inverted.begin(), std::negate<>{});
    proc.compute(stereo(tone, inverted), mixed);
    EXPECT_LT(*std::max_element(mixed.begin(), mixed.end()), 1e-5f);
}

TEST_F(FFTProcessorTest, ShortFrameIsPaddedAtTheFront) {
    FFTProcessor proc{linear(WindowFunction::Rectangular)};
    std::vector<float> magnitudes(proc.bin_count());

    // A constant half-length frame has half the DC of a full one
    EXPECT_EQ(proc.compute(std::vector<float>(kFFTSize / 2, 1.0f), magnitudes), proc.bin_count());
    EXPECT_NEAR(magnitudes[0], 0.5f, 1e-4f);
}

TEST_F(FFTProcessorTest, LongFrameUsesNewestRows) {
    FFTProcessor proc{linear(WindowFunction::Rectangular)};
    std::vector<float> frame(kFFTSize * 2, 0.0f);
    std::fill(frame.begin() + kFFTSize, frame.end(), 1.0f);

    std::vector<float> magnitudes(proc.bin_count());
    proc.compute(frame, magnitudes);

    EXPECT_NEAR(magnitudes[0], 1.0f, 1e-4f);
}

TEST_F(FFTProcessorTest, RejectsUndersizedOutput) {
    FFTProcessor proc{{.fft_size = 64}};
    std::vector<float> magnitudes(proc.bin_count() - 1);
    EXPECT_THROW(proc.compute(sine(1000.0f, 64), magnitudes), std::invalid_argument);
}

TEST_F(FFTProcessorTest, ReplansOnSizeChange) {
    FFTProcessor proc{{.fft_size = 512, .use_magnitude_db = false}};
    proc.set_config({.fft_size = 1024, .use_magnitude_db = false});

    std::vector<float> magnitudes(proc.bin_count());
    ASSERT_EQ(magnitudes.size(), 513);
    proc.compute(sine(500.0f, 1024), magnitudes);

    EXPECT_NEAR(proc.bin_to_frequency(peak_bin(magnitudes), kSampleRate), 500.0f, 50.0f);
}

TEST_F(FFTProcessorTest, MovedFromProcessorRefusesWork) {
    FFTProcessor source{{.fft_size = 64}};
    FFTProcessor moved{std::move(source)};

    std::vector<float> magnitudes(moved.bin_count());
    EXPECT_EQ(moved.compute(sine(1000.0f, 64), magnitudes), 33);
    EXPECT_THROW(source.compute(sine(1000.0f, 64), magnitudes), std::logic_error);
}

}  // namespace
}  // namespace ringframe
