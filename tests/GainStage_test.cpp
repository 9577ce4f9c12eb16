#include "Dsp/AutomaticGainControl.hpp"
#include "Dsp/GainStage.hpp"
#include "Dsp/LevelMeter.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace call_capture;

TEST(GainStageTest, SixDecibelsRoughlyDoublesAmplitude) {
    const std::vector<int16_t> input{1000, -2000, 4000, -8000};
    const std::vector<int16_t> output = GainStage::ApplyGain(input, 6.0f);

    ASSERT_EQ(output.size(), input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        EXPECT_NEAR(output[i], input[i] * 2.0, std::abs(input[i]) * 0.01);
    }
}

TEST(GainStageTest, LargeGainClipsWithoutOverflow) {
    const std::vector<int16_t> output = GainStage::ApplyGain({30000, -30000}, 20.0f);
    EXPECT_EQ(output, (std::vector<int16_t>{32767, -32768}));
}

TEST(GainStageTest, ZeroGainIsIdentity) {
    const std::vector<int16_t> input{-32768, -1, 0, 1, 32767};
    EXPECT_EQ(GainStage::ApplyGain(input, 0.0f), input);
}

TEST(GainStageTest, InPlaceChunkVariant) {
    std::vector<int16_t> chunk{100, -100, 200};
    GainStage::ApplyGain(chunk.data(), chunk.data(), chunk.size(), -6.0206f);
    EXPECT_EQ(chunk, (std::vector<int16_t>{50, -50, 100}));
}

TEST(AutomaticGainControlTest, SilenceIsReturnedUnchanged) {
    AutomaticGainControl agc(0.5f);
    const std::vector<int16_t> silence{0, 0, 0, 0};
    EXPECT_EQ(agc.Process(silence), silence);
    EXPECT_EQ(agc.RequiredGainDb(0.0f), 0.0f);
}

TEST(AutomaticGainControlTest, QuietSignalIsBroughtTowardsTarget) {
    test_utils::TestAudioGenerator generator(44100, 440.0);
    generator.SetAmplitude(0.1);
    const std::vector<int16_t> quiet = generator.Generate(4410);

    AutomaticGainControl agc(0.3f, 20.0f);
    const std::vector<int16_t> boosted = agc.Process(quiet);

    EXPECT_NEAR(LevelMeter::Rms(boosted), 0.3f, 0.01f);
}

TEST(AutomaticGainControlTest, GainIsLimitedToMaximum) {
    AutomaticGainControl agc(0.5f, 20.0f);
    EXPECT_FLOAT_EQ(agc.RequiredGainDb(0.0001f), 20.0f);
    EXPECT_NEAR(agc.RequiredGainDb(1.0f), -6.0206f, 1e-3f);
    EXPECT_NEAR(agc.RequiredGainDb(0.5f), 0.0f, 1e-5f);
}

TEST(AutomaticGainControlTest, RejectsInvalidParameters) {
    EXPECT_THROW(AutomaticGainControl(0.0f), std::invalid_argument);
    EXPECT_THROW(AutomaticGainControl(1.5f), std::invalid_argument);
    EXPECT_THROW(AutomaticGainControl(0.5f, -1.0f), std::invalid_argument);
}

TEST(AutomaticGainControlTest, ChunkVariantReportsAppliedGain) {
    AutomaticGainControl agc(0.5f, 20.0f);
    std::vector<int16_t> chunk(256, 0);
    std::vector<int16_t> out(chunk.size(), 1);

    EXPECT_EQ(agc.Process(chunk.data(), out.data(), chunk.size()), 0.0f);
    EXPECT_EQ(out, chunk);
}
