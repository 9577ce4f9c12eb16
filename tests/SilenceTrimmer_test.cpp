#include "Dsp/SilenceTrimmer.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace call_capture;

namespace {

std::vector<int16_t> Repeat(int16_t value, size_t count) {
    return std::vector<int16_t>(count, value);
}

std::vector<int16_t> Concat(std::initializer_list<std::vector<int16_t>> parts) {
    std::vector<int16_t> out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

} // namespace

TEST(SilenceTrimmerTest, DropsRemainderOfLongSilentRun) {
    // 5 ms at 1 kHz keeps five quiet samples per run
    SilenceTrimmer trimmer(0.02f, 5);
    ASSERT_EQ(trimmer.MinRunFrames(1000), 5u);

    const std::vector<int16_t> input = Concat({Repeat(1000, 3), Repeat(10, 12), Repeat(1000, 3)});
    const std::vector<int16_t> output = trimmer.Trim(input, 1000);

    EXPECT_EQ(output.size(), input.size() - 7);
    EXPECT_EQ(output, Concat({Repeat(1000, 3), Repeat(10, 5), Repeat(1000, 3)}));
}

TEST(SilenceTrimmerTest, ShortSilenceIsKept) {
    SilenceTrimmer trimmer(0.02f, 5);
    const std::vector<int16_t> input = Concat({Repeat(1000, 2), Repeat(0, 4), Repeat(1000, 2)});

    EXPECT_EQ(trimmer.Trim(input, 1000), input);
}

TEST(SilenceTrimmerTest, LoudFrameResetsRun) {
    SilenceTrimmer trimmer(0.02f, 2);
    const std::vector<int16_t> input{0, 0, 0, 1000, 0, 0, 0};

    EXPECT_EQ(trimmer.Trim(input, 1000), (std::vector<int16_t>{0, 0, 1000, 0, 0}));
}

TEST(SilenceTrimmerTest, EmptyInputGivesEmptyOutput) {
    EXPECT_TRUE(SilenceTrimmer().Trim({}).empty());
}

TEST(SilenceTrimmerTest, StereoFramesAreTrimmedWhole) {
    SilenceTrimmer trimmer(0.02f, 1);
    // Second frame is loud on the right channel only
    const std::vector<int16_t> input{0, 0, 0, 1000, 0, 0, 0, 0, 0, 0};

    EXPECT_EQ(trimmer.Trim(input, 1000, 2), (std::vector<int16_t>{0, 0, 0, 1000, 0, 0}));
}

TEST(SilenceTrimmerTest, RejectsInvalidParameters) {
    EXPECT_THROW(SilenceTrimmer(1.5f), std::invalid_argument);
    EXPECT_THROW(SilenceTrimmer().Trim({1, 2}, 1000, 0), std::invalid_argument);
}
