#include "common/AudioQuality.hpp"
#include "common/ProcessingResult.hpp"
#include "common/SampleBuffer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <variant>

using namespace call_capture;

TEST(AudioQualityTest, PresetValuesAreFixed) {
    EXPECT_EQ(AudioQuality::HighQuality().sampleRate, 48000u);
    EXPECT_EQ(AudioQuality::HighQuality().bitRate, 128000u);
    EXPECT_EQ(AudioQuality::HighQuality().channels, 2u);

    EXPECT_EQ(AudioQuality::Standard().sampleRate, 44100u);
    EXPECT_EQ(AudioQuality::Standard().bitRate, 64000u);
    EXPECT_EQ(AudioQuality::Standard().channels, 1u);

    EXPECT_EQ(AudioQuality::SpaceSaving().sampleRate, 22050u);
    EXPECT_EQ(AudioQuality::SpaceSaving().bitRate, 32000u);
    EXPECT_EQ(AudioQuality::SpaceSaving().channels, 1u);
}

TEST(AudioQualityTest, NamesRoundTrip) {
    for (const AudioQuality& quality :
         {AudioQuality::HighQuality(), AudioQuality::Standard(), AudioQuality::SpaceSaving()}) {
        auto parsed = AudioQuality::FromName(quality.Name());
        ASSERT_TRUE(parsed.has_value()) << quality.Name();
        EXPECT_EQ(*parsed, quality);
    }
    EXPECT_FALSE(AudioQuality::FromName("standard").has_value());
}

TEST(AudioQualityTest, StorageEstimate) {
    EXPECT_EQ(AudioQuality::Standard().EstimatedBytesPerMinute(), 480000);
    EXPECT_EQ(AudioQuality::HighQuality().EstimatedBytesPerMinute(), 960000);
    EXPECT_TRUE(AudioQuality::SpaceSaving().IsSupported());
}

TEST(ProcessingResultTest, HoldsOneAlternative) {
    ProcessingResult success(ProcessingSuccess{"out.pcm", 1500, 132300, AudioQuality::Standard()});
    EXPECT_TRUE(success.IsSuccess());
    EXPECT_FALSE(success.IsError());
    EXPECT_EQ(success.Success().durationMs, 1500);
    EXPECT_THROW(success.Error(), std::bad_variant_access);

    ProcessingResult failure = ProcessingResult::Failure(ErrorKind::InsufficientStorage, "disk full");
    EXPECT_TRUE(failure.IsError());
    EXPECT_EQ(failure.Error().kind, ErrorKind::InsufficientStorage);
    EXPECT_EQ(failure.Error().message, "disk full");
}

TEST(ProcessingResultTest, ErrorKindNames) {
    EXPECT_STREQ(ToString(ErrorKind::PermissionDenied), "PermissionDenied");
    EXPECT_STREQ(ToString(ErrorKind::AudioProcessingFailed), "AudioProcessingFailed");
}

TEST(SampleBufferTest, ClampRoundsAndSaturates) {
    EXPECT_EQ(ClampToSample(1.4), 1);
    EXPECT_EQ(ClampToSample(1.6), 2);
    EXPECT_EQ(ClampToSample(-1.6), -2);
    EXPECT_EQ(ClampToSample(1e9), 32767);
    EXPECT_EQ(ClampToSample(-1e9), -32768);
}

TEST(SampleBufferTest, DurationFromFrames) {
    SampleBuffer buffer;
    buffer.sampleRate = 48000;
    buffer.channels = 2;
    buffer.samples.resize(96000);
    EXPECT_EQ(buffer.Frames(), 48000u);
    EXPECT_EQ(buffer.DurationMs(), 1000);
}
