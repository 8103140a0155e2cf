#include <gtest/gtest.h>

#include "reel_cut/validation.hpp"

using namespace reel_cut;

TEST(ValidationTest, ExtractsIdFromAllUrlForms) {
  const char *id = "dQw4w9WgXcQ";
  EXPECT_EQ(extract_video_id("https://www.youtube.com/watch?v=dQw4w9WgXcQ"), id);
  EXPECT_EQ(extract_video_id("https://m.youtube.com/watch?v=dQw4w9WgXcQ"), id);
  EXPECT_EQ(extract_video_id(
                "https://www.youtube.com/watch?feature=share&v=dQw4w9WgXcQ"),
            id);
  EXPECT_EQ(extract_video_id("youtube.com/embed/dQw4w9WgXcQ"), id);
  EXPECT_EQ(extract_video_id("http://youtube.com/v/dQw4w9WgXcQ"), id);
  EXPECT_EQ(extract_video_id("https://youtu.be/dQw4w9WgXcQ?t=42"), id);
  EXPECT_EQ(extract_video_id("https://www.youtube.com/shorts/dQw4w9WgXcQ"), id);
}

TEST(ValidationTest, RejectsNonYoutubeUrls) {
  EXPECT_FALSE(is_youtube_url(""));
  EXPECT_FALSE(is_youtube_url("https://vimeo.com/123456789"));
  EXPECT_FALSE(is_youtube_url("https://www.youtube.com/watch?v=short"));
  EXPECT_FALSE(is_youtube_url("https://www.youtube.com/channel/UCabc"));
  EXPECT_TRUE(extract_video_id("https://example.com/?v=dQw4w9WgXcQ").empty());
}

TEST(ValidationTest, AllowedDurationsAndCounts) {
  for (int d : {30, 60, 90, 120, 180})
    EXPECT_TRUE(is_allowed_duration(d)) << d;
  for (int d : {0, 45, 61, 300})
    EXPECT_FALSE(is_allowed_duration(d)) << d;
  for (int c : {5, 10, 15})
    EXPECT_TRUE(is_allowed_clip_count(c)) << c;
  for (int c : {0, 1, 7, 20})
    EXPECT_FALSE(is_allowed_clip_count(c)) << c;
}

TEST(ValidationTest, ValidateRequestReportsFirstProblem) {
  JobRequest request;
  request.source_url = "https://youtu.be/dQw4w9WgXcQ";
  request.clip_duration = 60;
  request.clip_count = 5;
  EXPECT_TRUE(static_cast<bool>(validate_request(request)));

  request.clip_count = 7;
  ValidationResult r = validate_request(request);
  EXPECT_FALSE(r);
  EXPECT_EQ(r.error, ValidationError::InvalidClipCount);

  request.clip_duration = 45;
  EXPECT_EQ(validate_request(request).error, ValidationError::InvalidDuration);

  request.source_url = "not a url";
  r = validate_request(request);
  EXPECT_EQ(r.error, ValidationError::InvalidUrl);
  EXPECT_FALSE(r.message.empty());
}
