#include <gtest/gtest.h>
#include "event_stream.hpp"
#include "json_fields.hpp"

#include <string>

using chatbot::ReconstructStreamText;

TEST(EventStreamTest, ConcatenatesDeltaFramesInOrder) {
  const std::string body =
      "data: {\"delta\":{\"content\":\"Hello\"}}\n"
      "data: {\"delta\":{\"content\":\" there\"}}\n"
      "data: [DONE]\n";
  auto r = ReconstructStreamText(body);
  EXPECT_EQ(r.text, "Hello there");
  EXPECT_EQ(r.data_frames, 3u);
  EXPECT_EQ(r.content_frames, 2u);
  EXPECT_EQ(r.skipped_frames, 0u);
  EXPECT_TRUE(r.saw_done);
}

TEST(EventStreamTest, MalformedFrameDoesNotAbortReconstruction) {
  const std::string body =
      "data: {\"delta\":{\"content\":\"A\"}}\n"
      "data: {this is not json\n"
      "data: {\"delta\":{\"content\":\"B\"}}\n";
  auto r = ReconstructStreamText(body);
  EXPECT_EQ(r.text, "AB");
  EXPECT_EQ(r.skipped_frames, 1u);
}

TEST(EventStreamTest, IgnoresNonDataLinesAndCrlf) {
  const std::string body =
      "event: message\r\n"
      ": keep-alive\r\n"
      "\r\n"
      "data:{\"delta\":{\"content\":\"x\"}}\r\n"
      "id: 7\r\n"
      "data: {\"delta\":{\"content\":\"y\"}}   \r\n";
  auto r = ReconstructStreamText(body);
  EXPECT_EQ(r.text, "xy");
  EXPECT_EQ(r.data_frames, 2u);
}

TEST(EventStreamTest, DecodesEscapedContent) {
  const std::string body = "data: {\"delta\":{\"content\":\"line1\\nsaid \\\"ok\\\"\"}}\n";
  EXPECT_EQ(ReconstructStreamText(body).text, "line1\nsaid \"ok\"");
}

TEST(EventStreamTest, AcceptsOpenAiChunkShape) {
  const std::string body =
      "data: {\"choices\":[{\"index\":0,\"delta\":{\"role\":\"assistant\"}}]}\n"
      "data: {\"choices\":[{\"index\":0,\"delta\":{\"content\":\"Hi\"}}]}\n"
      "data: [DONE]\n";
  auto r = ReconstructStreamText(body);
  EXPECT_EQ(r.text, "Hi");
  EXPECT_EQ(r.content_frames, 1u);
  EXPECT_EQ(r.skipped_frames, 1u);
}

TEST(EventStreamTest, EmptyBodyYieldsNothing) {
  auto r = ReconstructStreamText("");
  EXPECT_TRUE(r.text.empty());
  EXPECT_EQ(r.data_frames, 0u);
}

TEST(JsonFieldsTest, ClientSecretAsStringOrObject) {
  EXPECT_EQ(chatbot::ExtractClientSecret(R"({"id":"cksess_1","client_secret":"ek_abc"})").value_or(""), "ek_abc");
  EXPECT_EQ(chatbot::ExtractClientSecret(R"({"client_secret":{"value":"ek_obj","expires_at":1}})").value_or(""),
            "ek_obj");
  EXPECT_FALSE(chatbot::ExtractClientSecret(R"({"id":"cksess_1"})").has_value());
}

TEST(JsonFieldsTest, LenientScanOnNonJsonBody) {
  EXPECT_EQ(chatbot::ExtractClientSecret("garbage \"client_secret\": \"ek_x\" trailing").value_or(""), "ek_x");
  bool malformed = false;
  auto c = chatbot::ExtractDeltaContent("{\"delta\":{\"content\":\"frag\\tment\"}", &malformed);
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(*c, "frag\tment");
  EXPECT_FALSE(malformed);
}

TEST(JsonFieldsTest, CompletionContent) {
  const std::string body =
      R"({"id":"chatcmpl-1","choices":[{"index":0,"message":{"role":"assistant","content":"ROI is 6%"}}]})";
  EXPECT_EQ(chatbot::ExtractCompletionContent(body).value_or(""), "ROI is 6%");
  EXPECT_FALSE(chatbot::ExtractCompletionContent(R"({"choices":[]})").has_value());
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
