// SPDX-FileCopyrightText: 2025 Stuart Parmenter
// SPDX-License-Identifier: MIT
//
// @file frame_decoder_test.cpp
// @brief Serial frame decoding, resync and frame handoff

#include "protocol/frame_decoder.h"
#include "support/mutex_section.h"
#include <gtest/gtest.h>
#include <array>
#include <thread>

using namespace ledmatrix;
using ledmatrix::test::MutexSection;

class FrameDecoderTest : public ::testing::Test {
 protected:
  void feed(uint8_t byte, size_t count) {
    for (size_t i = 0; i < count; i++) {
      decoder.on_byte(byte);
    }
  }

  void feed_pixels(Color color, size_t count) {
    for (size_t i = 0; i < count; i++) {
      decoder.on_byte(color.r);
      decoder.on_byte(color.g);
      decoder.on_byte(color.b);
    }
  }

  // Stand-in for the display side: take whatever is pending
  FrameBuffer take_pending() {
    FrameBuffer *shown = exchange.take_pending(display);
    display = shown;
    return *shown;
  }

  BufferPool pool;
  MutexSection lock;
  FrameExchange exchange{pool, lock};
  FrameBuffer *display = exchange.acquire();
  FrameDecoder decoder{exchange};
};

TEST_F(FrameDecoderTest, StartsEmpty) {
  EXPECT_EQ(decoder.cursor(), 0u);
  EXPECT_EQ(decoder.frames_completed(), 0u);
  EXPECT_EQ(decoder.receiving(), FrameBuffer());
  EXPECT_FALSE(exchange.has_pending());
}

TEST_F(FrameDecoderTest, FullFrameIsPublished) {
  const Color color{10, 20, 30};
  feed_pixels(color, FRAME_PIXELS - 1);
  EXPECT_FALSE(exchange.has_pending());
  EXPECT_EQ(decoder.cursor(), FRAME_BYTES - 3);

  feed_pixels(color, 1);
  EXPECT_EQ(decoder.frames_completed(), 1u);
  EXPECT_EQ(decoder.cursor(), 0u);
  ASSERT_TRUE(exchange.has_pending());
  EXPECT_EQ(take_pending(), FrameBuffer::solid(color));
}

TEST_F(FrameDecoderTest, BytesLandRowMajor) {
  for (size_t k = 0; k < FRAME_BYTES; k++) {
    decoder.on_byte(static_cast<uint8_t>(k % 200));
  }
  const FrameBuffer frame = take_pending();
  for (uint8_t row = 1; row <= MATRIX_SIZE; row++) {
    for (uint8_t col = 1; col <= MATRIX_SIZE; col++) {
      const size_t base = (static_cast<size_t>(row - 1) * MATRIX_SIZE + (col - 1)) * 3;
      EXPECT_EQ(frame.at(row, col), (Color{static_cast<uint8_t>(base % 200), static_cast<uint8_t>((base + 1) % 200),
                                           static_cast<uint8_t>((base + 2) % 200)}));
    }
  }
}

TEST_F(FrameDecoderTest, NewReceiveBufferShowsFillPattern) {
  feed(0, FRAME_BYTES);
  EXPECT_EQ(decoder.receiving(), FrameBuffer::gradient(Color::BLUE));
}

TEST_F(FrameDecoderTest, SyncRestartsFrameAndKeepsOldCells) {
  feed(7, 100);
  decoder.on_byte(FrameDecoder::SYNC_BYTE);
  EXPECT_EQ(decoder.cursor(), 0u);
  EXPECT_EQ(decoder.resyncs(), 1u);

  feed(9, 10);
  EXPECT_EQ(decoder.cursor(), 10u);
  EXPECT_EQ(decoder.frames_completed(), 0u);

  const FrameBuffer &frame = decoder.receiving();
  EXPECT_EQ(frame.at(1, 1), (Color{9, 9, 9}));
  EXPECT_EQ(frame.at(1, 4), (Color{9, 7, 7}));
  // Pixel 20, written before the resync
  EXPECT_EQ(frame.at(3, 5), (Color{7, 7, 7}));
  // Pixel 33 only got its red byte
  EXPECT_EQ(frame.at(5, 2), (Color{7, 0, 0}));
  EXPECT_EQ(frame.at(8, 8), Color::BLACK);
}

TEST_F(FrameDecoderTest, SyncIsNeverPixelData) {
  feed(FrameDecoder::SYNC_BYTE, FRAME_BYTES * 2);
  EXPECT_EQ(decoder.cursor(), 0u);
  EXPECT_EQ(decoder.frames_completed(), 0u);
  EXPECT_EQ(decoder.receiving(), FrameBuffer());
}

TEST_F(FrameDecoderTest, FramesNeverDisplayedAreDropped) {
  feed_pixels(Color{200, 0, 0}, FRAME_PIXELS);
  feed_pixels(Color{0, 200, 0}, FRAME_PIXELS);
  feed_pixels(Color{1, 2, 3}, FRAME_PIXELS);
  EXPECT_EQ(decoder.frames_completed(), 3u);
  EXPECT_EQ(take_pending(), FrameBuffer::solid(Color{1, 2, 3}));

  // Receive, display and one free buffer
  EXPECT_EQ(pool.available(), 1u);
}

TEST_F(FrameDecoderTest, ResyncAfterPartialFrameThenFullFrame) {
  feed(50, 37);
  decoder.on_byte(FrameDecoder::SYNC_BYTE);
  feed_pixels(Color{0, 200, 0}, FRAME_PIXELS);
  EXPECT_EQ(decoder.frames_completed(), 1u);
  EXPECT_EQ(take_pending(), FrameBuffer::solid(Color{0, 200, 0}));
}

// 254 is the brightest value a channel can carry on the wire
TEST_F(FrameDecoderTest, FullIntensityChannelCannotBeSent) {
  feed_pixels(Color::RED, FRAME_PIXELS);
  EXPECT_EQ(decoder.frames_completed(), 0u);
  EXPECT_EQ(decoder.resyncs(), FRAME_PIXELS);
  EXPECT_FALSE(exchange.has_pending());

  decoder.on_byte(FrameDecoder::SYNC_BYTE);
  feed_pixels(Color{254, 254, 254}, FRAME_PIXELS);
  EXPECT_EQ(decoder.frames_completed(), 1u);
  EXPECT_EQ(take_pending(), FrameBuffer::solid(Color{254, 254, 254}));
}

TEST_F(FrameDecoderTest, SyncAtEveryCursorPosition) {
  for (size_t k = 0; k < FRAME_BYTES; k++) {
    std::array<uint8_t, FRAME_BYTES> expected{};
    decoder.receiving().to_bytes(expected.data());
    for (size_t i = 0; i < k; i++) {
      expected[i] = 7;
    }

    feed(7, k);
    decoder.on_byte(FrameDecoder::SYNC_BYTE);
    ASSERT_EQ(decoder.cursor(), 0u) << "k=" << k;
    ASSERT_EQ(decoder.frames_completed(), k) << "k=" << k;

    // Bytes written before the resync stay, the rest is untouched
    std::array<uint8_t, FRAME_BYTES> actual{};
    decoder.receiving().to_bytes(actual.data());
    ASSERT_EQ(actual, expected) << "k=" << k;

    // The next full frame starts at (1, 1) and completes normally
    feed(9, FRAME_BYTES);
    ASSERT_EQ(decoder.frames_completed(), k + 1) << "k=" << k;
    ASSERT_EQ(take_pending(), FrameBuffer::solid(Color{9, 9, 9})) << "k=" << k;
  }
  EXPECT_EQ(decoder.resyncs(), FRAME_BYTES);
}

TEST_F(FrameDecoderTest, CountersReadableFromAnotherTask) {
  constexpr uint32_t FRAMES = 200;
  std::thread receiver([this] {
    for (uint32_t frame = 0; frame < FRAMES; frame++) {
      feed(static_cast<uint8_t>(frame % 200), FRAME_BYTES);
    }
  });

  uint32_t last = 0;
  while (last < FRAMES) {
    const uint32_t seen = decoder.frames_completed();
    EXPECT_GE(seen, last);
    last = seen;
  }
  receiver.join();
  EXPECT_EQ(decoder.frames_completed(), FRAMES);
}
