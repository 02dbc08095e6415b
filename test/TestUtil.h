#pragma once

#include "graphics/Frame.h"
#include "graphics/Region.h"
#include <initializer_list>
#include <stdint.h>
#include <vector>

// Initialize testing environment. Console at debug level, written to stderr without colours.
void initializeTestEnvironment();

// All white frame
graphics::FramePtr blankFrame(uint16_t width, uint16_t height);

// Copy of base with the given rectangles filled black
graphics::FramePtr withRects(const graphics::Frame &base, std::initializer_list<graphics::Region> rects);

// Copy of base with single pixels flipped
graphics::FramePtr withFlippedPixels(const graphics::Frame &base, const std::vector<std::pair<int32_t, int32_t>> &pixels);

// Frame filled with pseudo random noise, same seed gives the same frame
graphics::FramePtr noiseFrame(uint16_t width, uint16_t height, uint32_t seed, uint8_t densityPercent);

// Every pixel that differs between a and b lies inside one of the windows
bool windowsCoverChanges(const graphics::Frame &a, const graphics::Frame &b, const std::vector<graphics::Region> &windows);
