#include "graphics/ChangeDetector.h"

#include "TestUtil.h"
#include <unity.h>

using namespace graphics;

void setUp(void) {}
void tearDown(void) {}

static void test_no_previous_frame_is_full_repaint()
{
    FramePtr next = blankFrame(800, 480);
    ChangeDetector::Result r = ChangeDetector::diff(nullptr, *next);
    TEST_ASSERT_EQUAL(ChangeDetector::FULL_REPAINT, r.outcome);
}

static void test_geometry_mismatch_is_full_repaint()
{
    FramePtr prev = blankFrame(800, 480);
    FramePtr next = blankFrame(640, 480);
    TEST_ASSERT_EQUAL(ChangeDetector::FULL_REPAINT, ChangeDetector::diff(prev.get(), *next).outcome);

    FramePtr taller = blankFrame(800, 600);
    TEST_ASSERT_EQUAL(ChangeDetector::FULL_REPAINT, ChangeDetector::diff(prev.get(), *taller).outcome);
}

static void test_identical_frames_are_no_change()
{
    FramePtr a = noiseFrame(128, 64, 3, 30);
    Frame b(*a);
    ChangeDetector::Result r = ChangeDetector::diff(a.get(), b);
    TEST_ASSERT_EQUAL(ChangeDetector::NO_CHANGE, r.outcome);
    TEST_ASSERT_EQUAL_UINT32(0, r.changedPixels);
}

static void test_frame_against_itself_is_no_change()
{
    FramePtr a = blankFrame(800, 480);
    TEST_ASSERT_EQUAL(ChangeDetector::NO_CHANGE, ChangeDetector::diff(a.get(), *a).outcome);
}

static void test_mask_marks_exactly_the_changed_pixels()
{
    FramePtr prev = noiseFrame(61, 17, 5, 40);
    FramePtr next = withFlippedPixels(*prev, {{0, 0}, {60, 16}, {33, 8}, {7, 9}, {8, 9}});
    ChangeDetector::Result r = ChangeDetector::diff(prev.get(), *next);

    TEST_ASSERT_EQUAL(ChangeDetector::CHANGED, r.outcome);
    TEST_ASSERT_EQUAL_UINT32(5, r.changedPixels);
    TEST_ASSERT_EQUAL_UINT32(5, r.mask.count());
    TEST_ASSERT_EQUAL_UINT16(61, r.mask.width());
    TEST_ASSERT_EQUAL_UINT16(17, r.mask.height());
    for (int y = 0; y < 17; y++)
        for (int x = 0; x < 61; x++)
            TEST_ASSERT_EQUAL(prev->getPixel(x, y) != next->getPixel(x, y), r.mask.get(x, y));
}

static void test_change_in_last_byte_is_found()
{
    FramePtr prev = blankFrame(800, 480);
    FramePtr next = withFlippedPixels(*prev, {{799, 479}});
    ChangeDetector::Result r = ChangeDetector::diff(prev.get(), *next);
    TEST_ASSERT_EQUAL(ChangeDetector::CHANGED, r.outcome);
    TEST_ASSERT_TRUE(r.mask.get(799, 479));
    TEST_ASSERT_TRUE(r.mask.any());
}

static void test_outcome_names()
{
    TEST_ASSERT_EQUAL_STRING("NO_CHANGE", ChangeDetector::outcomeName(ChangeDetector::NO_CHANGE));
    TEST_ASSERT_EQUAL_STRING("FULL_REPAINT", ChangeDetector::outcomeName(ChangeDetector::FULL_REPAINT));
    TEST_ASSERT_EQUAL_STRING("CHANGED", ChangeDetector::outcomeName(ChangeDetector::CHANGED));
}

int main()
{
    initializeTestEnvironment();
    UNITY_BEGIN();
    RUN_TEST(test_no_previous_frame_is_full_repaint);
    RUN_TEST(test_geometry_mismatch_is_full_repaint);
    RUN_TEST(test_identical_frames_are_no_change);
    RUN_TEST(test_frame_against_itself_is_no_change);
    RUN_TEST(test_mask_marks_exactly_the_changed_pixels);
    RUN_TEST(test_change_in_last_byte_is_found);
    RUN_TEST(test_outcome_names);
    return UNITY_END();
}
