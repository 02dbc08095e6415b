#include "graphics/BoundaryAligner.h"

#include "TestUtil.h"
#include <unity.h>

using namespace graphics;

void setUp(void) {}
void tearDown(void) {}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void assertWindow(int x0, int x1, int expectX0, int expectX1)
{
    int32_t ox0, ox1;
    BoundaryAligner::hardwareWindow(x0, x1, 8, ox0, ox1);
    TEST_ASSERT_EQUAL_INT32(expectX0, ox0);
    TEST_ASSERT_EQUAL_INT32(expectX1, ox1);
}

static AlignedRegion alignOk(const BoundaryAligner &aligner, const Region &r)
{
    AlignedRegion out;
    TEST_ASSERT_EQUAL(ERRNO_OK, aligner.align(r, out));
    return out;
}

// ===========================================================================
// Group 1: Controller window rule
// ===========================================================================

static void test_both_edges_on_the_grid()
{
    assertWindow(16, 32, 16, 32);
}

static void test_remainders_sum_to_8_left_larger_snaps_down()
{
    assertWindow(5, 11, 0, 8);
}

static void test_width_multiple_of_8_snaps_down()
{
    assertWindow(3, 11, 0, 8);
}

static void test_remainders_sum_to_8_right_larger_snaps_up()
{
    assertWindow(3, 13, 0, 16);
}

static void test_ragged_right_edge_snaps_up()
{
    assertWindow(8, 20, 8, 24);
    assertWindow(100, 117, 96, 120);
}

static void test_right_edge_on_grid_stays()
{
    assertWindow(12, 16, 8, 16);
}

// ===========================================================================
// Group 2: align()
// ===========================================================================

static void test_align_widens_a_clipped_window()
{
    BoundaryAligner aligner(800, 480);
    AlignedRegion a = alignOk(aligner, Region(5, 10, 11, 20));
    TEST_ASSERT_EQUAL_INT16(0, a.x0);
    TEST_ASSERT_EQUAL_INT16(16, a.x1);

    a = alignOk(aligner, Region(3, 10, 11, 20));
    TEST_ASSERT_EQUAL_INT16(0, a.x0);
    TEST_ASSERT_EQUAL_INT16(16, a.x1);
}

static void test_align_keeps_rows_and_source()
{
    BoundaryAligner aligner(800, 480);
    Region r(92, 92, 109, 109);
    AlignedRegion a = alignOk(aligner, r);
    TEST_ASSERT_EQUAL_INT16(88, a.x0);
    TEST_ASSERT_EQUAL_INT16(112, a.x1);
    TEST_ASSERT_EQUAL_INT16(92, a.y0);
    TEST_ASSERT_EQUAL_INT16(109, a.y1);
    TEST_ASSERT_TRUE(a.source == r);
    TEST_ASSERT_EQUAL_INT32(3, a.rowBytes());
}

static void test_align_at_the_right_edge()
{
    BoundaryAligner aligner(800, 480);
    AlignedRegion a = alignOk(aligner, Region(790, 0, 800, 480));
    TEST_ASSERT_EQUAL_INT16(784, a.x0);
    TEST_ASSERT_EQUAL_INT16(800, a.x1);
}

static void test_align_rejects_bad_regions()
{
    BoundaryAligner aligner(800, 480);
    AlignedRegion out(Region(1, 2, 3, 4), Region(1, 2, 3, 4));
    TEST_ASSERT_EQUAL(ERRNO_BAD_REGION, aligner.align(Region(10, 10, 10, 20), out));
    TEST_ASSERT_EQUAL(ERRNO_BAD_REGION, aligner.align(Region(-8, 0, 8, 8), out));
    TEST_ASSERT_EQUAL(ERRNO_BAD_REGION, aligner.align(Region(792, 0, 808, 8), out));
    TEST_ASSERT_EQUAL(ERRNO_BAD_REGION, aligner.align(Region(0, 470, 8, 481), out));
    TEST_ASSERT_TRUE(out == Region(1, 2, 3, 4));
}

static void test_align_rejects_window_past_a_ragged_panel_edge()
{
    BoundaryAligner aligner(803, 480);
    AlignedRegion out;
    TEST_ASSERT_EQUAL(ERRNO_BAD_REGION, aligner.align(Region(790, 0, 803, 8), out));
    // Away from the ragged edge everything still works
    TEST_ASSERT_EQUAL(ERRNO_OK, aligner.align(Region(10, 0, 20, 8), out));
}

static void test_every_small_region_is_covered()
{
    BoundaryAligner aligner(64, 4);
    for (int x0 = 0; x0 < 64; x0++) {
        for (int x1 = x0 + 1; x1 <= 64; x1++) {
            Region r((int16_t)x0, 0, (int16_t)x1, 4);
            AlignedRegion a = alignOk(aligner, r);
            TEST_ASSERT_TRUE(a.containsRegion(r));
            TEST_ASSERT_EQUAL_INT32(0, a.width() % 8);
            TEST_ASSERT_EQUAL_INT32(0, a.x0 % 8);
            TEST_ASSERT_TRUE(a.x0 >= 0);
            TEST_ASSERT_TRUE(a.x1 <= 64);
            // Never more than one extra byte on each side
            TEST_ASSERT_TRUE(r.x0 - a.x0 < 8);
            TEST_ASSERT_TRUE(a.x1 - r.x1 < 8);
        }
    }
}

int main()
{
    initializeTestEnvironment();
    UNITY_BEGIN();

    // Group 1: Controller window rule
    RUN_TEST(test_both_edges_on_the_grid);
    RUN_TEST(test_remainders_sum_to_8_left_larger_snaps_down);
    RUN_TEST(test_width_multiple_of_8_snaps_down);
    RUN_TEST(test_remainders_sum_to_8_right_larger_snaps_up);
    RUN_TEST(test_ragged_right_edge_snaps_up);
    RUN_TEST(test_right_edge_on_grid_stays);

    // Group 2: align()
    RUN_TEST(test_align_widens_a_clipped_window);
    RUN_TEST(test_align_keeps_rows_and_source);
    RUN_TEST(test_align_at_the_right_edge);
    RUN_TEST(test_align_rejects_bad_regions);
    RUN_TEST(test_align_rejects_window_past_a_ragged_panel_edge);
    RUN_TEST(test_every_small_region_is_covered);

    return UNITY_END();
}
