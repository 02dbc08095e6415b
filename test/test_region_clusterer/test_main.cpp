#include "graphics/RegionClusterer.h"

#include "TestUtil.h"
#include <unity.h>

using namespace graphics;

void setUp(void) {}
void tearDown(void) {}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void setRect(DiffMask &m, int x0, int y0, int x1, int y1)
{
    for (int y = y0; y < y1; y++)
        for (int x = x0; x < x1; x++)
            m.set(x, y);
}

static void assertRegion(int x0, int y0, int x1, int y1, const Region &r)
{
    TEST_ASSERT_EQUAL_INT16(x0, r.x0);
    TEST_ASSERT_EQUAL_INT16(y0, r.y0);
    TEST_ASSERT_EQUAL_INT16(x1, r.x1);
    TEST_ASSERT_EQUAL_INT16(y1, r.y1);
}

// ===========================================================================
// Group 1: Components
// ===========================================================================

static void test_empty_mask_gives_no_regions()
{
    DiffMask m(800, 480);
    TEST_ASSERT_EQUAL(0, RegionClusterer(4, 8).cluster(m).size());
}

static void test_single_pixel_component()
{
    DiffMask m(64, 64);
    m.set(10, 20);
    std::vector<Region> c = RegionClusterer(4, 0).components(m);
    TEST_ASSERT_EQUAL(1, c.size());
    assertRegion(10, 20, 11, 21, c[0]);
}

static void test_u_shape_is_one_component()
{
    // Two vertical bars joined only at the bottom: runs split on the upper rows, join later
    DiffMask m(32, 32);
    setRect(m, 2, 2, 4, 20);
    setRect(m, 20, 2, 22, 20);
    setRect(m, 2, 18, 22, 20);
    std::vector<Region> c = RegionClusterer(4, 0).components(m);
    TEST_ASSERT_EQUAL(1, c.size());
    assertRegion(2, 2, 22, 20, c[0]);
}

static void test_separate_blocks_in_raster_order()
{
    DiffMask m(100, 100);
    setRect(m, 60, 50, 70, 60);
    setRect(m, 5, 10, 15, 12);
    setRect(m, 80, 5, 90, 6);
    std::vector<Region> c = RegionClusterer(4, 0).components(m);
    TEST_ASSERT_EQUAL(3, c.size());
    assertRegion(80, 5, 90, 6, c[0]);
    assertRegion(5, 10, 15, 12, c[1]);
    assertRegion(60, 50, 70, 60, c[2]);
}

static void test_full_bytes_make_long_runs()
{
    DiffMask m(800, 2);
    setRect(m, 0, 0, 800, 1);
    std::vector<Region> c = RegionClusterer(4, 0).components(m);
    TEST_ASSERT_EQUAL(1, c.size());
    assertRegion(0, 0, 800, 1, c[0]);
}

// ===========================================================================
// Group 2: Connectivity
// ===========================================================================

static void test_diagonal_split_with_4_connectivity()
{
    DiffMask m(16, 16);
    m.set(4, 4);
    m.set(5, 5);
    m.set(6, 6);
    TEST_ASSERT_EQUAL(3, RegionClusterer(4, 0).components(m).size());
}

static void test_diagonal_joined_with_8_connectivity()
{
    DiffMask m(16, 16);
    m.set(4, 4);
    m.set(5, 5);
    m.set(6, 6);
    m.set(3, 7);
    std::vector<Region> c = RegionClusterer(8, 0).components(m);
    TEST_ASSERT_EQUAL(2, c.size());
    assertRegion(4, 4, 7, 7, c[0]);
    assertRegion(3, 7, 4, 8, c[1]);
}

static void test_anti_diagonal_with_8_connectivity()
{
    DiffMask m(16, 16);
    m.set(8, 1);
    m.set(7, 2);
    m.set(6, 3);
    std::vector<Region> c = RegionClusterer(8, 0).components(m);
    TEST_ASSERT_EQUAL(1, c.size());
    assertRegion(6, 1, 9, 4, c[0]);
}

static void test_unknown_connectivity_falls_back_to_4()
{
    DiffMask m(16, 16);
    m.set(4, 4);
    m.set(5, 5);
    TEST_ASSERT_EQUAL(2, RegionClusterer(6, 0).components(m).size());
}

// ===========================================================================
// Group 3: Padding and clamping
// ===========================================================================

static void test_padding_is_symmetric()
{
    DiffMask m(800, 480);
    m.set(100, 100);
    std::vector<Region> c = RegionClusterer(4, 8).cluster(m);
    TEST_ASSERT_EQUAL(1, c.size());
    assertRegion(92, 92, 109, 109, c[0]);
}

// RegionClusterer.h is the first include of this file, so this also checks it is self contained
static void test_default_padding_comes_from_configuration()
{
    DiffMask m(800, 480);
    m.set(200, 200);
    std::vector<Region> c = RegionClusterer().cluster(m);
    TEST_ASSERT_EQUAL(1, c.size());
    assertRegion(200 - EINK_DEFAULT_PADDING_PX, 200 - EINK_DEFAULT_PADDING_PX, 201 + EINK_DEFAULT_PADDING_PX,
                 201 + EINK_DEFAULT_PADDING_PX, c[0]);
}

static void test_padding_is_clamped_to_the_panel()
{
    DiffMask m(64, 32);
    m.set(0, 0);
    m.set(63, 31);
    std::vector<Region> c = RegionClusterer(4, 8).cluster(m);
    TEST_ASSERT_EQUAL(2, c.size());
    assertRegion(0, 0, 9, 9, c[0]);
    assertRegion(55, 23, 64, 32, c[1]);
}

static void test_every_changed_pixel_is_covered()
{
    FramePtr a = noiseFrame(96, 40, 17, 3);
    FramePtr b = noiseFrame(96, 40, 29, 3);
    ChangeDetector::Result r = ChangeDetector::diff(a.get(), *b);
    TEST_ASSERT_EQUAL(ChangeDetector::CHANGED, r.outcome);

    std::vector<Region> c = RegionClusterer(4, 2).cluster(r.mask);
    TEST_ASSERT_TRUE(windowsCoverChanges(*a, *b, c));
    for (const Region &reg : c)
        TEST_ASSERT_TRUE(reg.fitsPanel(96, 40));
}

int main()
{
    initializeTestEnvironment();
    UNITY_BEGIN();

    // Group 1: Components
    RUN_TEST(test_empty_mask_gives_no_regions);
    RUN_TEST(test_single_pixel_component);
    RUN_TEST(test_u_shape_is_one_component);
    RUN_TEST(test_separate_blocks_in_raster_order);
    RUN_TEST(test_full_bytes_make_long_runs);

    // Group 2: Connectivity
    RUN_TEST(test_diagonal_split_with_4_connectivity);
    RUN_TEST(test_diagonal_joined_with_8_connectivity);
    RUN_TEST(test_anti_diagonal_with_8_connectivity);
    RUN_TEST(test_unknown_connectivity_falls_back_to_4);

    // Group 3: Padding and clamping
    RUN_TEST(test_padding_is_symmetric);
    RUN_TEST(test_default_padding_comes_from_configuration);
    RUN_TEST(test_padding_is_clamped_to_the_panel);
    RUN_TEST(test_every_changed_pixel_is_covered);

    return UNITY_END();
}
