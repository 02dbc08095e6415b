#include "graphics/RegionMerger.h"

#include "TestUtil.h"
#include <algorithm>
#include <unity.h>

using namespace graphics;

static PlannerConfig config;

void setUp(void)
{
    config = PlannerConfig();
}

void tearDown(void) {}

// ===========================================================================
// Group 1: Size filter
// ===========================================================================

static void test_filter_drops_thin_and_short_regions()
{
    RegionMerger merger(config);
    std::vector<Region> kept = merger.filterBySize({Region(0, 0, 15, 100), Region(0, 0, 100, 15), Region(0, 0, 16, 16)});
    TEST_ASSERT_EQUAL(1, kept.size());
    TEST_ASSERT_TRUE(kept[0] == Region(0, 0, 16, 16));
}

static void test_zero_minimum_keeps_everything()
{
    config.minRegionPx = 0;
    RegionMerger merger(config);
    TEST_ASSERT_EQUAL(2, merger.filterBySize({Region(1, 1, 2, 2), Region(5, 5, 6, 6)}).size());
}

// ===========================================================================
// Group 2: Merging
// ===========================================================================

static void test_near_on_both_axes()
{
    TEST_ASSERT_TRUE(RegionMerger::isNear(Region(0, 0, 10, 10), Region(5, 5, 20, 20), 0));
    TEST_ASSERT_TRUE(RegionMerger::isNear(Region(0, 0, 10, 10), Region(42, 0, 50, 10), 32));
    TEST_ASSERT_FALSE(RegionMerger::isNear(Region(0, 0, 10, 10), Region(43, 0, 50, 10), 32));
    // Close horizontally, far vertically
    TEST_ASSERT_FALSE(RegionMerger::isNear(Region(0, 0, 10, 10), Region(12, 100, 20, 110), 32));
}

static void test_two_clusters_5px_apart_merge()
{
    config.regionPaddingPx = 0;
    RegionMerger merger(config);
    RegionMerger::Result r = merger.refine({Region(100, 100, 120, 120), Region(125, 100, 145, 120)});
    TEST_ASSERT_EQUAL(1, r.regions.size());
    TEST_ASSERT_TRUE(r.regions[0] == Region(100, 100, 145, 120));
    TEST_ASSERT_EQUAL_UINT32(1, r.merged);
}

static void test_merge_is_transitive_through_growth()
{
    // a and c are far apart, b bridges them
    std::vector<Region> regions = {Region(0, 0, 20, 20), Region(200, 0, 220, 20), Region(30, 0, 190, 20)};
    uint32_t merges = RegionMerger::mergeNearby(regions, 10);
    TEST_ASSERT_EQUAL_UINT32(2, merges);
    TEST_ASSERT_EQUAL(1, regions.size());
    TEST_ASSERT_TRUE(regions[0] == Region(0, 0, 220, 20));
}

static void test_union_growth_pulls_in_a_third_box()
{
    // c is not near a or b on its own, only near their union
    std::vector<Region> regions = {Region(0, 0, 20, 20), Region(40, 40, 60, 60), Region(0, 75, 10, 90)};
    TEST_ASSERT_FALSE(RegionMerger::isNear(regions[0], regions[2], 20));
    TEST_ASSERT_FALSE(RegionMerger::isNear(regions[1], regions[2], 20));

    RegionMerger::mergeNearby(regions, 20);
    TEST_ASSERT_EQUAL(1, regions.size());
    TEST_ASSERT_TRUE(regions[0] == Region(0, 0, 60, 90));
}

static void test_distant_boxes_stay_apart()
{
    std::vector<Region> regions = {Region(0, 0, 20, 20), Region(0, 60, 20, 80), Region(100, 0, 120, 20)};
    TEST_ASSERT_EQUAL_UINT32(0, RegionMerger::mergeNearby(regions, 20));
    TEST_ASSERT_EQUAL(3, regions.size());
}

static void test_refine_is_order_independent()
{
    std::vector<Region> input = {Region(0, 0, 20, 20),    Region(300, 300, 340, 330), Region(25, 0, 60, 30),
                                 Region(500, 10, 530, 40), Region(320, 335, 360, 360), Region(700, 400, 800, 480)};
    RegionMerger merger(config);
    RegionMerger::Result expected = merger.refine(input);

    std::vector<Region> shuffled = input;
    std::reverse(shuffled.begin(), shuffled.end());
    RegionMerger::Result r1 = merger.refine(shuffled);
    std::rotate(shuffled.begin(), shuffled.begin() + 2, shuffled.end());
    RegionMerger::Result r2 = merger.refine(shuffled);

    TEST_ASSERT_EQUAL(expected.regions.size(), r1.regions.size());
    TEST_ASSERT_EQUAL(expected.regions.size(), r2.regions.size());
    for (size_t i = 0; i < expected.regions.size(); i++) {
        TEST_ASSERT_TRUE(expected.regions[i] == r1.regions[i]);
        TEST_ASSERT_TRUE(expected.regions[i] == r2.regions[i]);
    }
}

// ===========================================================================
// Group 3: Priority and cap
// ===========================================================================

static void test_largest_first()
{
    config.mergeDistancePx = 0;
    RegionMerger merger(config);
    RegionMerger::Result r = merger.refine({Region(0, 0, 20, 20), Region(100, 100, 200, 200), Region(300, 0, 350, 50)});
    TEST_ASSERT_EQUAL(3, r.regions.size());
    TEST_ASSERT_TRUE(r.regions[0] == Region(100, 100, 200, 200));
    TEST_ASSERT_TRUE(r.regions[1] == Region(300, 0, 350, 50));
    TEST_ASSERT_TRUE(r.regions[2] == Region(0, 0, 20, 20));
}

static void test_equal_area_top_then_left()
{
    std::vector<Region> regions = {Region(200, 50, 220, 70), Region(100, 50, 120, 70), Region(0, 100, 20, 120)};
    RegionMerger::prioritize(regions);
    TEST_ASSERT_TRUE(regions[0] == Region(100, 50, 120, 70));
    TEST_ASSERT_TRUE(regions[1] == Region(200, 50, 220, 70));
    TEST_ASSERT_TRUE(regions[2] == Region(0, 100, 20, 120));
}

static void test_cap_drops_the_smallest()
{
    config.mergeDistancePx = 0;
    config.maxRegionsPerCycle = 2;
    RegionMerger merger(config);
    RegionMerger::Result r =
        merger.refine({Region(0, 0, 20, 20), Region(100, 0, 130, 30), Region(200, 0, 240, 40), Region(300, 0, 316, 16)});
    TEST_ASSERT_EQUAL(2, r.regions.size());
    TEST_ASSERT_EQUAL_UINT32(2, r.capped);
    TEST_ASSERT_TRUE(r.regions[0] == Region(200, 0, 240, 40));
    TEST_ASSERT_TRUE(r.regions[1] == Region(100, 0, 130, 30));
}

// ===========================================================================
// Group 4: Empty after filter
// ===========================================================================

static void test_all_filtered_escalates_by_default()
{
    RegionMerger merger(config);
    RegionMerger::Result r = merger.refine({Region(0, 0, 4, 4), Region(50, 50, 52, 60)});
    TEST_ASSERT_TRUE(r.emptiedByFilter);
    TEST_ASSERT_FALSE(r.keptLargest);
    TEST_ASSERT_EQUAL(0, r.regions.size());
    TEST_ASSERT_EQUAL_UINT32(2, r.filtered);
}

static void test_all_filtered_keeps_largest_when_asked()
{
    config.emptyPolicy = EmptyRegionPolicy::KEEP_LARGEST;
    RegionMerger merger(config);
    RegionMerger::Result r = merger.refine({Region(0, 0, 4, 4), Region(50, 50, 52, 60), Region(90, 90, 95, 95)});
    TEST_ASSERT_FALSE(r.emptiedByFilter);
    TEST_ASSERT_TRUE(r.keptLargest);
    TEST_ASSERT_EQUAL(1, r.regions.size());
    TEST_ASSERT_TRUE(r.regions[0] == Region(90, 90, 95, 95));
}

static void test_no_candidates_is_not_an_escalation()
{
    RegionMerger merger(config);
    RegionMerger::Result r = merger.refine({});
    TEST_ASSERT_FALSE(r.emptiedByFilter);
    TEST_ASSERT_EQUAL(0, r.regions.size());
}

int main()
{
    initializeTestEnvironment();
    UNITY_BEGIN();

    // Group 1: Size filter
    RUN_TEST(test_filter_drops_thin_and_short_regions);
    RUN_TEST(test_zero_minimum_keeps_everything);

    // Group 2: Merging
    RUN_TEST(test_near_on_both_axes);
    RUN_TEST(test_two_clusters_5px_apart_merge);
    RUN_TEST(test_merge_is_transitive_through_growth);
    RUN_TEST(test_union_growth_pulls_in_a_third_box);
    RUN_TEST(test_distant_boxes_stay_apart);
    RUN_TEST(test_refine_is_order_independent);

    // Group 3: Priority and cap
    RUN_TEST(test_largest_first);
    RUN_TEST(test_equal_area_top_then_left);
    RUN_TEST(test_cap_drops_the_smallest);

    // Group 4: Empty after filter
    RUN_TEST(test_all_filtered_escalates_by_default);
    RUN_TEST(test_all_filtered_keeps_largest_when_asked);
    RUN_TEST(test_no_candidates_is_not_an_escalation);

    return UNITY_END();
}
