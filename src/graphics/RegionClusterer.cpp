#include "RegionClusterer.h"
#include "configuration.h"
#include <algorithm>

namespace graphics
{

RegionClusterer::RegionClusterer(uint8_t connectivity, int32_t paddingPx)
    : connectivity(connectivity == 8 ? 8 : 4), paddingPx(paddingPx < 0 ? 0 : paddingPx)
{
}

// Append the runs of set bits on row y, left to right
void RegionClusterer::collectRuns(const DiffMask &mask, uint16_t y, std::vector<Run> &runs)
{
    const uint8_t *bits = mask.row(y);
    const int32_t w = mask.width();
    int32_t x = 0;

    while (x < w) {
        // Skip whole empty bytes
        if ((x & 7) == 0 && bits[x >> 3] == 0) {
            x += 8;
            continue;
        }
        if (!((bits[x >> 3] >> (7 - (x & 7))) & 1)) {
            x++;
            continue;
        }

        const int32_t start = x;
        while (x < w && ((bits[x >> 3] >> (7 - (x & 7))) & 1)) {
            if ((x & 7) == 0 && bits[x >> 3] == 0xFF && x + 8 <= w)
                x += 8;
            else
                x++;
        }
        runs.push_back({(int16_t)y, (int16_t)start, (int16_t)x});
    }
}

uint32_t RegionClusterer::findRoot(std::vector<uint32_t> &parent, uint32_t i)
{
    uint32_t root = i;
    while (parent[root] != root)
        root = parent[root];
    // Path compression
    while (parent[i] != root) {
        uint32_t next = parent[i];
        parent[i] = root;
        i = next;
    }
    return root;
}

// The lower index always becomes the root, so each component is keyed by its first run in raster order
void RegionClusterer::join(std::vector<uint32_t> &parent, uint32_t a, uint32_t b)
{
    a = findRoot(parent, a);
    b = findRoot(parent, b);
    if (a == b)
        return;
    if (a < b)
        parent[b] = a;
    else
        parent[a] = b;
}

std::vector<Region> RegionClusterer::components(const DiffMask &mask) const
{
    std::vector<Run> runs;
    std::vector<uint32_t> parent;

    // Diagonal neighbours count as touching with 8-connectivity
    const int32_t reach = connectivity == 8 ? 1 : 0;

    size_t prevBegin = 0, prevEnd = 0;
    for (uint16_t y = 0; y < mask.height(); y++) {
        const size_t curBegin = runs.size();
        collectRuns(mask, y, runs);
        const size_t curEnd = runs.size();
        for (size_t i = curBegin; i < curEnd; i++)
            parent.push_back((uint32_t)i);

        // Both rows are sorted by xs, sweep them together
        size_t p = prevBegin;
        for (size_t c = curBegin; c < curEnd; c++) {
            const Run &cur = runs[c];
            while (p < prevEnd && runs[p].xe + reach <= cur.xs)
                p++;
            for (size_t q = p; q < prevEnd && runs[q].xs < cur.xe + reach; q++)
                join(parent, (uint32_t)q, (uint32_t)c);
        }

        prevBegin = curBegin;
        prevEnd = curEnd;
    }

    // One box per root, in order of the root's index
    std::vector<int32_t> slot(runs.size(), -1);
    std::vector<Region> boxes;
    for (size_t i = 0; i < runs.size(); i++) {
        const uint32_t root = findRoot(parent, (uint32_t)i);
        const Run &run = runs[i];
        if (slot[root] < 0) {
            slot[root] = (int32_t)boxes.size();
            boxes.push_back(Region(run.xs, run.y, run.xe, run.y + 1));
        } else {
            Region &box = boxes[slot[root]];
            box = box.unite(Region(run.xs, run.y, run.xe, run.y + 1));
        }
    }

    LOG_TRACE("cluster: %u runs, %u components", (unsigned)runs.size(), (unsigned)boxes.size());
    return boxes;
}

std::vector<Region> RegionClusterer::cluster(const DiffMask &mask) const
{
    std::vector<Region> boxes = components(mask);
    const int32_t w = mask.width(), h = mask.height();

    for (Region &r : boxes) {
        r.x0 = (int16_t)std::max<int32_t>(0, r.x0 - paddingPx);
        r.y0 = (int16_t)std::max<int32_t>(0, r.y0 - paddingPx);
        r.x1 = (int16_t)std::min<int32_t>(w, r.x1 + paddingPx);
        r.y1 = (int16_t)std::min<int32_t>(h, r.y1 + paddingPx);
    }
    return boxes;
}

} // namespace graphics
