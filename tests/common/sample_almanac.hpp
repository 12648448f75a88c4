#pragma once

#include <string_view>

namespace almanac::test {

// Seven-stage seed-to-location almanac. Seeds 79, 14, 55 and 13 end up at
// locations 82, 43, 86 and 35; as ranges the lowest location is 46.
inline constexpr std::string_view kSampleAlmanac = R"(seeds: 79 14 55 13

seed-to-soil map:
50 98 2
52 50 48

soil-to-fertilizer map:
0 15 37
37 52 2
39 0 15

fertilizer-to-water map:
49 53 8
0 11 42
42 0 7
57 7 4

water-to-light map:
88 18 7
18 25 70

light-to-temperature map:
45 77 23
81 45 19
68 64 13

temperature-to-humidity map:
0 69 1
1 0 69

humidity-to-location map:
60 56 37
56 93 4
)";

}  // namespace almanac::test
