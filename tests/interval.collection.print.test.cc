#include <limits>
#include <string>
#include <string_view>

#include "gtest/gtest.h"

#include "interval.collection.hpp"

namespace {

std::string repeat(const std::string_view s, const size_t count) {
    std::string out;
    for (size_t i = 0; i < count; ++i) {
        out += s;
    }
    return out;
}

std::string summary_header(const int64_t min_low, const int64_t max_high) {
    return "\n\n==================================\n SUMMARY (minLow=" + std::to_string(min_low) +
           ", maxHigh=" + std::to_string(max_high) +
           ")\n==================================\n • Legend: ◌ (empty), ◎ (full), ● (overlap)";
}

TEST(IntervalCollectionPrintTest, EmptyCollection) {
    IntervalCollection coll{0, 40};

    const std::string expected = summary_header(0, 40) +
                                 "\n • Intervals: "
                                 "\n • Gaps: [0,40]"
                                 "\n • Overlapped: "
                                 "\n\n 0" +
                                 repeat(" ", 38) + "40\n╠" + repeat("◌", 40) + "╣\n";

    EXPECT_EQ(coll.print(), expected);
}

TEST(IntervalCollectionPrintTest, EndToEndSummary) {
    IntervalCollection coll{0, 40};
    coll.add({30, 35});
    coll.add({5, 10});
    coll.add({8, 15});

    const std::string graph = "◌◌◌◌◌◎◎◎●●║●◎◎◎◎◎◌◌◌◌║◌◌◌◌◌◌◌◌◌◌║◎◎◎◎◎◎◌◌◌◌";
    const std::string expected = summary_header(0, 40) +
                                 "\n • Intervals: [5,10], [8,15], [30,35]"
                                 "\n • Gaps: [0,4], [16,29], [36,40]"
                                 "\n • Overlapped: [8,10]"
                                 "\n\n 0" +
                                 repeat(" ", 41) + "40\n╠" + graph + "╣\n";

    EXPECT_EQ(coll.print(), expected);
    EXPECT_TRUE(coll.is_sorted());
}

TEST(IntervalCollectionPrintTest, OverlapUnitsUseTheOverlapSymbol) {
    IntervalCollection coll{0, 10};
    coll.add({0, 4});
    coll.add({3, 6});

    const std::string expected = summary_header(0, 10) +
                                 "\n • Intervals: [0,4], [3,6]"
                                 "\n • Gaps: [7,10]"
                                 "\n • Overlapped: [3,4]"
                                 "\n\n 0" +
                                 repeat(" ", 8) + "10\n╠◎◎◎●●◎◎◌◌◌╣\n";

    EXPECT_EQ(coll.print(), expected);
}

TEST(IntervalCollectionPrintTest, NonZeroDomainStart) {
    IntervalCollection coll{5, 25};
    coll.add({8, 12});

    // separators follow absolute positions, so the first one comes after unit 9
    const std::string expected = summary_header(5, 25) +
                                 "\n • Intervals: [8,12]"
                                 "\n • Gaps: [5,7], [13,25]"
                                 "\n • Overlapped: "
                                 "\n\n 5" +
                                 repeat(" ", 19) + "25\n╠◌◌◌◎◎║◎◎◎" + repeat("◌", 12) + "╣\n";

    EXPECT_EQ(coll.print(), expected);
}

TEST(IntervalCollectionPrintTest, DomainEndingAtMaxRepresentable) {
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    IntervalCollection coll{kMax - 12, kMax};
    coll.add({kMax - 3, kMax});

    const std::string expected = summary_header(kMax - 12, kMax) +
                                 "\n • Intervals: [9223372036854775804,9223372036854775807]"
                                 "\n • Gaps: [9223372036854775795,9223372036854775803]"
                                 "\n • Overlapped: "
                                 "\n\n 9223372036854775795" +
                                 repeat(" ", 11) + "9223372036854775807\n╠◌◌◌◌◌║◌◌◌◌◎◎◎◎╣\n";

    EXPECT_EQ(coll.print(), expected);
}

TEST(IntervalCollectionPrintTest, OutputDoesNotDependOnInsertionOrder) {
    IntervalCollection first{0, 60};
    first.add({2, 9});
    first.add({7, 22});
    first.add({40, 44});
    first.add({21, 30});

    IntervalCollection second{0, 60};
    second.add({40, 44});
    second.add({21, 30});
    second.add({2, 9});
    second.add({7, 22});

    EXPECT_EQ(first.print(), second.print());
}

TEST(IntervalCollectionPrintTest, PrintingTwiceGivesTheSameText) {
    IntervalCollection coll{0, 30};
    coll.add({12, 18});
    coll.add({3, 14});

    const std::string once = coll.print();
    EXPECT_EQ(coll.print(), once);
}

} // namespace
