// =============================================================================
// alnstore - Alignment Store Property Tests
// =============================================================================
// An indexed query returns exactly the records a full scan finds overlapping
// the same interval, in file order.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <string>
#include <tuple>
#include <vector>

#include "aln/store/alignment_store.h"
#include "test_support.h"

namespace aln::store::test {
namespace {

using aln::test::makeHeader;
using aln::test::makeRecord;
using aln::test::TempFileGuard;

constexpr std::uint32_t kChromosomeLength = 400'000;

const std::vector<std::string> kNames = {"chr1", "chr2", "chr3"};

std::vector<codec::AlignmentRecord> generateRecords(std::size_t count) {
    std::vector<codec::AlignmentRecord> records;
    records.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto unplaced = *rc::gen::inRange(0, 10) == 0;
        if (unplaced) {
            records.push_back(makeRecord("u" + std::to_string(i), "*", 0));
            continue;
        }
        const auto reference = *rc::gen::elementOf(kNames);
        const auto position = *rc::gen::inRange<std::int64_t>(1, kChromosomeLength - 1000);
        const auto length = *rc::gen::inRange<std::uint32_t>(1, 600);
        records.push_back(makeRecord("m" + std::to_string(i), reference, position, length));
    }
    return records;
}

void sortByCoordinate(std::vector<codec::AlignmentRecord>& records) {
    auto key = [](const codec::AlignmentRecord& record) {
        const bool unplaced = record.isUnmapped();
        return std::make_tuple(unplaced, unplaced ? std::string() : record.referenceName,
                               unplaced ? 0 : record.position);
    };
    std::stable_sort(records.begin(), records.end(),
                     [&key](const auto& a, const auto& b) { return key(a) < key(b); });
}

std::vector<std::string> scanOverlapping(AlignmentStore& store, const std::string& reference,
                                         std::int64_t begin, std::int64_t end) {
    std::vector<std::string> names;
    for (const auto& record : store.iterate()) {
        if (record.isUnmapped() || record.referenceName != reference) {
            continue;
        }
        const auto recordBegin = record.position - 1;
        const auto recordEnd = recordBegin + record.referenceSpan();
        if (recordBegin < end && recordEnd > begin) {
            names.push_back(record.queryName);
        }
    }
    return names;
}

void checkQueriesMatchScan(bool sorted) {
    auto records = generateRecords(*rc::gen::inRange<std::size_t>(0, 300));
    if (sorted) {
        sortByCoordinate(records);
    }

    TempFileGuard guard;
    {
        StoreOptions options;
        options.sorted = sorted;
        options.blockThreshold = kMinBlockThreshold;
        auto store = AlignmentStore::open(
            guard.path(), OpenMode::kWrite, options,
            makeHeader({{"chr1", kChromosomeLength},
                        {"chr2", kChromosomeLength},
                        {"chr3", kChromosomeLength}}));
        for (const auto& record : records) {
            store.write(record);
        }
        store.close();
    }

    auto store = AlignmentStore::open(guard.path(), OpenMode::kRead);
    RC_ASSERT(store.hasIndex() == sorted);
    RC_ASSERT(store.count() == records.size());

    for (int i = 0; i < 5; ++i) {
        const auto reference = *rc::gen::elementOf(kNames);
        const auto begin = *rc::gen::inRange<std::int64_t>(0, kChromosomeLength);
        const auto end = begin + *rc::gen::inRange<std::int64_t>(0, 50'000);

        std::vector<std::string> queried;
        for (const auto& record : store.query(reference, begin, end)) {
            queried.push_back(record.queryName);
        }
        RC_ASSERT(queried == scanOverlapping(store, reference, begin, end));
    }
}

RC_GTEST_PROP(AlignmentStoreProperty, SortedQueryMatchesFullScan, ()) {
    checkQueriesMatchScan(true);
}

RC_GTEST_PROP(AlignmentStoreProperty, UnsortedQueryMatchesFullScan, ()) {
    checkQueriesMatchScan(false);
}

}  // namespace
}  // namespace aln::store::test
