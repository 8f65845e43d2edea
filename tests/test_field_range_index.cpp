#include <gtest/gtest.h>
#include <cstring>
#include <string>
#include <vector>

#include "index/field_range_index_def.h"
#include "storage/schema_errors.h"
#include "storage/table_value.h"
#include "utils/bits.h"
#include "utils/byte_arena.h"

using namespace strata;
using strata::utils::ByteArena;

namespace {

TableValueBuilder makeRow() {
    TableValueBuilder builder;
    builder.add("abc").add("d").add("ef");
    return builder;
}

} // namespace

class FieldRangeIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        builder_ = makeRow();
        bytes_ = builder_.serialize();
        reader_ = TableValueReader(bytes_.data(), bytes_.size());
    }

    TableValueBuilder builder_;
    std::vector<uint8_t> bytes_;
    TableValueReader reader_;
    ByteArena arena_;
};

TEST_F(FieldRangeIndexTest, SingleFieldIsZeroCopy) {
    FieldRangeIndexDef index("by_second", 1);

    int size = 0;
    const uint8_t* field = reader_.read(1, size);
    ScopedSlice key = index.getValue(arena_, reader_);

    EXPECT_EQ(key.data(), field);
    EXPECT_EQ(static_cast<int>(key.size()), size);
    EXPECT_FALSE(key.isOwned());
    EXPECT_EQ(arena_.stats().total_allocations, 0u);
}

TEST_F(FieldRangeIndexTest, SingleFieldFromBuilderIsZeroCopy) {
    FieldRangeIndexDef index("by_first", 0);

    int size = 0;
    const uint8_t* field = builder_.read(0, size);
    ScopedSlice key = index.getValue(arena_, builder_);

    EXPECT_EQ(key.data(), field);
    EXPECT_EQ(key.toString(), "abc");
    EXPECT_EQ(arena_.stats().total_allocations, 0u);
}

TEST_F(FieldRangeIndexTest, MultiFieldConcatenatesIntoExactAllocation) {
    FieldRangeIndexDef index("by_first_two", 0, 2);
    {
        ScopedSlice key = index.getValue(arena_, reader_);
        EXPECT_EQ(key.toString(), "abcd");
        EXPECT_TRUE(key.isOwned());
        EXPECT_EQ(arena_.liveAllocations(), 1u);
        EXPECT_EQ(arena_.stats().live_bytes, 4u);
    }
    EXPECT_EQ(arena_.liveAllocations(), 0u);
}

TEST_F(FieldRangeIndexTest, WholeRowRange) {
    FieldRangeIndexDef index("all", 0, 3);
    ScopedSlice key = index.getValue(arena_, reader_);
    EXPECT_EQ(key.toString(), "abcdef");
}

TEST_F(FieldRangeIndexTest, BuilderExtractionEqualsReaderExtraction) {
    for (int start = 0; start < 3; ++start) {
        for (int count = 1; start + count <= 3; ++count) {
            FieldRangeIndexDef index("range", start, count);
            ScopedSlice from_reader = index.getValue(arena_, reader_);
            ScopedSlice from_builder = index.getValue(arena_, builder_);
            EXPECT_TRUE(from_reader.slice().equals(from_builder.slice()))
                << "start=" << start << " count=" << count;
        }
    }
}

TEST_F(FieldRangeIndexTest, RangePastLastFieldThrows) {
    FieldRangeIndexDef index("too_far", 2, 2);
    EXPECT_THROW(index.getValue(arena_, reader_), std::out_of_range);
    EXPECT_THROW(index.getValue(arena_, builder_), std::out_of_range);
    EXPECT_EQ(arena_.liveAllocations(), 0u);
}

TEST(FieldRangeIndexBoundsTest, OversizedCompositeKeyThrows) {
    std::string chunk(40000, 'x');
    TableValueBuilder builder;
    builder.add(std::string_view(chunk)).add(std::string_view(chunk));
    auto bytes = builder.serialize();
    TableValueReader reader(bytes.data(), bytes.size());

    ByteArena arena;
    FieldRangeIndexDef index("huge", 0, 2);
    EXPECT_THROW(index.getValue(arena, reader), IndexCorruptionException);
    EXPECT_THROW(index.getValue(arena, builder), IndexCorruptionException);
    EXPECT_EQ(arena.liveAllocations(), 0u);
}

TEST(FieldRangeIndexBoundsTest, OversizedSingleFieldThrows) {
    std::string chunk(Slice::kMaxSize + 1, 'y');
    TableValueBuilder builder;
    builder.add(std::string_view(chunk));

    ByteArena arena;
    FieldRangeIndexDef index("huge", 0);
    EXPECT_THROW(index.getValue(arena, builder), IndexCorruptionException);
}

TEST(FieldRangeIndexBoundsTest, NegativeFieldSizeIsRejected) {
    TableValueBuilder builder;
    builder.add("abcd").add("ef").add("g");
    auto bytes = builder.serialize();
    // end[0] = 6, end[1] = 4: field 1 has length -2
    utils::bits::storeUInt32LE(bytes.data() + 4, 6);
    utils::bits::storeUInt32LE(bytes.data() + 8, 4);
    TableValueReader reader(bytes.data(), bytes.size());

    ByteArena arena;
    EXPECT_THROW(FieldRangeIndexDef("single", 1).getValue(arena, reader), IndexCorruptionException);
    EXPECT_THROW(FieldRangeIndexDef("multi", 0, 2).getValue(arena, reader), IndexCorruptionException);
    EXPECT_EQ(arena.liveAllocations(), 0u);
}

// ----------------- Definition lifecycle -----------------

TEST(FieldRangeIndexDefTest, ValidateRejectsIllFormedDefinitions) {
    EXPECT_NO_THROW(FieldRangeIndexDef("ok", 0, 1).validate());
    EXPECT_THROW(FieldRangeIndexDef("", 0).validate(), std::invalid_argument);
    EXPECT_THROW(FieldRangeIndexDef("neg", -1).validate(), std::out_of_range);
    EXPECT_THROW(FieldRangeIndexDef("zero", 0, 0).validate(), std::out_of_range);
}

TEST(FieldRangeIndexDefTest, SerializeReadFromRoundTrip) {
    FieldRangeIndexDef original("by_collection", 1, 2, true);
    auto bytes = original.serialize();

    auto restored = AbstractTreeIndexDef::readFrom(bytes.data(), bytes.size());
    ASSERT_NE(restored, nullptr);
    EXPECT_EQ(restored->type(), TreeIndexType::DEFAULT);
    EXPECT_NO_THROW(original.ensureIdentical(*restored));

    auto range = std::dynamic_pointer_cast<FieldRangeIndexDef>(restored);
    ASSERT_NE(range, nullptr);
    EXPECT_EQ(range->name(), "by_collection");
    EXPECT_EQ(range->startIndex(), 1);
    EXPECT_EQ(range->count(), 2);
    EXPECT_TRUE(range->isGlobal());
}

TEST(FieldRangeIndexDefTest, SerializedFieldOrder) {
    FieldRangeIndexDef index("idx", 3, 2, true);
    auto bytes = index.serialize();
    TableValueReader reader(bytes.data(), bytes.size());

    ASSERT_EQ(reader.count(), 5);
    EXPECT_EQ(reader.readInt64(0), static_cast<int64_t>(TreeIndexType::DEFAULT));
    EXPECT_EQ(reader.readInt32(1), 3);
    EXPECT_EQ(reader.readInt32(2), 2);
    EXPECT_TRUE(reader.readBool(3));
    EXPECT_EQ(reader.readString(4), "idx");
}

struct MismatchCase {
    FieldRangeIndexDef actual;
    const char* field;
};

TEST(FieldRangeIndexDefTest, EnsureIdenticalNamesEachDifferingField) {
    const FieldRangeIndexDef expected("idx", 1, 2, false);
    const MismatchCase cases[] = {
        {FieldRangeIndexDef("other", 1, 2, false), "Name"},
        {FieldRangeIndexDef("idx", 1, 2, true), "IsGlobal"},
        {FieldRangeIndexDef("idx", 0, 2, false), "StartIndex"},
        {FieldRangeIndexDef("idx", 1, 3, false), "Count"},
    };

    for (const auto& c : cases) {
        try {
            expected.ensureIdentical(c.actual);
            FAIL() << "expected a mismatch on " << c.field;
        } catch (const IndexDefinitionMismatchException& e) {
            EXPECT_EQ(e.field(), c.field);
        }
        auto diffs = expected.differences(c.actual);
        ASSERT_EQ(diffs.size(), 1u) << c.field;
        EXPECT_EQ(diffs[0].field, c.field);
    }
}

TEST(FieldRangeIndexDefTest, MismatchMessageNamesExpectedAndActual) {
    const FieldRangeIndexDef expected("idx", 1);
    const FieldRangeIndexDef actual("idx", 2);
    try {
        expected.ensureIdentical(actual);
        FAIL() << "expected a mismatch";
    } catch (const IndexDefinitionMismatchException& e) {
        EXPECT_STREQ(e.what(), "Expected index idx to have StartIndex='1', got StartIndex='2' instead");
        EXPECT_EQ(e.mismatch().expected, "1");
        EXPECT_EQ(e.mismatch().actual, "2");
    }
}

TEST(FieldRangeIndexDefTest, UnknownKindTagIsCorruption) {
    TableValueBuilder builder;
    builder.add(int64_t{0x7F}).add(int32_t{0}).add(int32_t{1}).add(false).add("x");
    auto bytes = builder.serialize();
    EXPECT_THROW(AbstractTreeIndexDef::readFrom(bytes.data(), bytes.size()), IndexCorruptionException);
}

TEST(FieldRangeIndexDefTest, TruncatedRecordIsCorruption) {
    TableValueBuilder builder;
    builder.add(static_cast<int64_t>(TreeIndexType::DEFAULT)).add(int32_t{0}).add(int32_t{1});
    auto bytes = builder.serialize();
    EXPECT_THROW(AbstractTreeIndexDef::readFrom(bytes.data(), bytes.size()), IndexCorruptionException);
}

TEST(FieldRangeIndexDefTest, WrongFieldWidthInRecordIsCorruption) {
    TableValueBuilder builder;
    builder.add(static_cast<int64_t>(TreeIndexType::DEFAULT))
           .add(int64_t{0})      // StartIndex must be int32
           .add(int32_t{1})
           .add(false)
           .add("x");
    auto bytes = builder.serialize();
    try {
        AbstractTreeIndexDef::readFrom(bytes.data(), bytes.size());
        FAIL() << "expected corruption";
    } catch (const IndexCorruptionException& e) {
        EXPECT_NE(std::string(e.what()).find("StartIndex"), std::string::npos);
    }
}

TEST(FieldRangeIndexDefTest, PersistedZeroCountIsCorruption) {
    TableValueBuilder builder;
    builder.add(static_cast<int64_t>(TreeIndexType::DEFAULT))
           .add(int32_t{0})
           .add(int32_t{0})
           .add(false)
           .add("by_nothing");
    auto bytes = builder.serialize();
    try {
        AbstractTreeIndexDef::readFrom(bytes.data(), bytes.size());
        FAIL() << "expected corruption";
    } catch (const IndexCorruptionException& e) {
        EXPECT_NE(std::string(e.what()).find("Count"), std::string::npos);
    }
}

TEST(FieldRangeIndexDefTest, PersistedNegativeStartOrEmptyNameIsCorruption) {
    TableValueBuilder negative;
    negative.add(static_cast<int64_t>(TreeIndexType::DEFAULT)).add(int32_t{-1}).add(int32_t{1}).add(false).add("x");
    auto negative_bytes = negative.serialize();
    EXPECT_THROW(AbstractTreeIndexDef::readFrom(negative_bytes.data(), negative_bytes.size()),
                 IndexCorruptionException);

    TableValueBuilder unnamed;
    unnamed.add(static_cast<int64_t>(TreeIndexType::DEFAULT)).add(int32_t{0}).add(int32_t{1}).add(false).add("");
    auto unnamed_bytes = unnamed.serialize();
    EXPECT_THROW(AbstractTreeIndexDef::readFrom(unnamed_bytes.data(), unnamed_bytes.size()),
                 IndexCorruptionException);
}

TEST(FieldRangeIndexBoundsTest, ZeroCountNeverReturnsArenaBytes) {
    ByteArena arena;
    {
        // Leave recognizable bytes in a pooled block
        utils::ArenaScope dirty = arena.allocate(3);
        std::memcpy(dirty.data(), "XYZ", 3);
    }
    TableValueBuilder builder;
    builder.add("abc").add("d");
    auto bytes = builder.serialize();
    TableValueReader reader(bytes.data(), bytes.size());

    FieldRangeIndexDef empty("by_nothing", 0, 0);
    EXPECT_THROW(empty.getValue(arena, reader), std::out_of_range);
    EXPECT_THROW(empty.getValue(arena, builder), std::out_of_range);
    EXPECT_EQ(arena.liveAllocations(), 0u);
}
