#include <gtest/gtest.h>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include "index/builtin_key_generators.h"
#include "index/dynamic_key_index_def.h"
#include "index/field_range_index_def.h"
#include "index/key_generator_registry.h"
#include "storage/schema_errors.h"
#include "storage/table_value.h"
#include "utils/byte_arena.h"

using namespace strata;
using strata::utils::ByteArena;

namespace {

constexpr const char* kTestScope = "tests.dynamic";

ScopedSlice throwingGenerator(ByteArena&, const TableValueReader&) {
    throw std::runtime_error("generator failed");
}

ScopedSlice secondFieldGenerator(ByteArena&, const TableValueReader& value) {
    return ScopedSlice::borrowed(value.readSlice(1));
}

class Prefixer {
public:
    explicit Prefixer(std::string prefix) : prefix_(std::move(prefix)) {}

    ScopedSlice generate(ByteArena& arena, const TableValueReader& value) const {
        const Slice field = value.readSlice(0);
        utils::ArenaScope out = arena.allocate(prefix_.size() + field.size());
        std::memcpy(out.data(), prefix_.data(), prefix_.size());
        field.copyTo(out.data() + prefix_.size());
        return ScopedSlice::owned(std::move(out));
    }

private:
    std::string prefix_;
};

} // namespace

class DynamicKeyIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        registerBuiltinKeyGenerators();
        auto& registry = KeyGeneratorRegistry::instance();
        registry.registerKeyGenerator(kTestScope, "throwing", &throwingGenerator);
        registry.registerKeyGenerator(kTestScope, "second_field", &secondFieldGenerator);

        KeyGeneratorDescriptor unmarked;
        unmarked.scope = kTestScope;
        unmarked.name = "unmarked";
        unmarked.generator = &secondFieldGenerator;
        unmarked.is_index_key_generator = false;
        registry.registerDescriptor(std::move(unmarked));

        registry.registerMemberGenerator(kTestScope, "prefixed", &prefixer_, &Prefixer::generate);

        builder_.add("HeLLo").add("World");
        bytes_ = builder_.serialize();
        reader_ = TableValueReader(bytes_.data(), bytes_.size());
    }

    void TearDown() override {
        auto& registry = KeyGeneratorRegistry::instance();
        for (const auto& name : registry.names(kTestScope)) {
            registry.unregister(kTestScope, name);
        }
    }

    std::shared_ptr<DynamicKeyIndexDef> builtin(const std::string& generator, const std::string& name = "dyn") {
        return DynamicKeyIndexDef::create(name, builtin_keys::kBuiltinScope, generator);
    }

    Prefixer prefixer_{"p:"};
    TableValueBuilder builder_;
    std::vector<uint8_t> bytes_;
    TableValueReader reader_;
    ByteArena arena_;
};

TEST_F(DynamicKeyIndexTest, LowercaseGeneratorFromReader) {
    auto index = builtin(builtin_keys::kLowercaseFirstField);
    ScopedSlice key = index->getValue(arena_, reader_);
    EXPECT_EQ(key.toString(), "hello");
    EXPECT_TRUE(key.isOwned());
}

TEST_F(DynamicKeyIndexTest, CompositeGenerator) {
    auto index = builtin(builtin_keys::kLowercaseFirstFieldThenSecond);
    ScopedSlice key = index->getValue(arena_, reader_);
    EXPECT_EQ(key.toString(), "helloWorld");
}

TEST_F(DynamicKeyIndexTest, BuilderExtractionEqualsReaderExtraction) {
    const char* generators[] = {
        builtin_keys::kFirstField,
        builtin_keys::kLowercaseFirstField,
        builtin_keys::kLowercaseFirstFieldThenSecond,
    };
    for (const char* generator : generators) {
        auto index = builtin(generator);
        ScopedSlice from_reader = index->getValue(arena_, reader_);
        ScopedSlice from_builder = index->getValue(arena_, builder_);
        EXPECT_TRUE(from_reader.slice().equals(from_builder.slice())) << generator;
    }
}

TEST_F(DynamicKeyIndexTest, BorrowedKeyFromBuilderOutlivesTemporaryRow) {
    auto index = builtin(builtin_keys::kFirstField);
    ScopedSlice key = index->getValue(arena_, builder_);

    // The temporary materialized row is gone; only the key copy is live.
    EXPECT_TRUE(key.isOwned());
    EXPECT_EQ(arena_.liveAllocations(), 1u);
    EXPECT_EQ(key.toString(), "HeLLo");
}

TEST_F(DynamicKeyIndexTest, BorrowedKeyFromReaderIsZeroCopy) {
    auto index = builtin(builtin_keys::kFirstField);
    ScopedSlice key = index->getValue(arena_, reader_);
    EXPECT_FALSE(key.isOwned());
    EXPECT_TRUE(key.pointsInto(bytes_.data(), bytes_.size()));
    EXPECT_EQ(arena_.stats().total_allocations, 0u);
}

TEST_F(DynamicKeyIndexTest, TemporaryRowReleasedWhenGeneratorThrows) {
    auto index = DynamicKeyIndexDef::create("boom", kTestScope, "throwing");
    EXPECT_THROW(index->getValue(arena_, builder_), std::runtime_error);
    EXPECT_EQ(arena_.liveAllocations(), 0u);
}

TEST_F(DynamicKeyIndexTest, OversizedCompositeKeyThrows) {
    std::string chunk(40000, 'A');
    TableValueBuilder builder;
    builder.add(std::string_view(chunk)).add(std::string_view(chunk));

    auto index = builtin(builtin_keys::kLowercaseFirstFieldThenSecond);
    EXPECT_THROW(index->getValue(arena_, builder), IndexCorruptionException);
    EXPECT_EQ(arena_.liveAllocations(), 0u);
}

TEST_F(DynamicKeyIndexTest, SerializeReadFromRoundTrip) {
    auto original = DynamicKeyIndexDef::create("by_lower", builtin_keys::kBuiltinScope,
                                               builtin_keys::kLowercaseFirstField, true);
    auto bytes = original->serialize();

    auto restored = AbstractTreeIndexDef::readFrom(bytes.data(), bytes.size());
    ASSERT_NE(restored, nullptr);
    EXPECT_EQ(restored->type(), TreeIndexType::DYNAMIC_KEY_VALUES);
    EXPECT_NO_THROW(original->ensureIdentical(*restored));

    auto dynamic = std::dynamic_pointer_cast<DynamicKeyIndexDef>(restored);
    ASSERT_NE(dynamic, nullptr);
    EXPECT_EQ(dynamic->generator(), original->generator());
    EXPECT_TRUE(dynamic->isGlobal());

    ScopedSlice key = dynamic->getValue(arena_, reader_);
    EXPECT_EQ(key.toString(), "hello");
}

TEST_F(DynamicKeyIndexTest, SerializedFieldOrder) {
    auto index = builtin(builtin_keys::kLowercaseFirstField, "idx");
    auto bytes = index->serialize();
    TableValueReader reader(bytes.data(), bytes.size());

    ASSERT_EQ(reader.count(), 5);
    EXPECT_EQ(reader.readInt64(0), static_cast<int64_t>(TreeIndexType::DYNAMIC_KEY_VALUES));
    EXPECT_FALSE(reader.readBool(1));
    EXPECT_EQ(reader.readString(2), "idx");
    EXPECT_EQ(reader.readString(3), builtin_keys::kLowercaseFirstField);
    EXPECT_EQ(reader.readString(4), builtin_keys::kBuiltinScope);
}

TEST_F(DynamicKeyIndexTest, UnregisteredScopeFailsReadFrom) {
    KeyGeneratorRegistry::instance().registerKeyGenerator("tests.transient", "gen", &secondFieldGenerator);
    auto index = DynamicKeyIndexDef::create("dyn", "tests.transient", "gen");
    auto bytes = index->serialize();
    KeyGeneratorRegistry::instance().unregister("tests.transient", "gen");

    try {
        AbstractTreeIndexDef::readFrom(bytes.data(), bytes.size());
        FAIL() << "expected resolution failure";
    } catch (const KeyGeneratorResolutionException& e) {
        EXPECT_EQ(e.scope(), "tests.transient");
        EXPECT_EQ(e.name(), "gen");
    }
}

TEST_F(DynamicKeyIndexTest, UnknownGeneratorNameFailsReadFrom) {
    TableValueBuilder record;
    record.add(static_cast<int64_t>(TreeIndexType::DYNAMIC_KEY_VALUES))
          .add(false)
          .add("dyn")
          .add("no_such_generator")
          .add(kTestScope);
    auto bytes = record.serialize();
    EXPECT_THROW(AbstractTreeIndexDef::readFrom(bytes.data(), bytes.size()), KeyGeneratorResolutionException);
}

TEST_F(DynamicKeyIndexTest, CreateWithUnknownScopeThrows) {
    EXPECT_THROW(DynamicKeyIndexDef::create("dyn", "tests.nowhere", "gen"), KeyGeneratorResolutionException);
}

TEST_F(DynamicKeyIndexTest, InstanceBoundGeneratorFailsValidation) {
    auto index = DynamicKeyIndexDef::create("dyn", kTestScope, "prefixed");

    // Usable, but not persistable
    ScopedSlice key = index->getValue(arena_, reader_);
    EXPECT_EQ(key.toString(), "p:HeLLo");
    EXPECT_THROW(index->validate(), std::invalid_argument);

    auto bytes = index->serialize();
    EXPECT_THROW(AbstractTreeIndexDef::readFrom(bytes.data(), bytes.size()), KeyGeneratorResolutionException);
}

TEST_F(DynamicKeyIndexTest, UnmarkedGeneratorFailsValidation) {
    auto index = DynamicKeyIndexDef::create("dyn", kTestScope, "unmarked");
    EXPECT_THROW(index->validate(), std::invalid_argument);

    auto bytes = index->serialize();
    EXPECT_THROW(AbstractTreeIndexDef::readFrom(bytes.data(), bytes.size()), KeyGeneratorResolutionException);
}

TEST_F(DynamicKeyIndexTest, MissingGeneratorFailsValidation) {
    DynamicKeyIndexDef index("dyn", nullptr);
    EXPECT_THROW(index.validate(), std::invalid_argument);
    EXPECT_THROW(index.getValue(arena_, reader_), std::logic_error);
}

TEST_F(DynamicKeyIndexTest, EnsureIdenticalNamesEachDifferingField) {
    auto expected = builtin(builtin_keys::kLowercaseFirstField, "idx");

    struct Case {
        std::shared_ptr<AbstractTreeIndexDef> actual;
        const char* field;
    };
    const Case cases[] = {
        {builtin(builtin_keys::kLowercaseFirstField, "other"), "Name"},
        {DynamicKeyIndexDef::create("idx", builtin_keys::kBuiltinScope, builtin_keys::kLowercaseFirstField, true),
         "IsGlobal"},
        {builtin(builtin_keys::kFirstField, "idx"), "GenerateKey.Name"},
        {DynamicKeyIndexDef::create("idx", kTestScope, "second_field"), "GenerateKey.Name"},
        {std::make_shared<FieldRangeIndexDef>("idx", 0), "Type"},
    };

    for (const auto& c : cases) {
        try {
            expected->ensureIdentical(*c.actual);
            FAIL() << "expected a mismatch on " << c.field;
        } catch (const IndexDefinitionMismatchException& e) {
            EXPECT_EQ(e.field(), c.field);
        }
    }
}

TEST_F(DynamicKeyIndexTest, ScopeDifferenceIsReported) {
    auto& registry = KeyGeneratorRegistry::instance();
    registry.registerKeyGenerator(kTestScope, builtin_keys::kLowercaseFirstField, &builtin_keys::lowercaseFirstField);

    auto expected = builtin(builtin_keys::kLowercaseFirstField, "idx");
    auto actual = DynamicKeyIndexDef::create("idx", kTestScope, builtin_keys::kLowercaseFirstField);

    auto diffs = expected->differences(*actual);
    ASSERT_EQ(diffs.size(), 1u);
    EXPECT_EQ(diffs[0].field, "GenerateKey.Scope");
    EXPECT_EQ(diffs[0].expected, builtin_keys::kBuiltinScope);
    EXPECT_EQ(diffs[0].actual, kTestScope);
}

TEST_F(DynamicKeyIndexTest, EntryChangedCallback) {
    int calls = 0;
    int last_old = 0;
    int last_new = 0;
    auto index = DynamicKeyIndexDef::create(
        "dyn", builtin_keys::kBuiltinScope, builtin_keys::kFirstField, false,
        [&](const Slice&, int old_size, int new_size) {
            ++calls;
            last_old = old_size;
            last_new = new_size;
        });

    ASSERT_TRUE(index->hasEntryChangedCallback());
    index->onIndexEntryChanged(Slice::fromString("k"), 3, 5);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(last_old, 3);
    EXPECT_EQ(last_new, 5);

    EXPECT_THROW(index->attachEntryChangedCallback([](const Slice&, int, int) {}), std::logic_error);
}

TEST_F(DynamicKeyIndexTest, CallbackIsNotPersisted) {
    auto index = DynamicKeyIndexDef::create("dyn", builtin_keys::kBuiltinScope, builtin_keys::kFirstField, false,
                                            [](const Slice&, int, int) {});
    auto bytes = index->serialize();
    auto restored = std::dynamic_pointer_cast<DynamicKeyIndexDef>(
        AbstractTreeIndexDef::readFrom(bytes.data(), bytes.size()));
    ASSERT_NE(restored, nullptr);
    EXPECT_FALSE(restored->hasEntryChangedCallback());

    // No callback: a no-op
    EXPECT_NO_THROW(restored->onIndexEntryChanged(Slice::fromString("k"), 1, 2));

    bool called = false;
    restored->attachEntryChangedCallback([&](const Slice&, int, int) { called = true; });
    restored->onIndexEntryChanged(Slice::fromString("k"), 1, 2);
    EXPECT_TRUE(called);
}
