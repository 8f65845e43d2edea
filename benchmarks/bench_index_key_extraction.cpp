#include <benchmark/benchmark.h>
#include "index/builtin_key_generators.h"
#include "index/dynamic_key_index_def.h"
#include "index/field_range_index_def.h"
#include "index/fixed_size_key_index_def.h"
#include "storage/table_value.h"
#include "utils/byte_arena.h"
#include <random>

namespace {
    std::string makeRandomString(size_t len) {
        static const char charset[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
        static std::mt19937 rng{42};
        static std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);
        std::string s;
        s.reserve(len);
        for (size_t i = 0; i < len; ++i) s += charset[dist(rng)];
        return s;
    }

    strata::TableValueBuilder makeRow(size_t field_len) {
        strata::TableValueBuilder builder;
        builder.add(std::string_view(makeRandomString(field_len)))
               .add(std::string_view(makeRandomString(field_len)))
               .add(std::string_view(makeRandomString(field_len)))
               .addBigEndian(123456789);
        return builder;
    }
}

static void BM_FieldRange_SingleField(benchmark::State& state) {
    auto builder = makeRow(static_cast<size_t>(state.range(0)));
    auto bytes = builder.serialize();
    strata::TableValueReader reader(bytes.data(), bytes.size());
    strata::FieldRangeIndexDef index("by_first", 0);
    strata::utils::ByteArena arena;

    for (auto _ : state) {
        auto key = index.getValue(arena, reader);
        benchmark::DoNotOptimize(key.data());
    }
}
BENCHMARK(BM_FieldRange_SingleField)->Arg(16)->Arg(256);

static void BM_FieldRange_MultiField(benchmark::State& state) {
    auto builder = makeRow(static_cast<size_t>(state.range(0)));
    auto bytes = builder.serialize();
    strata::TableValueReader reader(bytes.data(), bytes.size());
    strata::FieldRangeIndexDef index("by_first_three", 0, 3);
    strata::utils::ByteArena arena;

    for (auto _ : state) {
        auto key = index.getValue(arena, reader);
        benchmark::DoNotOptimize(key.data());
    }
    state.counters["reused_blocks"] = static_cast<double>(arena.stats().reused_blocks);
}
BENCHMARK(BM_FieldRange_MultiField)->Arg(16)->Arg(256);

static void BM_Dynamic_Lowercase(benchmark::State& state) {
    strata::registerBuiltinKeyGenerators();
    auto builder = makeRow(static_cast<size_t>(state.range(0)));
    auto bytes = builder.serialize();
    strata::TableValueReader reader(bytes.data(), bytes.size());
    auto index = strata::DynamicKeyIndexDef::create("by_lower", strata::builtin_keys::kBuiltinScope,
                                                    strata::builtin_keys::kLowercaseFirstField);
    strata::utils::ByteArena arena;

    for (auto _ : state) {
        auto key = index->getValue(arena, reader);
        benchmark::DoNotOptimize(key.data());
    }
}
BENCHMARK(BM_Dynamic_Lowercase)->Arg(16)->Arg(256);

static void BM_Dynamic_FromBuilder(benchmark::State& state) {
    strata::registerBuiltinKeyGenerators();
    auto builder = makeRow(static_cast<size_t>(state.range(0)));
    auto index = strata::DynamicKeyIndexDef::create("by_lower", strata::builtin_keys::kBuiltinScope,
                                                    strata::builtin_keys::kLowercaseFirstField);
    strata::utils::ByteArena arena;

    for (auto _ : state) {
        auto key = index->getValue(arena, builder);
        benchmark::DoNotOptimize(key.data());
    }
}
BENCHMARK(BM_Dynamic_FromBuilder)->Arg(16)->Arg(256);

static void BM_FixedSize_Extract(benchmark::State& state) {
    auto builder = makeRow(16);
    auto bytes = builder.serialize();
    strata::TableValueReader reader(bytes.data(), bytes.size());
    strata::FixedSizeKeyIndexDef index("etag", 3);

    for (auto _ : state) {
        benchmark::DoNotOptimize(index.getValue(reader));
    }
}
BENCHMARK(BM_FixedSize_Extract);

BENCHMARK_MAIN();
