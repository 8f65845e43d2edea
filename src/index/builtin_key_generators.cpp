#include "index/builtin_key_generators.h"
#include "storage/schema_errors.h"
#include "utils/logger.h"

#include <cstring>

namespace strata {

namespace {

inline uint8_t asciiLower(uint8_t c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<uint8_t>(c + ('a' - 'A')) : c;
}

void lowerInto(uint8_t* out, const uint8_t* in, size_t size) {
    for (size_t i = 0; i < size; ++i) {
        out[i] = asciiLower(in[i]);
    }
}

} // namespace

namespace builtin_keys {

ScopedSlice firstField(utils::ByteArena&, const TableValueReader& value) {
    return ScopedSlice::borrowed(value.readSlice(0));
}

ScopedSlice lowercaseFirstField(utils::ByteArena& arena, const TableValueReader& value) {
    const Slice field = value.readSlice(0);
    utils::ArenaScope out = arena.allocate(field.size());
    lowerInto(out.data(), field.data(), field.size());
    return ScopedSlice::owned(std::move(out));
}

ScopedSlice lowercaseFirstFieldThenSecond(utils::ByteArena& arena, const TableValueReader& value) {
    const Slice first = value.readSlice(0);
    const Slice second = value.readSlice(1);
    const size_t total = static_cast<size_t>(first.size()) + second.size();
    if (total > Slice::kMaxSize) {
        throw IndexCorruptionException("Composite key of " + std::to_string(total) + " bytes exceeds " +
                                       std::to_string(Slice::kMaxSize));
    }
    utils::ArenaScope out = arena.allocate(total);
    lowerInto(out.data(), first.data(), first.size());
    if (second.size() > 0) {
        std::memcpy(out.data() + first.size(), second.data(), second.size());
    }
    return ScopedSlice::owned(std::move(out));
}

} // namespace builtin_keys

size_t registerBuiltinKeyGenerators(KeyGeneratorRegistry& registry) {
    struct Entry {
        const char* name;
        KeyGeneratorFn fn;
    };
    const Entry entries[] = {
        {builtin_keys::kFirstField, &builtin_keys::firstField},
        {builtin_keys::kLowercaseFirstField, &builtin_keys::lowercaseFirstField},
        {builtin_keys::kLowercaseFirstFieldThenSecond, &builtin_keys::lowercaseFirstFieldThenSecond},
    };

    size_t added = 0;
    for (const auto& e : entries) {
        if (registry.contains(builtin_keys::kBuiltinScope, e.name)) {
            continue;
        }
        registry.registerKeyGenerator(builtin_keys::kBuiltinScope, e.name, e.fn);
        ++added;
    }
    STRATA_DEBUG("Registered {} builtin key generator(s)", added);
    return added;
}

} // namespace strata
