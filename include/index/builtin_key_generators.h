#pragma once

#include "index/key_generator_registry.h"

namespace strata {

/// Generators shipped with the engine, registered under kBuiltinScope.
namespace builtin_keys {

constexpr const char* kBuiltinScope = "strata.builtin";

/// Field 0 as is (zero-copy)
constexpr const char* kFirstField = "first_field";
/// Field 0, ASCII-lowercased
constexpr const char* kLowercaseFirstField = "lowercase_first_field";
/// Field 0 ASCII-lowercased, then field 1 unchanged
constexpr const char* kLowercaseFirstFieldThenSecond = "lowercase_first_field_then_second";

ScopedSlice firstField(utils::ByteArena& arena, const TableValueReader& value);
ScopedSlice lowercaseFirstField(utils::ByteArena& arena, const TableValueReader& value);
ScopedSlice lowercaseFirstFieldThenSecond(utils::ByteArena& arena, const TableValueReader& value);

} // namespace builtin_keys

/// Registers the builtin generators; already registered ones are skipped.
/// Returns the number newly registered.
size_t registerBuiltinKeyGenerators(KeyGeneratorRegistry& registry = KeyGeneratorRegistry::instance());

} // namespace strata
