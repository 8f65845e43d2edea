#pragma once

#include "storage/slice.h"
#include "storage/table_value.h"
#include "utils/byte_arena.h"

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace strata {

/// Stateless key generator: derives an index key from a materialized row.
using KeyGeneratorFn = ScopedSlice (*)(utils::ByteArena& arena, const TableValueReader& value);

/// Any callable form, including generators bound to an object instance.
using KeyGenerator = std::function<ScopedSlice(utils::ByteArena& arena, const TableValueReader& value)>;

/**
 * @brief Registered key generator and the identity it is persisted under
 *
 * (scope, name) is the stable identifier written into the schema. The two
 * flags mirror the constraints a dynamic index checks before binding:
 * the generator must not depend on object state, and it must have been
 * registered explicitly as an index key generator.
 */
struct KeyGeneratorDescriptor {
    std::string scope;
    std::string name;
    KeyGenerator generator;
    bool is_static = true;
    bool is_index_key_generator = false;

    std::string qualifiedName() const { return scope + "::" + name; }
};

using KeyGeneratorDescriptorPtr = std::shared_ptr<const KeyGeneratorDescriptor>;

/**
 * @brief Process-wide map from (scope, name) to key generators
 *
 * Populated at startup, before any schema is loaded. Persisted dynamic
 * indexes store only the identifier and resolve it here after a restart.
 *
 * Thread-Safety: registration and lookup may run concurrently.
 */
class KeyGeneratorRegistry {
public:
    static KeyGeneratorRegistry& instance();

    KeyGeneratorRegistry() = default;
    KeyGeneratorRegistry(const KeyGeneratorRegistry&) = delete;
    KeyGeneratorRegistry& operator=(const KeyGeneratorRegistry&) = delete;

    /// Register a stateless generator marked for index use
    /// @throws std::invalid_argument on empty ids, null fn or duplicate id
    KeyGeneratorDescriptorPtr registerKeyGenerator(const std::string& scope, const std::string& name, KeyGeneratorFn fn);

    /// Register a descriptor as given (flags are not altered)
    KeyGeneratorDescriptorPtr registerDescriptor(KeyGeneratorDescriptor descriptor);

    /// Register a member function bound to `instance`; such generators carry
    /// object state and are rejected by dynamic index validation.
    template<typename T>
    KeyGeneratorDescriptorPtr registerMemberGenerator(const std::string& scope, const std::string& name, const T* instance,
                                                      ScopedSlice (T::*method)(utils::ByteArena&, const TableValueReader&) const) {
        KeyGeneratorDescriptor d;
        d.scope = scope;
        d.name = name;
        d.generator = [instance, method](utils::ByteArena& arena, const TableValueReader& value) {
            return (instance->*method)(arena, value);
        };
        d.is_static = false;
        d.is_index_key_generator = true;
        return registerDescriptor(std::move(d));
    }

    /// @throws KeyGeneratorResolutionException if scope or name is unknown
    KeyGeneratorDescriptorPtr resolve(const std::string& scope, const std::string& name) const;

    /// nullptr if unknown
    KeyGeneratorDescriptorPtr find(const std::string& scope, const std::string& name) const;

    bool contains(const std::string& scope, const std::string& name) const;
    bool unregister(const std::string& scope, const std::string& name);

    std::vector<std::string> scopes() const;
    std::vector<std::string> names(const std::string& scope) const;
    size_t size() const;

    /// Remove every registration (tests)
    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::map<std::string, KeyGeneratorDescriptorPtr>> scopes_;
};

} // namespace strata
