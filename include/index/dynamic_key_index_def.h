#pragma once

#include "index/key_generator_registry.h"
#include "index/tree_index_def.h"

#include <functional>
#include <mutex>

namespace strata {

/**
 * @brief Index whose key is computed by a registered key generator
 *
 * Used where a key is not a plain field projection (normalization,
 * composite business rules, bucketing). The generator is persisted by its
 * registry identifier (scope + name) and resolved again on load.
 *
 * The entry-changed callback is not persisted. After reading a schema from
 * disk the caller has to attach it again, see
 * TableSchema::adoptEntryChangedCallbacks().
 */
class DynamicKeyIndexDef : public AbstractTreeIndexDef {
public:
    /// Invoked when the stored value of an index entry changes size
    using OnIndexEntryChanged = std::function<void(const Slice& key, int old_size, int new_size)>;

    DynamicKeyIndexDef(std::string name, KeyGeneratorDescriptorPtr generator, bool is_global = false,
                       OnIndexEntryChanged on_entry_changed = nullptr);

    /// Resolves the generator through the registry
    /// @throws KeyGeneratorResolutionException if (scope, name) is unknown
    static std::shared_ptr<DynamicKeyIndexDef> create(std::string name, const std::string& scope,
                                                      const std::string& generator_name, bool is_global = false,
                                                      OnIndexEntryChanged on_entry_changed = nullptr);

    TreeIndexType type() const override { return TreeIndexType::DYNAMIC_KEY_VALUES; }

    const KeyGeneratorDescriptorPtr& generator() const { return generator_; }

    ScopedSlice getValue(utils::ByteArena& arena, const TableValueReader& value) const override;

    /// Materializes the builder into a temporary arena buffer, runs the
    /// generator on a reader over it and releases the buffer before returning.
    ScopedSlice getValue(utils::ByteArena& arena, const TableValueBuilder& value) const override;

    /// Calls the attached callback, if any
    void onIndexEntryChanged(const Slice& key, int old_size, int new_size) const;

    /// Attach the callback once (after a reload)
    /// @throws std::logic_error if a callback is already attached
    void attachEntryChangedCallback(OnIndexEntryChanged callback);

    bool hasEntryChangedCallback() const;
    OnIndexEntryChanged entryChangedCallback() const;

    /// type(i64), is_global(bool), name, generator name, generator scope
    std::vector<uint8_t> serialize() const override;

    void validate() const override;

    /// @throws KeyGeneratorResolutionException if the generator cannot be bound
    static std::shared_ptr<DynamicKeyIndexDef> readFrom(const TableValueReader& input);

protected:
    void collectDifferences(const AbstractTreeIndexDef& actual, std::vector<IndexMismatch>& out) const override;

private:
    KeyGeneratorDescriptorPtr generator_;

    mutable std::mutex callback_mutex_;
    OnIndexEntryChanged on_entry_changed_;
};

} // namespace strata
