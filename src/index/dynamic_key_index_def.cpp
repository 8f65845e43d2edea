#include "index/dynamic_key_index_def.h"
#include "utils/logger.h"

#include <stdexcept>

namespace strata {

DynamicKeyIndexDef::DynamicKeyIndexDef(std::string name, KeyGeneratorDescriptorPtr generator, bool is_global,
                                       OnIndexEntryChanged on_entry_changed)
    : AbstractTreeIndexDef(std::move(name), is_global)
    , generator_(std::move(generator))
    , on_entry_changed_(std::move(on_entry_changed)) {}

// static
std::shared_ptr<DynamicKeyIndexDef> DynamicKeyIndexDef::create(std::string name, const std::string& scope,
                                                               const std::string& generator_name, bool is_global,
                                                               OnIndexEntryChanged on_entry_changed) {
    auto generator = KeyGeneratorRegistry::instance().resolve(scope, generator_name);
    return std::make_shared<DynamicKeyIndexDef>(std::move(name), std::move(generator), is_global,
                                                std::move(on_entry_changed));
}

ScopedSlice DynamicKeyIndexDef::getValue(utils::ByteArena& arena, const TableValueReader& value) const {
    if (!generator_ || !generator_->generator) {
        throw std::logic_error("Dynamic index " + name() + " has no key generator");
    }
    return generator_->generator(arena, value);
}

ScopedSlice DynamicKeyIndexDef::getValue(utils::ByteArena& arena, const TableValueBuilder& value) const {
    if (!generator_ || !generator_->generator) {
        throw std::logic_error("Dynamic index " + name() + " has no key generator");
    }

    // TODO: run generators directly against the builder once they accept either row form, to skip this copy
    utils::ArenaScope buffer = arena.allocate(value.size());
    value.copyTo(buffer.data());
    TableValueReader reader = value.createReader(buffer.data());

    ScopedSlice key = generator_->generator(arena, reader);
    if (!key.isOwned() && key.pointsInto(buffer.data(), buffer.size())) {
        // The temporary row goes away below; the key must not point into it.
        return ScopedSlice::owned(arena.copyFrom(key.data(), key.size()));
    }
    return key;
}

void DynamicKeyIndexDef::onIndexEntryChanged(const Slice& key, int old_size, int new_size) const {
    OnIndexEntryChanged callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = on_entry_changed_;
    }
    if (callback) {
        callback(key, old_size, new_size);
    }
}

void DynamicKeyIndexDef::attachEntryChangedCallback(OnIndexEntryChanged callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (on_entry_changed_) {
        throw std::logic_error("Dynamic index " + name() + " already has an entry-changed callback");
    }
    on_entry_changed_ = std::move(callback);
}

bool DynamicKeyIndexDef::hasEntryChangedCallback() const {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    return static_cast<bool>(on_entry_changed_);
}

DynamicKeyIndexDef::OnIndexEntryChanged DynamicKeyIndexDef::entryChangedCallback() const {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    return on_entry_changed_;
}

std::vector<uint8_t> DynamicKeyIndexDef::serialize() const {
    if (!generator_) {
        throw std::logic_error("Cannot serialize dynamic index " + name() + " without a key generator");
    }
    TableValueBuilder serializer;
    serializer.add(static_cast<int64_t>(type()))
              .add(isGlobal())
              .add(std::string_view(name()))
              .add(std::string_view(generator_->name))
              .add(std::string_view(generator_->scope));
    return serializer.serialize();
}

void DynamicKeyIndexDef::validate() const {
    validateName();
    if (!generator_ || !generator_->generator) {
        throw std::invalid_argument("GenerateKey delegate cannot be null (index " + name() + ")");
    }
    if (generator_->scope.empty()) {
        throw std::invalid_argument("GenerateKey declaring scope cannot be empty (index " + name() + ")");
    }
    if (!generator_->is_static) {
        throw std::invalid_argument("GenerateKey must be a static generator (index " + name() +
                                    ", generator " + generator_->qualifiedName() + ")");
    }
    if (!generator_->is_index_key_generator) {
        throw std::invalid_argument("GenerateKey must be registered as an index key generator (index " + name() +
                                    ", generator " + generator_->qualifiedName() + ")");
    }
}

// static
std::shared_ptr<DynamicKeyIndexDef> DynamicKeyIndexDef::readFrom(const TableValueReader& input) {
    index_record::requireFields(input, 5, "Dynamic key index");
    const bool is_global = index_record::readBool(input, 1, "IsGlobal");
    std::string name = index_record::readString(input, 2, "Name");
    const std::string generator_name = index_record::readString(input, 3, "GenerateKey.Name");
    const std::string scope = index_record::readString(input, 4, "GenerateKey.Scope");

    KeyGeneratorDescriptorPtr generator;
    try {
        generator = KeyGeneratorRegistry::instance().resolve(scope, generator_name);
    } catch (const KeyGeneratorResolutionException& e) {
        STRATA_ERROR("Dynamic index '{}': {}", name, e.what());
        throw;
    }
    if (!generator->is_static) {
        throw KeyGeneratorResolutionException(scope, generator_name, "GenerateKey must be a static generator");
    }
    if (!generator->is_index_key_generator) {
        throw KeyGeneratorResolutionException(scope, generator_name,
                                              "GenerateKey is not registered as an index key generator");
    }

    STRATA_DEBUG("Read dynamic index '{}' bound to {} (entry-changed callback must be re-attached)",
                 name, generator->qualifiedName());
    auto def = std::make_shared<DynamicKeyIndexDef>(std::move(name), std::move(generator), is_global);
    index_record::requireValid(*def, "dynamic key index");
    return def;
}

void DynamicKeyIndexDef::collectDifferences(const AbstractTreeIndexDef& actual, std::vector<IndexMismatch>& out) const {
    const auto& other = static_cast<const DynamicKeyIndexDef&>(actual);
    const std::string expected_name = generator_ ? generator_->name : std::string();
    const std::string actual_name = other.generator_ ? other.generator_->name : std::string();
    if (expected_name != actual_name) {
        out.push_back(mismatch("GenerateKey.Name", expected_name, actual_name));
    }
    const std::string expected_scope = generator_ ? generator_->scope : std::string();
    const std::string actual_scope = other.generator_ ? other.generator_->scope : std::string();
    if (expected_scope != actual_scope) {
        out.push_back(mismatch("GenerateKey.Scope", expected_scope, actual_scope));
    }
}

} // namespace strata
