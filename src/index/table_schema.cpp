#include "index/table_schema.h"
#include "index/dynamic_key_index_def.h"
#include "utils/logger.h"

#include <set>
#include <sstream>
#include <stdexcept>

namespace strata {

namespace {

constexpr const char* kPrimaryKeySection = "PrimaryKey";
constexpr const char* kIndexesSection = "Indexes";
constexpr const char* kFixedSizeSection = "FixedSizeIndexes";

SchemaMismatch sectionMismatch(const char* section, std::string index_name, std::string field,
                               std::string expected, std::string actual) {
    return SchemaMismatch{section, IndexMismatch{std::move(index_name), std::move(field),
                                                 std::move(expected), std::move(actual)}};
}

void appendDifferences(const char* section, std::vector<IndexMismatch> diffs, std::vector<SchemaMismatch>& out) {
    for (auto& d : diffs) {
        out.push_back(SchemaMismatch{section, std::move(d)});
    }
}

} // namespace

TableSchema& TableSchema::defineKey(std::shared_ptr<FieldRangeIndexDef> key) {
    if (!key) {
        throw std::invalid_argument("Primary key definition cannot be null");
    }
    if (key->isGlobal() && key->name().empty()) {
        throw std::invalid_argument("Global index must have a non-empty name");
    }
    if (key->count() > 1) {
        throw std::invalid_argument("Primary key must be a single field");
    }
    if (key->name().empty()) {
        key = key->withName(kDefaultPrimaryKeyName);
    }
    key->validate();

    if (hasName(key->name())) {
        throw std::invalid_argument("Index name already defined: " + key->name());
    }
    primary_key_ = std::move(key);
    return *this;
}

TableSchema& TableSchema::defineIndex(std::shared_ptr<AbstractTreeIndexDef> index) {
    if (!index) {
        throw std::invalid_argument("Index definition cannot be null");
    }
    index->validate();
    if (hasName(index->name())) {
        throw std::invalid_argument("Index name already defined: " + index->name());
    }
    insertIndex(std::move(index));
    return *this;
}

TableSchema& TableSchema::defineFixedSizeIndex(std::shared_ptr<FixedSizeKeyIndexDef> index) {
    if (!index) {
        throw std::invalid_argument("Fixed size index definition cannot be null");
    }
    index->validate();
    if (hasName(index->name())) {
        throw std::invalid_argument("Index name already defined: " + index->name());
    }
    insertFixedSizeIndex(std::move(index));
    return *this;
}

std::vector<TreeIndexDefPtr> TableSchema::indexes() const {
    return std::vector<TreeIndexDefPtr>(indexes_.begin(), indexes_.end());
}

std::vector<FixedSizeKeyIndexDefPtr> TableSchema::fixedSizeIndexes() const {
    return std::vector<FixedSizeKeyIndexDefPtr>(fixed_size_indexes_.begin(), fixed_size_indexes_.end());
}

TreeIndexDefPtr TableSchema::index(const std::string& name) const {
    auto it = index_by_name_.find(name);
    return it == index_by_name_.end() ? nullptr : indexes_[it->second];
}

FixedSizeKeyIndexDefPtr TableSchema::fixedSizeIndex(const std::string& name) const {
    auto it = fixed_size_by_name_.find(name);
    return it == fixed_size_by_name_.end() ? nullptr : fixed_size_indexes_[it->second];
}

bool TableSchema::hasName(const std::string& name) const {
    return (primary_key_ && primary_key_->name() == name) ||
           index_by_name_.count(name) != 0 ||
           fixed_size_by_name_.count(name) != 0;
}

void TableSchema::insertIndex(std::shared_ptr<AbstractTreeIndexDef> index) {
    index_by_name_[index->name()] = indexes_.size();
    indexes_.push_back(std::move(index));
}

void TableSchema::insertFixedSizeIndex(std::shared_ptr<FixedSizeKeyIndexDef> index) {
    fixed_size_by_name_[index->name()] = fixed_size_indexes_.size();
    fixed_size_indexes_.push_back(std::move(index));
}

void TableSchema::validate() const {
    std::set<std::string> names;
    auto claim = [&names](const std::string& name) {
        if (!names.insert(name).second) {
            throw std::invalid_argument("Duplicate index name: " + name);
        }
    };

    if (primary_key_) {
        primary_key_->validate();
        if (primary_key_->count() > 1) {
            throw std::invalid_argument("Primary key must be a single field");
        }
        claim(primary_key_->name());
    }
    for (const auto& index : indexes_) {
        index->validate();
        claim(index->name());
    }
    for (const auto& index : fixed_size_indexes_) {
        index->validate();
        claim(index->name());
    }
}

std::vector<uint8_t> TableSchema::serialize() const {
    TableValueBuilder serializer;
    if (primary_key_) {
        serializer.add(primary_key_->serialize());
    } else {
        serializer.add(std::vector<uint8_t>());
    }

    serializer.add(static_cast<int32_t>(indexes_.size()));
    for (const auto& index : indexes_) {
        serializer.add(index->serialize());
    }

    serializer.add(static_cast<int32_t>(fixed_size_indexes_.size()));
    for (const auto& index : fixed_size_indexes_) {
        serializer.add(index->serialize());
    }
    return serializer.serialize();
}

// static
TableSchema TableSchema::readFrom(const uint8_t* ptr, size_t size) {
    TableValueReader input(ptr, size);
    index_record::requireFields(input, 3, "Table schema");

    TableSchema schema;
    int pos = 0;

    int pk_size = 0;
    const uint8_t* pk_ptr = input.read(pos++, pk_size);
    if (pk_size < 0) {
        throw IndexCorruptionException("Primary key record has negative length " + std::to_string(pk_size));
    }
    if (pk_size > 0) {
        auto def = AbstractTreeIndexDef::readFrom(pk_ptr, static_cast<size_t>(pk_size));
        auto key = std::dynamic_pointer_cast<FieldRangeIndexDef>(def);
        if (!key) {
            throw IndexCorruptionException(std::string("Primary key record has kind ") +
                                           treeIndexTypeToString(def->type()) + ", expected Default");
        }
        schema.primary_key_ = std::move(key);
    }

    auto readCount = [&input, &pos](const char* what) {
        const int32_t count = index_record::readInt32(input, pos++, what);
        if (count < 0 || count > input.count() - pos) {
            throw IndexCorruptionException(std::string(what) + " " + std::to_string(count) +
                                           " does not fit the record (" + std::to_string(input.count()) +
                                           " fields)");
        }
        return count;
    };
    auto nextRecord = [&input, &pos](int& record_size) {
        const uint8_t* record = input.read(pos++, record_size);
        if (record_size < 0) {
            throw IndexCorruptionException("Index record has negative length " + std::to_string(record_size));
        }
        return record;
    };

    const int32_t index_count = readCount("Index count");
    for (int32_t i = 0; i < index_count; ++i) {
        int record_size = 0;
        const uint8_t* record = nextRecord(record_size);
        auto index = AbstractTreeIndexDef::readFrom(record, static_cast<size_t>(record_size));
        if (schema.hasName(index->name())) {
            throw IndexCorruptionException("Duplicate index name in persisted schema: " + index->name());
        }
        schema.insertIndex(std::move(index));
    }

    if (pos >= input.count()) {
        throw IndexCorruptionException("Table schema is missing the fixed size index count");
    }
    const int32_t fixed_count = readCount("Fixed size index count");
    for (int32_t i = 0; i < fixed_count; ++i) {
        int record_size = 0;
        const uint8_t* record = nextRecord(record_size);
        auto index = FixedSizeKeyIndexDef::readFrom(record, static_cast<size_t>(record_size));
        if (schema.hasName(index->name())) {
            throw IndexCorruptionException("Duplicate index name in persisted schema: " + index->name());
        }
        schema.insertFixedSizeIndex(std::move(index));
    }

    STRATA_DEBUG("Read table schema: pk={}, {} indexes, {} fixed size indexes",
                 schema.primary_key_ ? schema.primary_key_->name() : std::string("<none>"),
                 schema.indexes_.size(), schema.fixed_size_indexes_.size());
    return schema;
}

std::vector<SchemaMismatch> TableSchema::diff(const TableSchema& actual) const {
    std::vector<SchemaMismatch> out;

    if (primary_key_ && actual.primary_key_) {
        appendDifferences(kPrimaryKeySection, primary_key_->differences(*actual.primary_key_), out);
    } else if (primary_key_ || actual.primary_key_) {
        const std::string name = primary_key_ ? primary_key_->name() : actual.primary_key_->name();
        out.push_back(sectionMismatch(kPrimaryKeySection, name, "Exists",
                                      index_record::boolToString(primary_key_ != nullptr),
                                      index_record::boolToString(actual.primary_key_ != nullptr)));
    }

    if (indexes_.size() != actual.indexes_.size()) {
        out.push_back(sectionMismatch(kIndexesSection, "", "Count", std::to_string(indexes_.size()),
                                      std::to_string(actual.indexes_.size())));
    }
    for (const auto& expected : indexes_) {
        auto found = actual.index(expected->name());
        if (!found) {
            out.push_back(sectionMismatch(kIndexesSection, expected->name(), "Exists", "true", "false"));
            continue;
        }
        appendDifferences(kIndexesSection, expected->differences(*found), out);
    }
    for (const auto& extra : actual.indexes_) {
        if (index_by_name_.count(extra->name()) == 0) {
            out.push_back(sectionMismatch(kIndexesSection, extra->name(), "Exists", "false", "true"));
        }
    }

    if (fixed_size_indexes_.size() != actual.fixed_size_indexes_.size()) {
        out.push_back(sectionMismatch(kFixedSizeSection, "", "Count", std::to_string(fixed_size_indexes_.size()),
                                      std::to_string(actual.fixed_size_indexes_.size())));
    }
    for (const auto& expected : fixed_size_indexes_) {
        auto found = actual.fixedSizeIndex(expected->name());
        if (!found) {
            out.push_back(sectionMismatch(kFixedSizeSection, expected->name(), "Exists", "true", "false"));
            continue;
        }
        appendDifferences(kFixedSizeSection, expected->differences(*found), out);
    }
    for (const auto& extra : actual.fixed_size_indexes_) {
        if (fixed_size_by_name_.count(extra->name()) == 0) {
            out.push_back(sectionMismatch(kFixedSizeSection, extra->name(), "Exists", "false", "true"));
        }
    }

    return out;
}

void TableSchema::ensureIdentical(const TableSchema& actual, bool report_all) const {
    auto mismatches = diff(actual);
    if (mismatches.empty()) {
        return;
    }
    if (!report_all) {
        mismatches.resize(1);
    }
    for (const auto& m : mismatches) {
        STRATA_ERROR("Schema drift: {}", m.describe());
    }
    throw SchemaDriftException(std::move(mismatches));
}

size_t TableSchema::adoptEntryChangedCallbacks(const TableSchema& source) {
    size_t attached = 0;
    for (const auto& index : indexes_) {
        auto target = std::dynamic_pointer_cast<DynamicKeyIndexDef>(index);
        if (!target || target->hasEntryChangedCallback()) {
            continue;
        }
        auto origin = std::dynamic_pointer_cast<const DynamicKeyIndexDef>(source.index(target->name()));
        if (!origin) {
            continue;
        }
        auto callback = origin->entryChangedCallback();
        if (callback) {
            target->attachEntryChangedCallback(std::move(callback));
            ++attached;
        }
    }
    STRATA_DEBUG("Adopted {} entry-changed callback(s)", attached);
    return attached;
}

std::string TableSchema::describe() const {
    std::ostringstream out;
    if (primary_key_) {
        out << "primary key " << primary_key_->name() << ": field " << primary_key_->startIndex()
            << (primary_key_->isGlobal() ? " (global)" : "") << "\n";
    } else {
        out << "no primary key\n";
    }
    for (const auto& index : indexes_) {
        out << "index " << index->name() << ": " << treeIndexTypeToString(index->type());
        if (auto range = std::dynamic_pointer_cast<const FieldRangeIndexDef>(index)) {
            out << " fields [" << range->startIndex() << ", " << range->startIndex() + range->count() << ")";
        } else if (auto dynamic = std::dynamic_pointer_cast<const DynamicKeyIndexDef>(index)) {
            out << " generator " << (dynamic->generator() ? dynamic->generator()->qualifiedName() : "<unbound>");
        }
        out << (index->isGlobal() ? " (global)" : "") << "\n";
    }
    for (const auto& index : fixed_size_indexes_) {
        out << "fixed size index " << index->name() << ": field " << index->startIndex()
            << (index->isGlobal() ? " (global)" : "") << "\n";
    }
    return out.str();
}

} // namespace strata
