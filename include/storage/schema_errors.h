#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace strata {

/**
 * @brief Thrown when row or schema bytes violate size/shape invariants
 *
 * Covers negative field lengths, keys longer than a slice can hold and
 * fixed-size key fields that are not exactly 8 bytes. These usually come
 * from persisted data rather than from caller misuse, so they are kept apart
 * from std::out_of_range / std::invalid_argument contract violations.
 */
class IndexCorruptionException : public std::runtime_error {
public:
    explicit IndexCorruptionException(const std::string& message)
        : std::runtime_error("Index corruption: " + message)
    {}
};

/**
 * @brief One field that differs between two index definitions
 */
struct IndexMismatch {
    std::string index_name;
    std::string field;      // "Name", "IsGlobal", "Type", "StartIndex", "Count", "GenerateKey.Name", "GenerateKey.Scope"
    std::string expected;
    std::string actual;

    std::string describe() const;
};

/**
 * @brief Thrown by ensureIdentical() when two index definitions differ
 */
class IndexDefinitionMismatchException : public std::runtime_error {
public:
    explicit IndexDefinitionMismatchException(IndexMismatch mismatch)
        : std::runtime_error(mismatch.describe())
        , mismatch_(std::move(mismatch))
    {}

    const IndexMismatch& mismatch() const { return mismatch_; }
    const std::string& field() const { return mismatch_.field; }

private:
    IndexMismatch mismatch_;
};

/**
 * @brief Schema-level difference (missing index, count mismatch or field drift)
 */
struct SchemaMismatch {
    std::string section;    // "PrimaryKey", "Indexes", "FixedSizeIndexes"
    IndexMismatch detail;

    std::string describe() const;
};

/**
 * @brief Thrown when a persisted schema does not match the schema in code
 *
 * Raised at table-open time; the table must not be used afterwards.
 */
class SchemaDriftException : public std::runtime_error {
public:
    explicit SchemaDriftException(std::vector<SchemaMismatch> mismatches);

    const std::vector<SchemaMismatch>& mismatches() const { return mismatches_; }

private:
    static std::string buildMessage(const std::vector<SchemaMismatch>& mismatches);

    std::vector<SchemaMismatch> mismatches_;
};

/**
 * @brief Thrown when a dynamic index's generator reference cannot be bound
 */
class KeyGeneratorResolutionException : public std::runtime_error {
public:
    KeyGeneratorResolutionException(const std::string& scope, const std::string& name, const std::string& reason)
        : std::runtime_error("Failed to resolve key generator '" + scope + "::" + name + "': " + reason)
        , scope_(scope)
        , name_(name)
    {}

    const std::string& scope() const { return scope_; }
    const std::string& name() const { return name_; }

private:
    std::string scope_;
    std::string name_;
};

} // namespace strata
