#include "storage/schema_errors.h"

#include <sstream>

namespace strata {

std::string IndexMismatch::describe() const {
    std::ostringstream oss;
    if (field == "Name") {
        oss << "Expected index to have Name='" << expected << "', got Name='" << actual << "' instead";
    } else if (index_name.empty()) {
        oss << "Expected " << field << "='" << expected << "', got " << field << "='" << actual << "' instead";
    } else {
        oss << "Expected index " << index_name << " to have " << field << "='" << expected
            << "', got " << field << "='" << actual << "' instead";
    }
    return oss.str();
}

std::string SchemaMismatch::describe() const {
    return section + ": " + detail.describe();
}

SchemaDriftException::SchemaDriftException(std::vector<SchemaMismatch> mismatches)
    : std::runtime_error(buildMessage(mismatches))
    , mismatches_(std::move(mismatches))
{}

// static
std::string SchemaDriftException::buildMessage(const std::vector<SchemaMismatch>& mismatches) {
    std::ostringstream oss;
    oss << "Schema mismatch (" << mismatches.size() << " difference"
        << (mismatches.size() == 1 ? "" : "s") << ")";
    for (const auto& m : mismatches) {
        oss << "\n  - " << m.describe();
    }
    return oss.str();
}

} // namespace strata
