#include "storage/schema_config.h"
#include "index/dynamic_key_index_def.h"
#include "utils/logger.h"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace strata {

namespace {

SchemaConfig::IndexConfig parseIndex(const YAML::Node& node) {
    SchemaConfig::IndexConfig index;
    index.name = node["name"].as<std::string>("");
    index.type = node["type"].as<std::string>("field_range");
    index.start_index = node["start_index"].as<int>(0);
    index.count = node["count"].as<int>(1);
    index.global = node["global"].as<bool>(false);
    index.scope = node["scope"].as<std::string>("");
    index.generator = node["generator"].as<std::string>("");
    return index;
}

SchemaConfig::TableConfig parseTable(const YAML::Node& node) {
    SchemaConfig::TableConfig table;
    table.name = node["name"].as<std::string>("");
    if (table.name.empty()) {
        throw std::runtime_error("table entry without a name");
    }

    if (node["primary_key"]) {
        auto pk = node["primary_key"];
        SchemaConfig::PrimaryKeyConfig key;
        key.name = pk["name"].as<std::string>("");
        key.start_index = pk["start_index"].as<int>(0);
        key.global = pk["global"].as<bool>(false);
        table.primary_key = key;
    }

    if (node["indexes"]) {
        for (const auto& index : node["indexes"]) {
            table.indexes.push_back(parseIndex(index));
        }
    }

    if (node["fixed_size_indexes"]) {
        for (const auto& fixed : node["fixed_size_indexes"]) {
            SchemaConfig::FixedSizeIndexConfig index;
            index.name = fixed["name"].as<std::string>("");
            index.start_index = fixed["start_index"].as<int>(0);
            index.global = fixed["global"].as<bool>(false);
            table.fixed_size_indexes.push_back(index);
        }
    }
    return table;
}

SchemaConfig fromNode(const YAML::Node& config) {
    SchemaConfig result;

    if (config["logging"]) {
        auto logging = config["logging"];
        result.logging.level = logging["level"].as<std::string>("info");
        result.logging.file = logging["file"].as<std::string>("");
        result.logging.pattern = logging["pattern"].as<std::string>("");
    }

    if (config["validation"]) {
        result.validation.report_all_mismatches =
            config["validation"]["report_all_mismatches"].as<bool>(false);
    }

    if (config["storage"]) {
        auto storage = config["storage"];
        result.storage.backend = storage["backend"].as<std::string>("filesystem");
        result.storage.path = storage["path"].as<std::string>("./data/schemas");
    }

    if (config["tables"]) {
        for (const auto& table : config["tables"]) {
            result.tables.push_back(parseTable(table));
        }
    }
    return result;
}

} // namespace

SchemaConfig SchemaConfig::loadFromYaml(const std::string& yaml_path) {
    try {
        SchemaConfig result = fromNode(YAML::LoadFile(yaml_path));
        STRATA_INFO("Loaded schema configuration from {} ({} tables)", yaml_path, result.tables.size());
        return result;
    } catch (const std::exception& e) {
        STRATA_ERROR("Failed to load schema configuration from {}: {}", yaml_path, e.what());
        throw std::runtime_error("Failed to load schema configuration from " + yaml_path + ": " + e.what());
    }
}

SchemaConfig SchemaConfig::loadFromString(const std::string& yaml_text) {
    try {
        return fromNode(YAML::Load(yaml_text));
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to parse schema configuration: ") + e.what());
    }
}

const SchemaConfig::TableConfig* SchemaConfig::findTable(const std::string& name) const {
    for (const auto& table : tables) {
        if (table.name == name) {
            return &table;
        }
    }
    return nullptr;
}

TableSchema SchemaConfig::buildSchema(const std::string& table) const {
    const TableConfig* config = findTable(table);
    if (!config) {
        throw std::runtime_error("Table '" + table + "' is not configured");
    }
    return buildSchema(*config);
}

// static
TableSchema SchemaConfig::buildSchema(const TableConfig& table) {
    try {
        TableSchema schema;
        if (table.primary_key) {
            schema.defineKey(std::make_shared<FieldRangeIndexDef>(table.primary_key->name,
                                                                  table.primary_key->start_index, 1,
                                                                  table.primary_key->global));
        }

        for (const auto& index : table.indexes) {
            if (index.type == "field_range") {
                schema.defineIndex(std::make_shared<FieldRangeIndexDef>(index.name, index.start_index,
                                                                        index.count, index.global));
            } else if (index.type == "dynamic") {
                schema.defineIndex(DynamicKeyIndexDef::create(index.name, index.scope, index.generator,
                                                              index.global));
            } else {
                throw std::runtime_error("index '" + index.name + "' has unknown type '" + index.type + "'");
            }
        }

        for (const auto& fixed : table.fixed_size_indexes) {
            schema.defineFixedSizeIndex(std::make_shared<FixedSizeKeyIndexDef>(fixed.name, fixed.start_index,
                                                                               fixed.global));
        }

        schema.validate();
        return schema;
    } catch (const std::exception& e) {
        STRATA_ERROR("Invalid schema for table '{}': {}", table.name, e.what());
        throw std::runtime_error("Invalid schema for table '" + table.name + "': " + e.what());
    }
}

void SchemaConfig::applyLogging() const {
    const auto level = utils::Logger::levelFromString(logging.level);
    if (logging.file.empty()) {
        utils::Logger::initConsole(level);
    } else {
        utils::Logger::init(logging.file, level);
    }
    if (!logging.pattern.empty()) {
        utils::Logger::setPattern(logging.pattern);
    }
}

} // namespace strata
