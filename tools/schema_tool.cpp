#include "index/builtin_key_generators.h"
#include "index/table_schema.h"
#include "storage/schema_catalog.h"
#include "storage/schema_config.h"
#include "storage/schema_storage_backend.h"
#include "utils/logger.h"

#ifdef STRATA_ENABLE_ROCKSDB
#include "storage/schema_backend_rocksdb.h"
#endif

#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

using namespace strata;

namespace {

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " <command> --config FILE --table NAME [options]\n"
              << "Commands:\n"
              << "  describe        Print the schema declared in the config\n"
              << "  dump            Write the serialized schema to --file (hex to stdout without --file)\n"
              << "  verify          Compare the declared schema with a persisted one\n"
              << "  open            Open the table through the configured storage (persists on first use)\n"
              << "Options:\n"
              << "  --config FILE   YAML schema configuration\n"
              << "  --table NAME    Table to operate on\n"
              << "  --file PATH     Serialized schema file (dump: output, verify: input instead of storage)\n"
              << "  --all           Report every mismatch, not only the first\n"
              << "  --help, -h      Show this help message\n";
}

std::shared_ptr<ISchemaStorageBackend> createBackend(const SchemaConfig::StorageConfig& storage) {
    if (storage.backend == "filesystem") {
        return std::make_shared<FilesystemSchemaBackend>(storage.path);
    }
#ifdef STRATA_ENABLE_ROCKSDB
    if (storage.backend == "rocksdb") {
        RocksDBWrapper::Config config;
        config.db_path = storage.path;
        auto db = std::make_shared<RocksDBWrapper>(config);
        if (!db->open()) {
            throw std::runtime_error("Failed to open RocksDB at " + storage.path);
        }
        return std::make_shared<RocksDBSchemaBackend>(std::move(db));
    }
#endif
    throw std::runtime_error("Unsupported storage backend '" + storage.backend + "'");
}

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Failed to open " + path);
    }
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

void writeFile(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    ofs.close();
    if (!ofs) {
        throw std::runtime_error("Failed to write " + path);
    }
}

void printHex(const std::vector<uint8_t>& data) {
    std::ios_base::fmtflags flags(std::cout.flags());
    for (size_t i = 0; i < data.size(); ++i) {
        std::cout << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i])
                  << ((i % 16 == 15) ? '\n' : ' ');
    }
    if (data.size() % 16 != 0) {
        std::cout << '\n';
    }
    std::cout.flags(flags);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string config_path;
    std::string table;
    std::optional<std::string> file;
    bool report_all = false;

    if (command == "--help" || command == "-h") {
        printUsage(argv[0]);
        return 0;
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--table" && i + 1 < argc) {
            table = argv[++i];
        } else if (arg == "--file" && i + 1 < argc) {
            file = argv[++i];
        } else if (arg == "--all") {
            report_all = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty() || table.empty()) {
        std::cerr << "--config and --table are required\n";
        return 1;
    }

    try {
        SchemaConfig config = SchemaConfig::loadFromYaml(config_path);
        config.applyLogging();
        registerBuiltinKeyGenerators();
        report_all = report_all || config.validation.report_all_mismatches;

        TableSchema expected = config.buildSchema(table);

        if (command == "describe") {
            std::cout << "table " << table << "\n" << expected.describe();
            return 0;
        }

        if (command == "dump") {
            auto bytes = expected.serialize();
            if (file) {
                writeFile(*file, bytes);
                std::cout << "Wrote " << bytes.size() << " bytes to " << *file << "\n";
            } else {
                printHex(bytes);
            }
            return 0;
        }

        if (command == "verify") {
            std::optional<TableSchema> persisted;
            if (file) {
                persisted = TableSchema::readFrom(readFile(*file));
            } else {
                SchemaCatalog catalog(createBackend(config.storage), report_all);
                persisted = catalog.load(table);
            }
            if (!persisted) {
                std::cerr << "No persisted schema for table " << table << "\n";
                return 1;
            }
            try {
                expected.ensureIdentical(*persisted, report_all);
            } catch (const SchemaDriftException& e) {
                for (const auto& m : e.mismatches()) {
                    std::cout << "MISMATCH " << m.describe() << "\n";
                }
                return 2;
            }
            std::cout << "Schema of " << table << " is identical\n";
            return 0;
        }

        if (command == "open") {
            SchemaCatalog catalog(createBackend(config.storage), report_all);
            TableSchema opened = catalog.openTable(table, expected);
            std::cout << "Opened " << table << "\n" << opened.describe();
            return 0;
        }

        std::cerr << "Unknown command: " << command << "\n";
        printUsage(argv[0]);
        return 1;
    } catch (const SchemaDriftException& e) {
        for (const auto& m : e.mismatches()) {
            std::cout << "MISMATCH " << m.describe() << "\n";
        }
        return 2;
    } catch (const std::exception& e) {
        STRATA_ERROR("strata_schema_tool: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
