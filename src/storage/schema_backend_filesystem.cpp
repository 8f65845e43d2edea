#include "storage/schema_storage_backend.h"
#include "utils/logger.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace strata {

namespace fs = std::filesystem;

FilesystemSchemaBackend::FilesystemSchemaBackend(std::string base_path)
    : base_path_(std::move(base_path)) {
    try {
        fs::create_directories(base_path_);
        STRATA_INFO("FilesystemSchemaBackend initialized: path={}", base_path_);
    } catch (const std::exception& e) {
        STRATA_ERROR("Failed to create schema directory {}: {}", base_path_, e.what());
        throw;
    }
}

std::string FilesystemSchemaBackend::pathFor(const std::string& table) const {
    if (table.empty() || table == "." || table == ".." ||
        table.find_first_of("/\\") != std::string::npos) {
        throw std::invalid_argument("Invalid table name for schema storage: '" + table + "'");
    }
    return (fs::path(base_path_) / (table + ".schema")).string();
}

std::optional<std::vector<uint8_t>> FilesystemSchemaBackend::get(const std::string& table) {
    const std::string file_path = pathFor(table);
    if (!fs::exists(file_path)) {
        return std::nullopt;
    }

    std::ifstream ifs(file_path, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Failed to open schema file: " + file_path);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        throw std::runtime_error("Failed to read schema file: " + file_path);
    }

    STRATA_DEBUG("FilesystemSchemaBackend: read schema of {} ({} bytes)", table, data.size());
    return data;
}

void FilesystemSchemaBackend::put(const std::string& table, const std::vector<uint8_t>& schema) {
    const std::string file_path = pathFor(table);
    const std::string tmp_path = file_path + ".tmp";

    try {
        {
            std::ofstream ofs(tmp_path, std::ios::binary | std::ios::trunc);
            if (!ofs) {
                throw std::runtime_error("Failed to open file for writing: " + tmp_path);
            }
            ofs.write(reinterpret_cast<const char*>(schema.data()), static_cast<std::streamsize>(schema.size()));
            ofs.close();
            if (!ofs) {
                throw std::runtime_error("Failed to write schema to file: " + tmp_path);
            }
        }
        fs::rename(tmp_path, file_path);
    } catch (const std::exception& e) {
        STRATA_ERROR("FilesystemSchemaBackend::put failed for {}: {}", table, e.what());
        std::error_code ec;
        fs::remove(tmp_path, ec);
        throw;
    }

    STRATA_DEBUG("FilesystemSchemaBackend: stored schema of {} ({} bytes)", table, schema.size());
}

bool FilesystemSchemaBackend::remove(const std::string& table) {
    const std::string file_path = pathFor(table);
    if (fs::remove(file_path)) {
        STRATA_DEBUG("FilesystemSchemaBackend: removed schema of {}", table);
        return true;
    }
    return false;
}

bool FilesystemSchemaBackend::exists(const std::string& table) {
    return fs::exists(pathFor(table));
}

} // namespace strata
