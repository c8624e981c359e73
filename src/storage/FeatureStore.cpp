/**
 * @file FeatureStore.cpp
 * @brief Implementation of per-split feature persistence
 *
 * @author Research Team
 * @date 2026
 */

#include "FeatureStore.hpp"
#include "BinaryIO.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace orca {

namespace {

const char FEATURES_MAGIC[9] = "ORCAFEAT";

/// Giới hạn an toàn khi đọc file hỏng
constexpr uint32_t MAX_LABEL_LENGTH = 4096;
constexpr int32_t MAX_DIMENSION = 1 << 16;

} // namespace

// ============================================================================
// PATHS
// ============================================================================

FeatureStore::FeatureStore(const std::string& dataPath)
    : m_dataPath(dataPath)
{
}

std::string FeatureStore::featurePath(DatasetType type) const {
    return (fs::path(m_dataPath) / (datasetTypeName(type) + FEATURES_EXTENSION)).string();
}

bool FeatureStore::exists(DatasetType type) const {
    std::error_code ec;
    return fs::is_regular_file(featurePath(type), ec);
}

// ============================================================================
// SAVE
// ============================================================================

void FeatureStore::save(const std::string& splitName,
                        const std::vector<LabeledExample>& examples) const {
    save(parseDatasetType(splitName), examples);
}

void FeatureStore::save(DatasetType type, const std::vector<LabeledExample>& examples) const {
    const std::string path = featurePath(type);

    std::error_code ec;
    fs::create_directories(m_dataPath, ec);
    if (ec) {
        throw std::runtime_error("[FeatureStore] Cannot create directory " + m_dataPath +
                                 ": " + ec.message());
    }

    // ----- BƯỚC 1: Backup file cũ (một cấp undo) -----
    if (fs::exists(path, ec)) {
        const std::string backupPath = path + BACKUP_SUFFIX;
        fs::remove(backupPath, ec);
        fs::rename(path, backupPath, ec);
        if (ec) {
            throw std::runtime_error("[FeatureStore] Cannot back up " + path + ": " + ec.message());
        }
        std::cout << "[FeatureStore] Moved existing " << path << " to " << backupPath << std::endl;
    }

    // ----- BƯỚC 2: Ghi file mới -----
    std::cout << "[FeatureStore] Saving " << examples.size() << " "
              << datasetTypeName(type) << " examples to " << path << std::endl;
    writeFile(path, examples);
    std::cout << "[FeatureStore] Saved " << path << std::endl;
}

void FeatureStore::writeFile(const std::string& path,
                             const std::vector<LabeledExample>& examples) const {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("[FeatureStore] Cannot open " + path + " for writing");
    }

    // Header
    binary::writeMagic(file, FEATURES_MAGIC);
    binary::writeValue(file, FORMAT_VERSION);
    binary::writeValue(file, static_cast<uint64_t>(examples.size()));

    const size_t total = examples.size();
    const size_t step = total >= 10 ? total / 10 : 1;

    for (size_t i = 0; i < total; ++i) {
        const LabeledExample& entry = examples[i];
        const FeatureExample& f = entry.features;

        binary::writeString(file, entry.label);
        binary::writeValue(file, static_cast<int32_t>(f.frames));
        binary::writeValue(file, static_cast<int32_t>(f.bands));
        binary::writeValue(file, static_cast<int32_t>(f.channels));
        file.write(reinterpret_cast<const char*>(f.data.data()),
                   static_cast<std::streamsize>(f.data.size() * sizeof(float)));

        if (!file) {
            throw std::runtime_error("[FeatureStore] Write failed at entry " +
                                     std::to_string(i) + " of " + path);
        }

        if (total >= 10 && (i + 1) % step == 0) {
            std::cout << "[FeatureStore] " << (100 * (i + 1) / total) << "%" << std::endl;
        }
    }

    file.flush();
    if (!file) {
        throw std::runtime_error("[FeatureStore] Write failed: " + path);
    }
}

// ============================================================================
// LOAD
// ============================================================================

LoadedFeatures FeatureStore::load(const std::string& splitName,
                                  const std::set<std::string>& removeLabels,
                                  const std::set<std::string>& renameToOther) const {
    return load(parseDatasetType(splitName), removeLabels, renameToOther);
}

LoadedFeatures FeatureStore::load(DatasetType type,
                                  const std::set<std::string>& removeLabels,
                                  const std::set<std::string>& renameToOther) const {
    const std::string path = featurePath(type);
    if (!exists(type)) {
        throw MissingArtifactError("Data file " + path +
                                   " does not exist. Run orca_prepare to generate datafiles first.");
    }

    std::vector<LabeledExample> entries = readFile(path);

    // Lọc / đổi tên trước khi tách thành hai mảng song song
    LoadedFeatures loaded;
    loaded.features.reserve(entries.size());
    loaded.labels.reserve(entries.size());

    size_t removed = 0;
    size_t renamed = 0;
    for (auto& entry : entries) {
        if (removeLabels.count(entry.label)) {
            removed++;
            continue;
        }
        if (renameToOther.count(entry.label)) {
            entry.label = OTHER_CLASS;
            renamed++;
        }
        loaded.labels.push_back(std::move(entry.label));
        loaded.features.push_back(std::move(entry.features));
    }

    std::cout << "[FeatureStore] Loaded " << loaded.size() << " "
              << datasetTypeName(type) << " examples from " << path;
    if (removed > 0 || renamed > 0) {
        std::cout << " (" << removed << " removed, " << renamed << " renamed to "
                  << OTHER_CLASS << ")";
    }
    std::cout << std::endl;

    return loaded;
}

std::vector<LabeledExample> FeatureStore::readFile(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw MissingArtifactError("Cannot open data file " + path);
    }

    file.seekg(0, std::ios::end);
    const std::streamoff fileSize = file.tellg();
    file.seekg(0, std::ios::beg);

    if (!binary::readMagic(file, FEATURES_MAGIC)) {
        throw ArtifactFormatError(path + ": not a features file");
    }

    uint32_t version = 0;
    uint64_t count = 0;
    if (!binary::readValue(file, version) || version != FORMAT_VERSION) {
        throw ArtifactFormatError(path + ": unsupported format version " + std::to_string(version));
    }
    if (!binary::readValue(file, count)) {
        throw ArtifactFormatError(path + ": truncated header");
    }

    std::vector<LabeledExample> entries;
    for (uint64_t i = 0; i < count; ++i) {
        LabeledExample entry;
        int32_t frames = 0, bands = 0, channels = 0;

        if (!binary::readString(file, entry.label, MAX_LABEL_LENGTH) ||
            !binary::readValue(file, frames) ||
            !binary::readValue(file, bands) ||
            !binary::readValue(file, channels)) {
            throw ArtifactFormatError(path + ": truncated entry " + std::to_string(i));
        }
        if (frames < 0 || bands < 0 || channels < 0 ||
            frames > MAX_DIMENSION || bands > MAX_DIMENSION || channels > MAX_DIMENSION) {
            throw ArtifactFormatError(path + ": invalid shape in entry " + std::to_string(i));
        }

        // Payload phải nằm trong phần còn lại của file trước khi cấp phát
        const uint64_t payloadBytes = static_cast<uint64_t>(frames) * static_cast<uint64_t>(bands) *
                                      static_cast<uint64_t>(channels) * sizeof(float);
        const std::streamoff position = file.tellg();
        if (position < 0 || payloadBytes > static_cast<uint64_t>(fileSize - position)) {
            throw ArtifactFormatError(path + ": entry " + std::to_string(i) +
                                      " payload exceeds file size");
        }

        entry.features.allocate(frames, bands, channels);
        file.read(reinterpret_cast<char*>(entry.features.data.data()),
                  static_cast<std::streamsize>(entry.features.data.size() * sizeof(float)));
        if (!file) {
            throw ArtifactFormatError(path + ": truncated data in entry " + std::to_string(i));
        }

        entries.push_back(std::move(entry));
    }

    return entries;
}

} // namespace orca
