/**
 * @file LabelEncoder.cpp
 * @brief Implementation of label encoding and its persistence
 *
 * @author Research Team
 * @date 2026
 */

#include "LabelEncoder.hpp"
#include "BinaryIO.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace orca {

namespace {

const char ENCODER_MAGIC[9] = "ORCALENC";
constexpr uint32_t MAX_LABEL_LENGTH = 4096;
constexpr uint32_t MAX_CLASSES = 1u << 20;

/**
 * @brief Tạo (hoặc thay thế) symlink linkPath -> targetName trong cùng thư mục
 */
void createOrReplaceSymlink(const fs::path& targetName, const fs::path& linkPath) {
    std::error_code ec;
    if (fs::is_symlink(linkPath, ec) || fs::exists(linkPath, ec)) {
        fs::remove(linkPath, ec);
        if (ec) {
            throw std::runtime_error("[LabelEncoder] Cannot remove " + linkPath.string() +
                                     ": " + ec.message());
        }
    }
    fs::create_symlink(targetName, linkPath, ec);
    if (ec) {
        throw std::runtime_error("[LabelEncoder] Cannot create symlink " + linkPath.string() +
                                 ": " + ec.message());
    }
}

} // namespace

// ============================================================================
// FIT / TRANSFORM
// ============================================================================

void LabelEncoder::fit(const std::vector<std::string>& classes) {
    std::set<std::string> unique(classes.begin(), classes.end());
    m_classes.assign(unique.begin(), unique.end());

    m_index.clear();
    for (size_t i = 0; i < m_classes.size(); ++i) {
        m_index[m_classes[i]] = static_cast<int>(i);
    }
}

int LabelEncoder::transform(const std::string& label) const {
    auto it = m_index.find(label);
    if (it == m_index.end()) {
        throw std::out_of_range("label '" + label + "' was not seen during fit");
    }
    return it->second;
}

std::vector<int> LabelEncoder::transform(const std::vector<std::string>& labels) const {
    std::vector<int> ids;
    ids.reserve(labels.size());
    for (const auto& label : labels) {
        ids.push_back(transform(label));
    }
    return ids;
}

const std::string& LabelEncoder::inverseTransform(int id) const {
    if (id < 0 || id >= numClasses()) {
        throw std::out_of_range("class id " + std::to_string(id) + " out of range [0, " +
                                std::to_string(numClasses()) + ")");
    }
    return m_classes[static_cast<size_t>(id)];
}

std::vector<std::string> LabelEncoder::inverseTransform(const std::vector<int>& ids) const {
    std::vector<std::string> labels;
    labels.reserve(ids.size());
    for (int id : ids) {
        labels.push_back(inverseTransform(id));
    }
    return labels;
}

OneHotMatrix LabelEncoder::encode(const std::vector<std::string>& labels) const {
    std::vector<int> ids = transform(labels);

    OneHotMatrix onehot(ids.size(), std::vector<float>(m_classes.size(), 0.0f));
    for (size_t row = 0; row < ids.size(); ++row) {
        onehot[row][static_cast<size_t>(ids[row])] = 1.0f;
    }
    return onehot;
}

// ============================================================================
// PERSISTENCE
// ============================================================================

std::string LabelEncoder::encoderFileName(const std::string& runTimestamp) {
    return "label_encoder_" + runTimestamp + ".p";
}

std::string LabelEncoder::csvFileName(const std::string& runTimestamp) {
    return "label_encoder_" + runTimestamp + ".csv";
}

LabelEncoderFiles LabelEncoder::save(const std::string& outputDir,
                                     const std::string& runTimestamp) const {
    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        throw std::runtime_error("[LabelEncoder] Cannot create directory " + outputDir +
                                 ": " + ec.message());
    }

    const fs::path dir(outputDir);
    LabelEncoderFiles files;
    files.encoderPath = (dir / encoderFileName(runTimestamp)).string();
    files.csvPath = (dir / csvFileName(runTimestamp)).string();
    files.latestEncoderLink = (dir / encoderFileName(LATEST_TAG)).string();
    files.latestCsvLink = (dir / csvFileName(LATEST_TAG)).string();

    // ----- Binary -----
    {
        std::ofstream file(files.encoderPath, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("[LabelEncoder] Cannot open " + files.encoderPath);
        }
        binary::writeMagic(file, ENCODER_MAGIC);
        binary::writeValue(file, FORMAT_VERSION);
        binary::writeValue(file, static_cast<uint32_t>(m_classes.size()));
        for (const auto& label : m_classes) {
            binary::writeString(file, label);
        }
        file.flush();
        if (!file) {
            throw std::runtime_error("[LabelEncoder] Write failed: " + files.encoderPath);
        }
    }
    std::cout << "[LabelEncoder] Saved label encoder to " << files.encoderPath << std::endl;

    createOrReplaceSymlink(encoderFileName(runTimestamp), files.latestEncoderLink);
    std::cout << "[LabelEncoder] Created symbolic link to encoder as "
              << files.latestEncoderLink << std::endl;

    // ----- CSV -----
    {
        std::ofstream csvFile(files.csvPath, std::ios::trunc);
        if (!csvFile.is_open()) {
            throw std::runtime_error("[LabelEncoder] Cannot open " + files.csvPath);
        }
        csvFile << "encoded_id,label\n";
        for (size_t i = 0; i < m_classes.size(); ++i) {
            csvFile << i << "," << m_classes[i] << "\n";
        }
        csvFile.flush();
        if (!csvFile) {
            throw std::runtime_error("[LabelEncoder] Write failed: " + files.csvPath);
        }
    }
    std::cout << "[LabelEncoder] Saved label encoder (in csv format) to "
              << files.csvPath << std::endl;

    createOrReplaceSymlink(csvFileName(runTimestamp), files.latestCsvLink);
    std::cout << "[LabelEncoder] Created symbolic link to encoder csv as "
              << files.latestCsvLink << std::endl;

    return files;
}

LabelEncoder LabelEncoder::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw MissingArtifactError("Label encoder " + path +
                                   " does not exist. Run orca_prepare --encode first.");
    }

    if (!binary::readMagic(file, ENCODER_MAGIC)) {
        throw ArtifactFormatError(path + ": not a label encoder file");
    }

    uint32_t version = 0;
    uint32_t count = 0;
    if (!binary::readValue(file, version) || version != FORMAT_VERSION) {
        throw ArtifactFormatError(path + ": unsupported format version " + std::to_string(version));
    }
    if (!binary::readValue(file, count) || count > MAX_CLASSES) {
        throw ArtifactFormatError(path + ": invalid class count");
    }

    std::vector<std::string> classes(count);
    for (uint32_t i = 0; i < count; ++i) {
        if (!binary::readString(file, classes[i], MAX_LABEL_LENGTH)) {
            throw ArtifactFormatError(path + ": truncated class " + std::to_string(i));
        }
    }
    if (!std::is_sorted(classes.begin(), classes.end()) ||
        std::adjacent_find(classes.begin(), classes.end()) != classes.end()) {
        throw ArtifactFormatError(path + ": classes are not sorted and unique");
    }

    LabelEncoder encoder;
    encoder.fit(classes);
    return encoder;
}

} // namespace orca
