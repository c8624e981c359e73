/**
 * @file DatasetIndex.cpp
 * @brief Implementation of AudioIndexer, DatasetSplitter and SegmentQuantizer
 *
 * @author Research Team
 * @date 2026
 */

#include "DatasetIndex.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace orca {

// ============================================================================
// INDEX STATISTICS
// ============================================================================

void IndexStatistics::print() const {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════╗\n";
    std::cout << "║           Audio Dataset Index Statistics                 ║\n";
    std::cout << "╠══════════════════════════════════════════════════════════╣\n";
    std::cout << "║  Total audio files:    " << std::setw(8) << totalFiles
              << "                          ║\n";
    std::cout << "║  Audio directories:    " << std::setw(8) << totalDirectories
              << "                          ║\n";
    std::cout << "║  Labels:               " << std::setw(8) << filesPerLabel.size()
              << "                          ║\n";
    std::cout << "╠══════════════════════════════════════════════════════════╣\n";
    std::cout << "║  Label Distribution:                                     ║\n";
    for (const auto& entry : filesPerLabel) {
        std::cout << "║    - " << std::left << std::setw(24) << entry.first << std::right
                  << std::setw(8) << entry.second
                  << " (" << std::fixed << std::setprecision(1)
                  << (totalFiles > 0 ? 100.0 * entry.second / totalFiles : 0.0)
                  << "%)\n";
    }
    std::cout << "╚══════════════════════════════════════════════════════════╝\n";
    std::cout << "\n";
}

// ============================================================================
// AUDIO INDEXER
// ============================================================================

std::string AudioIndexer::sanitizeLabel(const std::string& raw) {
    std::string label;
    label.reserve(raw.size());
    for (char c : raw) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            label.push_back(c);
        }
    }
    return label;
}

bool AudioIndexer::isAudioFile(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == AUDIO_EXTENSION;
}

SampleCollection AudioIndexer::index(const std::string& rootPath) {
    /**
     * Quy trình:
     * 1. Duyệt root và mọi thư mục con (không theo symlink thư mục)
     * 2. Với mỗi thư mục: liệt kê file audio, bỏ qua thư mục không đọc được
     * 3. Label = tên thư mục cha của thư mục chứa file
     *    /data/MarineMammalName/1975/x.wav -> "MarineMammalName"
     */

    m_statistics = IndexStatistics();
    SampleCollection allSamples;

    fs::path root(rootPath);
    if (!root.has_filename()) {
        root = root.parent_path();
    }

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        std::cerr << "[AudioIndexer] Error: Not a directory: " << rootPath << std::endl;
        return allSamples;
    }

    // ----- BƯỚC 1: Duyệt cây thư mục -----
    // Thư mục không đọc được chỉ bỏ qua nhánh đó, phần còn lại vẫn được duyệt
    std::vector<fs::path> pending;
    pending.push_back(root);

    while (!pending.empty()) {
        fs::path dir = pending.back();
        pending.pop_back();

        std::vector<std::string> files;
        std::vector<fs::path> subdirectories;

        std::error_code dirEc;
        fs::directory_iterator entryIt(dir, dirEc);
        fs::directory_iterator entryEnd;
        while (!dirEc && entryIt != entryEnd) {
            std::error_code typeEc;
            if (entryIt->is_symlink(typeEc)) {
                // Symlink: chỉ nhận file, không đi vào thư mục
                if (entryIt->is_regular_file(typeEc) && isAudioFile(entryIt->path().string())) {
                    files.push_back(entryIt->path().string());
                }
            } else if (entryIt->is_directory(typeEc)) {
                subdirectories.push_back(entryIt->path());
            } else if (entryIt->is_regular_file(typeEc) && isAudioFile(entryIt->path().string())) {
                files.push_back(entryIt->path().string());
            }
            entryIt.increment(dirEc);
        }
        if (dirEc) {
            std::cerr << "[AudioIndexer] Warning: Skipping unreadable directory "
                      << dir.string() << ": " << dirEc.message() << std::endl;
        }

        // Thứ tự duyệt ổn định
        std::sort(subdirectories.rbegin(), subdirectories.rend());
        pending.insert(pending.end(), subdirectories.begin(), subdirectories.end());

        // ----- BƯỚC 2 + 3: Gom file theo label -----
        if (files.empty()) {
            continue;
        }

        std::string label = sanitizeLabel(dir.parent_path().filename().string());
        if (label.empty()) {
            std::cerr << "[AudioIndexer] Warning: Skipping " << files.size()
                      << " files in " << dir.string() << " (no class folder)" << std::endl;
            continue;
        }

        std::vector<std::string>& labelFiles = allSamples[label];
        labelFiles.insert(labelFiles.end(), files.begin(), files.end());

        m_statistics.totalFiles += files.size();
        m_statistics.totalDirectories++;
        m_statistics.filesPerLabel[label] += files.size();
    }

    std::cout << "[AudioIndexer] Observed " << allSamples.size() << " labels for "
              << m_statistics.totalFiles << " audio files." << std::endl;

    return allSamples;
}

// ============================================================================
// DATASET SPLITTER
// ============================================================================

DatasetSplitter::DatasetSplitter(std::mt19937& rng, size_t minFilesPerLabel)
    : m_rng(rng)
    , m_minFilesPerLabel(minFilesPerLabel)
{
}

DatasetSplits DatasetSplitter::split(SampleCollection& samples,
                                     double trainFraction,
                                     double validateFraction) {
    if (trainFraction < 0.0 || validateFraction < 0.0 ||
        trainFraction + validateFraction > 1.0) {
        throw ConfigurationError("invalid split fractions: train=" +
                                 std::to_string(trainFraction) + ", validate=" +
                                 std::to_string(validateFraction));
    }

    DatasetSplits splits;
    for (DatasetType type : ALL_DATASET_TYPES) {
        splits[type];
    }

    // std::map -> duyệt label theo thứ tự cố định, shuffle tái lập được
    for (auto& entry : samples) {
        const std::string& label = entry.first;
        std::vector<std::string>& files = entry.second;
        size_t n = files.size();

        if (n < m_minFilesPerLabel) {
            std::cerr << "[DatasetSplitter] Warning: Label '" << label << "' has only "
                      << n << " files (need " << m_minFilesPerLabel
                      << "), excluded from all splits" << std::endl;
            continue;
        }

        std::shuffle(files.begin(), files.end(), m_rng);

        size_t numTrain = static_cast<size_t>((n + 1) * trainFraction);
        size_t numValidate = static_cast<size_t>((n + 1) * validateFraction);

        // (n+1) có thể đẩy tổng vượt n với tỷ lệ lớn
        numTrain = std::min(numTrain, n);
        numValidate = std::min(numValidate, n - numTrain);

        auto trainEnd = files.begin() + static_cast<std::ptrdiff_t>(numTrain);
        auto validateEnd = trainEnd + static_cast<std::ptrdiff_t>(numValidate);

        splits[DatasetType::TRAIN][label].assign(files.begin(), trainEnd);
        splits[DatasetType::VALIDATE][label].assign(trainEnd, validateEnd);
        splits[DatasetType::TEST][label].assign(validateEnd, files.end());
    }

    return splits;
}

// ============================================================================
// SEGMENT QUANTIZER
// ============================================================================

SegmentQuantizer::SegmentQuantizer(double segmentSeconds, double maxSeconds)
    : m_segmentSeconds(segmentSeconds)
    , m_maxSeconds(maxSeconds)
{
    if (segmentSeconds <= 0.0) {
        throw ConfigurationError("segment length must be positive");
    }
}

std::vector<SegmentRef> SegmentQuantizer::quantize(const std::string& label,
                                                   const std::string& filePath,
                                                   const AudioInfo& info) const {
    std::vector<SegmentRef> segments;

    // e.g. 5s * 16000 = 80000 frames
    uint64_t segmentFrames = static_cast<uint64_t>(m_segmentSeconds * info.sampleRate);

    // m_maxSeconds không được áp dụng: file dài vẫn được quantize toàn bộ
    if (segmentFrames == 0 || info.totalFrames <= segmentFrames) {
        return segments;
    }

    for (uint64_t start = 0; start < info.totalFrames; start += segmentFrames) {
        segments.emplace_back(label, filePath, start, segmentFrames);
    }

    // Luôn bỏ segment cuối (theo vị trí, không kiểm tra độ dài)
    segments.pop_back();
    return segments;
}

std::vector<SegmentRef> SegmentQuantizer::quantize(const std::string& label,
                                                   const std::string& filePath) const {
    AudioInfo info;
    if (!m_signalProcessor.readInfo(filePath, info)) {
        std::cerr << "[SegmentQuantizer] Warning: Skipping unreadable file: "
                  << filePath << std::endl;
        return {};
    }
    return quantize(label, filePath, info);
}

std::vector<SegmentRef> SegmentQuantizer::quantizeAll(const std::vector<LabeledFile>& files) const {
    std::vector<SegmentRef> flat;
    for (const auto& file : files) {
        std::vector<SegmentRef> segments = quantize(file.label, file.path);
        flat.insert(flat.end(),
                    std::make_move_iterator(segments.begin()),
                    std::make_move_iterator(segments.end()));
    }
    return flat;
}

std::vector<SegmentRef> SegmentQuantizer::flattenAndQuantize(const SampleCollection& split) const {
    // ['SpermWhale', '/data/SpermWhale/1985/8500901B.wav'], ...
    std::vector<LabeledFile> files;
    for (const auto& entry : split) {
        for (const auto& path : entry.second) {
            files.emplace_back(entry.first, path);
        }
    }

    std::vector<SegmentRef> segments = quantizeAll(files);
    std::cout << "[SegmentQuantizer] Quantized " << segments.size()
              << " audio segments from " << files.size() << " sample files." << std::endl;
    return segments;
}

} // namespace orca
