/**
 * @file DatasetIndex.hpp
 * @brief Dataset indexing, stratified splitting and segment quantization
 *
 * Input layout:
 *   root/<ClassFolder>/<YearOrSubfolder>/*.wav
 *
 * Label = <ClassFolder> sau khi loại bỏ mọi ký tự không phải chữ/số.
 *
 * Pipeline stages:
 *   1. AudioIndexer    - quét thư mục, gom file theo label
 *   2. DatasetSplitter - chia train/validate/test theo từng label
 *   3. SegmentQuantizer - cắt mỗi file thành các segment cố định
 *
 * @author Research Team
 * @date 2026
 */

#ifndef DATASET_INDEX_HPP
#define DATASET_INDEX_HPP

#include "Common.h"
#include "SignalPrep.hpp"

#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace orca {

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @struct LabeledFile
 * @brief Một file audio cùng label suy ra từ đường dẫn
 */
struct LabeledFile {
    std::string label;              ///< Label đã sanitize (chỉ chữ/số)
    std::string path;               ///< Đường dẫn file

    LabeledFile() = default;
    LabeledFile(std::string l, std::string p)
        : label(std::move(l)), path(std::move(p)) {}
};

/**
 * @struct SegmentRef
 * @brief Tham chiếu tới một đoạn liên tục của file (chưa đọc audio)
 *
 * Invariant: startFrame + frameCount <= tổng số frames của file nguồn.
 */
struct SegmentRef {
    std::string label;              ///< Label của file nguồn
    std::string source;             ///< Đường dẫn file nguồn
    uint64_t startFrame;            ///< Frame bắt đầu (theo sample rate gốc)
    uint64_t frameCount;            ///< Số frames của segment

    SegmentRef() : startFrame(0), frameCount(0) {}
    SegmentRef(std::string l, std::string s, uint64_t start, uint64_t count)
        : label(std::move(l)), source(std::move(s)), startFrame(start), frameCount(count) {}

    /**
     * @brief Dạng "file:start:frames" để log
     */
    std::string toString() const {
        return source + ":" + std::to_string(startFrame) + ":" + std::to_string(frameCount);
    }
};

/// TRAIN / VALIDATE / TEST -> SampleCollection
using DatasetSplits = std::map<DatasetType, SampleCollection>;

/**
 * @struct IndexStatistics
 * @brief Thống kê sau khi index dataset
 */
struct IndexStatistics {
    size_t totalFiles;                      ///< Tổng số file audio
    size_t totalDirectories;                ///< Số thư mục có chứa audio
    std::map<std::string, size_t> filesPerLabel;

    IndexStatistics() : totalFiles(0), totalDirectories(0) {}

    /**
     * @brief In thống kê ra console
     */
    void print() const;
};

// ============================================================================
// AUDIO INDEXER
// ============================================================================

/**
 * @class AudioIndexer
 * @brief Quét cây thư mục và gom các file audio theo label
 *
 * Cách sử dụng:
 * @code
 *   AudioIndexer indexer;
 *   SampleCollection samples = indexer.index("data");
 *   indexer.getStatistics().print();
 * @endcode
 */
class AudioIndexer {
public:
    AudioIndexer() = default;

    /**
     * @brief Duyệt đệ quy rootPath, trả về mapping label -> files
     *
     * Mỗi thư mục có ít nhất một file audio đóng góp các file của nó
     * (theo thứ tự liệt kê của filesystem) vào label của thư mục ông.
     * Thư mục không đọc được bị bỏ qua (kèm warning), các nhánh khác
     * vẫn được duyệt tiếp.
     *
     * @param rootPath Thư mục gốc
     * @return SampleCollection
     */
    SampleCollection index(const std::string& rootPath);

    /**
     * @brief Thống kê của lần index gần nhất
     */
    const IndexStatistics& getStatistics() const { return m_statistics; }

    /**
     * @brief Loại bỏ mọi ký tự không phải chữ/số ("Killer Whale" -> "KillerWhale")
     */
    static std::string sanitizeLabel(const std::string& raw);

    /**
     * @brief Kiểm tra extension audio (không phân biệt hoa thường)
     */
    static bool isAudioFile(const std::string& path);

private:
    IndexStatistics m_statistics;
};

// ============================================================================
// DATASET SPLITTER
// ============================================================================

/**
 * @class DatasetSplitter
 * @brief Chia stratified train/validate/test theo từng label
 *
 * Với mỗi label có n file (n >= MIN_FILES_PER_LABEL):
 *   trainCount    = floor((n + 1) * trainFraction)
 *   validateCount = floor((n + 1) * validateFraction)
 *   test          = phần còn lại
 * Các slice liên tiếp trên danh sách đã shuffle: [train][validate][test].
 * Label có ít hơn MIN_FILES_PER_LABEL file bị loại khỏi cả ba split.
 */
class DatasetSplitter {
public:
    /**
     * @param rng Nguồn random dùng để shuffle (được seed từ trước)
     * @param minFilesPerLabel Ngưỡng số file tối thiểu
     */
    explicit DatasetSplitter(std::mt19937& rng,
                             size_t minFilesPerLabel = MIN_FILES_PER_LABEL);

    /**
     * @brief Thực hiện split
     *
     * Danh sách file trong samples bị shuffle tại chỗ.
     * Throw ConfigurationError nếu tỷ lệ nằm ngoài [0, 1] hoặc tổng > 1.
     */
    DatasetSplits split(SampleCollection& samples,
                        double trainFraction = TRAIN_PERCENTAGE,
                        double validateFraction = VALIDATE_PERCENTAGE);

private:
    std::mt19937& m_rng;
    size_t m_minFilesPerLabel;
};

// ============================================================================
// SEGMENT QUANTIZER
// ============================================================================

/**
 * @class SegmentQuantizer
 * @brief Cắt file thành các segment không chồng lấp, độ dài cố định
 *
 * Chỉ đọc metadata của file. Offset được sinh tại 0, S, 2S, ... < totalFrames
 * và phần tử cuối cùng luôn bị loại bỏ theo vị trí (không kiểm tra độ dài).
 */
class SegmentQuantizer {
public:
    explicit SegmentQuantizer(double segmentSeconds = FILE_SAMPLING_SIZE_SECONDS,
                              double maxSeconds = FILE_MAX_SIZE_SECONDS);

    /**
     * @brief Quantize một file dựa trên metadata đã biết
     */
    std::vector<SegmentRef> quantize(const std::string& label,
                                     const std::string& filePath,
                                     const AudioInfo& info) const;

    /**
     * @brief Quantize một file (đọc metadata từ đĩa)
     *
     * File không đọc được trả về danh sách rỗng.
     */
    std::vector<SegmentRef> quantize(const std::string& label,
                                     const std::string& filePath) const;

    /**
     * @brief Quantize danh sách (label, file) và làm phẳng kết quả
     */
    std::vector<SegmentRef> quantizeAll(const std::vector<LabeledFile>& files) const;

    /**
     * @brief Làm phẳng một split (theo thứ tự label) rồi quantize
     */
    std::vector<SegmentRef> flattenAndQuantize(const SampleCollection& split) const;

    double getSegmentSeconds() const { return m_segmentSeconds; }
    double getMaxSeconds() const { return m_maxSeconds; }

private:
    double m_segmentSeconds;
    double m_maxSeconds;            ///< Reserved: chưa dùng để lọc file dài
    SignalProcessor m_signalProcessor;
};

} // namespace orca

#endif // DATASET_INDEX_HPP
