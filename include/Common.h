/**
 * @file Common.h
 * @brief Common definitions, constants and error types for the Orca
 *        dataset preparation pipeline
 *
 * Chứa các định nghĩa chung, types, và constants được sử dụng
 * xuyên suốt dự án (indexing, splitting, feature extraction, storage).
 */

#ifndef COMMON_H
#define COMMON_H

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace orca {

// ============================================================================
// TYPE DEFINITIONS
// ============================================================================

/// Label -> danh sách đường dẫn file (giữ nguyên thứ tự trong từng label)
using SampleCollection = std::map<std::string, std::vector<std::string>>;

// ============================================================================
// CONSTANTS - Log-mel feature parameters
// ============================================================================

/// Canonical sample rate (Hz); every segment is resampled to this rate
constexpr int SAMPLE_RATE = 16000;

/// STFT window length (seconds) - 25ms
constexpr double STFT_WINDOW_LENGTH_SECONDS = 0.025;

/// STFT hop length (seconds) - 10ms
constexpr double STFT_HOP_LENGTH_SECONDS = 0.010;

/// Số mel bands
constexpr int NUM_MEL_BINS = 64;

/// Số bands của một example (trùng với NUM_MEL_BINS)
constexpr int NUM_BANDS = NUM_MEL_BINS;

/// Tần số thấp nhất của mel filterbank (Hz)
constexpr double MEL_MIN_HZ = 125.0;

/// Tần số cao nhất của mel filterbank (Hz)
constexpr double MEL_MAX_HZ = 7500.0;

/// Offset cộng vào trước khi lấy log để tránh log(0)
constexpr double LOG_OFFSET = 0.01;

/// Độ dài một example (seconds)
constexpr double EXAMPLE_WINDOW_SECONDS = 4.96;

/// Bước nhảy giữa các example (seconds)
constexpr double EXAMPLE_HOP_SECONDS = 4.96;

/// Số spectrogram frames trong một example (4.96s / 10ms)
constexpr int NUM_FRAMES = 496;

// ============================================================================
// CONSTANTS - Dataset parameters
// ============================================================================

/// Độ dài mỗi segment khi cắt file (seconds)
constexpr double FILE_SAMPLING_SIZE_SECONDS = 5.0;

/// Độ dài tối đa của file được chấp nhận (seconds) - reserved, not enforced
constexpr double FILE_MAX_SIZE_SECONDS = 60.0;

/// Tỷ lệ train / validate; phần còn lại thuộc về test
constexpr double TRAIN_PERCENTAGE = 0.70;
constexpr double VALIDATE_PERCENTAGE = 0.20;

/// Số file tối thiểu của một label để được đưa vào split
constexpr size_t MIN_FILES_PER_LABEL = 10;

/// Seed mặc định cho shuffle
constexpr unsigned int DEFAULT_SHUFFLE_SEED = 251;

/// Extension file audio được index (so sánh không phân biệt hoa thường)
const std::string AUDIO_EXTENSION = ".wav";

/// Extension của file features đã lưu
const std::string FEATURES_EXTENSION = ".features";

/// Hậu tố của file backup
const std::string BACKUP_SUFFIX = "-old";

/// Tên của catch-all class
const std::string OTHER_CLASS = "Other";

/// Đường dẫn mặc định
const std::string DEFAULT_DATA_PATH = "data";
const std::string DEFAULT_OUTPUT_PATH = "output";

// ============================================================================
// ENUMS
// ============================================================================

/**
 * @enum DatasetType
 * @brief Các split của dataset
 */
enum class DatasetType {
    TRAIN = 0,            ///< Training split
    VALIDATE = 1,         ///< Validation split
    TEST = 2              ///< Test split
};

/// Tất cả split theo thứ tự xử lý
const std::vector<DatasetType> ALL_DATASET_TYPES = {
    DatasetType::TRAIN, DatasetType::VALIDATE, DatasetType::TEST
};

// ============================================================================
// ERROR TYPES
// ============================================================================

/**
 * @brief Cấu hình không hợp lệ (split name lạ, tỷ lệ sai, ...)
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Artifact chưa được tạo (cần chạy bước generate trước)
 */
class MissingArtifactError : public std::runtime_error {
public:
    explicit MissingArtifactError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Artifact bị hỏng hoặc không đúng định dạng
 */
class ArtifactFormatError : public std::runtime_error {
public:
    explicit ArtifactFormatError(const std::string& what)
        : std::runtime_error(what) {}
};

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/**
 * @brief Chuyển đổi DatasetType sang string ("TRAIN", "VALIDATE", "TEST")
 */
inline std::string datasetTypeName(DatasetType type) {
    switch (type) {
        case DatasetType::TRAIN: return "TRAIN";
        case DatasetType::VALIDATE: return "VALIDATE";
        case DatasetType::TEST: return "TEST";
    }
    throw ConfigurationError("invalid DatasetType specified");
}

/**
 * @brief Parse tên split; throw ConfigurationError nếu không nhận ra
 */
inline DatasetType parseDatasetType(const std::string& name) {
    for (DatasetType type : ALL_DATASET_TYPES) {
        if (datasetTypeName(type) == name) {
            return type;
        }
    }
    throw ConfigurationError("invalid DatasetType specified: '" + name + "'");
}

/**
 * @brief Parse shuffle seed: số nguyên không dấu thập phân trong [0, UINT32_MAX]
 * @throws ConfigurationError nếu rỗng, có dấu, không phải số nguyên hoặc tràn
 */
inline uint32_t parseSeed(const std::string& value) {
    bool digitsOnly = !value.empty();
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            digitsOnly = false;
            break;
        }
    }
    if (!digitsOnly) {
        throw ConfigurationError("--seed expects a non-negative integer, got '" + value + "'");
    }

    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value);
    } catch (const std::out_of_range&) {
        parsed = std::numeric_limits<unsigned long long>::max();
    }
    if (parsed > std::numeric_limits<uint32_t>::max()) {
        throw ConfigurationError("--seed must not exceed " +
                                 std::to_string(std::numeric_limits<uint32_t>::max()) +
                                 ", got '" + value + "'");
    }
    return static_cast<uint32_t>(parsed);
}

} // namespace orca

#endif // COMMON_H
