/**
 * @file FeatureStore.hpp
 * @brief Per-split persistence of (label, FeatureExample) sequences
 *
 * Mỗi split có đúng một file: <dataPath>/<SPLIT>.features
 * File cũ được đổi tên thành <SPLIT>.features-old trước khi ghi đè.
 *
 * Binary layout:
 *   "ORCAFEAT" | uint32 version | uint64 count |
 *   count x (uint32 labelLen | label | int32 frames | int32 bands |
 *            int32 channels | float32 data[frames * bands * channels])
 *
 * @author Research Team
 * @date 2026
 */

#ifndef FEATURE_STORE_HPP
#define FEATURE_STORE_HPP

#include "Common.h"
#include "FeatureExtraction.h"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace orca {

/**
 * @struct LoadedFeatures
 * @brief Kết quả load: hai mảng song song features[i] <-> labels[i]
 */
struct LoadedFeatures {
    std::vector<FeatureExample> features;
    std::vector<std::string> labels;

    size_t size() const { return labels.size(); }
};

/**
 * @class FeatureStore
 * @brief Ghi và đọc file features của từng split
 *
 * Cách sử dụng:
 * @code
 *   FeatureStore store("output");
 *   store.save(DatasetType::TRAIN, examples);
 *   LoadedFeatures train = store.load(DatasetType::TRAIN, {"Noise"}, {"Seal"});
 * @endcode
 */
class FeatureStore {
public:
    explicit FeatureStore(const std::string& dataPath);

    /**
     * @brief <dataPath>/<SPLIT>.features
     */
    std::string featurePath(DatasetType type) const;

    bool exists(DatasetType type) const;

    /**
     * @brief Ghi toàn bộ sequence của một split
     *
     * File hiện có (nếu có) được rename sang backup trước khi ghi.
     * Throw std::runtime_error nếu không mở/ghi được file.
     */
    void save(DatasetType type, const std::vector<LabeledExample>& examples) const;

    /**
     * @brief Như trên, nhận tên split ("TRAIN", "VALIDATE", "TEST")
     *
     * Throw ConfigurationError nếu tên không hợp lệ.
     */
    void save(const std::string& splitName, const std::vector<LabeledExample>& examples) const;

    /**
     * @brief Đọc file features của một split
     *
     * Entry có label thuộc removeLabels bị bỏ; label thuộc renameToOther
     * được đổi thành OTHER_CLASS. Thứ tự còn lại giữ nguyên.
     *
     * Throw MissingArtifactError nếu file chưa tồn tại,
     * ArtifactFormatError nếu file hỏng.
     */
    LoadedFeatures load(DatasetType type,
                        const std::set<std::string>& removeLabels = {},
                        const std::set<std::string>& renameToOther = {}) const;

    LoadedFeatures load(const std::string& splitName,
                        const std::set<std::string>& removeLabels = {},
                        const std::set<std::string>& renameToOther = {}) const;

    const std::string& getDataPath() const { return m_dataPath; }

    static constexpr uint32_t FORMAT_VERSION = 1;

private:
    void writeFile(const std::string& path, const std::vector<LabeledExample>& examples) const;
    std::vector<LabeledExample> readFile(const std::string& path) const;

    std::string m_dataPath;
};

} // namespace orca

#endif // FEATURE_STORE_HPP
