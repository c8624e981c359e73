/**
 * @file LabelEncoder.hpp
 * @brief Stable bijection label <-> integer id, with one-hot encoding
 *
 * Id được gán theo thứ tự từ điển của các class đã fit:
 *   fit({"Seal", "KillerWhale", "Other"}) -> KillerWhale=0, Other=1, Seal=2
 *
 * Artifacts (mỗi lần chạy):
 *   label_encoder_<timestamp>.p    binary, đọc lại bằng LabelEncoder::load
 *   label_encoder_<timestamp>.csv  "encoded_id,label"
 *   label_encoder_latest.p / .csv  symlink tới file của lần chạy mới nhất
 *
 * @author Research Team
 * @date 2026
 */

#ifndef LABEL_ENCODER_HPP
#define LABEL_ENCODER_HPP

#include "Common.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace orca {

/// Ma trận one-hot [sample][class]
using OneHotMatrix = std::vector<std::vector<float>>;

/**
 * @struct LabelEncoderFiles
 * @brief Đường dẫn các file được ghi bởi LabelEncoder::save
 */
struct LabelEncoderFiles {
    std::string encoderPath;
    std::string csvPath;
    std::string latestEncoderLink;
    std::string latestCsvLink;
};

class LabelEncoder {
public:
    LabelEncoder() = default;

    /**
     * @brief Fit trên danh sách label (có thể trùng lặp, thứ tự bất kỳ)
     */
    void fit(const std::vector<std::string>& classes);

    /**
     * @brief label -> id. Throw std::out_of_range với label chưa fit.
     */
    int transform(const std::string& label) const;
    std::vector<int> transform(const std::vector<std::string>& labels) const;

    /**
     * @brief id -> label. Throw std::out_of_range nếu id ngoài [0, numClasses).
     */
    const std::string& inverseTransform(int id) const;
    std::vector<std::string> inverseTransform(const std::vector<int>& ids) const;

    /**
     * @brief One-hot encode: ma trận 0 (labels.size() x numClasses), đặt 1 tại id
     */
    OneHotMatrix encode(const std::vector<std::string>& labels) const;

    const std::vector<std::string>& classes() const { return m_classes; }
    int numClasses() const { return static_cast<int>(m_classes.size()); }
    bool isFitted() const { return !m_classes.empty(); }

    // ========================================================================
    // PERSISTENCE
    // ========================================================================

    /**
     * @brief Ghi .p và .csv cho runTimestamp, rồi trỏ các symlink "latest" vào đó
     *
     * Throw std::runtime_error nếu không ghi được file hoặc tạo symlink.
     */
    LabelEncoderFiles save(const std::string& outputDir, const std::string& runTimestamp) const;

    /**
     * @brief Đọc lại encoder từ file .p (hoặc symlink latest)
     *
     * Throw MissingArtifactError / ArtifactFormatError.
     */
    static LabelEncoder load(const std::string& path);

    static std::string encoderFileName(const std::string& runTimestamp);
    static std::string csvFileName(const std::string& runTimestamp);

    static constexpr const char* LATEST_TAG = "latest";
    static constexpr uint32_t FORMAT_VERSION = 1;

private:
    std::vector<std::string> m_classes;         ///< Đã sắp xếp, không trùng
    std::map<std::string, int> m_index;         ///< label -> id
};

} // namespace orca

#endif // LABEL_ENCODER_HPP
