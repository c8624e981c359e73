/**
 * @file SignalPrep.hpp
 * @brief Audio reading and waveform preparation for feature extraction
 *
 * Pipeline stages:
 *   1. WAV metadata / ranged segment loading (via dr_wav)
 *   2. Multi-channel -> mono downmix
 *   3. Resampling to the canonical 16kHz rate
 *
 * Chỉ đọc đúng đoạn [startFrame, startFrame + frameCount) của file,
 * không load toàn bộ file vào bộ nhớ.
 *
 * @author Research Team
 * @date 2026
 */

#ifndef SIGNAL_PREP_HPP
#define SIGNAL_PREP_HPP

#include "Common.h"

#include <cstdint>
#include <string>
#include <vector>

namespace orca {

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @struct AudioInfo
 * @brief Metadata của file WAV (không chứa samples)
 */
struct AudioInfo {
    uint32_t sampleRate;            ///< Tần số lấy mẫu gốc (Hz)
    uint16_t channels;              ///< Số kênh âm thanh
    uint64_t totalFrames;           ///< Tổng số PCM frames

    AudioInfo() : sampleRate(0), channels(0), totalFrames(0) {}

    /**
     * @brief Thời lượng file (giây)
     */
    double durationSeconds() const {
        return sampleRate > 0 ? static_cast<double>(totalFrames) / sampleRate : 0.0;
    }
};

/**
 * @struct AudioData
 * @brief Samples đã đọc (interleaved nếu nhiều kênh) và metadata
 */
struct AudioData {
    std::vector<float> samples;     ///< Interleaved float samples [-1.0, 1.0]
    uint32_t sampleRate;            ///< Tần số lấy mẫu gốc (Hz)
    uint16_t channels;              ///< Số kênh âm thanh
    uint64_t frames;                ///< Số frames thực sự đọc được

    AudioData() : sampleRate(0), channels(0), frames(0) {}
};

// ============================================================================
// MAIN CLASS
// ============================================================================

/**
 * @class SignalProcessor
 * @brief Đọc segment audio và chuẩn hóa về mono @ SAMPLE_RATE
 *
 * Class không giữ trạng thái giữa các lần gọi nên có thể dùng
 * đồng thời từ nhiều thread (mỗi lần gọi mở file riêng).
 */
class SignalProcessor {
public:
    SignalProcessor() = default;

    // ========================================================================
    // FILE ACCESS
    // ========================================================================

    /**
     * @brief Đọc metadata của file WAV (sample rate, channels, total frames)
     *
     * @param filePath Đường dẫn file WAV
     * @param info Struct lưu metadata đọc được
     * @return true nếu mở file thành công và metadata hợp lệ
     */
    bool readInfo(const std::string& filePath, AudioInfo& info) const;

    /**
     * @brief Đọc frameCount frames bắt đầu từ startFrame
     *
     * Nếu file kết thúc trước, chỉ trả về số frames còn lại
     * (audioData.frames < frameCount).
     *
     * @param filePath Đường dẫn file WAV
     * @param startFrame Frame bắt đầu
     * @param frameCount Số frames cần đọc
     * @param audioData Kết quả (interleaved samples)
     * @return true nếu đọc thành công
     */
    bool readSegment(const std::string& filePath,
                     uint64_t startFrame,
                     uint64_t frameCount,
                     AudioData& audioData) const;

    /**
     * @brief Đọc segment, downmix sang mono và resample về targetRate
     *
     * @param output Waveform mono tại targetRate
     * @return true nếu đọc thành công
     */
    bool loadSegment(const std::string& filePath,
                     uint64_t startFrame,
                     uint64_t frameCount,
                     std::vector<float>& output,
                     uint32_t targetRate = SAMPLE_RATE) const;

    // ========================================================================
    // WAVEFORM TRANSFORMS
    // ========================================================================

    /**
     * @brief Chuyển đổi tín hiệu nhiều kênh sang mono
     *
     * mono[i] = (ch1[i] + ch2[i] + ... + chN[i]) / N
     *
     * @param input Vector mẫu interleaved
     * @param output Vector mẫu mono
     * @param channels Số kênh
     */
    void convertToMono(const std::vector<float>& input,
                       std::vector<float>& output,
                       uint16_t channels) const;

    /**
     * @brief Resampling bằng nội suy tuyến tính
     *
     * Số samples đầu ra = floor(input.size() * targetRate / inputRate).
     *
     * @param input Vector mẫu đầu vào
     * @param inputRate Tần số lấy mẫu đầu vào (Hz)
     * @param output Vector mẫu đầu ra
     * @param targetRate Tần số lấy mẫu mục tiêu (Hz)
     */
    void resample(const std::vector<float>& input,
                  uint32_t inputRate,
                  std::vector<float>& output,
                  uint32_t targetRate = SAMPLE_RATE) const;
};

} // namespace orca

#endif // SIGNAL_PREP_HPP
