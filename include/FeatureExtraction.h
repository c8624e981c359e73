/**
 * @file FeatureExtraction.h
 * @brief Segment -> fixed-shape log-mel example
 *
 * Các bước cho mỗi SegmentRef:
 *   (a) Đọc đúng frameCount frames từ startFrame
 *   (b) Downmix mono
 *   (c) Resample về SAMPLE_RATE
 *   (d) Log-mel spectrogram (25ms / 10ms / 64 bands)
 *   (e) Framing thành cửa sổ EXAMPLE_WINDOW_SECONDS, giữ cửa sổ đầu tiên
 *
 * Segment quá ngắn (không đủ một cửa sổ) -> example toàn 0 cùng shape.
 *
 * @author Research Team
 * @date 2026
 */

#ifndef FEATURE_EXTRACTION_H
#define FEATURE_EXTRACTION_H

#include "Common.h"
#include "DatasetIndex.hpp"
#include "MelSpectrogram.h"
#include "SignalPrep.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace orca {

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @struct FeatureExample
 * @brief Mảng 3 chiều (frames x bands x channels), row-major
 */
struct FeatureExample {
    std::vector<float> data;        ///< frames * bands * channels giá trị
    int frames;                     ///< Số time frames
    int bands;                      ///< Số mel bands
    int channels;                   ///< Số kênh (luôn 1)

    FeatureExample() : frames(0), bands(0), channels(1) {}

    /**
     * @brief Cấp phát và điền 0
     */
    void allocate(int f, int b, int c = 1) {
        frames = f;
        bands = b;
        channels = c;
        data.assign(static_cast<size_t>(f) * b * c, 0.0f);
    }

    float at(int f, int b, int c = 0) const {
        return data[(static_cast<size_t>(f) * bands + b) * channels + c];
    }

    void set(int f, int b, float value, int c = 0) {
        data[(static_cast<size_t>(f) * bands + b) * channels + c] = value;
    }

    size_t size() const { return data.size(); }

    bool sameShape(const FeatureExample& other) const {
        return frames == other.frames && bands == other.bands && channels == other.channels;
    }

    bool isAllZero() const {
        for (float v : data) {
            if (v != 0.0f) return false;
        }
        return true;
    }

    bool operator==(const FeatureExample& other) const {
        return sameShape(other) && data == other.data;
    }
};

/**
 * @struct LabeledExample
 * @brief Một cặp (label, example) - đơn vị được lưu xuống file features
 */
struct LabeledExample {
    std::string label;
    FeatureExample features;

    LabeledExample() = default;
    LabeledExample(std::string l, FeatureExample f)
        : label(std::move(l)), features(std::move(f)) {}
};

// ============================================================================
// MAIN CLASS
// ============================================================================

/**
 * @class FeatureExtractor
 * @brief Trích xuất một log-mel example cố định shape cho mỗi segment
 *
 * Cách sử dụng:
 * @code
 *   FeatureExtractor extractor;
 *   std::vector<LabeledExample> data = extractor.extractBatch(segments);
 * @endcode
 */
class FeatureExtractor {
public:
    /**
     * @param melConfig Cấu hình log-mel
     * @param exampleWindowSeconds Độ dài mỗi example (giây)
     * @param exampleHopSeconds Bước nhảy giữa các example (giây)
     */
    explicit FeatureExtractor(const MelConfig& melConfig = MelConfig(),
                              double exampleWindowSeconds = EXAMPLE_WINDOW_SECONDS,
                              double exampleHopSeconds = EXAMPLE_HOP_SECONDS);

    virtual ~FeatureExtractor() = default;

    // ========================================================================
    // MAIN EXTRACTION METHODS
    // ========================================================================

    /**
     * @brief Trích xuất example từ một segment
     *
     * @param segment Tham chiếu segment
     * @param example Output, luôn có shape (frames, bands, 1) nếu thành công
     * @return false nếu không đọc được audio
     */
    virtual bool extract(const SegmentRef& segment, FeatureExample& example) const;

    /**
     * @brief Bước (d)-(e) trên waveform mono đã ở SAMPLE_RATE
     *
     * @return true nếu có ít nhất một cửa sổ; false nếu example bị điền 0
     */
    bool extractFromWaveform(const std::vector<float>& waveform,
                             FeatureExample& example) const;

    /**
     * @brief Trích xuất toàn bộ segment (OpenMP), giữ nguyên thứ tự đầu vào
     *
     * Segment không đọc được (hoặc extract throw) bị bỏ qua và được log.
     *
     * @param segments Danh sách segment của một split
     * @param verbose In tiến độ (%) mỗi PROGRESS_INTERVAL segment
     */
    std::vector<LabeledExample> extractBatch(const std::vector<SegmentRef>& segments,
                                             bool verbose = true) const;

    // ========================================================================
    // ACCESSORS
    // ========================================================================

    int getExampleWindowFrames() const { return m_exampleWindowFrames; }
    int getExampleHopFrames() const { return m_exampleHopFrames; }
    int getNumBands() const { return m_melSpectrogram.getConfig().numMelBins; }

    /**
     * @brief Số samples (@ SAMPLE_RATE) tối thiểu để có một example thật
     */
    size_t getMinimumSamples() const;

    static constexpr size_t PROGRESS_INTERVAL = 500;

private:
    MelSpectrogram m_melSpectrogram;
    SignalProcessor m_signalProcessor;
    int m_exampleWindowFrames;
    int m_exampleHopFrames;
};

} // namespace orca

#endif // FEATURE_EXTRACTION_H
