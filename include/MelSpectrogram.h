/**
 * @file MelSpectrogram.h
 * @brief Log-mel spectrogram and framing primitives
 *
 * waveform @ SAMPLE_RATE -> STFT magnitude -> mel filterbank -> log
 *
 * Thông số mặc định:
 *   - Window 25ms (400 samples), hop 10ms (160 samples) @ 16kHz
 *   - FFT size = lũy thừa 2 nhỏ nhất >= window (512)
 *   - 64 mel bands trong khoảng 125Hz - 7500Hz
 *   - log(mel + 0.01)
 *
 * @author Research Team
 * @date 2026
 */

#ifndef MEL_SPECTROGRAM_H
#define MEL_SPECTROGRAM_H

#include "Common.h"

#include <fftw3.h>

#include <vector>

namespace orca {

/// Ma trận [frame][band]
using FeatureMatrix = std::vector<std::vector<float>>;

// ============================================================================
// CONFIGURATION
// ============================================================================

/**
 * @struct MelConfig
 * @brief Cấu hình cho log-mel spectrogram
 */
struct MelConfig {
    int sampleRate = SAMPLE_RATE;                           ///< Hz
    double windowSeconds = STFT_WINDOW_LENGTH_SECONDS;      ///< STFT window
    double hopSeconds = STFT_HOP_LENGTH_SECONDS;            ///< STFT hop
    int numMelBins = NUM_MEL_BINS;                          ///< Số mel bands
    double lowerEdgeHz = MEL_MIN_HZ;                        ///< Tần số thấp nhất
    double upperEdgeHz = MEL_MAX_HZ;                        ///< Tần số cao nhất
    double logOffset = LOG_OFFSET;                          ///< log(x + offset)

    MelConfig() = default;
};

// ============================================================================
// MEL SPECTROGRAM CLASS
// ============================================================================

/**
 * @class MelSpectrogram
 * @brief Tính log-mel spectrogram bằng FFTW3
 *
 * FFT plan được tạo một lần trong constructor. compute() chỉ dùng buffer
 * cục bộ nên có thể gọi đồng thời từ nhiều thread.
 */
class MelSpectrogram {
public:
    explicit MelSpectrogram(const MelConfig& config = MelConfig());
    ~MelSpectrogram();

    MelSpectrogram(const MelSpectrogram&) = delete;
    MelSpectrogram& operator=(const MelSpectrogram&) = delete;

    /**
     * @brief Tính log-mel spectrogram
     *
     * Số frame = 1 + floor((n - window) / hop), bằng 0 nếu n < window.
     *
     * @param waveform Tín hiệu mono @ config.sampleRate
     * @param logMel Ma trận đầu ra [frame][band]
     */
    void compute(const std::vector<float>& waveform, FeatureMatrix& logMel) const;

    int getWindowLength() const { return m_windowLength; }
    int getHopLength() const { return m_hopLength; }
    int getFftLength() const { return m_fftLength; }
    const MelConfig& getConfig() const { return m_config; }

    /**
     * @brief Ma trận trọng số mel [spectrogram bin][mel band]
     */
    const std::vector<std::vector<float>>& getMelMatrix() const { return m_melMatrix; }

    /**
     * @brief HTK mel scale: 1127 * ln(1 + f / 700)
     */
    static double hzToMel(double freq);

private:
    void initWindow();
    void initMelMatrix();

    MelConfig m_config;
    int m_windowLength;
    int m_hopLength;
    int m_fftLength;
    int m_numSpectrogramBins;

    std::vector<float> m_window;                    ///< Periodic Hann window
    std::vector<std::vector<float>> m_melMatrix;    ///< [bin][band]

    float* m_planInput;                             ///< fftwf_malloc buffer
    fftwf_complex* m_planOutput;                    ///< fftwf_malloc buffer
    fftwf_plan m_plan;                              ///< r2c plan, m_fftLength
};

// ============================================================================
// FRAMING
// ============================================================================

/**
 * @brief Cắt trục thời gian của ma trận thành các cửa sổ cố định
 *
 * Số cửa sổ = max(0, 1 + floor((rows - windowLength) / hopLength)).
 *
 * @param matrix Ma trận [frame][band]
 * @param windowLength Số frame trong mỗi cửa sổ
 * @param hopLength Bước nhảy (frame)
 * @return Danh sách cửa sổ, mỗi cửa sổ là FeatureMatrix windowLength x bands
 */
std::vector<FeatureMatrix> frameRows(const FeatureMatrix& matrix,
                                     int windowLength,
                                     int hopLength);

} // namespace orca

#endif // MEL_SPECTROGRAM_H
