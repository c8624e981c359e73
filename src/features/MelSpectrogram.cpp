/**
 * @file MelSpectrogram.cpp
 * @brief Implementation of the log-mel spectrogram and framing primitives
 *
 * Quy trình cho mỗi STFT frame:
 *   1. Nhân periodic Hann window
 *   2. Zero-padding lên m_fftLength và FFT (FFTW3, real-to-complex)
 *   3. Magnitude |X[k]|
 *   4. Nhân ma trận mel [bin][band]
 *   5. log(mel + logOffset)
 *
 * @author Research Team
 * @date 2026
 */

#include "MelSpectrogram.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <memory>
#include <new>
#include <stdexcept>

namespace orca {

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {

int nextPowerOf2(int n) {
    int p = 1;
    while (p < n) p <<= 1;
    return p;
}

/// RAII cho buffer cấp phát bởi fftwf_malloc
struct FftwFree {
    void operator()(void* p) const { fftwf_free(p); }
};

} // namespace

// ============================================================================
// CONSTRUCTOR & DESTRUCTOR
// ============================================================================

MelSpectrogram::MelSpectrogram(const MelConfig& config)
    : m_config(config)
    , m_windowLength(static_cast<int>(std::lround(config.sampleRate * config.windowSeconds)))
    , m_hopLength(static_cast<int>(std::lround(config.sampleRate * config.hopSeconds)))
    , m_fftLength(0)
    , m_numSpectrogramBins(0)
    , m_planInput(nullptr)
    , m_planOutput(nullptr)
    , m_plan(nullptr)
{
    if (m_windowLength <= 0 || m_hopLength <= 0 || config.numMelBins <= 0) {
        throw ConfigurationError("invalid mel spectrogram configuration");
    }
    if (config.lowerEdgeHz < 0.0 || config.upperEdgeHz <= config.lowerEdgeHz ||
        config.upperEdgeHz > config.sampleRate / 2.0) {
        throw ConfigurationError("mel frequency bounds must satisfy 0 <= lower < upper <= nyquist");
    }

    m_fftLength = nextPowerOf2(m_windowLength);
    m_numSpectrogramBins = m_fftLength / 2 + 1;

    initWindow();
    initMelMatrix();

    // Plan được tạo một lần; compute() dùng fftwf_execute_dft_r2c với buffer riêng
    m_planInput = static_cast<float*>(fftwf_malloc(sizeof(float) * m_fftLength));
    m_planOutput = static_cast<fftwf_complex*>(
        fftwf_malloc(sizeof(fftwf_complex) * m_numSpectrogramBins));
    if (!m_planInput || !m_planOutput) {
        fftwf_free(m_planInput);
        fftwf_free(m_planOutput);
        throw std::bad_alloc();
    }

    m_plan = fftwf_plan_dft_r2c_1d(m_fftLength, m_planInput, m_planOutput, FFTW_ESTIMATE);
    if (!m_plan) {
        fftwf_free(m_planInput);
        fftwf_free(m_planOutput);
        throw std::runtime_error("[MelSpectrogram] FFTW plan creation failed");
    }
}

MelSpectrogram::~MelSpectrogram() {
    fftwf_destroy_plan(m_plan);
    fftwf_free(m_planInput);
    fftwf_free(m_planOutput);
}

// ============================================================================
// INITIALIZATION METHODS
// ============================================================================

void MelSpectrogram::initWindow() {
    /**
     * Periodic Hann window: w[n] = 0.5 - 0.5 * cos(2πn / N)
     */

    m_window.resize(m_windowLength);
    for (int n = 0; n < m_windowLength; ++n) {
        m_window[n] = static_cast<float>(0.5 - 0.5 * std::cos(2.0 * M_PI * n / m_windowLength));
    }
}

void MelSpectrogram::initMelMatrix() {
    /**
     * 1. Tần số (Hz) của mỗi spectrogram bin: linspace(0, nyquist, bins)
     * 2. Chuyển sang mel
     * 3. numMelBins + 2 biên đều nhau trên mel scale
     * 4. Trọng số tam giác = max(0, min(lowerSlope, upperSlope))
     * 5. Bin DC luôn có trọng số 0
     */

    const int numBands = m_config.numMelBins;
    const double nyquist = m_config.sampleRate / 2.0;

    std::vector<double> binsMel(m_numSpectrogramBins);
    for (int k = 0; k < m_numSpectrogramBins; ++k) {
        double hz = nyquist * k / (m_numSpectrogramBins - 1);
        binsMel[k] = hzToMel(hz);
    }

    const double melLow = hzToMel(m_config.lowerEdgeHz);
    const double melHigh = hzToMel(m_config.upperEdgeHz);
    std::vector<double> bandEdges(numBands + 2);
    for (int i = 0; i < numBands + 2; ++i) {
        bandEdges[i] = melLow + i * (melHigh - melLow) / (numBands + 1);
    }

    m_melMatrix.assign(m_numSpectrogramBins, std::vector<float>(numBands, 0.0f));

    for (int m = 0; m < numBands; ++m) {
        double lowerEdge = bandEdges[m];
        double center = bandEdges[m + 1];
        double upperEdge = bandEdges[m + 2];

        for (int k = 1; k < m_numSpectrogramBins; ++k) {
            double lowerSlope = (binsMel[k] - lowerEdge) / (center - lowerEdge);
            double upperSlope = (upperEdge - binsMel[k]) / (upperEdge - center);
            double weight = std::max(0.0, std::min(lowerSlope, upperSlope));
            m_melMatrix[k][m] = static_cast<float>(weight);
        }
    }
}

// ============================================================================
// MAIN COMPUTATION
// ============================================================================

void MelSpectrogram::compute(const std::vector<float>& waveform, FeatureMatrix& logMel) const {
    logMel.clear();

    const int numSamples = static_cast<int>(waveform.size());
    if (numSamples < m_windowLength) {
        return;
    }

    const int numFrames = 1 + (numSamples - m_windowLength) / m_hopLength;
    const int numBands = m_config.numMelBins;
    logMel.assign(numFrames, std::vector<float>(numBands, 0.0f));

    std::unique_ptr<void, FftwFree> inputBuffer(fftwf_malloc(sizeof(float) * m_fftLength));
    std::unique_ptr<void, FftwFree> outputBuffer(
        fftwf_malloc(sizeof(fftwf_complex) * m_numSpectrogramBins));
    if (!inputBuffer || !outputBuffer) {
        throw std::bad_alloc();
    }
    float* input = static_cast<float*>(inputBuffer.get());
    fftwf_complex* output = static_cast<fftwf_complex*>(outputBuffer.get());

    std::vector<float> magnitude(m_numSpectrogramBins);

    for (int t = 0; t < numFrames; ++t) {
        const float* frame = waveform.data() + static_cast<size_t>(t) * m_hopLength;

        // ----- BƯỚC 1 + 2: Window + zero-padding -----
        std::fill(input, input + m_fftLength, 0.0f);
        for (int n = 0; n < m_windowLength; ++n) {
            input[n] = frame[n] * m_window[n];
        }

        fftwf_execute_dft_r2c(m_plan, input, output);

        // ----- BƯỚC 3: Magnitude -----
        for (int k = 0; k < m_numSpectrogramBins; ++k) {
            float re = output[k][0];
            float im = output[k][1];
            magnitude[k] = std::sqrt(re * re + im * im);
        }

        // ----- BƯỚC 4 + 5: Mel + log -----
        std::vector<float>& row = logMel[t];
        for (int k = 0; k < m_numSpectrogramBins; ++k) {
            if (magnitude[k] == 0.0f) continue;
            const std::vector<float>& weights = m_melMatrix[k];
            for (int m = 0; m < numBands; ++m) {
                row[m] += magnitude[k] * weights[m];
            }
        }
        for (int m = 0; m < numBands; ++m) {
            row[m] = static_cast<float>(std::log(row[m] + m_config.logOffset));
        }
    }
}

double MelSpectrogram::hzToMel(double freq) {
    return 1127.0 * std::log(1.0 + freq / 700.0);
}

// ============================================================================
// FRAMING
// ============================================================================

std::vector<FeatureMatrix> frameRows(const FeatureMatrix& matrix,
                                     int windowLength,
                                     int hopLength) {
    if (windowLength <= 0 || hopLength <= 0) {
        throw ConfigurationError("frame window and hop must be positive");
    }

    std::vector<FeatureMatrix> windows;
    const int numRows = static_cast<int>(matrix.size());
    if (numRows < windowLength) {
        return windows;
    }

    const int numWindows = 1 + (numRows - windowLength) / hopLength;
    windows.reserve(numWindows);

    for (int w = 0; w < numWindows; ++w) {
        auto first = matrix.begin() + static_cast<std::ptrdiff_t>(w) * hopLength;
        windows.emplace_back(first, first + windowLength);
    }

    return windows;
}

} // namespace orca
