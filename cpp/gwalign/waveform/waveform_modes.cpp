// cpp/gwalign/waveform/waveform_modes.cpp
#include "waveform_modes.hpp"
#include <cmath>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace gwalign {

WaveformModes::WaveformModes(std::vector<double> t,
                             std::vector<std::complex<double>> data,
                             int ell_min, int ell_max)
    : m_t(std::move(t)), m_data(std::move(data)),
      m_ell_min(ell_min), m_ell_max(ell_max), m_n_modes(0) {

    if (ell_min < 0 || ell_max < ell_min) {
        throw std::invalid_argument("WaveformModes: invalid ell range (" +
                                    std::to_string(ell_min) + ", " +
                                    std::to_string(ell_max) + ")");
    }
    m_n_modes = static_cast<std::size_t>(LM_total_size(ell_min, ell_max));

    if (m_t.size() < 2) {
        throw std::invalid_argument("WaveformModes: need at least 2 time samples");
    }
    for (std::size_t i = 1; i < m_t.size(); ++i) {
        if (!(m_t[i] > m_t[i - 1])) {
            throw std::invalid_argument("WaveformModes: time samples must be strictly increasing (index " +
                                        std::to_string(i) + ")");
        }
    }
    if (m_data.size() != m_t.size() * m_n_modes) {
        throw std::invalid_argument("WaveformModes: data has " + std::to_string(m_data.size()) +
                                    " entries, expected " + std::to_string(m_t.size()) +
                                    " x " + std::to_string(m_n_modes));
    }
}

std::size_t WaveformModes::index(int ell, int m) const {
    if (ell < m_ell_min || ell > m_ell_max || m < -ell || m > ell) {
        throw std::out_of_range("WaveformModes: mode (" + std::to_string(ell) + ", " +
                                std::to_string(m) + ") not stored");
    }
    return static_cast<std::size_t>(LM_index(ell, m, m_ell_min));
}

std::vector<std::complex<double>> WaveformModes::mode(int ell, int m) const {
    const std::size_t k = index(ell, m);
    std::vector<std::complex<double>> out(m_t.size());
    for (std::size_t i = 0; i < m_t.size(); ++i) {
        out[i] = m_data[i * m_n_modes + k];
    }
    return out;
}

std::vector<double> WaveformModes::power() const {
    std::vector<double> p(m_t.size(), 0.0);
    for (std::size_t i = 0; i < m_t.size(); ++i) {
        const std::complex<double>* row = &m_data[i * m_n_modes];
        double sum = 0.0;
        for (std::size_t k = 0; k < m_n_modes; ++k) {
            sum += std::norm(row[k]); // |h|^2
        }
        p[i] = sum;
    }
    return p;
}

std::vector<double> WaveformModes::norm() const {
    std::vector<double> n = power();
    for (double& v : n) v = std::sqrt(v);
    return n;
}

std::vector<int> WaveformModes::mode_weights() const {
    std::vector<int> w;
    w.reserve(m_n_modes);
    for (int ell = m_ell_min; ell <= m_ell_max; ++ell) {
        for (int m = -ell; m <= ell; ++m) {
            w.push_back(m);
        }
    }
    return w;
}

double WaveformModes::max_norm_time() const {
    std::vector<double> p = power();
    auto it = std::max_element(p.begin(), p.end());
    return m_t[static_cast<std::size_t>(it - p.begin())];
}

WaveformModes WaveformModes::time_shifted(double dt) const {
    std::vector<double> t_new(m_t);
    for (double& v : t_new) v += dt;
    return WaveformModes(std::move(t_new), m_data, m_ell_min, m_ell_max);
}

void WaveformModes::zero_mode(int ell, int m) {
    const std::size_t k = index(ell, m);
    for (std::size_t i = 0; i < m_t.size(); ++i) {
        m_data[i * m_n_modes + k] = 0.0;
    }
}

} // namespace gwalign
