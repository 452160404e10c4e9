// cpp/gwalign/align/alignment_window.cpp
#include "alignment_window.hpp"
#include "../align_params.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace gwalign {

namespace {

void check_contained(const WaveformModes& w, const char* name, double t1, double t2) {
    if (w.t_min() > t1 || w.t_max() < t2) {
        std::ostringstream msg;
        msg << "(t1,t2)=(" << t1 << ", " << t2 << ") not contained in "
            << name << ".t, which spans (" << w.t_min() << ", " << w.t_max() << ")";
        throw InvalidWindow(msg.str());
    }
}

} // namespace

void validate_window(const WaveformModes& wa, const WaveformModes& wb, double t1, double t2) {
    // !(t1 < t2) 同时挡住 NaN
    if (!(t1 < t2)) {
        std::ostringstream msg;
        msg << "(t1,t2)=(" << t1 << ", " << t2 << ") is out of order";
        throw InvalidWindow(msg.str());
    }
    check_contained(wa, "wa", t1, t2);
    check_contained(wb, "wb", t1, t2);
}

void window_range(const std::vector<double>& t, double t1, double t2,
                  std::size_t& begin, std::size_t& end) {
    begin = static_cast<std::size_t>(std::lower_bound(t.begin(), t.end(), t1) - t.begin());
    end = static_cast<std::size_t>(std::upper_bound(t.begin(), t.end(), t2) - t.begin());
    if (end < begin) end = begin;
}

std::size_t count_in_window(const std::vector<double>& t, double t1, double t2) {
    std::size_t begin, end;
    window_range(t, t1, t2, begin, end);
    return end - begin;
}

std::size_t nearest_index(const std::vector<double>& t, double x) {
    auto it = std::lower_bound(t.begin(), t.end(), x);
    if (it == t.begin()) return 0;
    if (it == t.end()) return t.size() - 1;
    std::size_t hi = static_cast<std::size_t>(it - t.begin());
    std::size_t lo = hi - 1;
    return (std::abs(t[hi] - x) < std::abs(t[lo] - x)) ? hi : lo;
}

} // namespace gwalign
