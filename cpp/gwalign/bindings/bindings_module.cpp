#include <pybind11/pybind11.h>

namespace py = pybind11;

// 声明外部初始化函数
void init_bindings_waveform(py::module &m);
void init_bindings_align(py::module &m);

// 定义唯一的模块入口
PYBIND11_MODULE(_gwalign, m) {
    m.doc() = "Waveform time/phase alignment C++ backend";

    // 先注册 WaveformModes，align 的返回值依赖它
    init_bindings_waveform(m);
    init_bindings_align(m);
}
