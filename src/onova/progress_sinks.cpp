#include "onova/progress_sinks.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>

namespace onova {

FileProgressSink::FileProgressSink(std::string path) : path_(std::move(path)) {}

void FileProgressSink::Report(double fraction) {
    const double f = std::clamp(fraction, 0.0, 1.0);
    const int percent = static_cast<int>(std::floor(f * 100.0));
    if (percent == last_percent_)
        return;

    const nlohmann::json status = {{"percent", percent}, {"fraction", f}};

    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good())
        return;
    os << status.dump();
    os.close();
    if (!os.good())
        return;

    if (std::rename(tmp_path.c_str(), path_.c_str()) == 0) {
        last_percent_ = percent;
    }
}

} // namespace onova
