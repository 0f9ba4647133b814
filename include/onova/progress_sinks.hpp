#pragma once

#include "onova/progress.hpp"

#include <string>

namespace onova {

// Publishes {"percent":N,"fraction":F} to path via write-temp-then-rename so
// readers never observe a torn file.
class FileProgressSink final : public IProgress {
public:
    explicit FileProgressSink(std::string path);

    void Report(double fraction) override;

private:
    std::string path_;
    int last_percent_ = -1;
};

} // namespace onova
