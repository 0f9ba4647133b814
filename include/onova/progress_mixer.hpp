#pragma once

#include "onova/progress.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace onova {

// Splits one downstream sink into consecutive weighted intervals. Each split
// reports a local fraction; the sink receives the sum of all split
// contributions. Safe for concurrent reporting from different splits.
class ProgressMixer {
  public:
    explicit ProgressMixer(IProgress* sink);
    ProgressMixer(const ProgressMixer&) = delete;
    ProgressMixer& operator=(const ProgressMixer&) = delete;

    // Reserves the next interval of the given width. Widths past the end of
    // [0, 1] are truncated. The returned reporter lives as long as the mixer.
    IProgress* Split(double width);

    double Current() const;

  private:
    class SplitReporter final : public IProgress {
      public:
        SplitReporter(ProgressMixer* owner, size_t index, double width)
            : owner_(owner), index_(index), width_(width) {}
        void Report(double fraction) override;

      private:
        ProgressMixer* owner_;
        size_t index_;
        double width_;
    };

    void ReportSplit(size_t index, double contribution);

    IProgress* sink_;
    mutable std::mutex mu_;
    double allocated_ = 0.0;
    std::vector<double> contributions_;
    std::vector<std::unique_ptr<SplitReporter>> splits_;
};

} // namespace onova
