#include "onova/progress_mixer.hpp"

#include <algorithm>

namespace onova {

ProgressMixer::ProgressMixer(IProgress* sink) : sink_(sink) {}

IProgress* ProgressMixer::Split(double width) {
    std::lock_guard<std::mutex> lk(mu_);
    const double w = std::clamp(width, 0.0, std::max(0.0, 1.0 - allocated_));
    allocated_ += w;

    contributions_.push_back(0.0);
    splits_.push_back(std::make_unique<SplitReporter>(this, splits_.size(), w));
    return splits_.back().get();
}

double ProgressMixer::Current() const {
    std::lock_guard<std::mutex> lk(mu_);
    double total = 0.0;
    for (double c : contributions_) total += c;
    return std::clamp(total, 0.0, 1.0);
}

void ProgressMixer::SplitReporter::Report(double fraction) {
    owner_->ReportSplit(index_, std::clamp(fraction, 0.0, 1.0) * width_);
}

void ProgressMixer::ReportSplit(size_t index, double contribution) {
    std::lock_guard<std::mutex> lk(mu_);
    contributions_[index] = contribution;

    double total = 0.0;
    for (double c : contributions_) total += c;

    // Forwarded under the lock so the sink observes totals in the order they
    // were computed.
    if (sink_) sink_->Report(std::clamp(total, 0.0, 1.0));
}

} // namespace onova
