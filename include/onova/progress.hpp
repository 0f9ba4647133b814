#pragma once

namespace onova {

// Receives a completion fraction in [0, 1].
class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void Report(double fraction) = 0;
};

} // namespace onova
