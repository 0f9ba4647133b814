#pragma once

#include "util/result.hpp"

#include <string>

namespace onova {

// Supplies the helper executable bytes and writes them to a path.
class IUpdaterBinarySource {
  public:
    virtual ~IUpdaterBinarySource() = default;

    // Overwrites path atomically; the result is executable (0755).
    virtual Result WriteTo(const std::string& path) const = 0;
};

// Copies an installed onova-updater executable.
class FileUpdaterBinarySource final : public IUpdaterBinarySource {
  public:
    explicit FileUpdaterBinarySource(std::string source_path);

    Result WriteTo(const std::string& path) const override;

    const std::string& SourcePath() const { return source_path_; }

  private:
    std::string source_path_;
};

inline constexpr const char kUpdaterExecutableName[] = "onova-updater";

} // namespace onova
