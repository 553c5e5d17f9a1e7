#pragma once

#include "GuardDog/PipelineController.hpp"

#include <ctime>
#include <filesystem>
#include <string>

namespace guarddog {

// Self-contained HTML rendering of a RunSummary (inline CSS, no scripts, no
// external resources). A failed verification gate renders as a gate failure
// page without any check sections.
class HtmlReport {
  public:
    explicit HtmlReport(const RunSummary &summary);

    std::string render() const;

    // Writes GuardDog_Report_YYYYMMDD_HHMMSS.html into directory, creating it
    // when needed. The file appears complete or not at all. Throws IoError.
    std::filesystem::path write(const std::filesystem::path &directory) const;

    static std::string escape(const std::string &value);
    static std::string fileNameFor(std::time_t startedAt);
    static std::string bannerMessage(const RunSummary &summary);

  private:
    const RunSummary &summary_;
};

} // namespace guarddog
