#pragma once

#include "photo_triage/core/types.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace photo_triage::pipeline {

nlohmann::json report_to_json(const PipelineReport &report);

// Atomic replace of `path` with the pretty-printed report.
void write_report(const PipelineReport &report, const fs::path &path);

// Human-readable plan of the partition, used for dry runs.
std::string format_preview(const PipelineReport &report);

} // namespace photo_triage::pipeline
