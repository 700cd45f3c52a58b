#pragma once

#include "photo_finish/pipeline/finishing_pipeline.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace photo_finish::pipeline {

namespace fs = std::filesystem;

struct BatchItem {
    std::string image_id;
    fs::path image_path;
    fs::path mask_path;  // empty: use the image's own alpha channel
};

struct BatchItemResult {
    std::string image_id;
    std::string status;  // ok | degraded | error
    std::string failed_stage;
    std::string error;
    fs::path output_path;
};

struct BatchSummary {
    int ok = 0;
    int degraded = 0;
    int failed = 0;
    std::vector<BatchItemResult> items;  // same order as the input items

    nlohmann::json to_json() const;
};

// Load image and mask for one item. Without a mask path the image must carry
// an alpha channel, which is split off and used as the mask.
FinishRequest load_finish_request(const std::string& image_id, const fs::path& image_path,
                                  const fs::path& mask_path);

// Images in input_dir matching pattern, sorted by name. A mask is looked up in
// mask_dir as <stem>.png, <stem>_mask.png or the same file name. The image id
// is the file stem, or <stem>_<ext> when several inputs share a stem; ids are
// unique within the batch.
std::vector<BatchItem> collect_batch_items(const fs::path& input_dir, const fs::path& mask_dir,
                                           const std::string& pattern);

// Output paths for one image id: <out_dir>/<id>.png and <out_dir>/<id>.finish.json
fs::path output_image_path(const fs::path& out_dir, const std::string& image_id);
fs::path output_report_path(const fs::path& out_dir, const std::string& image_id);

// Finish one item and write its PNG (and report). Errors propagate.
FinishResult finish_item(const FinishingPipeline& pipeline, const BatchItem& item,
                         const fs::path& out_dir, bool write_report, std::ostream& log,
                         const std::atomic<bool>* stop = nullptr);

// Finish all items on up to `workers` threads. Per-item failures are recorded
// in the summary and never stop the other items.
BatchSummary finish_batch(const FinishingPipeline& pipeline, const std::vector<BatchItem>& items,
                          const fs::path& out_dir, int workers, bool write_reports,
                          std::ostream& log, const std::atomic<bool>* stop = nullptr);

} // namespace photo_finish::pipeline
