#include "photo_finish/pipeline/batch_runner.hpp"
#include "photo_finish/core/errors.hpp"
#include "photo_finish/core/utils.hpp"
#include "photo_finish/io/image_io.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>

namespace photo_finish::pipeline {

using json = nlohmann::json;

json BatchSummary::to_json() const {
    json arr = json::array();
    for (const auto& it : items) {
        json j = {{"image_id", it.image_id}, {"status", it.status}};
        if (!it.output_path.empty()) j["output"] = it.output_path.string();
        if (!it.failed_stage.empty()) j["failed_stage"] = it.failed_stage;
        if (!it.error.empty()) j["error"] = it.error;
        arr.push_back(j);
    }
    return {{"ok", ok}, {"degraded", degraded}, {"failed", failed}, {"items", arr}};
}

FinishRequest load_finish_request(const std::string& image_id, const fs::path& image_path,
                                  const fs::path& mask_path) {
    FinishRequest req;
    req.image_id = image_id.empty() ? image_path.stem().string() : image_id;
    req.image = io::read_image(image_path);

    if (!mask_path.empty()) {
        req.mask = io::read_mask(mask_path);
        require_same_size(req.image, req.mask, "mask " + mask_path.string());
        return req;
    }
    if (!req.image.has_alpha()) {
        throw IOError("No mask given and " + image_path.string() + " has no alpha channel");
    }
    auto [rgb, alpha] = io::split_alpha(req.image);
    req.image = rgb;
    req.mask = alpha;
    return req;
}

std::vector<BatchItem> collect_batch_items(const fs::path& input_dir, const fs::path& mask_dir,
                                           const std::string& pattern) {
    if (!fs::is_directory(input_dir)) {
        throw IOError("Input directory not found: " + input_dir.string());
    }
    const std::vector<fs::path> files = core::discover_files(input_dir, pattern);

    std::map<std::string, int> stem_count;
    for (const auto& path : files) {
        ++stem_count[path.stem().string()];
    }

    std::set<std::string> used_ids;
    std::vector<BatchItem> items;
    for (const auto& path : files) {
        const std::string stem = path.stem().string();
        BatchItem item;
        item.image_id = stem;
        // shirt.jpg and shirt.png would both write shirt.png
        if (stem_count[stem] > 1) {
            std::string ext = core::to_lower(path.extension().string());
            if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
            item.image_id = stem + "_" + ext;
        }
        const std::string base_id = item.image_id;
        for (int n = 2; used_ids.count(item.image_id); ++n) {
            item.image_id = base_id + "_" + std::to_string(n);
        }
        used_ids.insert(item.image_id);

        item.image_path = path;
        if (!mask_dir.empty()) {
            for (const fs::path& candidate : {mask_dir / (stem + ".png"),
                                              mask_dir / (stem + "_mask.png"),
                                              mask_dir / path.filename()}) {
                if (fs::exists(candidate)) {
                    item.mask_path = candidate;
                    break;
                }
            }
        }
        items.push_back(std::move(item));
    }
    return items;
}

fs::path output_image_path(const fs::path& out_dir, const std::string& image_id) {
    return out_dir / (image_id + ".png");
}

fs::path output_report_path(const fs::path& out_dir, const std::string& image_id) {
    return out_dir / (image_id + ".finish.json");
}

FinishResult finish_item(const FinishingPipeline& pipeline, const BatchItem& item,
                         const fs::path& out_dir, bool write_report, std::ostream& log,
                         const std::atomic<bool>* stop) {
    FinishRequest req = load_finish_request(item.image_id, item.image_path, item.mask_path);
    FinishResult result = pipeline.run(req, log, stop);

    io::write_png(output_image_path(out_dir, req.image_id), result.image);
    if (write_report) {
        json report = result.to_json();
        report["input"] = item.image_path.string();
        if (!item.mask_path.empty()) report["mask"] = item.mask_path.string();
        core::write_text(output_report_path(out_dir, req.image_id), report.dump(2) + "\n");
    }
    return result;
}

BatchSummary finish_batch(const FinishingPipeline& pipeline, const std::vector<BatchItem>& items,
                          const fs::path& out_dir, int workers, bool write_reports,
                          std::ostream& log, const std::atomic<bool>* stop) {
    BatchSummary summary;
    summary.items.resize(items.size());
    if (items.empty()) {
        return summary;
    }

    int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cpu_cores <= 0) cpu_cores = 1;
    int n_workers = std::max(1, std::min(workers, cpu_cores));
    n_workers = std::min<int>(n_workers, static_cast<int>(items.size()));

    std::mutex log_mutex;
    std::atomic<size_t> next_item{0};
    std::atomic<size_t> done{0};

    auto process_item = [&](size_t i) {
        const BatchItem& item = items[i];
        BatchItemResult& out = summary.items[i];
        out.image_id = item.image_id;

        std::ostringstream item_log;
        std::string progress;
        try {
            FinishResult r = finish_item(pipeline, item, out_dir, write_reports, item_log, stop);
            out.status = r.status;
            out.output_path = output_image_path(out_dir, r.image_id);
            progress = r.status;
        } catch (const PhotoFinishError& e) {
            out.status = "error";
            out.failed_stage = e.stage();
            out.error = e.what();
            progress = std::string("error: ") + e.what();
        } catch (const std::exception& e) {
            out.status = "error";
            out.error = e.what();
            progress = std::string("error: ") + e.what();
        }

        const size_t n = done.fetch_add(1) + 1;
        std::lock_guard<std::mutex> lock(log_mutex);
        log << item_log.str();
        log.flush();
        std::cout << "[BATCH] " << n << "/" << items.size() << " " << item.image_id << " "
                  << progress << std::endl;
    };

    // Parallelism is across images; keep OpenCV single-threaded per worker.
    const int prev_cv_threads = cv::getNumThreads();
    if (n_workers > 1) cv::setNumThreads(1);

    std::vector<std::thread> threads;
    for (int w = 0; w < n_workers; ++w) {
        threads.emplace_back([&]() {
            while (true) {
                const size_t i = next_item.fetch_add(1);
                if (i >= items.size()) break;
                process_item(i);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    cv::setNumThreads(prev_cv_threads);

    for (const auto& it : summary.items) {
        if (it.status == "ok") ++summary.ok;
        else if (it.status == "degraded") ++summary.degraded;
        else ++summary.failed;
    }
    return summary;
}

} // namespace photo_finish::pipeline
