#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct CaptionRecord {
    std::string image_id;
    std::string caption;
};

void to_json(nlohmann::json& j, const CaptionRecord& r);
void from_json(const nlohmann::json& j, CaptionRecord& r);

// image file stem, "data/images/test.jpg" -> "test"
std::string image_id_from_path(const std::string& image_path);

void save_caption_records(const std::string& path, const std::vector<CaptionRecord>& records);
std::vector<CaptionRecord> load_caption_records(const std::string& path);
