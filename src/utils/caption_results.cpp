#include "caption_results.h"

#include <fstream>
#include <stdexcept>

using nlohmann::json;

void to_json(json& j, const CaptionRecord& r) {
    j = json{{"image_id", r.image_id}, {"caption", r.caption}};
}

void from_json(const json& j, CaptionRecord& r) {
    j.at("image_id").get_to(r.image_id);
    j.at("caption").get_to(r.caption);
}

std::string image_id_from_path(const std::string& image_path) {
    size_t begin = image_path.find_last_of("/\\");
    begin = (begin == std::string::npos) ? 0 : begin + 1;

    size_t end = image_path.find_last_of('.');
    if (end == std::string::npos || end < begin) end = image_path.size();

    return image_path.substr(begin, end - begin);
}

void save_caption_records(const std::string& path, const std::vector<CaptionRecord>& records) {
    std::ofstream ofs(path);
    if (!ofs) {
        throw std::runtime_error("open " + path + " for writing failed");
    }
    ofs << json(records).dump();
    if (!ofs) {
        throw std::runtime_error("write " + path + " failed");
    }
}

std::vector<CaptionRecord> load_caption_records(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("open " + path + " failed");
    }
    try {
        json j;
        ifs >> j;
        return j.get<std::vector<CaptionRecord>>();
    } catch (const json::exception& e) {
        throw std::runtime_error("parse " + path + " failed: " + e.what());
    }
}
