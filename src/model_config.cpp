#include "model_config.h"

#include <fstream>
#include <stdexcept>

using nlohmann::json;

ModelConfig parse_model_config(const json& config, const std::string& model_path) {
    ModelConfig mc;

    auto file = [&](const json& section, const char* key) {
        return model_path + "/" + section.at(key).get<std::string>();
    };

    try {
        const json& params = config.at("params");
        mc.encoder_param = file(params, "encoder_param");
        mc.encoder_bin = file(params, "encoder_bin");
        mc.embed_token_param = file(params, "embed_token_param");
        mc.embed_token_bin = file(params, "embed_token_bin");
        mc.decoder_param = file(params, "decoder_param");
        mc.decoder_bin = file(params, "decoder_bin");
        mc.proj_out_param = file(params, "proj_out_param");
        mc.proj_out_bin = file(params, "proj_out_bin");

        const json& tokenizer = config.at("tokenizer");
        mc.vocab_file = file(tokenizer, "vocab_file");
        if (tokenizer.contains("bos")) mc.special_tokens.bos_token = tokenizer["bos"].get<std::string>();
        if (tokenizer.contains("eos")) mc.special_tokens.eos_token = tokenizer["eos"].get<std::string>();
        if (tokenizer.contains("pad")) mc.special_tokens.pad_token = tokenizer["pad"].get<std::string>();
        if (tokenizer.contains("unk")) mc.special_tokens.unk_token = tokenizer["unk"].get<std::string>();

        if (config.contains("setting")) {
            const json& setting = config["setting"];
            mc.image_size = setting.value("image_size", mc.image_size);
            mc.max_seq_len = setting.value("max_seq_len", mc.max_seq_len);
            if (setting.contains("mean")) mc.norm_mean = setting["mean"].get<std::array<float, 3>>();
            if (setting.contains("std")) mc.norm_std = setting["std"].get<std::array<float, 3>>();
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid model.json: ") + e.what());
    }

    if (mc.image_size <= 0) {
        throw std::runtime_error("invalid model.json: image_size must be positive");
    }
    if (mc.max_seq_len <= 0) {
        throw std::runtime_error("invalid model.json: max_seq_len must be positive");
    }
    for (float s : mc.norm_std) {
        if (s <= 0.f) throw std::runtime_error("invalid model.json: std entries must be positive");
    }
    return mc;
}

ModelConfig load_model_config(const std::string& model_path) {
    std::ifstream ifs(model_path + "/model.json");
    if (!ifs) {
        throw std::runtime_error("open " + model_path + "/model.json failed");
    }

    json config;
    try {
        ifs >> config;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("parse model.json failed: ") + e.what());
    }
    return parse_model_config(config, model_path);
}
