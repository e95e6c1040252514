#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "model_config.h"

using nlohmann::json;

namespace {

json minimal_config() {
    return json::parse(R"({
        "params": {
            "encoder_param": "encoder.ncnn.param",
            "encoder_bin": "encoder.ncnn.bin",
            "embed_token_param": "embed_token.ncnn.param",
            "embed_token_bin": "embed_token.ncnn.bin",
            "decoder_param": "decoder.ncnn.param",
            "decoder_bin": "decoder.ncnn.bin",
            "proj_out_param": "proj_out.ncnn.param",
            "proj_out_bin": "proj_out.ncnn.bin"
        },
        "tokenizer": {
            "vocab_file": "vocab.txt"
        }
    })");
}

} // namespace

TEST(ModelConfigTest, ResolvesFilesAgainstModelPath) {
    ModelConfig mc = parse_model_config(minimal_config(), "assets/caption");
    EXPECT_EQ(mc.encoder_param, "assets/caption/encoder.ncnn.param");
    EXPECT_EQ(mc.decoder_bin, "assets/caption/decoder.ncnn.bin");
    EXPECT_EQ(mc.proj_out_param, "assets/caption/proj_out.ncnn.param");
    EXPECT_EQ(mc.vocab_file, "assets/caption/vocab.txt");
}

TEST(ModelConfigTest, DefaultsWhenSettingIsAbsent) {
    ModelConfig mc = parse_model_config(minimal_config(), ".");
    EXPECT_EQ(mc.image_size, 224);
    EXPECT_EQ(mc.max_seq_len, 256);
    EXPECT_FLOAT_EQ(mc.norm_mean[0], 0.485f);
    EXPECT_FLOAT_EQ(mc.norm_std[2], 0.225f);
    EXPECT_EQ(mc.special_tokens.bos_token, "[CLS]");
    EXPECT_EQ(mc.special_tokens.eos_token, "[SEP]");
}

TEST(ModelConfigTest, ReadsSettingAndSpecialTokens) {
    json config = minimal_config();
    config["tokenizer"]["bos"] = "<s>";
    config["tokenizer"]["eos"] = "</s>";
    config["setting"] = {
        {"image_size", 384},
        {"max_seq_len", 64},
        {"mean", {0.5, 0.5, 0.5}},
        {"std", {0.25, 0.25, 0.25}}
    };

    ModelConfig mc = parse_model_config(config, ".");
    EXPECT_EQ(mc.image_size, 384);
    EXPECT_EQ(mc.max_seq_len, 64);
    EXPECT_FLOAT_EQ(mc.norm_mean[1], 0.5f);
    EXPECT_FLOAT_EQ(mc.norm_std[0], 0.25f);
    EXPECT_EQ(mc.special_tokens.bos_token, "<s>");
    EXPECT_EQ(mc.special_tokens.eos_token, "</s>");
}

TEST(ModelConfigTest, MissingKeysAreReported) {
    json config = minimal_config();
    config["params"].erase("decoder_bin");
    EXPECT_THROW(parse_model_config(config, "."), std::runtime_error);

    config = minimal_config();
    config.erase("tokenizer");
    EXPECT_THROW(parse_model_config(config, "."), std::runtime_error);
}

TEST(ModelConfigTest, InvalidSettingValues) {
    json config = minimal_config();
    config["setting"] = {{"image_size", "large"}};
    EXPECT_THROW(parse_model_config(config, "."), std::runtime_error);

    config["setting"] = {{"image_size", 0}};
    EXPECT_THROW(parse_model_config(config, "."), std::runtime_error);

    config["setting"] = {{"std", {0.2, 0.0, 0.2}}};
    EXPECT_THROW(parse_model_config(config, "."), std::runtime_error);
}

TEST(ModelConfigTest, LoadFromDirectory) {
    auto dir = std::filesystem::temp_directory_path() / "ncnn_caption_model_config_test";
    std::filesystem::create_directories(dir);
    {
        std::ofstream ofs(dir / "model.json");
        ofs << minimal_config().dump(2);
    }

    ModelConfig mc = load_model_config(dir.string());
    EXPECT_EQ(mc.encoder_bin, dir.string() + "/encoder.ncnn.bin");

    std::filesystem::remove_all(dir);
    EXPECT_THROW(load_model_config(dir.string()), std::runtime_error);
}
