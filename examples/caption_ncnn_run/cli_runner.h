#pragma once

#include "options.h"

#include "caption_generator.h"
#include "ncnn_caption_model.h"

CaptionConfig make_caption_config(const Options& opt, const ncnn_caption_model& model);

int run_cli(const Options& opt, const ncnn_caption_model& model);
