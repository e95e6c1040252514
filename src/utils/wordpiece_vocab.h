#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "caption_model.h"

struct SpecialTokensConfig {
    std::string bos_token = "[CLS]";
    std::string eos_token = "[SEP]";
    std::string pad_token = "[PAD]";
    std::string unk_token = "[UNK]";
};

// BERT style vocab.txt, one piece per line, id = line number.
// Continuation pieces carry a "##" prefix.
class WordPieceVocab : public Vocabulary {
public:
    WordPieceVocab(std::vector<std::string> pieces, const SpecialTokensConfig& special);

    static WordPieceVocab LoadFromFile(const std::string& vocab_file, const SpecialTokensConfig& special = SpecialTokensConfig{});

    void AddAdditionalSpecialToken(const std::string& token);

    int bos_id() const override { return bos; }
    int eos_id() const override { return eos; }

    std::string detokenize(const std::vector<int>& tokens, bool skip_special) const override;

    int vocab_size() const { return (int)id_to_piece.size(); }
    const std::unordered_map<std::string, int>& token_to_id() const { return piece_to_id; }
    const std::string& id_to_token(int id) const;

    bool is_special(int id) const { return special_ids.count(id) != 0; }

private:
    static std::string clean_up_tokenization(const std::string& text);

    std::vector<std::string> id_to_piece;
    std::unordered_map<std::string, int> piece_to_id;
    std::unordered_set<int> special_ids;

    int bos = -1;
    int eos = -1;
    int unk = -1;
};
