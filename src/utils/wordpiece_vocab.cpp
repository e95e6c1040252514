#include "wordpiece_vocab.h"

#include <fstream>
#include <stdexcept>

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

WordPieceVocab::WordPieceVocab(std::vector<std::string> pieces, const SpecialTokensConfig& special)
    : id_to_piece(std::move(pieces)) {
    for (int i = 0; i < (int)id_to_piece.size(); i++) {
        // first occurrence wins on duplicated lines
        piece_to_id.emplace(id_to_piece[i], i);
    }

    auto lookup = [&](const std::string& token, bool required) {
        if (token.empty()) return -1;
        auto it = piece_to_id.find(token);
        if (it == piece_to_id.end()) {
            if (required) throw std::runtime_error("special token " + token + " not found in vocab");
            return -1;
        }
        special_ids.insert(it->second);
        return it->second;
    };

    bos = lookup(special.bos_token, true);
    eos = lookup(special.eos_token, true);
    lookup(special.pad_token, false);
    unk = lookup(special.unk_token, false);
}

WordPieceVocab WordPieceVocab::LoadFromFile(const std::string& vocab_file, const SpecialTokensConfig& special) {
    std::ifstream ifs(vocab_file);
    if (!ifs) {
        throw std::runtime_error("open vocab file " + vocab_file + " failed");
    }

    std::vector<std::string> pieces;
    std::string line;
    while (std::getline(ifs, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        pieces.push_back(line);
    }
    if (pieces.empty()) {
        throw std::runtime_error("vocab file " + vocab_file + " is empty");
    }
    return WordPieceVocab(std::move(pieces), special);
}

void WordPieceVocab::AddAdditionalSpecialToken(const std::string& token) {
    auto it = piece_to_id.find(token);
    if (it == piece_to_id.end()) {
        int id = (int)id_to_piece.size();
        id_to_piece.push_back(token);
        it = piece_to_id.emplace(token, id).first;
    }
    special_ids.insert(it->second);
}

const std::string& WordPieceVocab::id_to_token(int id) const {
    if (id < 0 || id >= (int)id_to_piece.size()) {
        if (unk >= 0) return id_to_piece[unk];
        throw std::out_of_range("token id " + std::to_string(id) + " out of vocab range");
    }
    return id_to_piece[id];
}

std::string WordPieceVocab::clean_up_tokenization(const std::string& text) {
    std::string s = text;
    replace_all(s, " .", ".");
    replace_all(s, " ?", "?");
    replace_all(s, " !", "!");
    replace_all(s, " ,", ",");
    replace_all(s, " ' ", "'");
    replace_all(s, " n't", "n't");
    replace_all(s, " 'm", "'m");
    replace_all(s, " 's", "'s");
    replace_all(s, " 've", "'ve");
    replace_all(s, " 're", "'re");
    return s;
}

std::string WordPieceVocab::detokenize(const std::vector<int>& tokens, bool skip_special) const {
    std::string text;
    for (int id : tokens) {
        if (skip_special && is_special(id)) continue;

        const std::string& piece = id_to_token(id);
        if (piece.size() > 2 && piece.compare(0, 2, "##") == 0) {
            text += piece.substr(2);
            continue;
        }
        if (!text.empty()) text += ' ';
        text += piece;
    }
    return clean_up_tokenization(text);
}
