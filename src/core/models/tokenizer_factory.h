#pragma once

#include "core/embedding/tokenizer.h"
#include "core/models/model_manifest.h"

#include <QString>

#include <memory>

namespace sx {

// How a model feeds text to its tokenizer.
enum class TokenizerUse {
    Single,  // bi-encoder: [CLS] text [SEP]
    Pair,    // cross-encoder: [CLS] query [SEP] passage [SEP]
};

class TokenizerFactory {
public:
    // Smallest sequence that leaves a cross-encoder room for one query
    // token and one passage token next to its three special tokens.
    static constexpr int kMinPairSequenceLength = 8;

    // Builds the WordPiece tokenizer of a manifest entry, bounded by its
    // maxSeqLength. Rejects (nullptr, `error` set) an unsupported tokenizer
    // type, a missing or empty vocab, a vocab without [PAD], [UNK], [CLS]
    // and [SEP], and a pair model whose sequence cannot hold both texts.
    static std::unique_ptr<WordPieceTokenizer> create(const ModelManifestEntry& entry,
                                                      const QString& modelsDir,
                                                      TokenizerUse use = TokenizerUse::Single,
                                                      QString* error = nullptr);

    // The vocab is looked up beside the model file first (models shipped in
    // their own sub-directory), then at the top of modelsDir. Absolute vocab
    // paths are used as they are. Empty when no candidate exists.
    static QString resolveVocabPath(const ModelManifestEntry& entry, const QString& modelsDir);
};

} // namespace sx
