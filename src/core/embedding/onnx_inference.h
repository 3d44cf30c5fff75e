#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/embedding/tokenizer.h"

#include <cstdint>
#include <vector>

namespace sx {

class ModelSession;

struct InferenceOutput {
    ProviderStatus status = ProviderStatus::Ok;
    QString message;
    // First model output, row-major.
    std::vector<int64_t> shape;
    std::vector<float> data;

    bool ok() const { return status == ProviderStatus::Ok; }
};

// Feeds an encoded batch to the session's first output. Only the inputs the
// graph declares are bound (some exports have no token_type_ids). A watcher
// terminates the run when the context is cancelled or expires.
InferenceOutput runEncoder(ModelSession& session, const Encoding& encoding,
                           const CallContext& context);

} // namespace sx
