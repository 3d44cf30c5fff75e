#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace sx {

// In-memory HNSW index over L2-normalized vectors, labelled by entry id.
// Inner-product distance, so distance = 1 - cosine similarity.
class VectorIndex {
public:
    struct KnnResult {
        uint64_t label = 0;
        float distance = 0.0f;
    };

    struct IndexMetadata {
        int dimensions = 0;
        std::string modelId = "unknown";
    };

    using LabelFilter = std::function<bool(uint64_t)>;

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;
    static constexpr int kInitialCapacity = 1024;

    explicit VectorIndex(const IndexMetadata& metadata);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    bool create(int initialCapacity = kInitialCapacity);

    // Adds the vector under `label`, replacing the stored vector when the
    // label is already present (including a previously deleted one).
    bool addVector(uint64_t label, const float* embedding);
    bool deleteVector(uint64_t label);

    // Nearest neighbours by ascending distance. Labels rejected by `allow`
    // are skipped during graph traversal rather than after it.
    std::vector<KnnResult> search(const float* queryVector, int k,
                                  const LabelFilter& allow = {}) const;

    int totalElements() const;
    int deletedElements() const;
    bool isAvailable() const;
    int dimensions() const;
    const IndexMetadata& metadata() const;

private:
    bool ensureCapacityForOneMore();

    IndexMetadata m_metadata;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    int m_deletedCount = 0;
    mutable std::mutex m_writeMutex;
};

} // namespace sx
