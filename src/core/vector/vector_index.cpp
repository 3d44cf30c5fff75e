#include "core/vector/vector_index.h"

#include "core/shared/logging.h"

#include <hnswlib/hnswlib.h>

#include <algorithm>

namespace sx {

namespace {

class LabelFilterFunctor : public hnswlib::BaseFilterFunctor {
public:
    explicit LabelFilterFunctor(const VectorIndex::LabelFilter& allow)
        : m_allow(allow)
    {
    }

    bool operator()(hnswlib::labeltype id) override
    {
        return m_allow(static_cast<uint64_t>(id));
    }

private:
    const VectorIndex::LabelFilter& m_allow;
};

} // namespace

VectorIndex::VectorIndex(const IndexMetadata& metadata)
    : m_metadata(metadata)
{
}

VectorIndex::~VectorIndex()
{
}

bool VectorIndex::create(int initialCapacity)
{
    if (m_metadata.dimensions <= 0) {
        LOG_ERROR(sxStore, "VectorIndex::create requires a positive runtime dimension");
        return false;
    }

    try {
        const int capacity = std::max(initialCapacity, 1);
        m_space = std::make_unique<hnswlib::InnerProductSpace>(m_metadata.dimensions);
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(),
            static_cast<size_t>(capacity),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        m_deletedCount = 0;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(sxStore, "VectorIndex::create failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool VectorIndex::addVector(uint64_t label, const float* embedding)
{
    if (!m_index || embedding == nullptr) {
        LOG_WARN(sxStore,
                 "VectorIndex::addVector called with unavailable index or null embedding");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);

    if (!ensureCapacityForOneMore()) {
        return false;
    }

    try {
        const auto& labels = m_index->label_lookup_;
        const auto existing = labels.find(static_cast<hnswlib::labeltype>(label));
        if (existing != labels.end() && m_index->isMarkedDeleted(existing->second)) {
            m_index->unmarkDelete(static_cast<hnswlib::labeltype>(label));
            m_deletedCount = std::max(m_deletedCount - 1, 0);
        }
        m_index->addPoint(embedding, static_cast<hnswlib::labeltype>(label));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(sxStore, "VectorIndex::addVector failed: %s", e.what());
        return false;
    }
}

bool VectorIndex::deleteVector(uint64_t label)
{
    if (!m_index) {
        LOG_WARN(sxStore, "VectorIndex::deleteVector called with unavailable index");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    try {
        m_index->markDelete(static_cast<hnswlib::labeltype>(label));
        ++m_deletedCount;
        return true;
    } catch (const std::exception& e) {
        LOG_WARN(sxStore, "VectorIndex::deleteVector failed for label %llu: %s",
                 static_cast<qulonglong>(label), e.what());
        return false;
    }
}

std::vector<VectorIndex::KnnResult> VectorIndex::search(const float* queryVector, int k,
                                                        const LabelFilter& allow) const
{
    std::vector<KnnResult> results;
    if (!m_index || queryVector == nullptr || k <= 0) {
        return results;
    }

    std::lock_guard<std::mutex> lock(m_writeMutex);
    try {
        m_index->setEf(static_cast<size_t>(std::max(kEfSearch, k)));
        LabelFilterFunctor functor(allow);
        auto queue = m_index->searchKnn(queryVector, static_cast<size_t>(k),
                                        allow ? &functor : nullptr);
        results.reserve(queue.size());
        while (!queue.empty()) {
            const auto entry = queue.top();
            queue.pop();
            results.push_back(KnnResult{static_cast<uint64_t>(entry.second), entry.first});
        }
        std::sort(results.begin(), results.end(), [](const KnnResult& a, const KnnResult& b) {
            if (a.distance != b.distance) {
                return a.distance < b.distance;
            }
            return a.label < b.label;
        });
        return results;
    } catch (const std::exception& e) {
        LOG_ERROR(sxStore, "VectorIndex::search failed: %s", e.what());
        return {};
    }
}

int VectorIndex::totalElements() const
{
    if (!m_index) {
        return 0;
    }
    return static_cast<int>(m_index->getCurrentElementCount());
}

int VectorIndex::deletedElements() const
{
    return m_deletedCount;
}

bool VectorIndex::isAvailable() const
{
    return m_index != nullptr;
}

int VectorIndex::dimensions() const
{
    return m_metadata.dimensions;
}

const VectorIndex::IndexMetadata& VectorIndex::metadata() const
{
    return m_metadata;
}

bool VectorIndex::ensureCapacityForOneMore()
{
    const size_t current = m_index->getCurrentElementCount();
    const size_t maxElements = m_index->getMaxElements();
    if (maxElements == 0) {
        LOG_ERROR(sxStore, "VectorIndex has zero max elements");
        return false;
    }

    const size_t threshold = (maxElements * 8) / 10;
    if (current < threshold) {
        return true;
    }

    const size_t newCapacity = maxElements * 2;
    if (newCapacity <= maxElements) {
        LOG_ERROR(sxStore, "VectorIndex resize overflow");
        return false;
    }

    try {
        m_index->resizeIndex(newCapacity);
        LOG_INFO(sxStore, "VectorIndex resized to capacity %llu",
                 static_cast<qulonglong>(newCapacity));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(sxStore, "VectorIndex resize failed: %s", e.what());
        return false;
    }
}

} // namespace sx
