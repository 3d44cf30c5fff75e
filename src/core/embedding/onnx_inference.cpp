#include "core/embedding/onnx_inference.h"
#include "core/models/model_session.h"
#include "core/shared/logging.h"

#include <new>

#ifdef SEXTANT_WITH_ONNX
#include <onnxruntime_cxx_api.h>

#include <atomic>
#include <chrono>
#include <thread>
#endif

namespace sx {

#ifdef SEXTANT_WITH_ONNX
namespace {

constexpr int kTerminatePollMs = 10;

// Calls SetTerminate on the run options once the context says stop.
class TerminateWatcher {
public:
    TerminateWatcher(Ort::RunOptions& options, const CallContext& context)
        : m_thread([this, &options, context]() {
            while (!m_done.load()) {
                if (context.shouldStop()) {
                    m_fired.store(true);
                    options.SetTerminate();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(kTerminatePollMs));
            }
        })
    {
    }

    ~TerminateWatcher()
    {
        m_done.store(true);
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    bool fired() const { return m_fired.load(); }

private:
    std::atomic<bool> m_done{false};
    std::atomic<bool> m_fired{false};
    std::thread m_thread;
};

} // anonymous namespace
#endif

InferenceOutput runEncoder(ModelSession& session, const Encoding& encoding,
                           const CallContext& context)
{
    InferenceOutput output;

#ifdef SEXTANT_WITH_ONNX
    auto* ortSession = static_cast<Ort::Session*>(session.rawSession());
    if (!ortSession || session.outputNames().empty()) {
        output.status = ProviderStatus::ModelFailure;
        output.message = QStringLiteral("model session unavailable");
        return output;
    }
    if (encoding.batchSize <= 0 || encoding.sequenceLength <= 0) {
        output.status = ProviderStatus::ModelFailure;
        output.message = QStringLiteral("empty encoding");
        return output;
    }
    if (context.shouldStop()) {
        output.status = ProviderStatus::Cancelled;
        output.message = QStringLiteral("cancelled before inference");
        return output;
    }

    const int64_t inputShape[2] = {
        static_cast<int64_t>(encoding.batchSize),
        static_cast<int64_t>(encoding.sequenceLength),
    };

    try {
        Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator,
                                                                 OrtMemTypeDefault);

        std::vector<Ort::Value> inputTensors;
        std::vector<const char*> inputNames;
        for (const std::string& name : session.inputNames()) {
            const std::vector<int64_t>* source = nullptr;
            if (name == "input_ids") {
                source = &encoding.inputIds;
            } else if (name == "attention_mask") {
                source = &encoding.attentionMask;
            } else if (name == "token_type_ids") {
                source = &encoding.tokenTypeIds;
            } else {
                output.status = ProviderStatus::ModelFailure;
                output.message = QStringLiteral("unsupported model input '%1'")
                                     .arg(QString::fromStdString(name));
                return output;
            }
            inputTensors.push_back(Ort::Value::CreateTensor<int64_t>(
                memoryInfo,
                const_cast<int64_t*>(source->data()),
                source->size(),
                inputShape,
                2));
            inputNames.push_back(name.c_str());
        }

        const char* outputNames[1] = {session.outputNames().front().c_str()};

        Ort::RunOptions runOptions;
        std::vector<Ort::Value> outputs;
        bool terminated = false;
        {
            TerminateWatcher watcher(runOptions, context);
            try {
                outputs = ortSession->Run(runOptions,
                                          inputNames.data(),
                                          inputTensors.data(),
                                          inputTensors.size(),
                                          outputNames,
                                          1);
            } catch (const Ort::Exception&) {
                if (!watcher.fired()) {
                    throw;
                }
                terminated = true;
            }
        }
        if (terminated) {
            output.status = ProviderStatus::Cancelled;
            output.message = QStringLiteral("inference terminated");
            return output;
        }

        if (outputs.empty() || !outputs[0].IsTensor()) {
            LOG_WARN(sxEmbed, "runEncoder: missing tensor output");
            output.status = ProviderStatus::ModelFailure;
            output.message = QStringLiteral("missing tensor output");
            return output;
        }

        Ort::TensorTypeAndShapeInfo info = outputs[0].GetTensorTypeAndShapeInfo();
        const float* data = outputs[0].GetTensorData<float>();
        if (!data) {
            output.status = ProviderStatus::ModelFailure;
            output.message = QStringLiteral("null tensor data");
            return output;
        }
        output.shape = info.GetShape();
        output.data.assign(data, data + info.GetElementCount());
        return output;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(sxEmbed, "runEncoder: inference failed: %s", ex.what());
        output.status = ProviderStatus::ModelFailure;
        output.message = QString::fromUtf8(ex.what());
        return output;
    } catch (const std::bad_alloc&) {
        LOG_WARN(sxEmbed, "runEncoder: out of memory");
        output.status = ProviderStatus::ModelFailure;
        output.message = QStringLiteral("out of memory");
        return output;
    }
#else
    Q_UNUSED(session);
    Q_UNUSED(encoding);
    Q_UNUSED(context);
    output.status = ProviderStatus::ModelFailure;
    output.message = QStringLiteral("ONNX Runtime not enabled");
    return output;
#endif
}

} // namespace sx
