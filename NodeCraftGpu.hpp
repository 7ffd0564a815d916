// NodeCraft GPU pipelines
//
// A GPU segment of the proto graph is compiled into a GpuPipeline: a small
// register program (one instruction per proto node, operands are pipeline
// inputs or earlier registers) plus the text of an equivalent compute kernel.
// Devices sit behind the abstract GpuContext; HostComputeContext executes the
// register program on a dedicated device thread, which is what the engine
// uses when no real device is attached.
#pragma once
#include "NodeCraftCatalog.hpp"
#include "NodeCraftProtoGraph.hpp"
#include "NodeCraftValue.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace NodeCraft {

// Device-side representation: a scalar is a one-element non-array buffer.
struct GpuBuffer {
    std::vector<double> data;
    bool array = false;
};

bool hasGpuRepresentation(const Type& type);
// Throw FlowError(UnsupportedBoundaryType) for anything but f64 and f64[].
GpuBuffer toGpuBuffer(const Value& value);
Value fromGpuBuffer(const GpuBuffer& buffer, const Type& type);

struct GpuOperand {
    enum class Kind { Input, Register };
    Kind kind = Kind::Input;
    std::size_t index = 0;
};

struct GpuInstruction {
    GpuOpcode opcode = GpuOpcode::Identity;
    std::vector<GpuOperand> operands;
    std::size_t node = 0; // proto node index, register i belongs to nodes()[i]
    NodePath path;
    Type outputType;
};

class GpuPipeline {
public:
    const std::string& name() const { return pipelineName; }
    // External sources read by the program, in input slot order.
    const std::vector<ProtoInput>& inputs() const { return inputSources; }
    const std::vector<Type>& inputTypes() const { return inputTypeList; }
    const std::vector<GpuInstruction>& instructions() const { return program; }
    const std::vector<std::size_t>& nodes() const { return segmentNodes; }

    std::string kernelSource() const;

    // Executes the register program; returns one buffer per instruction.
    // Throws FlowError(OperationPanic) attributed to the failing node.
    std::vector<GpuBuffer> run(const std::vector<GpuBuffer>& inputs) const;

private:
    friend class GpuCompiler;

    std::string pipelineName;
    std::vector<ProtoInput> inputSources;
    std::vector<Type> inputTypeList;
    std::vector<GpuInstruction> program;
    std::vector<std::size_t> segmentNodes;
};

class GpuCompiler {
public:
    // `nodes` must be ascending GPU-eligible proto nodes. Segments are
    // contiguous runs; a partial rerun passes a subset of one, and the
    // skipped nodes are read as pipeline inputs.
    static std::shared_ptr<const GpuPipeline> compile(const ProtoGraph& graph, const std::vector<std::size_t>& nodes,
                                                      std::string name);
};

class GpuContext {
public:
    virtual ~GpuContext() = default;

    virtual std::string name() const = 0;
    virtual bool available() const = 0;
    // Asynchronous dispatch. The future carries the output buffers or the
    // device error; an unusable device reports FlowError(BackendUnavailable).
    virtual std::future<std::vector<GpuBuffer>> submit(std::shared_ptr<const GpuPipeline> pipeline,
                                                       std::vector<GpuBuffer> inputs) = 0;
};

class HostComputeContext : public GpuContext {
public:
    HostComputeContext();
    ~HostComputeContext() override;

    std::string name() const override { return "host-compute"; }
    bool available() const override;
    std::future<std::vector<GpuBuffer>> submit(std::shared_ptr<const GpuPipeline> pipeline, std::vector<GpuBuffer> inputs) override;

    // Simulates losing or regaining the device.
    void setAvailable(bool value);
    std::size_t dispatchCount() const;

private:
    void deviceLoop();

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::function<void()>> queue;
    bool online = true;
    bool stopping = false;
    std::size_t dispatched = 0;
    std::thread device; // last, starts after the state above exists
};

} // namespace NodeCraft
