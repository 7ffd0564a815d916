// NodeCraftGpu.cpp
#include "NodeCraftGpu.hpp"
#include "NodeCraftError.hpp"
#include "NodeCraftLog.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace NodeCraft {

bool hasGpuRepresentation(const Type& type) {
    return type == Type::concrete(TypeNames::F64) || type == Type::concrete(TypeNames::F64Array);
}

GpuBuffer toGpuBuffer(const Value& value) {
    if (const double* d = value.tryGet<double>()) return GpuBuffer{{*d}, false};
    if (const F64Array* a = value.tryGet<F64Array>()) return GpuBuffer{*a, true};
    throw FlowError(ErrorKind::UnsupportedBoundaryType, fmt::format("{} has no GPU buffer representation", value.typeName()));
}

Value fromGpuBuffer(const GpuBuffer& buffer, const Type& type) {
    if (type == Type::concrete(TypeNames::F64)) {
        if (buffer.array || buffer.data.size() != 1)
            throw FlowError(ErrorKind::UnsupportedBoundaryType, "Expected a scalar buffer for f64");
        return Value::make(buffer.data.front());
    }
    if (type == Type::concrete(TypeNames::F64Array)) return Value::make(F64Array(buffer.data));
    throw FlowError(ErrorKind::UnsupportedBoundaryType, fmt::format("{} has no GPU buffer representation", type.toString()));
}

namespace {

double applyOpcode(GpuOpcode op, double a, double b) {
    switch (op) {
    case GpuOpcode::Identity: return a;
    case GpuOpcode::Add: return a + b;
    case GpuOpcode::Subtract: return a - b;
    case GpuOpcode::Multiply: return a * b;
    case GpuOpcode::Divide: return a / b;
    case GpuOpcode::Negate: return -a;
    case GpuOpcode::Double: return a * 2.0;
    case GpuOpcode::Min: return std::min(a, b);
    case GpuOpcode::Max: return std::max(a, b);
    }
    return a;
}

const char* glslExpression(GpuOpcode op) {
    switch (op) {
    case GpuOpcode::Identity: return "{0}";
    case GpuOpcode::Add: return "{0} + {1}";
    case GpuOpcode::Subtract: return "{0} - {1}";
    case GpuOpcode::Multiply: return "{0} * {1}";
    case GpuOpcode::Divide: return "{0} / {1}";
    case GpuOpcode::Negate: return "-{0}";
    case GpuOpcode::Double: return "2.0 * {0}";
    case GpuOpcode::Min: return "min({0}, {1})";
    case GpuOpcode::Max: return "max({0}, {1})";
    }
    return "{0}";
}

} // namespace

std::vector<GpuBuffer> GpuPipeline::run(const std::vector<GpuBuffer>& inputs) const {
    if (inputs.size() != inputSources.size())
        throw FlowError(ErrorKind::MissingInput, fmt::format("Pipeline {} expects {} buffers, got {}", pipelineName, inputSources.size(), inputs.size()));
    std::vector<GpuBuffer> registers;
    registers.reserve(program.size());
    for (const auto& ins : program) {
        std::vector<const GpuBuffer*> args;
        for (const auto& op : ins.operands) args.push_back(op.kind == GpuOperand::Kind::Input ? &inputs.at(op.index) : &registers.at(op.index));

        // Scalars broadcast against arrays; arrays must agree in length.
        bool array = false;
        std::size_t length = 1;
        for (const GpuBuffer* b : args) {
            if (!b->array) continue;
            if (array && b->data.size() != length)
                throw FlowError(ErrorKind::OperationPanic, fmt::format("array lengths differ ({} vs {})", length, b->data.size()), ins.path);
            array = true;
            length = b->data.size();
        }
        GpuBuffer out;
        out.array = array;
        out.data.resize(length);
        for (std::size_t i = 0; i < length; ++i) {
            const double a = args.empty() ? 0.0 : args[0]->data[args[0]->array ? i : 0];
            const double b = args.size() < 2 ? 0.0 : args[1]->data[args[1]->array ? i : 0];
            out.data[i] = applyOpcode(ins.opcode, a, b);
        }
        registers.push_back(std::move(out));
    }
    return registers;
}

std::string GpuPipeline::kernelSource() const {
    std::ostringstream k;
    k << "// " << pipelineName << ": " << program.size() << " fused nodes\n";
    k << "#version 450\n";
    k << "layout(local_size_x = 64) in;\n";
    for (std::size_t i = 0; i < inputSources.size(); ++i)
        k << fmt::format("layout(std430, binding = {}) readonly buffer In{} {{ double in{}[]; }};\n", i, i, i);
    for (std::size_t r = 0; r < program.size(); ++r)
        k << fmt::format("layout(std430, binding = {}) writeonly buffer Out{} {{ double out{}[]; }};\n", inputSources.size() + r, r, r);
    k << "layout(push_constant) uniform Lengths { uint count; ";
    for (std::size_t i = 0; i < inputSources.size(); ++i) k << "uint in" << i << "_len; ";
    k << "};\n\n";
    k << "void main() {\n";
    k << "  uint i = gl_GlobalInvocationID.x;\n";
    k << "  if (i >= count) return;\n";
    for (std::size_t r = 0; r < program.size(); ++r) {
        const GpuInstruction& ins = program[r];
        std::vector<std::string> operands;
        for (const auto& op : ins.operands) {
            if (op.kind == GpuOperand::Kind::Input) operands.push_back(fmt::format("in{0}[in{0}_len == 1u ? 0u : i]", op.index));
            else operands.push_back(fmt::format("r{}", op.index));
        }
        while (operands.size() < 2) operands.emplace_back("0.0");
        k << fmt::format("  double r{} = ", r) << fmt::format(fmt::runtime(glslExpression(ins.opcode)), operands[0], operands[1]) << "; // "
          << formatPath(ins.path) << " " << gpuOpcodeName(ins.opcode) << "\n";
        k << fmt::format("  out{0}[i] = r{0};\n", r);
    }
    k << "}\n";
    return k.str();
}

std::shared_ptr<const GpuPipeline> GpuCompiler::compile(const ProtoGraph& graph, const std::vector<std::size_t>& nodes, std::string name) {
    if (nodes.empty()) throw std::invalid_argument("GPU segment is empty");
    auto pipeline = std::make_shared<GpuPipeline>();
    pipeline->pipelineName = std::move(name);
    pipeline->segmentNodes = nodes;

    for (std::size_t r = 0; r < nodes.size(); ++r) {
        const std::size_t index = nodes[r];
        if (r > 0 && index <= nodes[r - 1]) throw std::invalid_argument(fmt::format("GPU segment {} is not in ascending order", pipeline->pipelineName));
        const ProtoNode& node = graph.node(index);
        if (!node.gpuEligible()) throw std::invalid_argument(fmt::format("{} cannot run on the GPU", node.label()));

        GpuInstruction ins;
        ins.opcode = *node.resolved->gpu;
        ins.node = index;
        ins.path = node.path;
        ins.outputType = node.outputType;
        for (std::size_t k = 0; k < node.inputs.size(); ++k) {
            const ProtoInput& in = node.inputs[k];
            if (in.isNode()) {
                // Upstream nodes of the segment are registers; anything else is read as an input.
                auto reg = std::lower_bound(nodes.begin(), nodes.begin() + r, in.node());
                if (reg != nodes.begin() + r && *reg == in.node()) {
                    ins.operands.push_back({GpuOperand::Kind::Register, static_cast<std::size_t>(reg - nodes.begin())});
                    continue;
                }
            }
            auto existing = std::find(pipeline->inputSources.begin(), pipeline->inputSources.end(), in);
            std::size_t slot = static_cast<std::size_t>(existing - pipeline->inputSources.begin());
            if (existing == pipeline->inputSources.end()) {
                pipeline->inputSources.push_back(in);
                pipeline->inputTypeList.push_back(node.inputTypes.at(k));
            }
            ins.operands.push_back({GpuOperand::Kind::Input, slot});
        }
        pipeline->program.push_back(std::move(ins));
    }
    logDebug("Compiled GPU pipeline {} with {} instructions and {} inputs", pipeline->pipelineName, pipeline->program.size(),
             pipeline->inputSources.size());
    return pipeline;
}

HostComputeContext::HostComputeContext() : device([this] { deviceLoop(); }) {}

HostComputeContext::~HostComputeContext() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = true;
    }
    cv.notify_all();
    device.join();
}

bool HostComputeContext::available() const {
    std::lock_guard<std::mutex> lock(mutex);
    return online;
}

void HostComputeContext::setAvailable(bool value) {
    std::lock_guard<std::mutex> lock(mutex);
    online = value;
}

std::size_t HostComputeContext::dispatchCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return dispatched;
}

std::future<std::vector<GpuBuffer>> HostComputeContext::submit(std::shared_ptr<const GpuPipeline> pipeline, std::vector<GpuBuffer> inputs) {
    auto promise = std::make_shared<std::promise<std::vector<GpuBuffer>>>();
    auto future = promise->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!online) {
            promise->set_exception(std::make_exception_ptr(FlowError(ErrorKind::BackendUnavailable, "Host compute device is offline")));
            return future;
        }
        ++dispatched;
        queue.push_back([promise, pipeline = std::move(pipeline), inputs = std::move(inputs)] {
            try {
                promise->set_value(pipeline->run(inputs));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
    }
    cv.notify_one();
    return future;
}

void HostComputeContext::deviceLoop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [this] { return stopping || !queue.empty(); });
            if (queue.empty()) return;
            job = std::move(queue.front());
            queue.pop_front();
        }
        job();
    }
}

} // namespace NodeCraft
