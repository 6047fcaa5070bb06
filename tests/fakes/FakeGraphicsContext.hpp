#pragma once

#include "FakeRenderPass.hpp"
#include "vulkan/GraphicsContext.hpp"
#include <cstring>
#include <deque>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// GraphicsContext that keeps buffer contents in host memory, hands out
// counter-based handles and returns scripted surface statuses.
class FakeGraphicsContext : public GraphicsContext {
public:
    struct BufferRecord {
        VkDeviceSize size = 0;
        VkBufferUsageFlags usage = 0;
        bool deviceLocal = false;
        bool destroyed = false;
        std::vector<uint8_t> contents;
    };

    struct WriteRecord {
        VkBuffer buffer;
        VkDeviceSize offset;
        VkDeviceSize size;
    };

    // surface
    void configureSurface(uint32_t width, uint32_t height) override {
        configureCalls.push_back(VkExtent2D{width, height});
        extent = VkExtent2D{width, height};
    }
    VkExtent2D getSurfaceExtent() const override { return extent; }
    VkFormat getSurfaceFormat() const override { return VK_FORMAT_B8G8R8A8_SRGB; }
    VkFormat getDepthFormat() const override { return VK_FORMAT_D32_SFLOAT; }

    SurfaceStatus acquireFrame(FrameTarget& target) override {
        if (frameLive) throw std::logic_error("a frame target is already live");
        ++acquireCount;
        SurfaceStatus status = next(acquireScript);
        if (status != SurfaceStatus::Ok) return status;
        target.imageIndex = acquireCount % 3;
        target.view = fakeHandle<VkImageView>(0x1000 + target.imageIndex);
        target.commandBuffer = fakeHandle<VkCommandBuffer>(0xCB);
        target.live = true;
        frameLive = true;
        return status;
    }

    std::unique_ptr<RenderPass> beginRenderPass(FrameTarget& target, const DepthTarget& depth,
                                                const glm::vec4& clearColor, float clearDepth) override {
        if (!target.live) throw std::logic_error("render pass on a frame target that is not live");
        passes.emplace_back();
        PassRecord& record = passes.back();
        record.clearColor = clearColor;
        record.clearDepth = clearDepth;
        record.color = target.view;
        record.depth = depth.view;
        return std::make_unique<FakeRenderPass>(record);
    }

    void submit(FrameTarget& target) override {
        (void)target;
        ++submitCount;
    }

    SurfaceStatus present(FrameTarget& target) override {
        ++presentCount;
        target.live = false;
        frameLive = false;
        return next(presentScript);
    }

    DepthTarget createDepthTarget(uint32_t width, uint32_t height) override {
        DepthTarget target;
        target.image = fakeHandle<VkImage>(nextId());
        target.memory = fakeHandle<VkDeviceMemory>(nextId());
        target.view = fakeHandle<VkImageView>(nextId());
        target.width = width;
        target.height = height;
        depthCreated.push_back(VkExtent2D{width, height});
        return target;
    }

    void destroyDepthTarget(DepthTarget& target) override {
        ++depthDestroyed;
        target = DepthTarget{};
    }

    // buffers
    Buffer createBuffer(VkDeviceSize size, VkBufferUsageFlags usage) override {
        return allocate(size, usage, false);
    }

    Buffer createDeviceLocalBuffer(const void* data, VkDeviceSize size, VkBufferUsageFlags usage) override {
        Buffer buffer = allocate(size, usage, true);
        std::memcpy(buffers[buffer.buffer].contents.data(), data, static_cast<size_t>(size));
        return buffer;
    }

    void writeBuffer(Buffer& buffer, VkDeviceSize offset, const void* data, VkDeviceSize size) override {
        BufferRecord& record = recordOf(buffer);
        if (offset + size > record.size) throw std::logic_error("buffer write out of range");
        std::memcpy(record.contents.data() + offset, data, static_cast<size_t>(size));
        writes.push_back(WriteRecord{buffer.buffer, offset, size});
    }

    void destroyBuffer(Buffer& buffer) override {
        recordOf(buffer).destroyed = true;
        ++destroyedBuffers;
        buffer = Buffer{};
    }

    // pipelines
    VkShaderModule createShaderModule(const std::string& spirvPath) override {
        shaderPaths.push_back(spirvPath);
        return fakeHandle<VkShaderModule>(nextId());
    }
    void destroyShaderModule(VkShaderModule module) override {
        if (module != VK_NULL_HANDLE) ++destroyedModules;
    }

    Pipeline createGraphicsPipeline(const PipelineConfig& config) override {
        pipelineConfigs.push_back(config);
        Pipeline pipeline;
        pipeline.pipeline = fakeHandle<VkPipeline>(nextId());
        pipeline.layout = fakeHandle<VkPipelineLayout>(nextId());
        return pipeline;
    }
    void destroyPipeline(Pipeline& pipeline) override {
        if (pipeline.pipeline != VK_NULL_HANDLE) ++destroyedPipelines;
        pipeline = Pipeline{};
    }

    // descriptors
    VkDescriptorSetLayout createUniformSetLayout(VkShaderStageFlags stages) override {
        (void)stages;
        ++setLayoutsCreated;
        return fakeHandle<VkDescriptorSetLayout>(nextId());
    }
    void destroySetLayout(VkDescriptorSetLayout layout) override {
        if (layout != VK_NULL_HANDLE) ++setLayoutsDestroyed;
    }
    VkDescriptorSet createUniformDescriptorSet(VkDescriptorSetLayout layout, const Buffer& uniform) override {
        (void)layout;
        descriptorTargets.push_back(uniform.buffer);
        return fakeHandle<VkDescriptorSet>(nextId());
    }
    void freeDescriptorSet(VkDescriptorSet descriptorSet) override {
        if (descriptorSet != VK_NULL_HANDLE) ++descriptorSetsFreed;
    }

    void waitIdle() override { ++waitIdleCount; }

    // inspection helpers
    BufferRecord& recordOf(const Buffer& buffer) {
        auto it = buffers.find(buffer.buffer);
        if (it == buffers.end()) throw std::logic_error("unknown buffer");
        return it->second;
    }

    template <typename T>
    std::vector<T> contentsAs(const Buffer& buffer) {
        const BufferRecord& record = recordOf(buffer);
        std::vector<T> out(record.contents.size() / sizeof(T));
        std::memcpy(out.data(), record.contents.data(), out.size() * sizeof(T));
        return out;
    }

    size_t liveBufferCount() const {
        size_t n = 0;
        for (const auto& entry : buffers) {
            if (!entry.second.destroyed) ++n;
        }
        return n;
    }

    PassRecord& lastPass() { return passes.back(); }

    std::deque<SurfaceStatus> acquireScript;
    std::deque<SurfaceStatus> presentScript;

    VkExtent2D extent{0, 0};
    std::vector<VkExtent2D> configureCalls;
    std::vector<VkExtent2D> depthCreated;
    int depthDestroyed = 0;

    int acquireCount = 0;
    int submitCount = 0;
    int presentCount = 0;
    bool frameLive = false;
    std::deque<PassRecord> passes;

    std::map<VkBuffer, BufferRecord> buffers;
    std::vector<WriteRecord> writes;
    int destroyedBuffers = 0;

    std::vector<std::string> shaderPaths;
    int destroyedModules = 0;
    std::vector<PipelineConfig> pipelineConfigs;
    int destroyedPipelines = 0;

    int setLayoutsCreated = 0;
    int setLayoutsDestroyed = 0;
    std::vector<VkBuffer> descriptorTargets;
    int descriptorSetsFreed = 0;
    int waitIdleCount = 0;

private:
    static SurfaceStatus next(std::deque<SurfaceStatus>& script) {
        if (script.empty()) return SurfaceStatus::Ok;
        SurfaceStatus status = script.front();
        script.pop_front();
        return status;
    }

    uint64_t nextId() { return ++idCounter; }

    Buffer allocate(VkDeviceSize size, VkBufferUsageFlags usage, bool deviceLocal) {
        Buffer buffer;
        buffer.buffer = fakeHandle<VkBuffer>(nextId());
        buffer.memory = fakeHandle<VkDeviceMemory>(nextId());
        buffer.size = size;
        BufferRecord record;
        record.size = size;
        record.usage = usage;
        record.deviceLocal = deviceLocal;
        record.contents.assign(static_cast<size_t>(size), 0);
        buffers[buffer.buffer] = record;
        return buffer;
    }

    uint64_t idCounter = 0;
};
