#pragma once

#include <cstdint>
#include <cstring>
#include <deque>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

#include "gpu_device.h"

// Records every call so tests can check ordering, resource lifetimes and draw submissions.
class FakeGpuDevice final : public GpuDevice
{
public:
    enum class Op
    {
        BeginFrame,
        WriteUniform,
        BindPipeline,
        Draw,
        EndFrame
    };

    struct DrawCall
    {
        std::uint32_t buffer{0};
        std::uint32_t vertexCount{0};
        std::uint32_t instanceCount{0};
    };

    GpuPipeline createPipeline(const PipelineDesc& desc) override
    {
        lastPipeline = desc;
        ++livePipelines;
        return GpuPipeline{nextId_++};
    }

    void destroyPipeline(const GpuPipeline&) override { --livePipelines; }

    GpuBuffer createUniformBuffer(std::size_t sizeBytes) override
    {
        const std::uint32_t id = nextId_++;
        uniformBuffers[id] = sizeBytes;
        return GpuBuffer{id, sizeBytes};
    }

    void writeUniformBuffer(const GpuBuffer&, const void* data, std::size_t sizeBytes) override
    {
        ops.push_back(Op::WriteUniform);
        if (sizeBytes == sizeof(glm::mat4))
        {
            std::memcpy(&lastUniform, data, sizeBytes);
        }
    }

    GpuBuffer createInstanceBuffer(std::span<const BlockFaceInstance> instances) override
    {
        if (failInstanceAllocationsAfter >= 0 && instanceAllocations >= failInstanceAllocationsAfter)
        {
            throw GpuError("fake device out of memory");
        }
        ++instanceAllocations;
        const std::uint32_t id = nextId_++;
        liveInstanceBuffers[id] = instances.size();
        return GpuBuffer{id, instances.size_bytes()};
    }

    void destroyBuffer(const GpuBuffer& buffer) override
    {
        if (liveInstanceBuffers.erase(buffer.id) > 0)
        {
            destroyedInstanceBuffers.push_back(buffer.id);
        }
        uniformBuffers.erase(buffer.id);
    }

    GpuTexture createTexture(const LoadedImage& image) override
    {
        ++liveTextures;
        return GpuTexture{nextId_++, image.size};
    }

    void destroyTexture(const GpuTexture&) override { --liveTextures; }

    FrameStatus beginFrame(const glm::vec4&) override
    {
        ++beginFrameCalls;
        FrameStatus status = FrameStatus::Ok;
        if (!queuedFrameStatuses.empty())
        {
            status = queuedFrameStatuses.front();
            queuedFrameStatuses.pop_front();
        }
        if (status == FrameStatus::Ok)
        {
            ops.push_back(Op::BeginFrame);
        }
        return status;
    }

    void bindPipeline(const GpuPipeline&, const GpuBuffer&, const GpuTexture&) override
    {
        ops.push_back(Op::BindPipeline);
    }

    void drawInstanced(const GpuBuffer& instances, std::uint32_t vertexCount, std::uint32_t instanceCount) override
    {
        ops.push_back(Op::Draw);
        draws.push_back(DrawCall{instances.id, vertexCount, instanceCount});
    }

    void endFrame() override { ops.push_back(Op::EndFrame); }

    void configureSurface(int width, int height) override { surfaceConfigs.emplace_back(width, height); }

    void resetFrameLog()
    {
        ops.clear();
        draws.clear();
    }

    // Negative disables the failure.
    int failInstanceAllocationsAfter{-1};
    int instanceAllocations{0};
    std::deque<FrameStatus> queuedFrameStatuses;

    std::unordered_map<std::uint32_t, std::size_t> liveInstanceBuffers;
    std::unordered_map<std::uint32_t, std::size_t> uniformBuffers;
    std::vector<std::uint32_t> destroyedInstanceBuffers;
    int livePipelines{0};
    int liveTextures{0};
    int beginFrameCalls{0};

    std::vector<Op> ops;
    std::vector<DrawCall> draws;
    std::vector<glm::ivec2> surfaceConfigs;
    PipelineDesc lastPipeline{};
    glm::mat4 lastUniform{0.0f};

private:
    std::uint32_t nextId_{1};
};

inline LoadedImage makeSolidImage(int width, int height)
{
    LoadedImage image;
    image.size = glm::ivec2(width, height);
    image.pixels.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u, 255u);
    return image;
}
