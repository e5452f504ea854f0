#pragma once
// gpu_device.h
// Narrow GPU device/queue interface used by the chunk manager and the renderer.
// Object creation failures throw GpuError; frame acquisition reports a FrameStatus instead.

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

#include <glm/glm.hpp>

#include "TextureLoader.h"
#include "mesh_builder.h"

class GpuError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

enum class FrameStatus : std::uint8_t
{
    Ok = 0,
    SurfaceLost,
    SurfaceOutdated
};

const char* frameStatusName(FrameStatus status) noexcept;

struct GpuBuffer
{
    std::uint32_t id{0};
    std::size_t sizeBytes{0};

    bool valid() const noexcept { return id != 0; }
};

struct GpuTexture
{
    std::uint32_t id{0};
    glm::ivec2 size{0};

    bool valid() const noexcept { return id != 0; }
};

struct GpuPipeline
{
    std::uint32_t id{0};

    bool valid() const noexcept { return id != 0; }
};

struct PipelineDesc
{
    std::string vertexSource;
    std::string fragmentSource;
};

class GpuDevice
{
public:
    virtual ~GpuDevice() = default;

    virtual GpuPipeline createPipeline(const PipelineDesc& desc) = 0;
    virtual void destroyPipeline(const GpuPipeline& pipeline) = 0;

    virtual GpuBuffer createUniformBuffer(std::size_t sizeBytes) = 0;
    virtual void writeUniformBuffer(const GpuBuffer& buffer, const void* data, std::size_t sizeBytes) = 0;

    // Sized exactly to the instance count; the span must not be empty.
    virtual GpuBuffer createInstanceBuffer(std::span<const BlockFaceInstance> instances) = 0;
    virtual void destroyBuffer(const GpuBuffer& buffer) = 0;

    // Texture plus its sampler.
    virtual GpuTexture createTexture(const LoadedImage& image) = 0;
    virtual void destroyTexture(const GpuTexture& texture) = 0;

    virtual FrameStatus beginFrame(const glm::vec4& clearColor) = 0;
    virtual void bindPipeline(const GpuPipeline& pipeline, const GpuBuffer& uniforms, const GpuTexture& atlas) = 0;
    virtual void drawInstanced(const GpuBuffer& instances, std::uint32_t vertexCount, std::uint32_t instanceCount) = 0;
    // Submits recorded work and presents.
    virtual void endFrame() = 0;

    virtual void configureSurface(int width, int height) = 0;
};
