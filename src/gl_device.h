#pragma once
// gl_device.h
// OpenGL 3.3 core implementation of GpuDevice over a GLFW window. The context must be current
// and glad loaded before construction.

#include <cstdint>
#include <unordered_map>

#include <glad/glad.h>

#include "gpu_device.h"

struct GLFWwindow;

class GlDevice final : public GpuDevice
{
public:
    explicit GlDevice(GLFWwindow* window);
    ~GlDevice() override;

    GlDevice(const GlDevice&) = delete;
    GlDevice& operator=(const GlDevice&) = delete;

    GpuPipeline createPipeline(const PipelineDesc& desc) override;
    void destroyPipeline(const GpuPipeline& pipeline) override;

    GpuBuffer createUniformBuffer(std::size_t sizeBytes) override;
    void writeUniformBuffer(const GpuBuffer& buffer, const void* data, std::size_t sizeBytes) override;

    GpuBuffer createInstanceBuffer(std::span<const BlockFaceInstance> instances) override;
    void destroyBuffer(const GpuBuffer& buffer) override;

    GpuTexture createTexture(const LoadedImage& image) override;
    void destroyTexture(const GpuTexture& texture) override;

    FrameStatus beginFrame(const glm::vec4& clearColor) override;
    void bindPipeline(const GpuPipeline& pipeline, const GpuBuffer& uniforms, const GpuTexture& atlas) override;
    void drawInstanced(const GpuBuffer& instances, std::uint32_t vertexCount, std::uint32_t instanceCount) override;
    void endFrame() override;

    void configureSurface(int width, int height) override;

private:
    struct BufferRecord
    {
        GLuint buffer{0};
        GLuint vao{0}; // instance buffers only
    };

    struct TextureRecord
    {
        GLuint texture{0};
        GLuint sampler{0};
    };

    void createQuad();

    GLFWwindow* window_{nullptr};
    GLuint quadVbo_{0};
    int surfaceWidth_{0};
    int surfaceHeight_{0};
    bool frameActive_{false};

    std::uint32_t nextId_{1};
    std::unordered_map<std::uint32_t, GLuint> programs_;
    std::unordered_map<std::uint32_t, BufferRecord> buffers_;
    std::unordered_map<std::uint32_t, TextureRecord> textures_;
};
