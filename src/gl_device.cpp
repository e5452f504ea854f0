#include "gl_device.h"

#include <cstddef>
#include <iostream>
#include <string>

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include "shader_source.h"

namespace
{

[[nodiscard]] GLuint compileShader(GLenum type, const char* source)
{
    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);

    GLint success = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (success == GL_FALSE)
    {
        GLint logLength = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &logLength);

        std::string infoLog;
        if (logLength > 0)
        {
            infoLog.resize(static_cast<size_t>(logLength));
            GLsizei written = 0;
            glGetShaderInfoLog(shader, logLength, &written, infoLog.data());
            infoLog.resize(static_cast<size_t>(written));
        }
        if (infoLog.empty())
        {
            infoLog = "unknown error";
        }

        glDeleteShader(shader);
        throw GpuError("Shader compilation failed: " + infoLog);
    }

    return shader;
}

[[nodiscard]] GLuint createProgram(const char* vertexSrc, const char* fragmentSrc)
{
    GLuint vertexShader = compileShader(GL_VERTEX_SHADER, vertexSrc);
    GLuint fragmentShader = 0;
    try
    {
        fragmentShader = compileShader(GL_FRAGMENT_SHADER, fragmentSrc);
    }
    catch (const GpuError&)
    {
        glDeleteShader(vertexShader);
        throw;
    }

    GLuint program = glCreateProgram();
    glAttachShader(program, vertexShader);
    glAttachShader(program, fragmentShader);
    glLinkProgram(program);

    GLint success = 0;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (success == GL_FALSE)
    {
        GLint logLength = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &logLength);

        std::string infoLog;
        if (logLength > 0)
        {
            infoLog.resize(static_cast<size_t>(logLength));
            GLsizei written = 0;
            glGetProgramInfoLog(program, logLength, &written, infoLog.data());
            infoLog.resize(static_cast<size_t>(written));
        }
        if (infoLog.empty())
        {
            infoLog = "unknown error";
        }

        glDeleteProgram(program);
        glDeleteShader(vertexShader);
        glDeleteShader(fragmentShader);
        throw GpuError("Program linkage failed: " + infoLog);
    }

    glDetachShader(program, vertexShader);
    glDetachShader(program, fragmentShader);
    glDeleteShader(vertexShader);
    glDeleteShader(fragmentShader);

    return program;
}

// Drains the error queue; true when any allocation failed.
bool consumeOutOfMemory()
{
    bool outOfMemory = false;
    for (GLenum error = glGetError(); error != GL_NO_ERROR; error = glGetError())
    {
        if (error == GL_OUT_OF_MEMORY)
        {
            outOfMemory = true;
        }
        else
        {
            std::cerr << "[GlDevice] GL error 0x" << std::hex << error << std::dec << std::endl;
        }
    }
    return outOfMemory;
}

} // namespace

GlDevice::GlDevice(GLFWwindow* window)
    : window_(window)
{
    if (window_ == nullptr)
    {
        throw GpuError("GlDevice requires a window");
    }

    glfwGetFramebufferSize(window_, &surfaceWidth_, &surfaceHeight_);
    createQuad();

    glEnable(GL_DEPTH_TEST);
    glDepthFunc(GL_LESS);
    // Quads are seen from both sides.
    glDisable(GL_CULL_FACE);
}

GlDevice::~GlDevice()
{
    for (auto& [id, record] : buffers_)
    {
        if (record.vao != 0)
        {
            glDeleteVertexArrays(1, &record.vao);
        }
        glDeleteBuffers(1, &record.buffer);
    }
    for (auto& [id, record] : textures_)
    {
        glDeleteSamplers(1, &record.sampler);
        glDeleteTextures(1, &record.texture);
    }
    for (auto& [id, program] : programs_)
    {
        glDeleteProgram(program);
    }
    if (quadVbo_ != 0)
    {
        glDeleteBuffers(1, &quadVbo_);
    }
}

void GlDevice::createQuad()
{
    const auto& vertices = faceQuadVertices();
    glGenBuffers(1, &quadVbo_);
    glBindBuffer(GL_ARRAY_BUFFER, quadVbo_);
    glBufferData(GL_ARRAY_BUFFER,
                 static_cast<GLsizeiptr>(sizeof(QuadVertex) * vertices.size()),
                 vertices.data(),
                 GL_STATIC_DRAW);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    if (consumeOutOfMemory())
    {
        glDeleteBuffers(1, &quadVbo_);
        quadVbo_ = 0;
        throw GpuError("Out of memory creating the face quad");
    }
}

GpuPipeline GlDevice::createPipeline(const PipelineDesc& desc)
{
    const GLuint program = createProgram(desc.vertexSource.c_str(), desc.fragmentSource.c_str());

    const GLuint blockIndex = glGetUniformBlockIndex(program, kCameraUniformBlockName);
    if (blockIndex == GL_INVALID_INDEX)
    {
        glDeleteProgram(program);
        throw GpuError(std::string("Pipeline is missing uniform block ") + kCameraUniformBlockName);
    }
    glUniformBlockBinding(program, blockIndex, kCameraUniformBinding);

    glUseProgram(program);
    const GLint atlasLocation = glGetUniformLocation(program, kAtlasSamplerName);
    if (atlasLocation >= 0)
    {
        glUniform1i(atlasLocation, static_cast<GLint>(kAtlasTextureUnit));
    }
    glUseProgram(0);

    const std::uint32_t id = nextId_++;
    programs_.emplace(id, program);
    return GpuPipeline{id};
}

void GlDevice::destroyPipeline(const GpuPipeline& pipeline)
{
    auto it = programs_.find(pipeline.id);
    if (it == programs_.end())
    {
        return;
    }
    glDeleteProgram(it->second);
    programs_.erase(it);
}

GpuBuffer GlDevice::createUniformBuffer(std::size_t sizeBytes)
{
    GLuint ubo = 0;
    glGenBuffers(1, &ubo);
    glBindBuffer(GL_UNIFORM_BUFFER, ubo);
    glBufferData(GL_UNIFORM_BUFFER, static_cast<GLsizeiptr>(sizeBytes), nullptr, GL_DYNAMIC_DRAW);
    glBindBuffer(GL_UNIFORM_BUFFER, 0);
    if (consumeOutOfMemory())
    {
        glDeleteBuffers(1, &ubo);
        throw GpuError("Out of memory allocating uniform buffer");
    }

    const std::uint32_t id = nextId_++;
    buffers_.emplace(id, BufferRecord{ubo, 0});
    return GpuBuffer{id, sizeBytes};
}

void GlDevice::writeUniformBuffer(const GpuBuffer& buffer, const void* data, std::size_t sizeBytes)
{
    auto it = buffers_.find(buffer.id);
    if (it == buffers_.end())
    {
        throw GpuError("writeUniformBuffer on unknown buffer");
    }
    glBindBuffer(GL_UNIFORM_BUFFER, it->second.buffer);
    glBufferSubData(GL_UNIFORM_BUFFER, 0, static_cast<GLsizeiptr>(sizeBytes), data);
    glBindBuffer(GL_UNIFORM_BUFFER, 0);
}

GpuBuffer GlDevice::createInstanceBuffer(std::span<const BlockFaceInstance> instances)
{
    if (instances.empty())
    {
        throw GpuError("createInstanceBuffer called with no instances");
    }

    const std::size_t sizeBytes = instances.size_bytes();

    BufferRecord record{};
    glGenVertexArrays(1, &record.vao);
    glGenBuffers(1, &record.buffer);

    glBindVertexArray(record.vao);

    glBindBuffer(GL_ARRAY_BUFFER, quadVbo_);
    glEnableVertexAttribArray(kPositionLocation);
    glVertexAttribPointer(kPositionLocation, 3, GL_FLOAT, GL_FALSE, sizeof(QuadVertex),
                          reinterpret_cast<void*>(offsetof(QuadVertex, position)));
    glEnableVertexAttribArray(kTexCoordLocation);
    glVertexAttribPointer(kTexCoordLocation, 2, GL_FLOAT, GL_FALSE, sizeof(QuadVertex),
                          reinterpret_cast<void*>(offsetof(QuadVertex, texCoords)));

    glBindBuffer(GL_ARRAY_BUFFER, record.buffer);
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(sizeBytes), instances.data(), GL_STATIC_DRAW);

    glEnableVertexAttribArray(kInstancePositionLocation);
    glVertexAttribPointer(kInstancePositionLocation, 3, GL_FLOAT, GL_FALSE, sizeof(BlockFaceInstance),
                          reinterpret_cast<void*>(offsetof(BlockFaceInstance, position)));
    glVertexAttribDivisor(kInstancePositionLocation, 1);
    glEnableVertexAttribArray(kInstanceFaceLocation);
    glVertexAttribIPointer(kInstanceFaceLocation, 1, GL_UNSIGNED_INT, sizeof(BlockFaceInstance),
                           reinterpret_cast<void*>(offsetof(BlockFaceInstance, face)));
    glVertexAttribDivisor(kInstanceFaceLocation, 1);
    glEnableVertexAttribArray(kInstanceBlockTypeLocation);
    glVertexAttribIPointer(kInstanceBlockTypeLocation, 1, GL_UNSIGNED_INT, sizeof(BlockFaceInstance),
                           reinterpret_cast<void*>(offsetof(BlockFaceInstance, blockType)));
    glVertexAttribDivisor(kInstanceBlockTypeLocation, 1);

    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    if (consumeOutOfMemory())
    {
        glDeleteVertexArrays(1, &record.vao);
        glDeleteBuffers(1, &record.buffer);
        throw GpuError("Out of memory allocating instance buffer of " + std::to_string(sizeBytes) + " bytes");
    }

    const std::uint32_t id = nextId_++;
    buffers_.emplace(id, record);
    return GpuBuffer{id, sizeBytes};
}

void GlDevice::destroyBuffer(const GpuBuffer& buffer)
{
    auto it = buffers_.find(buffer.id);
    if (it == buffers_.end())
    {
        return;
    }
    if (it->second.vao != 0)
    {
        glDeleteVertexArrays(1, &it->second.vao);
    }
    glDeleteBuffers(1, &it->second.buffer);
    buffers_.erase(it);
}

GpuTexture GlDevice::createTexture(const LoadedImage& image)
{
    if (image.empty() || image.size.x <= 0 || image.size.y <= 0)
    {
        throw GpuError("createTexture called with an empty image");
    }

    TextureRecord record{};
    glGenTextures(1, &record.texture);
    glBindTexture(GL_TEXTURE_2D, record.texture);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, image.size.x, image.size.y, 0, GL_RGBA, GL_UNSIGNED_BYTE,
                 image.pixels.data());
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAX_LEVEL, 0);
    glBindTexture(GL_TEXTURE_2D, 0);

    // Nearest filtering keeps pixel-art tiles crisp and stops bleeding between tiles.
    glGenSamplers(1, &record.sampler);
    glSamplerParameteri(record.sampler, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glSamplerParameteri(record.sampler, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glSamplerParameteri(record.sampler, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glSamplerParameteri(record.sampler, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

    if (consumeOutOfMemory())
    {
        glDeleteSamplers(1, &record.sampler);
        glDeleteTextures(1, &record.texture);
        throw GpuError("Out of memory uploading texture");
    }

    const std::uint32_t id = nextId_++;
    textures_.emplace(id, record);
    return GpuTexture{id, image.size};
}

void GlDevice::destroyTexture(const GpuTexture& texture)
{
    auto it = textures_.find(texture.id);
    if (it == textures_.end())
    {
        return;
    }
    glDeleteSamplers(1, &it->second.sampler);
    glDeleteTextures(1, &it->second.texture);
    textures_.erase(it);
}

FrameStatus GlDevice::beginFrame(const glm::vec4& clearColor)
{
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(window_, &width, &height);
    if (width <= 0 || height <= 0 || width != surfaceWidth_ || height != surfaceHeight_)
    {
        return FrameStatus::SurfaceOutdated;
    }
    if (glCheckFramebufferStatus(GL_FRAMEBUFFER) != GL_FRAMEBUFFER_COMPLETE)
    {
        return FrameStatus::SurfaceLost;
    }

    glViewport(0, 0, surfaceWidth_, surfaceHeight_);
    glClearColor(clearColor.r, clearColor.g, clearColor.b, clearColor.a);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
    frameActive_ = true;
    return FrameStatus::Ok;
}

void GlDevice::bindPipeline(const GpuPipeline& pipeline, const GpuBuffer& uniforms, const GpuTexture& atlas)
{
    auto program = programs_.find(pipeline.id);
    auto ubo = buffers_.find(uniforms.id);
    auto texture = textures_.find(atlas.id);
    if (program == programs_.end() || ubo == buffers_.end() || texture == textures_.end())
    {
        throw GpuError("bindPipeline with unknown resources");
    }

    glUseProgram(program->second);
    glBindBufferBase(GL_UNIFORM_BUFFER, kCameraUniformBinding, ubo->second.buffer);
    glActiveTexture(GL_TEXTURE0 + kAtlasTextureUnit);
    glBindTexture(GL_TEXTURE_2D, texture->second.texture);
    glBindSampler(kAtlasTextureUnit, texture->second.sampler);
}

void GlDevice::drawInstanced(const GpuBuffer& instances, std::uint32_t vertexCount, std::uint32_t instanceCount)
{
    auto it = buffers_.find(instances.id);
    if (it == buffers_.end() || it->second.vao == 0)
    {
        throw GpuError("drawInstanced on unknown instance buffer");
    }
    glBindVertexArray(it->second.vao);
    glDrawArraysInstanced(GL_TRIANGLES, 0, static_cast<GLsizei>(vertexCount), static_cast<GLsizei>(instanceCount));
}

void GlDevice::endFrame()
{
    if (!frameActive_)
    {
        return;
    }
    glBindVertexArray(0);
    glBindSampler(kAtlasTextureUnit, 0);
    glBindTexture(GL_TEXTURE_2D, 0);
    glUseProgram(0);
    glfwSwapBuffers(window_);
    frameActive_ = false;
}

void GlDevice::configureSurface(int width, int height)
{
    surfaceWidth_ = width;
    surfaceHeight_ = height;
    if (width > 0 && height > 0)
    {
        glViewport(0, 0, width, height);
    }
}
