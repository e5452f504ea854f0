#include "renderer.h"

#include <iostream>

#include "camera.h"
#include "chunk_manager.h"
#include "shader_source.h"

Renderer::Renderer(GpuDevice& device, const AtlasLayout& atlas, const LoadedImage& atlasImage,
                   const glm::vec4& clearColor)
    : device_(device),
      clearColor_(clearColor)
{
    PipelineDesc desc{};
    desc.vertexSource = buildBlockVertexShader(atlas);
    desc.fragmentSource = buildBlockFragmentShader();
    pipeline_ = device_.createPipeline(desc);

    try
    {
        cameraUniform_ = device_.createUniformBuffer(sizeof(glm::mat4));
        atlasTexture_ = device_.createTexture(atlasImage);
    }
    catch (const GpuError&)
    {
        if (cameraUniform_.valid())
        {
            device_.destroyBuffer(cameraUniform_);
        }
        device_.destroyPipeline(pipeline_);
        throw;
    }

    std::cout << "[Renderer] Pipeline ready, atlas " << atlasTexture_.size.x << "x" << atlasTexture_.size.y
              << " (" << atlas.columns() << "x" << atlas.rows() << " tiles)" << std::endl;
}

Renderer::~Renderer()
{
    device_.destroyTexture(atlasTexture_);
    device_.destroyBuffer(cameraUniform_);
    device_.destroyPipeline(pipeline_);
}

FrameStatus Renderer::render(const Camera& camera, const ChunkManager& chunks)
{
    lastDrawCount_ = 0;

    const FrameStatus status = device_.beginFrame(clearColor_);
    if (status != FrameStatus::Ok)
    {
        return status;
    }

    const glm::mat4& viewProj = camera.viewProjection();
    device_.writeUniformBuffer(cameraUniform_, &viewProj, sizeof(glm::mat4));
    device_.bindPipeline(pipeline_, cameraUniform_, atlasTexture_);

    for (const ChunkDrawItem& item : chunks.drawList(camera.position()))
    {
        if (item.instanceCount == 0)
        {
            continue;
        }
        device_.drawInstanced(item.instances, kFaceQuadVertexCount, item.instanceCount);
        ++lastDrawCount_;
    }

    device_.endFrame();
    return FrameStatus::Ok;
}

void Renderer::resize(int width, int height)
{
    device_.configureSurface(width, height);
}
