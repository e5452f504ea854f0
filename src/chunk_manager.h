#pragma once
// chunk_manager.h
// Declares the chunk streaming subsystem: which chunks are resident around the camera, their
// generation and meshing, and ownership of each chunk's GPU instance buffer.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <glm/glm.hpp>

#include "block.h"
#include "gpu_device.h"

namespace terrain
{
class TerrainGenerator;
}

inline constexpr int kDefaultViewRadius = 1;
inline constexpr int kMaxViewRadius = 16;

struct ChunkDrawItem
{
    glm::ivec3 coord{0};
    GpuBuffer instances{};
    std::uint32_t instanceCount{0};
};

struct ChunkStreamingStats
{
    double averageGenerationMs{0.0};
    double averageMeshingMs{0.0};
    std::size_t uploadedBytes{0};
    int generatedChunks{0};
    int meshedChunks{0};
    int uploadedChunks{0};
    int evictedChunks{0};
    int loadedChunks{0};
    std::size_t loadedInstances{0};
};

class ChunkManager
{
public:
    // The device and generator must outlive the manager.
    ChunkManager(GpuDevice& device, const terrain::TerrainGenerator& generator, int viewRadius = kDefaultViewRadius);
    ~ChunkManager();

    ChunkManager(const ChunkManager&) = delete;
    ChunkManager& operator=(const ChunkManager&) = delete;
    ChunkManager(ChunkManager&&) = delete;
    ChunkManager& operator=(ChunkManager&&) = delete;

    // Loads every chunk within the view radius (Chebyshev distance) of cameraChunk, evicts the
    // rest and re-meshes dirty chunks. GpuError from an upload propagates; chunks loaded before
    // the failure stay loaded.
    void update(const glm::ivec3& cameraChunk);
    void update(const glm::vec3& cameraWorldPos);

    void markDirty(const glm::ivec3& chunkCoord);
    void markAllDirty();

    void setViewRadius(int radius) noexcept;
    int viewRadius() const noexcept;

    bool isLoaded(const glm::ivec3& chunkCoord) const noexcept;
    std::size_t loadedCount() const noexcept;
    std::vector<glm::ivec3> loadedCoords() const;

    // Empty when the containing chunk is not loaded.
    std::optional<BlockType> blockAt(const glm::ivec3& worldPos) const noexcept;

    // One item per loaded chunk with instances, nearest chunk centre first.
    std::vector<ChunkDrawItem> drawList(const glm::vec3& cameraWorldPos) const;

    // Counters accumulate between samples and reset on read.
    ChunkStreamingStats sampleStats();

    void clear();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
