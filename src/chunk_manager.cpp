#include "chunk_manager.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <unordered_map>
#include <utility>

#include "chunk.h"
#include "mesh_builder.h"
#include "terrain/terrain_generator.h"

namespace
{

struct ChunkHasher
{
    std::size_t operator()(const glm::ivec3& v) const noexcept
    {
        std::size_t hash = static_cast<std::size_t>(v.x) * 73856093u;
        hash ^= static_cast<std::size_t>(v.y) * 19349663u;
        hash ^= static_cast<std::size_t>(v.z) * 83492791u;
        return hash;
    }
};

struct StreamingCounters
{
    std::size_t uploadedBytes{0};
    long long generationMicros{0};
    long long meshingMicros{0};
    int generatedChunks{0};
    int meshedChunks{0};
    int uploadedChunks{0};
    int evictedChunks{0};
};

int chebyshevDistance(const glm::ivec3& a, const glm::ivec3& b) noexcept
{
    const glm::ivec3 d = glm::abs(a - b);
    return std::max(d.x, std::max(d.y, d.z));
}

long long elapsedMicros(std::chrono::steady_clock::time_point start)
{
    const auto end = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
}

} // namespace

struct ChunkManager::Impl
{
    struct ChunkSlot
    {
        std::unique_ptr<Chunk> chunk;
        GpuBuffer buffer{};
        std::uint32_t instanceCount{0};
        bool dirty{false};
    };

    Impl(GpuDevice& device, const terrain::TerrainGenerator& generator, int viewRadius);
    ~Impl();

    void update(const glm::ivec3& cameraChunk);
    void evictOutside(const glm::ivec3& cameraChunk);
    void loadChunk(const glm::ivec3& coord);
    void remesh(ChunkSlot& slot);
    void uploadInstances(ChunkSlot& slot, const std::vector<BlockFaceInstance>& instances);
    void releaseBuffer(ChunkSlot& slot);
    void clear();

    ChunkStreamingStats sampleStats();

    GpuDevice& device_;
    const terrain::TerrainGenerator& generator_;
    int viewRadius_{kDefaultViewRadius};
    std::unordered_map<glm::ivec3, ChunkSlot, ChunkHasher> chunks_;
    std::optional<glm::ivec3> lastCenter_{};
    int lastRadius_{-1};
    StreamingCounters counters_{};
};

ChunkManager::Impl::Impl(GpuDevice& device, const terrain::TerrainGenerator& generator, int viewRadius)
    : device_(device),
      generator_(generator),
      viewRadius_(std::clamp(viewRadius, 0, kMaxViewRadius))
{
}

ChunkManager::Impl::~Impl()
{
    clear();
}

void ChunkManager::Impl::update(const glm::ivec3& cameraChunk)
{
    const bool centerChanged = !lastCenter_ || *lastCenter_ != cameraChunk || lastRadius_ != viewRadius_;

    evictOutside(cameraChunk);

    int loaded = 0;
    const int r = viewRadius_;
    for (int dy = -r; dy <= r; ++dy)
    {
        for (int dz = -r; dz <= r; ++dz)
        {
            for (int dx = -r; dx <= r; ++dx)
            {
                const glm::ivec3 coord = cameraChunk + glm::ivec3(dx, dy, dz);
                auto it = chunks_.find(coord);
                if (it == chunks_.end())
                {
                    loadChunk(coord);
                    ++loaded;
                }
                else if (it->second.dirty)
                {
                    remesh(it->second);
                }
            }
        }
    }

    if (centerChanged)
    {
        std::cout << "[ChunkManager] Streaming around chunk (" << cameraChunk.x << ", " << cameraChunk.y << ", "
                  << cameraChunk.z << "), radius " << viewRadius_ << ": loaded " << loaded << ", resident "
                  << chunks_.size() << std::endl;
        lastCenter_ = cameraChunk;
        lastRadius_ = viewRadius_;
    }
}

void ChunkManager::Impl::evictOutside(const glm::ivec3& cameraChunk)
{
    for (auto it = chunks_.begin(); it != chunks_.end();)
    {
        if (chebyshevDistance(it->first, cameraChunk) > viewRadius_)
        {
            releaseBuffer(it->second);
            it = chunks_.erase(it);
            ++counters_.evictedChunks;
        }
        else
        {
            ++it;
        }
    }
}

void ChunkManager::Impl::loadChunk(const glm::ivec3& coord)
{
    ChunkSlot slot{};

    const auto genStart = std::chrono::steady_clock::now();
    slot.chunk = std::make_unique<Chunk>(generator_.generate(coord));
    counters_.generationMicros += elapsedMicros(genStart);
    ++counters_.generatedChunks;

    remesh(slot);

    // Only inserted once the upload went through.
    chunks_.emplace(coord, std::move(slot));
}

void ChunkManager::Impl::remesh(ChunkSlot& slot)
{
    const auto meshStart = std::chrono::steady_clock::now();
    std::vector<BlockFaceInstance> instances;
    if (slot.chunk->hasSolidBlocks())
    {
        instances = buildInstances(*slot.chunk);
    }
    counters_.meshingMicros += elapsedMicros(meshStart);
    ++counters_.meshedChunks;

    releaseBuffer(slot);
    uploadInstances(slot, instances);
    slot.dirty = false;
}

void ChunkManager::Impl::uploadInstances(ChunkSlot& slot, const std::vector<BlockFaceInstance>& instances)
{
    if (instances.empty())
    {
        return;
    }

    GpuBuffer buffer = device_.createInstanceBuffer(instances);
    slot.buffer = buffer;
    slot.instanceCount = static_cast<std::uint32_t>(instances.size());
    counters_.uploadedBytes += buffer.sizeBytes;
    ++counters_.uploadedChunks;
}

void ChunkManager::Impl::releaseBuffer(ChunkSlot& slot)
{
    if (slot.buffer.valid())
    {
        device_.destroyBuffer(slot.buffer);
    }
    slot.buffer = GpuBuffer{};
    slot.instanceCount = 0;
}

void ChunkManager::Impl::clear()
{
    for (auto& [coord, slot] : chunks_)
    {
        releaseBuffer(slot);
    }
    chunks_.clear();
    lastCenter_.reset();
    lastRadius_ = -1;
}

ChunkStreamingStats ChunkManager::Impl::sampleStats()
{
    ChunkStreamingStats stats{};
    stats.generatedChunks = counters_.generatedChunks;
    stats.meshedChunks = counters_.meshedChunks;
    stats.uploadedChunks = counters_.uploadedChunks;
    stats.evictedChunks = counters_.evictedChunks;
    stats.uploadedBytes = counters_.uploadedBytes;

    if (counters_.generatedChunks > 0)
    {
        stats.averageGenerationMs = static_cast<double>(counters_.generationMicros) /
                                    (1000.0 * static_cast<double>(counters_.generatedChunks));
    }
    if (counters_.meshedChunks > 0)
    {
        stats.averageMeshingMs = static_cast<double>(counters_.meshingMicros) /
                                 (1000.0 * static_cast<double>(counters_.meshedChunks));
    }

    stats.loadedChunks = static_cast<int>(chunks_.size());
    for (const auto& [coord, slot] : chunks_)
    {
        stats.loadedInstances += slot.instanceCount;
    }

    counters_ = StreamingCounters{};
    return stats;
}

ChunkManager::ChunkManager(GpuDevice& device, const terrain::TerrainGenerator& generator, int viewRadius)
    : impl_(std::make_unique<Impl>(device, generator, viewRadius))
{
}

ChunkManager::~ChunkManager() = default;

void ChunkManager::update(const glm::ivec3& cameraChunk)
{
    impl_->update(cameraChunk);
}

void ChunkManager::update(const glm::vec3& cameraWorldPos)
{
    impl_->update(worldToChunkCoord(cameraWorldPos));
}

void ChunkManager::markDirty(const glm::ivec3& chunkCoord)
{
    auto it = impl_->chunks_.find(chunkCoord);
    if (it != impl_->chunks_.end())
    {
        it->second.dirty = true;
    }
}

void ChunkManager::markAllDirty()
{
    for (auto& [coord, slot] : impl_->chunks_)
    {
        slot.dirty = true;
    }
}

void ChunkManager::setViewRadius(int radius) noexcept
{
    impl_->viewRadius_ = std::clamp(radius, 0, kMaxViewRadius);
}

int ChunkManager::viewRadius() const noexcept
{
    return impl_->viewRadius_;
}

bool ChunkManager::isLoaded(const glm::ivec3& chunkCoord) const noexcept
{
    return impl_->chunks_.find(chunkCoord) != impl_->chunks_.end();
}

std::size_t ChunkManager::loadedCount() const noexcept
{
    return impl_->chunks_.size();
}

std::vector<glm::ivec3> ChunkManager::loadedCoords() const
{
    std::vector<glm::ivec3> coords;
    coords.reserve(impl_->chunks_.size());
    for (const auto& [coord, slot] : impl_->chunks_)
    {
        coords.push_back(coord);
    }
    return coords;
}

std::optional<BlockType> ChunkManager::blockAt(const glm::ivec3& worldPos) const noexcept
{
    auto it = impl_->chunks_.find(worldToChunkCoord(worldPos));
    if (it == impl_->chunks_.end())
    {
        return std::nullopt;
    }
    const glm::ivec3 local = worldToLocalCoord(worldPos);
    return it->second.chunk->blockAt(local.x, local.y, local.z);
}

std::vector<ChunkDrawItem> ChunkManager::drawList(const glm::vec3& cameraWorldPos) const
{
    std::vector<std::pair<float, ChunkDrawItem>> sorted;
    sorted.reserve(impl_->chunks_.size());

    const glm::vec3 halfExtent(kChunkSizeX * 0.5f, kChunkSizeY * 0.5f, kChunkSizeZ * 0.5f);
    for (const auto& [coord, slot] : impl_->chunks_)
    {
        if (!slot.buffer.valid() || slot.instanceCount == 0)
        {
            continue;
        }
        const glm::vec3 center = glm::vec3(chunkOrigin(coord)) + halfExtent;
        const glm::vec3 delta = center - cameraWorldPos;
        sorted.emplace_back(glm::dot(delta, delta), ChunkDrawItem{coord, slot.buffer, slot.instanceCount});
    }

    std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first)
        {
            return a.first < b.first;
        }
        // Stable order for equidistant chunks.
        if (a.second.coord.x != b.second.coord.x)
        {
            return a.second.coord.x < b.second.coord.x;
        }
        if (a.second.coord.y != b.second.coord.y)
        {
            return a.second.coord.y < b.second.coord.y;
        }
        return a.second.coord.z < b.second.coord.z;
    });

    std::vector<ChunkDrawItem> items;
    items.reserve(sorted.size());
    for (auto& entry : sorted)
    {
        items.push_back(entry.second);
    }
    return items;
}

ChunkStreamingStats ChunkManager::sampleStats()
{
    return impl_->sampleStats();
}

void ChunkManager::clear()
{
    impl_->clear();
}
