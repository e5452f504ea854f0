#include <glad/glad.h>
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include "TextureLoader.h"
#include "app_config.h"
#include "camera.h"
#include "chunk_manager.h"
#include "frame_loop.h"
#include "gl_device.h"
#include "input_context.h"
#include "renderer.h"
#include "terrain/terrain_generator.h"
#include "terrain/worldgen_profile.h"

#include <glm/glm.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace
{
constexpr unsigned kDefaultWorldSeed = 42u;
constexpr float kSpawnClearance = 3.0f;
constexpr double kStatsIntervalSeconds = 5.0;

std::mutex gCrashLogMutex;
std::filesystem::path gCrashLogPath;

void appendCrashLog(std::string message);

void crashSignalHandler(int signalValue)
{
    const char* name = "unknown";
    switch (signalValue)
    {
        case SIGABRT:
            name = "SIGABRT";
            break;
#ifdef SIGSEGV
        case SIGSEGV:
            name = "SIGSEGV";
            break;
#endif
#ifdef SIGILL
        case SIGILL:
            name = "SIGILL";
            break;
#endif
#ifdef SIGFPE
        case SIGFPE:
            name = "SIGFPE";
            break;
#endif
    }
    appendCrashLog(std::string("signal: ") + name);
    std::_Exit(EXIT_FAILURE);
}

void appendCrashLog(std::string message)
{
    if (gCrashLogPath.empty())
    {
        return;
    }

    std::lock_guard<std::mutex> lock(gCrashLogMutex);

    std::ofstream out(gCrashLogPath, std::ios::app);
    if (!out)
    {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const std::time_t timestamp = std::chrono::system_clock::to_time_t(now);
    std::tm timeInfo{};
    if (std::tm* local = std::localtime(&timestamp))
    {
        timeInfo = *local;
    }
    out << std::put_time(&timeInfo, "%Y-%m-%d %H:%M:%S") << " - " << message << '\n';
}

void initializeCrashLogging(const std::filesystem::path& logPath)
{
    gCrashLogPath = logPath;

    // Create the file up front so appends work even if the process dies immediately.
    {
        std::ofstream out(gCrashLogPath, std::ios::app);
    }

    std::signal(SIGABRT, crashSignalHandler);
#ifdef SIGSEGV
    std::signal(SIGSEGV, crashSignalHandler);
#endif
#ifdef SIGILL
    std::signal(SIGILL, crashSignalHandler);
#endif
#ifdef SIGFPE
    std::signal(SIGFPE, crashSignalHandler);
#endif

    std::set_terminate([]
    {
        if (auto current = std::current_exception())
        {
            try
            {
                std::rethrow_exception(current);
            }
            catch (const std::exception& e)
            {
                appendCrashLog(std::string("terminate: ") + e.what());
            }
            catch (...)
            {
                appendCrashLog("terminate: unknown exception");
            }
        }
        else
        {
            appendCrashLog("terminate: no active exception");
        }
        std::abort();
    });
}

void logStreamingStats(ChunkManager& chunkManager)
{
    const ChunkStreamingStats stats = chunkManager.sampleStats();
    if (stats.generatedChunks == 0 && stats.meshedChunks == 0 && stats.evictedChunks == 0)
    {
        return;
    }

    std::ostringstream line;
    line.setf(std::ios::fixed, std::ios::floatfield);
    line << std::setprecision(2);
    line << "[ChunkManager] Gen " << stats.generatedChunks;
    if (stats.generatedChunks > 0)
    {
        line << " @" << stats.averageGenerationMs << "ms";
    }
    line << " | Mesh " << stats.meshedChunks;
    if (stats.meshedChunks > 0)
    {
        line << " @" << stats.averageMeshingMs << "ms";
    }
    line << " | Upload " << stats.uploadedChunks << " ("
         << static_cast<double>(stats.uploadedBytes) / 1024.0 << " KiB)";
    if (stats.evictedChunks > 0)
    {
        line << " Evict " << stats.evictedChunks;
    }
    line << " | Resident " << stats.loadedChunks << " chunks, " << stats.loadedInstances << " faces";
    std::cout << line.str() << std::endl;
}

// Everything holding GPU objects lives in here so it is released before the context goes away.
void runWorld(GLFWwindow* window, const AppConfig& config)
{
    const terrain::WorldgenProfile profile = terrain::WorldgenProfile::load("assets/worldgen.toml");
    const terrain::TerrainGenerator generator(profile, profile.effectiveSeed(kDefaultWorldSeed));
    std::cout << "World seed: " << generator.seed() << std::endl;

    const LoadedImage atlasImage = loadImage(config.renderer.atlasPath.string().c_str());
    if (atlasImage.empty())
    {
        throw std::runtime_error("Block atlas could not be loaded from " + config.renderer.atlasPath.string());
    }

    GlDevice device(window);

    Camera camera;
    camera.moveSpeed = config.camera.moveSpeed;
    camera.lookSensitivity = config.camera.lookSensitivity;
    camera.setLens(config.camera.fovDegrees, config.camera.nearPlane, config.camera.farPlane);

    glm::vec3 start = config.camera.start;
    if (!config.camera.hasStartY)
    {
        const int surface = generator.surfaceHeight(static_cast<int>(std::floor(start.x)),
                                                    static_cast<int>(std::floor(start.z)));
        start.y = static_cast<float>(surface) + kSpawnClearance;
    }
    camera.setPosition(start);
    std::cout << "Camera spawned at: (" << start.x << ", " << start.y << ", " << start.z << ")" << std::endl;

    InputContext& inputContext = *static_cast<InputContext*>(glfwGetWindowUserPointer(window));

    Renderer renderer(device, config.atlas, atlasImage, config.renderer.clearColor);
    ChunkManager chunkManager(device, generator, config.viewRadius);
    FrameLoop frameLoop(camera, chunkManager, renderer, config.renderer.maxSurfaceRetries);

    std::cout << "Controls: WASD to move, SPACE/SHIFT to rise/sink, mouse to look, ESC to quit." << std::endl;

    double previousTime = glfwGetTime();
    double statsTimer = 0.0;
    while (!glfwWindowShouldClose(window))
    {
        const double currentTime = glfwGetTime();
        double frameTime = currentTime - previousTime;
        previousTime = currentTime;
        frameTime = std::min(frameTime, 0.25);

        glfwPollEvents();
        if (glfwGetKey(window, GLFW_KEY_ESCAPE) == GLFW_PRESS)
        {
            glfwSetWindowShouldClose(window, GLFW_TRUE);
        }

        FrameInput frame{};
        frame.deltaSeconds = static_cast<float>(frameTime);
        frame.camera = pollCameraInput(window, inputContext);
        frame.framebufferSize = inputContext.framebufferSize;
        frameLoop.tick(frame);

        statsTimer += frameTime;
        if (statsTimer >= kStatsIntervalSeconds)
        {
            logStreamingStats(chunkManager);
            statsTimer = 0.0;
        }
    }

    chunkManager.clear();
}

int runGame(const AppConfig& config)
{
    if (glfwInit() != GLFW_TRUE)
    {
        std::cerr << "Failed to initialize GLFW" << std::endl;
        return EXIT_FAILURE;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    GLFWwindow* window = glfwCreateWindow(config.window.width, config.window.height, config.window.title.c_str(),
                                          nullptr, nullptr);
    if (window == nullptr)
    {
        std::cerr << "Failed to create GLFW window" << std::endl;
        glfwTerminate();
        return EXIT_FAILURE;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(config.window.vsync ? 1 : 0);

    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress)))
    {
        std::cerr << "Failed to initialize GLAD" << std::endl;
        glfwDestroyWindow(window);
        glfwTerminate();
        return EXIT_FAILURE;
    }

    InputContext inputContext;
    int windowWidth = 0;
    int windowHeight = 0;
    glfwGetWindowSize(window, &windowWidth, &windowHeight);
    inputContext.lastX = static_cast<float>(windowWidth) * 0.5f;
    inputContext.lastY = static_cast<float>(windowHeight) * 0.5f;
    glfwGetFramebufferSize(window, &inputContext.framebufferSize.x, &inputContext.framebufferSize.y);

    glfwSetWindowUserPointer(window, &inputContext);
    glfwSetFramebufferSizeCallback(window, framebufferSizeCallback);
    glfwSetCursorPosCallback(window, mouseCallback);
    glfwSetInputMode(window, GLFW_CURSOR, GLFW_CURSOR_DISABLED);

    int exitCode = EXIT_SUCCESS;
    try
    {
        runWorld(window, config);
    }
    catch (const GpuError& ex)
    {
        std::cerr << "[GlDevice] Fatal GPU error: " << ex.what() << std::endl;
        exitCode = EXIT_FAILURE;
    }
    catch (const std::runtime_error& ex)
    {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        exitCode = EXIT_FAILURE;
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    return exitCode;
}

} // namespace

int main(int argc, char** argv)
{
    std::filesystem::path exePath;
    if (argc > 0 && argv[0] != nullptr)
    {
        std::error_code ec;
        exePath = std::filesystem::canonical(argv[0], ec);
        if (ec)
        {
            exePath.clear();
        }
    }

    std::filesystem::path exeDirectory = exePath.parent_path();
    if (exeDirectory.empty())
    {
        exeDirectory = std::filesystem::current_path();
    }

    std::filesystem::path logPath = exeDirectory / "chunkcraft_crash.log";

#ifndef NDEBUG
    std::cout << "Crash log path: " << logPath << '\n';
#endif

    initializeCrashLogging(logPath);

    const std::filesystem::path settingsPath = (argc > 1) ? std::filesystem::path(argv[1])
                                                          : std::filesystem::path("assets/settings.toml");

    try
    {
        const AppConfig config = AppConfig::load(settingsPath);
        return runGame(config);
    }
    catch (const std::exception& e)
    {
        appendCrashLog(std::string("uncaught exception: ") + e.what());
        std::cerr << "Unhandled exception: " << e.what() << '\n';
    }

    return EXIT_FAILURE;
}
