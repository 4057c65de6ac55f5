#pragma once

#include <liveview/core/Error.hpp>
#include <liveview/render/CameraPose.hpp>
#include <liveview/render/ImageBuffer.hpp>
#include <liveview/render/PoseStore.hpp>
#include <liveview/render/RenderQueue.hpp>
#include <liveview/render/RenderQueueConfig.hpp>
#include <liveview/render/RenderQueueService.hpp>
#include <liveview/render/RenderQueueStats.hpp>
#include <liveview/render/RenderWorker.hpp>
#include <liveview/render/Renderer.hpp>
#include <liveview/render/ResultArbiter.hpp>
#include <liveview/render/SyntheticRenderer.hpp>
