#pragma once

#include "core/Cancellation.hpp"
#include "core/Error.hpp"
#include "core/Ids.hpp"
#include "log/TaggedLogger.hpp"
#include "tree/ComponentTree.hpp"
#include "bridge/Resolvable.hpp"
#include "hydration/StateCodec.hpp"
#include "hydration/HydrationPayload.hpp"
#include "render/AssetResolver.hpp"
#include "render/DocumentShell.hpp"
#include "render/OutputSink.hpp"
#include "render/RenderConfig.hpp"
#include "render/RenderReportJson.hpp"
#include "render/RenderSession.hpp"
#include "task/TaskPool.hpp"
