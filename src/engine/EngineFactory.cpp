#include "IAnimationEngine.hpp"
#include "GraphEngine.hpp"
#include "SurfaceEngine.hpp"

#include <memory>

namespace engine
{

const char* engineKindName(EngineKind kind)
{
    switch (kind)
    {
    case EngineKind::Graph:
        return "graph";
    case EngineKind::Surface:
        return "surface";
    }
    return "unknown";
}

std::unique_ptr<IAnimationEngine> createEngine(EngineKind kind, const EngineContext& ctx)
{
    switch (kind)
    {
    case EngineKind::Graph:
        return std::make_unique<GraphEngine>(ctx);
    case EngineKind::Surface:
        return std::make_unique<SurfaceEngine>(ctx);
    default:
        return nullptr;
    }
}

} // namespace engine
