#include <igm/version.hpp>

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)

std::string_view ImageGridVersion()
{
#ifdef IGM_VERSION
    return TOSTRING(IGM_VERSION);
#else
    return "<unknown version>";
#endif
}

std::string_view ImageGridBuildTime()
{
#ifdef IGM_NOW
    return TOSTRING(IGM_NOW);
#else
    return "<unknown build time>";
#endif
}
