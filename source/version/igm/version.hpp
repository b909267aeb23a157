#pragma once

#include <string_view>

std::string_view ImageGridVersion();
std::string_view ImageGridBuildTime();
