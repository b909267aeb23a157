#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include <igm/util.hpp>

enum class FileDialogType
{
    Open,
    Save,
};

std::optional<fs::path> OpenFileDialog(std::string_view title, const fs::path& root, std::string_view filter, FileDialogType type);
std::vector<fs::path> OpenImagesDialog(const fs::path& root);
std::optional<fs::path> OpenSettingsDialog(const fs::path& root, FileDialogType type);
std::optional<fs::path> OpenOutputDialog(const fs::path& root);
