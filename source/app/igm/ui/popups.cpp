#include <igm/ui/popups.hpp>

#include <ranges>
#include <string>

#include <QFileDialog>
#include <QStringList>

#include <igm/constants.hpp>
#include <igm/qt_util.hpp>

std::optional<fs::path> OpenFileDialog(std::string_view title, const fs::path& root, std::string_view filter, FileDialogType type)
{
    QString choice{};
    if (type == FileDialogType::Open)
    {
        choice = QFileDialog::getOpenFileName(
            nullptr,
            ToQString(title),
            ToQString(root),
            ToQString(filter));
    }
    else
    {
        choice = QFileDialog::getSaveFileName(
            nullptr,
            ToQString(title),
            ToQString(root),
            ToQString(filter));
    }

    if (choice.isEmpty())
    {
        return std::nullopt;
    }
    else
    {
        return ToFsPath(choice);
    }
}

std::vector<fs::path> OpenImagesDialog(const fs::path& root)
{
    std::string image_filters_str{ "Images (*" + g_ValidImageExtensions[0].string() };
    for (const fs::path& valid_extension : g_ValidImageExtensions | std::views::drop(1))
    {
        image_filters_str.append(" *");
        image_filters_str.append(valid_extension.string());
    }
    image_filters_str.append(")");

    const QStringList choices{
        QFileDialog::getOpenFileNames(
            nullptr,
            "Add Images",
            ToQString(root),
            ToQString(image_filters_str))
    };

    std::vector<fs::path> images{};
    images.reserve(choices.size());
    for (const auto& choice : choices)
    {
        images.push_back(ToFsPath(choice));
    }
    return images;
}

std::optional<fs::path> OpenSettingsDialog(const fs::path& root, FileDialogType type)
{
    return OpenFileDialog(type == FileDialogType::Open ? "Load Settings" : "Save Settings As",
                          root,
                          "Json Files (*.json)",
                          type);
}

std::optional<fs::path> OpenOutputDialog(const fs::path& root)
{
    return OpenFileDialog("Render To", root, "Pdf Files (*.pdf)", FileDialogType::Save);
}
