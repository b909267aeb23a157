#include <igm/util.hpp>

#include <cctype>

#include <QDesktopServices>
#include <QString>
#include <QUrl>

#include <igm/constants.hpp>
#include <igm/qt_util.hpp>

std::vector<fs::path> ListFiles(const fs::path& path, const std::span<const fs::path> extensions)
{
    std::vector<fs::path> files;
    ForEachFile(
        path,
        [&files](const fs::path& file)
        {
            files.push_back(file);
        },
        extensions);
    std::ranges::sort(files, {}, [](const fs::path& file)
                      { return file.filename(); });
    return files;
}

bool HasImageExtension(const fs::path& path)
{
    std::string extension{ path.extension().string() };
    std::ranges::transform(extension, extension.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
    return std::ranges::contains(g_ValidImageExtensions, fs::path{ extension });
}

bool OpenFolder(const fs::path& path)
{
    return OpenPath(fs::absolute(path));
}

bool OpenFile(const fs::path& path)
{
    return OpenPath(fs::absolute(path));
}

bool OpenPath(const fs::path& path)
{
    return QDesktopServices::openUrl(QUrl::fromLocalFile(ToQString(path)));
}
