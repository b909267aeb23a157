#include <igm/qt_util.hpp>

#include <QColor>
#include <QString>

QString ToQString(const char* c_string)
{
    return QString::fromUtf8(c_string);
}

QString ToQString(const std::string& string)
{
    return QString::fromStdString(string);
}

QString ToQString(std::string_view string_view)
{
    return QString::fromUtf8(string_view.data(), static_cast<qsizetype>(string_view.size()));
}

QString ToQString(const fs::path& path)
{
    return QString::fromStdU16String(path.u16string());
}

fs::path ToFsPath(const QString& string)
{
    return fs::path{ string.toStdU16String() };
}

QColor ToQColor(const ColorRGB8& color)
{
    return QColor{ color.r, color.g, color.b };
}

ColorRGB8 FromQColor(const QColor& color)
{
    return ColorRGB8{
        static_cast<uint8_t>(color.red()),
        static_cast<uint8_t>(color.green()),
        static_cast<uint8_t>(color.blue()),
    };
}
