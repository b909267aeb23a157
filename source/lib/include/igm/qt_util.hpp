#pragma once

#include <string>
#include <string_view>

#include <igm/color.hpp>
#include <igm/util.hpp>

class QString;
class QColor;

QString ToQString(const char* c_string);
QString ToQString(const std::string& string);
QString ToQString(std::string_view string_view);
QString ToQString(const fs::path& path);

fs::path ToFsPath(const QString& string);

QColor ToQColor(const ColorRGB8& color);
ColorRGB8 FromQColor(const QColor& color);
