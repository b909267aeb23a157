#pragma once

#include <stdexcept>
#include <string>

#include <igm/util.hpp>

// Invalid layout inputs, raised before anything is rendered
class ConfigError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// A single source image could not be read or decoded
class ImageDecodeError : public std::runtime_error
{
  public:
    ImageDecodeError(fs::path source, const std::string& reason);

    const fs::path& Source() const;

  private:
    fs::path m_Source;
};

// Reading or writing a file failed, fatal for the operation
class IoError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};
