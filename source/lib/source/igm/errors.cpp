#include <igm/errors.hpp>

#include <fmt/format.h>

ImageDecodeError::ImageDecodeError(fs::path source, const std::string& reason)
    : std::runtime_error{ fmt::format("Failed decoding {}: {}", source.string(), reason) }
    , m_Source{ std::move(source) }
{
}

const fs::path& ImageDecodeError::Source() const
{
    return m_Source;
}
