#pragma once

#include <cstdint>

#include <igm/util/bit_field.hpp>

enum class LogFlags : uint32_t
{
    None = 0u,
    Console = Bit(0u),
    File = Bit(1u),
    FatalQuit = Bit(2u),
    DetailTime = Bit(3u),
    DetailFile = Bit(4u),
    DetailLine = Bit(5u),
    DetailColumn = DetailLine | Bit(6u),
    DetailFunction = Bit(7u),
    DetailThread = Bit(8u),
    DetailErrorStacktrace = Bit(9u),
    DetailFatalStacktrace = Bit(10u),

    DetailStacktrace = DetailErrorStacktrace | DetailFatalStacktrace,
    DetailAll = DetailTime | DetailFile | DetailLine | DetailColumn | DetailFunction | DetailThread,
    DetailAllStacktrace = DetailAll | DetailStacktrace,
};
ENABLE_BITFIELD_OPERATORS(LogFlags);

enum class PdfBackend
{
    PoDoFo,
    Png,
};
