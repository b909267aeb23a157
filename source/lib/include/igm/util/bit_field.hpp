#pragma once

#include <concepts>
#include <type_traits>

// NOLINTBEGIN

namespace detail
{
template<typename BitFieldTy>
inline constexpr bool c_BitFieldOperatorsEnabled{ false };
} // namespace detail

template<typename T>
concept BitField = std::is_enum_v<T> && detail::c_BitFieldOperatorsEnabled<T>;

// Call this on an enum class type to enable the bitwise operators below
#define ENABLE_BITFIELD_OPERATORS(bitfield) \
    template<>                              \
    inline constexpr bool detail::c_BitFieldOperatorsEnabled<bitfield> { true }

template<BitField T>
inline constexpr T operator|(T lhs, T rhs)
{
    using BaseTy = std::underlying_type_t<T>;
    return static_cast<T>(static_cast<BaseTy>(lhs) | static_cast<BaseTy>(rhs));
}

template<BitField T>
inline constexpr T operator&(T lhs, T rhs)
{
    using BaseTy = std::underlying_type_t<T>;
    return static_cast<T>(static_cast<BaseTy>(lhs) & static_cast<BaseTy>(rhs));
}

template<BitField T>
inline constexpr T operator~(T value)
{
    using BaseTy = std::underlying_type_t<T>;
    return static_cast<T>(~static_cast<BaseTy>(value));
}

template<BitField T>
inline constexpr T& operator|=(T& lhs, T rhs)
{
    lhs = lhs | rhs;
    return lhs;
}

template<BitField T>
inline constexpr T& operator&=(T& lhs, T rhs)
{
    lhs = lhs & rhs;
    return lhs;
}

template<BitField T>
inline constexpr bool IsSet(T lhs, T rhs)
{
    return (lhs & rhs) == rhs;
}

template<BitField T>
inline constexpr bool IsAnySet(T lhs, T rhs)
{
    using BaseTy = std::underlying_type_t<T>;
    return static_cast<BaseTy>(lhs & rhs) != BaseTy{};
}

template<std::unsigned_integral T>
consteval T Bit(T ith)
{
    return static_cast<T>(T{ 1 } << ith);
}

// NOLINTEND
