#pragma once

#include <cstdint>
#include <cstring>
#include <type_traits>


// -------------------------------------------------------------
// Endian helpers for fixed-layout binary files
// -------------------------------------------------------------
// Sierra Chart writes every field LITTLE-ENDIAN.
// load_le<T>() reads a field at an arbitrary (unaligned) byte
// address and converts it to host order; store_le<T>() is the
// inverse, used by writers and test fixtures.
// -------------------------------------------------------------

#if defined(__BYTE_ORDER__) && defined(__ORDER_LITTLE_ENDIAN__) && defined(__ORDER_BIG_ENDIAN__)
#  define LCR_HOST_IS_LITTLE_ENDIAN (__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__)
#else
#  error "Cannot determine host endianness"
#endif


namespace lcr {

inline constexpr uint16_t to_le16(uint16_t x) noexcept {
#if LCR_HOST_IS_LITTLE_ENDIAN
    return x;
#else
    return __builtin_bswap16(x);
#endif
}

inline constexpr uint32_t to_le32(uint32_t x) noexcept {
#if LCR_HOST_IS_LITTLE_ENDIAN
    return x;
#else
    return __builtin_bswap32(x);
#endif
}

inline constexpr uint64_t to_le64(uint64_t x) noexcept {
#if LCR_HOST_IS_LITTLE_ENDIAN
    return x;
#else
    return __builtin_bswap64(x);
#endif
}

inline constexpr uint16_t from_le16(uint16_t x) noexcept { return to_le16(x); }
inline constexpr uint32_t from_le32(uint32_t x) noexcept { return to_le32(x); }
inline constexpr uint64_t from_le64(uint64_t x) noexcept { return to_le64(x); }

namespace detail {

template <std::size_t N> struct uint_of_size;
template <> struct uint_of_size<1> { using type = uint8_t; };
template <> struct uint_of_size<2> { using type = uint16_t; };
template <> struct uint_of_size<4> { using type = uint32_t; };
template <> struct uint_of_size<8> { using type = uint64_t; };

template <typename U>
inline constexpr U swap_to_le(U v) noexcept {
    if constexpr (sizeof(U) == 1) return v;
    else if constexpr (sizeof(U) == 2) return to_le16(v);
    else if constexpr (sizeof(U) == 4) return to_le32(v);
    else return to_le64(v);
}

} // namespace detail

// Read a little-endian scalar (integral or IEEE float) from raw bytes
template <typename T>
[[nodiscard]] inline T load_le(const uint8_t* p) noexcept {
    static_assert(std::is_arithmetic_v<T>, "load_le requires an arithmetic type");
    using U = typename detail::uint_of_size<sizeof(T)>::type;
    U raw;
    std::memcpy(&raw, p, sizeof(U));
    raw = detail::swap_to_le(raw);
    T out;
    std::memcpy(&out, &raw, sizeof(T));
    return out;
}

// Write a scalar as little-endian into raw bytes
template <typename T>
inline void store_le(uint8_t* p, T value) noexcept {
    static_assert(std::is_arithmetic_v<T>, "store_le requires an arithmetic type");
    using U = typename detail::uint_of_size<sizeof(T)>::type;
    U raw;
    std::memcpy(&raw, &value, sizeof(T));
    raw = detail::swap_to_le(raw);
    std::memcpy(p, &raw, sizeof(U));
}

} // namespace lcr
