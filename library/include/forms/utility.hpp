#ifndef forms_utility_hpp
#define forms_utility_hpp

#include <cstddef> // for std::size_t
#include <functional> // for std::hash
#include <type_traits>

namespace forms {

namespace detail {
template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
}

/// @brief Mixes the hash of the given value into the given seed.
/// @note This is the same mixing step as <code>boost::hash_combine</code>.
template <class T>
auto hash_combine(std::size_t& seed, const T& v) noexcept -> void
{
    seed ^= std::hash<T>{}(v) + 0x9e3779b9u + (seed << 6u) + (seed >> 2u);
}

/// @brief Converts the given enumerate into its underlying value.
/// @note This is basically a back port from C++23.
template <class Enum>
constexpr auto to_underlying(Enum e) noexcept ->
    decltype(static_cast<std::underlying_type_t<Enum>>(e))
{
    return static_cast<std::underlying_type_t<Enum>>(e);
}

}

#endif /* forms_utility_hpp */
