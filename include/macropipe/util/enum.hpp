#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>

namespace macropipe {

template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> T;

namespace util {

/// Lower-case alphanumerics only: "Client-Configured" -> "clientconfigured".
[[nodiscard]] inline auto normalize_enum_token(std::string_view token)
    -> std::string {
  std::string out;
  out.reserve(token.size());
  for (char c : token) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) != 0) {
      out.push_back(static_cast<char>(std::tolower(uc)));
    }
  }
  return out;
}

/// "ClientConfigured" -> "client_configured", "IOError" -> "io_error".
[[nodiscard]] inline auto enum_name_to_snake_case(std::string_view name)
    -> std::string {
  std::string out;
  out.reserve(name.size() + 4);
  for (std::size_t i = 0; i < name.size(); ++i) {
    const auto uch = static_cast<unsigned char>(name[i]);
    if (i > 0 && std::isupper(uch) != 0) {
      const bool after_lower =
          std::islower(static_cast<unsigned char>(name[i - 1])) != 0;
      const bool before_lower =
          i + 1 < name.size() &&
          std::islower(static_cast<unsigned char>(name[i + 1])) != 0;
      if (after_lower || before_lower) {
        out.push_back('_');
      }
    }
    out.push_back(static_cast<char>(std::tolower(uch)));
  }
  return out;
}

template <typename E>
concept DescribedEnum =
    std::is_enum_v<E> && boost::describe::has_describe_enumerators<E>::value;

/// Display and lookup names of every enumerator of E, built once.
template <DescribedEnum E> struct EnumNames {
  struct Entry {
    E value;
    std::string display; // snake_case
    std::string key;     // normalized, for lenient parsing
  };

  using descriptors = boost::describe::describe_enumerators<E>;
  static constexpr std::size_t kCount = boost::mp11::mp_size<descriptors>::value;

  [[nodiscard]] static auto entries() -> const std::array<Entry, kCount> & {
    static const auto table = [] {
      std::array<Entry, kCount> out{};
      std::size_t i = 0;
      boost::mp11::mp_for_each<descriptors>([&](auto d) {
        out[i++] = Entry{d.value, enum_name_to_snake_case(d.name),
                         normalize_enum_token(d.name)};
      });
      return out;
    }();
    return table;
  }
};

template <DescribedEnum E>
[[nodiscard]] inline auto
enum_to_snake_case_view(E value, std::string_view fallback = "unknown") noexcept
    -> std::string_view {
  const auto &table = EnumNames<E>::entries();
  auto it = std::ranges::find(table, value, &EnumNames<E>::Entry::value);
  return it != table.end() ? std::string_view{it->display} : fallback;
}

/// Lookup ignoring case and punctuation; std::nullopt when nothing matches.
template <DescribedEnum E>
[[nodiscard]] inline auto try_parse_enum(std::string_view input)
    -> std::optional<E> {
  const auto key = normalize_enum_token(input);
  const auto &table = EnumNames<E>::entries();
  auto it = std::ranges::find(table, key, &EnumNames<E>::Entry::key);
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->value;
}

/// Strict lookup: only the exact snake_case name matches.
template <DescribedEnum E>
[[nodiscard]] inline auto find_enum_exact(std::string_view name)
    -> std::optional<E> {
  const auto &table = EnumNames<E>::entries();
  auto it = std::ranges::find(table, name, &EnumNames<E>::Entry::display);
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->value;
}

template <DescribedEnum E>
[[nodiscard]] inline auto parse_enum(std::string_view input,
                                     E default_value) noexcept -> E {
  return try_parse_enum<E>(input).value_or(default_value);
}

} // namespace util

#define MACROPIPE_DEFINE_ENUM_SERDE(EnumType, DefaultValue)                    \
  [[nodiscard]] inline auto to_string_view(EnumType value) noexcept            \
      -> std::string_view {                                                    \
    return ::macropipe::util::enum_to_snake_case_view(value);                  \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<EnumType>(std::string_view s) noexcept       \
      -> EnumType {                                                            \
    return ::macropipe::util::parse_enum(s, DefaultValue);                     \
  }

} // namespace macropipe

/// Described enums format as their snake_case name.
template <macropipe::util::DescribedEnum E>
struct std::formatter<E, char> : std::formatter<std::string_view, char> {
  auto format(E value, std::format_context &ctx) const {
    return std::formatter<std::string_view, char>::format(
        macropipe::util::enum_to_snake_case_view(value), ctx);
  }
};
