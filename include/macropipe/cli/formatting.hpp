#pragma once

#include <cstdio>
#include <cstdlib>
#include <format>
#include <string>
#include <string_view>
#include <unistd.h>

namespace macropipe::cli::fmt {

/// Colour only when stdout is a terminal and NO_COLOR is unset.
[[nodiscard]] inline auto color_enabled() noexcept -> bool {
  static const bool enabled =
      ::isatty(::fileno(stdout)) != 0 && std::getenv("NO_COLOR") == nullptr;
  return enabled;
}

enum class Tone { Good, Bad, Plain };

template <typename T>
[[nodiscard]] auto paint(Tone tone, const T &value) -> std::string {
  if (tone == Tone::Plain || !color_enabled()) {
    return std::format("{}", value);
  }
  return std::format("\033[{}m{}\033[0m", tone == Tone::Good ? 32 : 31,
                     value);
}

/// ✓ or ✗, coloured to match.
[[nodiscard]] inline auto mark(bool ok) -> std::string {
  return ok ? paint(Tone::Good, "✓") : paint(Tone::Bad, "✗");
}

} // namespace macropipe::cli::fmt
