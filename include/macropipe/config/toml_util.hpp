#pragma once

#include "macropipe/core/error.hpp"

#include <glaze/toml.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace macropipe::toml_util {

/// Whole file as text. FileNotFound when it does not exist, FileOpenFailed
/// when it exists but cannot be read.
[[nodiscard]] inline auto read_file(const std::filesystem::path &path)
    -> Result<std::string> {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return fail(Error::FileNotFound);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(Error::FileOpenFailed);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

/// Decode TOML into a glz::meta mirror struct. Unknown keys are ignored so
/// batch files may carry extra annotations. On failure `diagnostic` receives
/// glaze's positioned message prefixed with `source`.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text, std::string_view source,
                              std::string *diagnostic) -> Result<T> {
  T raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    if (diagnostic) {
      *diagnostic =
          std::format("{}: {}", source, glz::format_error(ec, text));
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

} // namespace macropipe::toml_util
