#include <fmt/format.h>
#include <simplefind/compiler.hpp>
#include <utility>

pattern_compile_error::pattern_compile_error(std::string pattern,
                                             std::string reason)
    : std::runtime_error(
          fmt::format("Error compiling pattern '{}': {}", pattern, reason)),
      pattern_text(std::move(pattern)), reason_text(std::move(reason)) {}

matcher::matcher(hs_database_t *database, hs_database_t *byte_database,
                 bool database_accepts_any_bytes)
    : compiled_database(database), compiled_byte_database(byte_database),
      any_bytes(database_accepts_any_bytes) {}

matcher::matcher(matcher &&other) noexcept
    : compiled_database(other.compiled_database),
      compiled_byte_database(other.compiled_byte_database),
      any_bytes(other.any_bytes) {
  other.compiled_database = nullptr;
  other.compiled_byte_database = nullptr;
}

matcher &matcher::operator=(matcher &&other) noexcept {
  if (this != &other) {
    release();
    compiled_database = other.compiled_database;
    compiled_byte_database = other.compiled_byte_database;
    any_bytes = other.any_bytes;
    other.compiled_database = nullptr;
    other.compiled_byte_database = nullptr;
  }
  return *this;
}

matcher::~matcher() { release(); }

void matcher::release() {
  if (compiled_database) {
    hs_free_database(compiled_database);
    compiled_database = nullptr;
  }
  if (compiled_byte_database) {
    hs_free_database(compiled_byte_database);
    compiled_byte_database = nullptr;
  }
}

scratch_space::scratch_space(const matcher &m) {
  if (!m.database()) {
    throw std::runtime_error("Database is NULL");
  }
  if (hs_alloc_scratch(m.database(), &scratch) != HS_SUCCESS) {
    throw std::runtime_error("Error allocating scratch space");
  }
  // Grows the same region so that it also fits the byte mode database
  if (m.byte_database() &&
      hs_alloc_scratch(m.byte_database(), &scratch) != HS_SUCCESS) {
    hs_free_scratch(scratch);
    scratch = nullptr;
    throw std::runtime_error("Error allocating scratch space");
  }
}

scratch_space::~scratch_space() {
  if (scratch) {
    hs_free_scratch(scratch);
  }
}

namespace {

// Targets the vector extensions the HyperScan runtime detects on this host
hs_platform_info_t host_platform_info() {
  hs_platform_info_t platform{};
  if (hs_populate_platform(&platform) != HS_SUCCESS) {
    platform = hs_platform_info_t{};
    platform.tune = HS_TUNE_FAMILY_GENERIC;
  }
  return platform;
}

[[noreturn]] void throw_compile_error(std::string_view pattern,
                                     hs_compile_error_t *compile_error) {
  std::string reason =
      compile_error ? compile_error->message : "unknown HyperScan error";
  if (compile_error) {
    hs_free_compile_error(compile_error);
  }
  throw pattern_compile_error(std::string{pattern}, std::move(reason));
}

} // namespace

std::string escape_literal(std::string_view text) {
  static constexpr std::string_view metacharacters = "\\^$.|?*+()[]{}";
  std::string result;
  result.reserve(text.size() * 2);
  for (const auto c : text) {
    if (metacharacters.find(c) != std::string_view::npos) {
      result += '\\';
    }
    result += c;
  }
  return result;
}

matcher compile_pattern(std::string_view pattern, bool case_sensitive) {
  compile_options options;
  options.ignore_case = !case_sensitive;
  return compile_pattern(pattern, options);
}

matcher compile_pattern(std::string_view pattern,
                        const compile_options &options) {
  hs_database_t *database = nullptr;
  hs_compile_error_t *compile_error = nullptr;
  hs_error_t error_code;

  static const auto platform = host_platform_info();

  // Start of match is always needed to report columns
  const unsigned int common_flags =
      (options.ignore_case ? HS_FLAG_CASELESS : 0) | HS_FLAG_SOM_LEFTMOST;

  // hs_compile_lit rejects an empty literal. The empty regex is equivalent.
  const bool as_literal = options.compile_pattern_as_literal &&
                          !options.match_whole_words && !pattern.empty();

  if (as_literal) {
    error_code = hs_compile_lit(pattern.data(), common_flags, pattern.size(),
                                HS_MODE_BLOCK, &platform, &database,
                                &compile_error);
    if (error_code != HS_SUCCESS) {
      throw_compile_error(pattern, compile_error);
    }
    return matcher{database, nullptr, true};
  }

  // hs_compile reads a NUL-terminated expression, anything after an
  // embedded NUL would be dropped
  const auto nul = pattern.find('\0');
  if (nul != std::string_view::npos) {
    throw pattern_compile_error(
        std::string{pattern},
        fmt::format("pattern contains a NUL byte at index {}", nul));
  }

  std::string expression{pattern};
  if (options.compile_pattern_as_literal) {
    expression = escape_literal(pattern);
  }
  if (options.match_whole_words) {
    expression = "\\b" + expression + "\\b";
  }

  const unsigned int regex_flags = common_flags | HS_FLAG_ALLOWEMPTY;

  error_code = hs_compile(
      expression.c_str(),
      regex_flags | HS_FLAG_UTF8 | (options.use_ucp ? HS_FLAG_UCP : 0),
      HS_MODE_BLOCK, &platform, &database, &compile_error);
  if (error_code != HS_SUCCESS) {
    throw_compile_error(pattern, compile_error);
  }

  // Byte mode, for lines that are not valid UTF-8. Patterns that need
  // UTF-8 mode (code points above 0xFF) have none.
  hs_database_t *byte_database = nullptr;
  if (hs_compile(expression.c_str(), regex_flags, HS_MODE_BLOCK, &platform,
                 &byte_database, &compile_error) != HS_SUCCESS) {
    if (compile_error) {
      hs_free_compile_error(compile_error);
    }
    byte_database = nullptr;
  }

  return matcher{database, byte_database, false};
}
