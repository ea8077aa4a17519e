#pragma once
#include <hs/hs.h>
#include <stdexcept>
#include <string>
#include <string_view>

class pattern_compile_error : public std::runtime_error {
public:
  pattern_compile_error(std::string pattern, std::string reason);

  const std::string &pattern() const { return pattern_text; }
  const std::string &reason() const { return reason_text; }

private:
  std::string pattern_text;
  std::string reason_text;
};

struct compile_options {
  bool ignore_case{false};
  bool compile_pattern_as_literal{false};
  bool match_whole_words{false};
  bool use_ucp{false};
};

/// Owns the compiled HyperScan databases of a pattern. Immutable once
/// constructed and safe to share between threads; each scanning thread
/// needs its own scratch_space.
///
/// A regex is compiled twice: in UTF-8 mode for lines that are valid UTF-8
/// and in byte mode for lines that are not. The byte mode database is
/// missing when the pattern only compiles in UTF-8 mode. A literal database
/// works on any bytes and serves both.
class matcher {
public:
  matcher(hs_database_t *database, hs_database_t *byte_database,
          bool database_accepts_any_bytes);
  matcher(matcher &&other) noexcept;
  matcher &operator=(matcher &&other) noexcept;
  matcher(const matcher &) = delete;
  matcher &operator=(const matcher &) = delete;
  ~matcher();

  const hs_database_t *database() const { return compiled_database; }

  // nullptr if lines that are not valid UTF-8 cannot be scanned
  const hs_database_t *byte_database() const {
    return any_bytes ? compiled_database : compiled_byte_database;
  }

private:
  void release();

  hs_database_t *compiled_database{nullptr};
  hs_database_t *compiled_byte_database{nullptr};
  bool any_bytes{false};
};

/// Per-thread HyperScan scratch region for a matcher
class scratch_space {
public:
  explicit scratch_space(const matcher &m);
  scratch_space(const scratch_space &) = delete;
  scratch_space &operator=(const scratch_space &) = delete;
  ~scratch_space();

  hs_scratch_t *get() const { return scratch; }

private:
  hs_scratch_t *scratch{nullptr};
};

matcher compile_pattern(std::string_view pattern, bool case_sensitive);

matcher compile_pattern(std::string_view pattern,
                        const compile_options &options);

/// Escapes every regex metacharacter so the result matches `text` literally
std::string escape_literal(std::string_view text);
