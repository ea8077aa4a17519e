#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <iterator>
#include <simplefind/constants.hpp>
#include <simplefind/file_loader.hpp>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace {

void report_os_error(const std::string &path) {
  const auto error = errno;
  fmt::print(stderr, "{}: {} (os error {})\n", path, std::strerror(error),
             error);
}

bool starts_with(std::string_view buffer, std::string_view magic) {
  return buffer.substr(0, magic.size()) == magic;
}

} // namespace

bool is_elf_header(std::string_view buffer) {
  static constexpr std::string_view elf_magic = "\x7f"
                                                "ELF";
  return starts_with(buffer, elf_magic);
}

bool is_archive_header(std::string_view buffer) {
  static constexpr std::string_view archive_magic = "!<arch>";
  return starts_with(buffer, archive_magic);
}

bool has_null_bytes(std::string_view buffer) {
  return buffer.find('\0') != std::string_view::npos;
}

bool is_binary(std::string_view content) {
  const auto head = content.substr(0, BINARY_PROBE_SIZE);
  return is_elf_header(head) || is_archive_header(head) ||
         has_null_bytes(head);
}

std::optional<file_input> load_file(const std::string &path) {
  int fd = open(path.data(), O_RDONLY, 0);
  if (fd == -1) {
    report_os_error(path);
    return std::nullopt;
  }

  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    report_os_error(path);
    close(fd);
    return std::nullopt;
  }

  if (S_ISDIR(sb.st_mode)) {
    fmt::print(stderr, "{}: Is a directory\n", path);
    close(fd);
    return std::nullopt;
  }

  file_input file{path, {}};
  const std::size_t file_size = sb.st_size;

  // mmap rejects zero-length mappings
  if (file_size > 0) {
    char *buffer =
        (char *)mmap(NULL, file_size, PROT_READ, MAP_PRIVATE, fd, 0);
    if (buffer == MAP_FAILED) {
      report_os_error(path);
      close(fd);
      return std::nullopt;
    }

    file.content.assign(buffer, file_size);

    if (munmap(buffer, file_size) == -1) {
      report_os_error(path);
    }
  }

  if (close(fd) == -1) {
    report_os_error(path);
  }

  return file;
}

file_input load_stream(std::istream &stream, std::string path) {
  file_input file{std::move(path), {}};
  file.content.assign(std::istreambuf_iterator<char>(stream),
                      std::istreambuf_iterator<char>());
  return file;
}
