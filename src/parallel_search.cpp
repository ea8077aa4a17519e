#include <algorithm>
#include <concurrentqueue/concurrentqueue.h>
#include <exception>
#include <iterator>
#include <simplefind/line_scanner.hpp>
#include <simplefind/parallel_search.hpp>
#include <thread>

namespace {

struct file_result {
  std::size_t index{0};
  std::vector<match_result> matches{};
};

} // namespace

std::vector<match_result> search_parallel(const matcher &m,
                                          const std::vector<file_input> &files,
                                          std::size_t num_threads) {
  if (num_threads <= 1 || files.size() <= 1) {
    return scan_files(m, files);
  }
  num_threads = std::min(num_threads, files.size());

  // Work items are file indices, results come back tagged with the index
  // so that they can be put back into input order
  moodycamel::ConcurrentQueue<std::size_t> pending_files(files.size());
  moodycamel::ConcurrentQueue<file_result> output_queue(files.size());
  for (std::size_t i = 0; i < files.size(); ++i) {
    pending_files.enqueue(i);
  }

  std::vector<std::exception_ptr> errors(num_threads);
  std::vector<std::thread> threads;
  threads.reserve(num_threads);

  for (std::size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([&m, &files, &pending_files, &output_queue, &errors,
                          i]() {
      try {
        // Each worker owns its scratch space, the database is shared
        line_scanner scanner(m);
        std::size_t index{0};
        while (pending_files.try_dequeue(index)) {
          file_result result{index, {}};
          scanner.scan(files[index], result.matches, index);
          output_queue.enqueue(std::move(result));
        }
      } catch (...) {
        errors[i] = std::current_exception();
      }
    });
  }

  for (auto &t : threads) {
    t.join();
  }

  for (const auto &error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }

  std::vector<std::vector<match_result>> matches_per_file(files.size());

  // Anything the workers left behind is scanned here
  {
    std::size_t index{0};
    if (pending_files.try_dequeue(index)) {
      line_scanner scanner(m);
      do {
        scanner.scan(files[index], matches_per_file[index], index);
      } while (pending_files.try_dequeue(index));
    }
  }

  file_result next_result{};
  while (output_queue.try_dequeue(next_result)) {
    matches_per_file[next_result.index] = std::move(next_result.matches);
  }

  std::size_t total{0};
  for (const auto &matches : matches_per_file) {
    total += matches.size();
  }

  std::vector<match_result> results;
  results.reserve(total);
  for (auto &matches : matches_per_file) {
    std::move(matches.begin(), matches.end(), std::back_inserter(results));
  }
  return results;
}
