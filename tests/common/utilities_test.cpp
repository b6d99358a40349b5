#include "utilities_test.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <stdexcept>

namespace plaintext_tests {

std::string TestUtilities::repeat(const std::string& unit, size_t count) {
  std::string out;
  out.reserve(unit.size() * count);
  for (size_t i = 0; i < count; ++i) {
    out += unit;
  }
  return out;
}

std::string TestUtilities::with_control_byte(char control) {
  std::string out = "Hello";
  out.push_back(control);
  return out;
}

std::filesystem::path TestUtilities::unique_temp_dir(const std::string& prefix) {
  static std::atomic<int> counter{0};
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();

  auto dir = std::filesystem::temp_directory_path() /
             (prefix + "_" + std::to_string(timestamp) + "_" + std::to_string(counter++));
  std::filesystem::create_directories(dir);
  return dir;
}

void TempDirTestBase::SetUp() {
  test_dir_ = TestUtilities::unique_temp_dir("plaintext_check_tests");
}

void TempDirTestBase::TearDown() {
  std::error_code ec;
  std::filesystem::remove_all(test_dir_, ec);
}

std::filesystem::path TempDirTestBase::create_test_file(const std::string& filename,
                                                        const std::string& content) {
  auto file_path = test_dir_ / filename;
  std::ofstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to create test file: " + file_path.string());
  }
  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  file.close();
  return file_path;
}

}  // namespace plaintext_tests
