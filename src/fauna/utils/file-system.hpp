#pragma once

#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fauna
{
using std::error_code;

// ------------------------------------------------------- file-get/put-contents

error_code file_get_contents(const std::string_view fname,
                             std::string& out) noexcept;
error_code file_get_contents(const std::string_view fname,
                             std::vector<char>& out) noexcept;

// Throws std::runtime_error if the file cannot be read
std::string file_get_contents(const std::string_view fname) noexcept(false);

error_code file_put_contents(const std::string_view fname,
                             const std::string_view dat) noexcept;

// ----------------------------------------------------------- is-file/directory

bool is_regular_file(const std::string_view filename) noexcept;
bool is_directory(const std::string_view filename) noexcept;

// --------------------------------------------------- basename/dirname/file_ext

std::string absolute_path(const std::string_view filename) noexcept;
std::string basename(const std::string_view filename,
                     const bool strip_extension = false) noexcept;
std::string dirname(const std::string_view filename) noexcept;
std::string file_ext(const std::string_view filename) noexcept; // like ".png"
std::string extensionless(const std::string_view filename) noexcept;

// Joins with '/', unless `b` is absolute
std::string path_join(const std::string_view a,
                      const std::string_view b) noexcept;

// ----------------------------------------------------------------------- mkdir

bool mkdir_p(const std::string_view dname) noexcept;

// --------------------------------------------------------- make-temp-directory
// make_temp_directory("/tmp/fooXXXXXX");
std::string make_temp_directory(const std::string_view p) noexcept(false);

// -------------------------------------------------------------- list-directory
// Regular files directly inside `dname`, sorted by full path
std::vector<std::string>
list_directory(const std::string_view dname) noexcept(false);

// ------------------------------------------------------------------ remove-all

std::error_code delete_file(const std::string_view path);

int remove_all(const std::string_view path) noexcept(false);

} // namespace fauna
